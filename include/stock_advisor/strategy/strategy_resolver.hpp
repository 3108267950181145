// include/stock_advisor/strategy/strategy_resolver.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/strategy/screening.hpp"
#include "stock_advisor/strategy/strategy_types.hpp"

namespace stock_advisor {

/**
 * @brief Configuration for strategy resolution
 */
struct ResolverConfig : public ConfigBase {
    ResolutionMode mode{ResolutionMode::DYNAMIC};
    size_t max_strategies{2};
    size_t max_portfolio_size{10};

    // Returned when dynamic screening selects nothing at all
    std::string fallback_ticker{"MSFT"};

    // Hand-curated baskets. INDEX is used in both modes; the others only in STATIC mode
    std::map<Strategy, std::vector<std::string>> baskets{
        {Strategy::INDEX, {"VOO", "QQQ", "VTI", "BND", "IVV", "SPY"}},
        {Strategy::ETHICAL, {"AAPL", "MSFT", "GOOGL", "ADBE", "CRM"}},
        {Strategy::GROWTH, {"NVDA", "TSLA", "AMD", "SHOP", "SNOW"}},
        {Strategy::QUALITY, {"MSFT", "V", "MA", "JNJ", "COST"}},
        {Strategy::VALUE, {"JPM", "BAC", "MRK", "PG", "KO"}}};

    ScreeningConfig screening;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Turns 1-2 strategies into an ordered, deduplicated, bounded ticker list
 *
 * Pure function of its inputs: the candidate universe and the fundamentals snapshot are
 * arguments, not state.
 */
class StrategyResolver {
public:
    explicit StrategyResolver(ResolverConfig config = ResolverConfig());

    /**
     * @brief Resolve strategies to tickers
     * @param strategies Requested strategies, in request order
     * @param universe Candidates for the screened strategies, in priority order
     * @param fundamentals Attributes per candidate; candidates without an entry are skipped
     * @return At most max_portfolio_size tickers, first-seen order.
     *         INVALID_ARGUMENT when the strategy count is outside [1, max_strategies]
     */
    Result<std::vector<std::string>> resolve(const std::vector<Strategy>& strategies,
                                             const std::vector<std::string>& universe,
                                             const FundamentalsMap& fundamentals) const;

    /**
     * @brief Convenience overload for static resolution without a universe
     */
    Result<std::vector<std::string>> resolve(const std::vector<Strategy>& strategies) const;

    /**
     * @brief Whether resolve() will read fundamentals for these strategies
     */
    bool needs_fundamentals(const std::vector<Strategy>& strategies) const;

    /**
     * @brief Configured basket for a strategy, empty if none
     */
    const std::vector<std::string>& basket(Strategy strategy) const;

    const ResolverConfig& config() const { return config_; }

private:
    std::vector<std::string> screen(Strategy strategy, const std::vector<std::string>& universe,
                                    const FundamentalsMap& fundamentals) const;

    bool is_index_member(const std::string& ticker) const;

    ResolverConfig config_;
    Screener screener_;
};

}  // namespace stock_advisor
