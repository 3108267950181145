// include/stock_advisor/portfolio/portfolio_advisor.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/core/logger.hpp"
#include "stock_advisor/core/types.hpp"
#include "stock_advisor/data/market_data_provider.hpp"
#include "stock_advisor/portfolio/allocator.hpp"
#include "stock_advisor/portfolio/trend_reconstructor.hpp"
#include "stock_advisor/strategy/strategy_resolver.hpp"

namespace stock_advisor {

/**
 * @brief Top-level configuration, one section per component
 */
struct AdvisorConfig : public ConfigBase {
    double min_investment_usd{5000.0};
    bool use_trend_weighting{false};

    // Screened in order by the dynamic strategies; index funds are skipped by the resolver
    std::vector<std::string> candidate_universe{
        "VOO", "QQQ", "VTI", "BND", "IVV", "SPY",
        "NVDA", "TSLA", "AMD", "SHOP", "SNOW",
        "AAPL", "MSFT", "GOOGL", "AMZN", "META", "JPM", "JNJ", "V", "PG", "MA",
        "HD", "CVX", "MRK", "ABBV", "PEP", "KO", "BAC", "COST", "ADBE", "CRM"};

    ResolverConfig resolver;
    AllocatorConfig allocator;
    TrendConfig trend;
    LoggerConfig logger;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Investment request as received from the transport layer
 */
struct PortfolioRequest {
    double investment_amount{0.0};
    std::vector<std::string> strategies;

    /**
     * @brief Parse {"investment_amount": 10000, "strategies": ["Growth Investing"]}
     * @return INVALID_ARGUMENT when a field is missing or has the wrong type
     */
    static Result<PortfolioRequest> parse(const nlohmann::json& j);

    /**
     * @brief Parse a command-line amount such as "10000" or "12500.50"
     * @return INVALID_ARGUMENT unless the whole text is a number
     */
    static Result<double> parse_amount(const std::string& text);
};

/**
 * @brief Rounded response for the transport layer
 */
struct PortfolioSuggestion {
    std::vector<Holding> suggested_holdings;
    double current_total_value_usd{0.0};
    std::vector<TrendPoint> weekly_value_trend;
    double leftover_cash_usd{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Error payload in the same shape the CLI prints
 */
nlohmann::json error_to_json(const AdvisorError& error);

/**
 * @brief Runs one request end to end
 *
 * Validation, strategy resolution, data fetch, allocation, valuation and trend
 * reconstruction. Holds no state between requests.
 */
class PortfolioAdvisor {
public:
    PortfolioAdvisor(AdvisorConfig config, std::shared_ptr<MarketDataProvider> provider);

    /**
     * @brief Produce a suggestion
     * @return INVALID_AMOUNT below the configured minimum, INVALID_STRATEGY for unknown
     *         names, INVALID_ARGUMENT for a bad strategy count, EMPTY_TICKER_LIST when
     *         resolution yields nothing, MARKET_DATA_ERROR when prices or history cannot
     *         be fetched
     */
    Result<PortfolioSuggestion> suggest(const PortfolioRequest& request) const;

    const AdvisorConfig& config() const { return config_; }

private:
    Result<void> validate(const PortfolioRequest& request) const;

    AdvisorConfig config_;
    std::shared_ptr<MarketDataProvider> provider_;
    StrategyResolver resolver_;
    Allocator allocator_;
    TrendReconstructor trend_;
};

}  // namespace stock_advisor
