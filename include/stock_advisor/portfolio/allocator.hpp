// include/stock_advisor/portfolio/allocator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/core/types.hpp"
#include "stock_advisor/data/price_history.hpp"

namespace stock_advisor {

/**
 * @brief Configuration for trend weighting
 */
struct AllocatorConfig : public ConfigBase {
    int lookback_window{20};     // Rows in the moving average window
    int min_periods{5};          // Observations needed before the average is defined
    double trend_exponent{2.0};  // weight = (price / sma) ^ trend_exponent

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Turns a cash amount into whole-share holdings
 *
 * Equal weights without history, trend weights with it. Tickers without a positive quote
 * and tickers that round down to zero shares are left out of the result; their cash stays
 * in leftover_cash.
 */
class Allocator {
public:
    explicit Allocator(AllocatorConfig config = AllocatorConfig());

    /**
     * @brief Allocate cash across tickers
     * @param amount Cash to invest
     * @param tickers Resolved tickers, in priority order, no duplicates
     * @param prices Live quotes, possibly partial
     * @param history Historical closes; nullptr or empty selects equal weighting
     * @return EMPTY_TICKER_LIST for no tickers, INVALID_ARGUMENT for a non-positive amount
     */
    Result<AllocationResult> allocate(double amount, const std::vector<std::string>& tickers,
                                      const PriceQuote& prices,
                                      const PriceHistory* history = nullptr) const;

    /**
     * @brief Normalized weights, in ticker order
     */
    std::vector<std::pair<std::string, double>> compute_weights(
        const std::vector<std::string>& tickers, const PriceQuote& prices,
        const PriceHistory* history) const;

    /**
     * @brief Mean of the present values in the trailing window
     * @return nullopt when fewer than min_periods values are present
     */
    std::optional<double> moving_average(const PriceSeries& closes) const;

    const AllocatorConfig& config() const { return config_; }

private:
    AllocatorConfig config_;
};

}  // namespace stock_advisor
