// include/stock_advisor/data/snapshot_provider.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "stock_advisor/data/market_data_provider.hpp"

namespace stock_advisor {

/**
 * @brief Provider backed by an already materialized market snapshot
 *
 * Snapshot JSON layout:
 * {
 *   "prices": {"AAPL": 189.5, ...},
 *   "fundamentals": {"AAPL": {"sector": "Technology", "revenueGrowth": 0.06,
 *                             "returnOnEquity": 1.5, "debtToEquity": 150.0,
 *                             "trailingPE": 29.1}, ...},
 *   "history": {"dates": ["2024-05-06", ...], "closes": {"AAPL": [181.7, null, ...]}}
 * }
 * Every section is optional. A history CSV, read through PriceHistoryLoader, replaces the
 * inline history.
 */
class SnapshotMarketDataProvider : public MarketDataProvider {
public:
    SnapshotMarketDataProvider(PriceQuote prices, FundamentalsMap fundamentals,
                               PriceHistory history);

    static Result<std::shared_ptr<SnapshotMarketDataProvider>> from_json(
        const nlohmann::json& j);

    /**
     * @brief Load a snapshot file and, optionally, a history CSV
     */
    static Result<std::shared_ptr<SnapshotMarketDataProvider>> load(
        const std::string& snapshot_path,
        const std::optional<std::string>& history_csv = std::nullopt);

    Result<PriceQuote> get_live_prices(const std::vector<std::string>& tickers) override;

    Result<PriceHistory> get_historical_closes(const std::vector<std::string>& tickers) override;

    Result<FundamentalsMap> get_fundamentals(const std::vector<std::string>& tickers) override;

private:
    PriceQuote prices_;
    FundamentalsMap fundamentals_;
    PriceHistory history_;
};

}  // namespace stock_advisor
