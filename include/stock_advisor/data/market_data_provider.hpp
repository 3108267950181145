// include/stock_advisor/data/market_data_provider.hpp
#pragma once

#include <string>
#include <vector>
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/core/types.hpp"
#include "stock_advisor/data/price_history.hpp"
#include "stock_advisor/strategy/strategy_types.hpp"

namespace stock_advisor {

/**
 * @brief Source of live quotes, historical closes and fundamentals
 *
 * Results may be partial: a ticker the provider knows nothing about is simply absent.
 * An error is reserved for the provider itself being unusable.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual Result<PriceQuote> get_live_prices(const std::vector<std::string>& tickers) = 0;

    virtual Result<PriceHistory> get_historical_closes(
        const std::vector<std::string>& tickers) = 0;

    virtual Result<FundamentalsMap> get_fundamentals(const std::vector<std::string>& tickers) = 0;
};

}  // namespace stock_advisor
