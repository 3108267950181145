// src/portfolio/valuation.cpp
#include "stock_advisor/portfolio/valuation.hpp"
#include "stock_advisor/core/logger.hpp"

namespace stock_advisor {

double Valuation::value(const AllocationResult& allocation, const PriceQuote& prices) {
    double total = 0.0;
    for (const auto& holding : allocation.holdings) {
        auto quote = prices.find(holding.symbol);
        if (quote == prices.end()) {
            WARN("No live price to value " << holding.symbol << ", counting as zero");
            continue;
        }
        total += static_cast<double>(holding.shares_purchased) * quote->second;
    }
    return total;
}

}  // namespace stock_advisor
