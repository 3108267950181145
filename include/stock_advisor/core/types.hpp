// include/stock_advisor/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace stock_advisor {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Live quotes keyed by ticker
 * A quote is usable only when strictly positive
 */
using PriceQuote = std::unordered_map<std::string, Price>;

/**
 * @brief Whole-share position bought at allocation time
 * allocated_usd == shares_purchased * price at allocation time
 */
struct Holding {
    std::string symbol;
    double allocated_usd{0.0};
    int64_t shares_purchased{0};
    double weight_pct{0.0};  // Normalized weight * 100, two decimals

    Holding() = default;
    Holding(std::string sym, double allocated, int64_t shares, double weight)
        : symbol(std::move(sym)),
          allocated_usd(allocated),
          shares_purchased(shares),
          weight_pct(weight) {}
};

/**
 * @brief Output of the allocator
 */
struct AllocationResult {
    std::vector<Holding> holdings;
    double leftover_cash{0.0};

    // Normalized weight used for every input ticker, in input order
    std::vector<std::pair<std::string, double>> weights;

    bool empty() const { return holdings.empty(); }
};

/**
 * @brief Portfolio value on one historical date
 */
struct TrendPoint {
    std::string date;  // YYYY-MM-DD
    double portfolio_value_usd{0.0};

    TrendPoint() = default;
    TrendPoint(std::string d, double v) : date(std::move(d)), portfolio_value_usd(v) {}
};

/**
 * @brief Round a monetary amount to cents
 */
inline double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

}  // namespace stock_advisor
