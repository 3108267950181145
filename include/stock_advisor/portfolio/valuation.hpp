// include/stock_advisor/portfolio/valuation.hpp
#pragma once

#include "stock_advisor/core/types.hpp"

namespace stock_advisor {

/**
 * @brief Marks holdings to live prices
 */
class Valuation {
public:
    /**
     * @brief Current value of an allocation
     *
     * Best effort: a holding without a quote contributes zero instead of failing the
     * whole valuation.
     */
    static double value(const AllocationResult& allocation, const PriceQuote& prices);
};

}  // namespace stock_advisor
