// include/stock_advisor/portfolio/trend_reconstructor.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/core/types.hpp"
#include "stock_advisor/data/price_history.hpp"

namespace stock_advisor {

struct TrendConfig : public ConfigBase {
    size_t trend_days{5};  // Most recent history rows to replay

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Replays a fixed allocation over the tail of a price history
 */
class TrendReconstructor {
public:
    explicit TrendReconstructor(TrendConfig config = TrendConfig());

    /**
     * @brief Portfolio value for each of the last trend_days rows, oldest first
     *
     * A missing close contributes zero for that ticker on that date. An empty allocation
     * or history yields an empty series.
     */
    std::vector<TrendPoint> trend(const AllocationResult& allocation,
                                  const PriceHistory& history) const;

    const TrendConfig& config() const { return config_; }

private:
    TrendConfig config_;
};

}  // namespace stock_advisor
