// src/portfolio/trend_reconstructor.cpp
#include "stock_advisor/portfolio/trend_reconstructor.hpp"
#include <algorithm>
#include "stock_advisor/core/logger.hpp"

namespace stock_advisor {

nlohmann::json TrendConfig::to_json() const {
    nlohmann::json j;
    j["trend_days"] = trend_days;
    return j;
}

void TrendConfig::from_json(const nlohmann::json& j) {
    if (j.contains("trend_days"))
        trend_days = j.at("trend_days").get<size_t>();
}

TrendReconstructor::TrendReconstructor(TrendConfig config) : config_(std::move(config)) {}

std::vector<TrendPoint> TrendReconstructor::trend(const AllocationResult& allocation,
                                                  const PriceHistory& history) const {
    std::vector<TrendPoint> points;
    if (allocation.empty() || history.empty()) {
        return points;
    }

    const size_t rows = history.num_rows();
    const size_t days = std::min(config_.trend_days, rows);
    const bool sole = allocation.holdings.size() == 1;
    points.reserve(days);

    for (size_t row = rows - days; row < rows; ++row) {
        double value = 0.0;
        for (const auto& holding : allocation.holdings) {
            auto close = history.close_at(holding.symbol, row, sole);
            if (!close.has_value()) {
                TRACE("No close for " << holding.symbol << " on " << history.date_label(row));
                continue;
            }
            value += static_cast<double>(holding.shares_purchased) * *close;
        }
        points.emplace_back(history.date_label(row), round_to_cents(value));
    }

    return points;
}

}  // namespace stock_advisor
