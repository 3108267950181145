// include/stock_advisor/strategy/screening.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/strategy/strategy_types.hpp"

namespace stock_advisor {

/**
 * @brief Thresholds for the fundamentals screens
 *
 * missing_debt_to_equity and missing_sector_passes decide how absent attributes are
 * treated. The defaults make an absent attribute fail its screen.
 */
struct ScreeningConfig : public ConfigBase {
    std::vector<std::string> excluded_sectors{"Energy", "Utilities", "Basic Materials"};
    bool missing_sector_passes{false};

    double min_revenue_growth{0.15};     // Growth: revenue_growth > threshold
    double min_return_on_equity{0.15};   // Quality: return_on_equity > threshold
    double max_debt_to_equity{50.0};     // Quality: debt_to_equity < threshold
    double missing_debt_to_equity{100.0};  // Substituted when debt_to_equity is absent
    double max_trailing_pe{25.0};        // Value: 0 < trailing_pe < threshold

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Fundamentals predicates for the screened strategies
 */
class Screener {
public:
    explicit Screener(ScreeningConfig config = ScreeningConfig());

    /**
     * @brief Check an instrument against a strategy's screen
     * @return false for INDEX, which is never screened
     */
    bool passes(Strategy strategy, const Fundamentals& info) const;

    bool passes_ethical(const Fundamentals& info) const;
    bool passes_growth(const Fundamentals& info) const;
    bool passes_quality(const Fundamentals& info) const;
    bool passes_value(const Fundamentals& info) const;

    const ScreeningConfig& config() const { return config_; }

private:
    ScreeningConfig config_;
};

}  // namespace stock_advisor
