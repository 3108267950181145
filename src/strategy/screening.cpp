// src/strategy/screening.cpp
#include "stock_advisor/strategy/screening.hpp"
#include <algorithm>

namespace stock_advisor {

nlohmann::json ScreeningConfig::to_json() const {
    nlohmann::json j;
    j["excluded_sectors"] = excluded_sectors;
    j["missing_sector_passes"] = missing_sector_passes;
    j["min_revenue_growth"] = min_revenue_growth;
    j["min_return_on_equity"] = min_return_on_equity;
    j["max_debt_to_equity"] = max_debt_to_equity;
    j["missing_debt_to_equity"] = missing_debt_to_equity;
    j["max_trailing_pe"] = max_trailing_pe;
    return j;
}

void ScreeningConfig::from_json(const nlohmann::json& j) {
    if (j.contains("excluded_sectors"))
        excluded_sectors = j.at("excluded_sectors").get<std::vector<std::string>>();
    if (j.contains("missing_sector_passes"))
        missing_sector_passes = j.at("missing_sector_passes").get<bool>();
    if (j.contains("min_revenue_growth"))
        min_revenue_growth = j.at("min_revenue_growth").get<double>();
    if (j.contains("min_return_on_equity"))
        min_return_on_equity = j.at("min_return_on_equity").get<double>();
    if (j.contains("max_debt_to_equity"))
        max_debt_to_equity = j.at("max_debt_to_equity").get<double>();
    if (j.contains("missing_debt_to_equity"))
        missing_debt_to_equity = j.at("missing_debt_to_equity").get<double>();
    if (j.contains("max_trailing_pe"))
        max_trailing_pe = j.at("max_trailing_pe").get<double>();
}

Screener::Screener(ScreeningConfig config) : config_(std::move(config)) {}

bool Screener::passes(Strategy strategy, const Fundamentals& info) const {
    switch (strategy) {
        case Strategy::ETHICAL:
            return passes_ethical(info);
        case Strategy::GROWTH:
            return passes_growth(info);
        case Strategy::QUALITY:
            return passes_quality(info);
        case Strategy::VALUE:
            return passes_value(info);
        case Strategy::INDEX:
        default:
            return false;
    }
}

bool Screener::passes_ethical(const Fundamentals& info) const {
    if (!info.sector.has_value()) {
        return config_.missing_sector_passes;
    }
    const auto& excluded = config_.excluded_sectors;
    return std::find(excluded.begin(), excluded.end(), *info.sector) == excluded.end();
}

bool Screener::passes_growth(const Fundamentals& info) const {
    return info.revenue_growth.has_value() && *info.revenue_growth > config_.min_revenue_growth;
}

bool Screener::passes_quality(const Fundamentals& info) const {
    if (!info.return_on_equity.has_value() ||
        !(*info.return_on_equity > config_.min_return_on_equity)) {
        return false;
    }
    double debt_to_equity = info.debt_to_equity.value_or(config_.missing_debt_to_equity);
    return debt_to_equity < config_.max_debt_to_equity;
}

bool Screener::passes_value(const Fundamentals& info) const {
    return info.trailing_pe.has_value() && *info.trailing_pe > 0.0 &&
           *info.trailing_pe < config_.max_trailing_pe;
}

}  // namespace stock_advisor
