// include/stock_advisor/strategy/strategy_types.hpp
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "stock_advisor/core/error.hpp"

namespace stock_advisor {

/**
 * @brief Investment themes a request may ask for
 */
enum class Strategy { ETHICAL, GROWTH, INDEX, QUALITY, VALUE };

/**
 * @brief How non-index strategies are turned into tickers
 */
enum class ResolutionMode {
    STATIC,  // Hand-curated basket per strategy
    DYNAMIC  // Screen a candidate universe against fundamentals
};

/**
 * @brief Display name, e.g. "Growth Investing"
 */
std::string strategy_to_string(Strategy strategy);

/**
 * @brief Short key, e.g. "growth"
 */
std::string strategy_key(Strategy strategy);

/**
 * @brief Parse a display name or short key, case-insensitively
 * @return INVALID_STRATEGY for anything outside the enumerated set
 */
Result<Strategy> parse_strategy(const std::string& name);

/**
 * @brief Parse every name, failing on the first unknown one
 */
Result<std::vector<Strategy>> parse_strategies(const std::vector<std::string>& names);

const std::vector<Strategy>& all_strategies();

std::string resolution_mode_to_string(ResolutionMode mode);
ResolutionMode resolution_mode_from_string(const std::string& mode,
                                           ResolutionMode fallback = ResolutionMode::DYNAMIC);

/**
 * @brief Fundamental attributes of an instrument
 * Every attribute may be absent; absence is never read as zero
 */
struct Fundamentals {
    std::optional<std::string> sector;
    std::optional<double> revenue_growth;    // Fraction, 0.15 == 15%
    std::optional<double> return_on_equity;  // Fraction
    std::optional<double> debt_to_equity;    // Percent, 50 == 0.5x
    std::optional<double> trailing_pe;
};

using FundamentalsMap = std::unordered_map<std::string, Fundamentals>;

}  // namespace stock_advisor
