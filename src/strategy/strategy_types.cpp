// src/strategy/strategy_types.cpp
#include "stock_advisor/strategy/strategy_types.hpp"
#include <algorithm>
#include <cctype>

namespace stock_advisor {

namespace {

std::string normalize(const std::string& name) {
    auto begin = std::find_if_not(name.begin(), name.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(name.rbegin(), name.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();

    std::string out;
    if (begin < end) {
        out.assign(begin, end);
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::string strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::ETHICAL:
            return "Ethical Investing";
        case Strategy::GROWTH:
            return "Growth Investing";
        case Strategy::INDEX:
            return "Index Investing";
        case Strategy::QUALITY:
            return "Quality Investing";
        case Strategy::VALUE:
            return "Value Investing";
        default:
            return "Unknown";
    }
}

std::string strategy_key(Strategy strategy) {
    switch (strategy) {
        case Strategy::ETHICAL:
            return "ethical";
        case Strategy::GROWTH:
            return "growth";
        case Strategy::INDEX:
            return "index";
        case Strategy::QUALITY:
            return "quality";
        case Strategy::VALUE:
            return "value";
        default:
            return "unknown";
    }
}

const std::vector<Strategy>& all_strategies() {
    static const std::vector<Strategy> strategies = {Strategy::ETHICAL, Strategy::GROWTH,
                                                     Strategy::INDEX, Strategy::QUALITY,
                                                     Strategy::VALUE};
    return strategies;
}

Result<Strategy> parse_strategy(const std::string& name) {
    const std::string wanted = normalize(name);
    for (Strategy strategy : all_strategies()) {
        if (wanted == strategy_key(strategy) ||
            wanted == normalize(strategy_to_string(strategy))) {
            return Result<Strategy>(strategy);
        }
    }

    std::string allowed;
    for (Strategy strategy : all_strategies()) {
        if (!allowed.empty())
            allowed += ", ";
        allowed += strategy_to_string(strategy);
    }
    return make_error<Strategy>(ErrorCode::INVALID_STRATEGY,
                                "Invalid strategy '" + name + "'. Allowed strategies: " + allowed,
                                "StrategyTypes");
}

Result<std::vector<Strategy>> parse_strategies(const std::vector<std::string>& names) {
    std::vector<Strategy> strategies;
    strategies.reserve(names.size());
    for (const auto& name : names) {
        auto parsed = parse_strategy(name);
        if (parsed.is_error()) {
            return make_error<std::vector<Strategy>>(parsed.error()->code(),
                                                     parsed.error()->what(),
                                                     parsed.error()->component());
        }
        strategies.push_back(parsed.value());
    }
    return Result<std::vector<Strategy>>(std::move(strategies));
}

std::string resolution_mode_to_string(ResolutionMode mode) {
    return mode == ResolutionMode::STATIC ? "STATIC" : "DYNAMIC";
}

ResolutionMode resolution_mode_from_string(const std::string& mode, ResolutionMode fallback) {
    const std::string wanted = normalize(mode);
    if (wanted == "static")
        return ResolutionMode::STATIC;
    if (wanted == "dynamic")
        return ResolutionMode::DYNAMIC;
    return fallback;
}

}  // namespace stock_advisor
