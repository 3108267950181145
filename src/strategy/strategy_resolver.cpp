// src/strategy/strategy_resolver.cpp
#include "stock_advisor/strategy/strategy_resolver.hpp"
#include <algorithm>
#include <unordered_set>
#include "stock_advisor/core/logger.hpp"

namespace stock_advisor {

nlohmann::json ResolverConfig::to_json() const {
    nlohmann::json j;
    j["mode"] = resolution_mode_to_string(mode);
    j["max_strategies"] = max_strategies;
    j["max_portfolio_size"] = max_portfolio_size;
    j["fallback_ticker"] = fallback_ticker;

    nlohmann::json baskets_json = nlohmann::json::object();
    for (const auto& [strategy, tickers] : baskets) {
        baskets_json[strategy_key(strategy)] = tickers;
    }
    j["baskets"] = baskets_json;
    j["screening"] = screening.to_json();
    return j;
}

void ResolverConfig::from_json(const nlohmann::json& j) {
    if (j.contains("mode"))
        mode = resolution_mode_from_string(j.at("mode").get<std::string>(), mode);
    if (j.contains("max_strategies"))
        max_strategies = j.at("max_strategies").get<size_t>();
    if (j.contains("max_portfolio_size"))
        max_portfolio_size = j.at("max_portfolio_size").get<size_t>();
    if (j.contains("fallback_ticker"))
        fallback_ticker = j.at("fallback_ticker").get<std::string>();
    if (j.contains("baskets")) {
        for (const auto& [key, tickers] : j.at("baskets").items()) {
            auto strategy = parse_strategy(key);
            if (strategy.is_error()) {
                throw std::invalid_argument(strategy.error()->what());
            }
            baskets[strategy.value()] = tickers.get<std::vector<std::string>>();
        }
    }
    if (j.contains("screening"))
        screening.from_json(j.at("screening"));
}

StrategyResolver::StrategyResolver(ResolverConfig config)
    : config_(std::move(config)), screener_(config_.screening) {}

const std::vector<std::string>& StrategyResolver::basket(Strategy strategy) const {
    static const std::vector<std::string> empty;
    auto it = config_.baskets.find(strategy);
    return it != config_.baskets.end() ? it->second : empty;
}

bool StrategyResolver::needs_fundamentals(const std::vector<Strategy>& strategies) const {
    if (config_.mode != ResolutionMode::DYNAMIC) {
        return false;
    }
    return std::any_of(strategies.begin(), strategies.end(),
                       [](Strategy s) { return s != Strategy::INDEX; });
}

bool StrategyResolver::is_index_member(const std::string& ticker) const {
    const auto& index = basket(Strategy::INDEX);
    return std::find(index.begin(), index.end(), ticker) != index.end();
}

std::vector<std::string> StrategyResolver::screen(Strategy strategy,
                                                  const std::vector<std::string>& universe,
                                                  const FundamentalsMap& fundamentals) const {
    std::vector<std::string> selected;
    for (const auto& ticker : universe) {
        if (is_index_member(ticker)) {
            continue;
        }

        auto it = fundamentals.find(ticker);
        if (it == fundamentals.end()) {
            TRACE("No fundamentals for " << ticker << ", skipping");
            continue;
        }

        if (screener_.passes(strategy, it->second)) {
            selected.push_back(ticker);
        }
    }

    DEBUG(strategy_to_string(strategy) << " screen kept " << selected.size() << " of "
                                       << universe.size() << " candidates");
    return selected;
}

Result<std::vector<std::string>> StrategyResolver::resolve(
    const std::vector<Strategy>& strategies, const std::vector<std::string>& universe,
    const FundamentalsMap& fundamentals) const {
    Logger::register_component("StrategyResolver");

    if (strategies.empty() || strategies.size() > config_.max_strategies) {
        return make_error<std::vector<std::string>>(
            ErrorCode::INVALID_ARGUMENT,
            "Expected between 1 and " + std::to_string(config_.max_strategies) +
                " strategies, got " + std::to_string(strategies.size()),
            "StrategyResolver");
    }

    std::vector<std::string> selected;
    for (Strategy strategy : strategies) {
        std::vector<std::string> tickers;
        if (strategy == Strategy::INDEX || config_.mode == ResolutionMode::STATIC) {
            tickers = basket(strategy);
        } else {
            tickers = screen(strategy, universe, fundamentals);
        }
        selected.insert(selected.end(), tickers.begin(), tickers.end());
    }

    if (selected.empty() && config_.mode == ResolutionMode::DYNAMIC) {
        WARN("No candidates passed screening, falling back to " << config_.fallback_ticker);
        return Result<std::vector<std::string>>(
            std::vector<std::string>{config_.fallback_ticker});
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    for (const auto& ticker : selected) {
        if (seen.insert(ticker).second) {
            unique.push_back(ticker);
        }
    }

    if (unique.size() > config_.max_portfolio_size) {
        DEBUG("Truncating " << unique.size() << " tickers to " << config_.max_portfolio_size);
        unique.resize(config_.max_portfolio_size);
    }

    INFO("Resolved " << strategies.size() << " strategies to " << unique.size() << " tickers");
    return Result<std::vector<std::string>>(std::move(unique));
}

Result<std::vector<std::string>> StrategyResolver::resolve(
    const std::vector<Strategy>& strategies) const {
    return resolve(strategies, {}, {});
}

}  // namespace stock_advisor
