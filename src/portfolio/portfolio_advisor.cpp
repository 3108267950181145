// src/portfolio/portfolio_advisor.cpp
#include "stock_advisor/portfolio/portfolio_advisor.hpp"
#include <cmath>
#include <stdexcept>
#include "stock_advisor/portfolio/valuation.hpp"

namespace stock_advisor {

nlohmann::json AdvisorConfig::to_json() const {
    nlohmann::json j;
    j["min_investment_usd"] = min_investment_usd;
    j["use_trend_weighting"] = use_trend_weighting;
    j["candidate_universe"] = candidate_universe;
    j["resolver"] = resolver.to_json();
    j["allocator"] = allocator.to_json();
    j["trend"] = trend.to_json();
    j["logger"] = logger.to_json();
    return j;
}

void AdvisorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_investment_usd"))
        min_investment_usd = j.at("min_investment_usd").get<double>();
    if (j.contains("use_trend_weighting"))
        use_trend_weighting = j.at("use_trend_weighting").get<bool>();
    if (j.contains("candidate_universe"))
        candidate_universe = j.at("candidate_universe").get<std::vector<std::string>>();
    if (j.contains("resolver"))
        resolver.from_json(j.at("resolver"));
    if (j.contains("allocator"))
        allocator.from_json(j.at("allocator"));
    if (j.contains("trend"))
        trend.from_json(j.at("trend"));
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
}

Result<PortfolioRequest> PortfolioRequest::parse(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("investment_amount") ||
        !j.at("investment_amount").is_number()) {
        return make_error<PortfolioRequest>(ErrorCode::INVALID_ARGUMENT,
                                            "investment_amount must be a number",
                                            "PortfolioRequest");
    }
    if (!j.contains("strategies") || !j.at("strategies").is_array()) {
        return make_error<PortfolioRequest>(ErrorCode::INVALID_ARGUMENT,
                                            "strategies must be a list of names",
                                            "PortfolioRequest");
    }

    PortfolioRequest request;
    request.investment_amount = j.at("investment_amount").get<double>();
    for (const auto& name : j.at("strategies")) {
        if (!name.is_string()) {
            return make_error<PortfolioRequest>(ErrorCode::INVALID_ARGUMENT,
                                                "strategies must be a list of names",
                                                "PortfolioRequest");
        }
        request.strategies.push_back(name.get<std::string>());
    }
    return Result<PortfolioRequest>(std::move(request));
}

Result<double> PortfolioRequest::parse_amount(const std::string& text) {
    size_t consumed = 0;
    double amount = 0.0;
    try {
        amount = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }

    if (consumed == 0 || consumed != text.size()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid amount: '" + text + "'",
                                  "PortfolioRequest");
    }
    return Result<double>(amount);
}

nlohmann::json PortfolioSuggestion::to_json() const {
    nlohmann::json j;

    j["suggested_holdings"] = nlohmann::json::array();
    for (const auto& holding : suggested_holdings) {
        j["suggested_holdings"].push_back({{"ticker", holding.symbol},
                                           {"allocated_usd", holding.allocated_usd},
                                           {"shares_purchased", holding.shares_purchased}});
    }

    j["current_total_value_usd"] = current_total_value_usd;

    j["weekly_value_trend"] = nlohmann::json::array();
    for (const auto& point : weekly_value_trend) {
        j["weekly_value_trend"].push_back(
            {{"date", point.date}, {"portfolio_value_usd", point.portfolio_value_usd}});
    }

    j["leftover_cash_usd"] = leftover_cash_usd;
    return j;
}

nlohmann::json error_to_json(const AdvisorError& error) {
    return {{"error",
             {{"code", error_code_to_string(error.code())},
              {"component", error.component()},
              {"message", error.what()}}}};
}

PortfolioAdvisor::PortfolioAdvisor(AdvisorConfig config,
                                   std::shared_ptr<MarketDataProvider> provider)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      resolver_(config_.resolver),
      allocator_(config_.allocator),
      trend_(config_.trend) {
    if (!provider_) {
        throw std::invalid_argument("PortfolioAdvisor requires a market data provider");
    }
}

Result<void> PortfolioAdvisor::validate(const PortfolioRequest& request) const {
    if (!std::isfinite(request.investment_amount) ||
        request.investment_amount < config_.min_investment_usd) {
        return make_error<void>(ErrorCode::INVALID_AMOUNT,
                                "Investment amount must be at least " +
                                    std::to_string(config_.min_investment_usd) + " USD",
                                "PortfolioAdvisor");
    }

    const size_t count = request.strategies.size();
    if (count == 0 || count > config_.resolver.max_strategies) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Expected between 1 and " +
                                    std::to_string(config_.resolver.max_strategies) +
                                    " strategies, got " + std::to_string(count),
                                "PortfolioAdvisor");
    }
    return Result<void>();
}

Result<PortfolioSuggestion> PortfolioAdvisor::suggest(const PortfolioRequest& request) const {
    Logger::register_component("PortfolioAdvisor");

    auto valid = validate(request);
    if (valid.is_error()) {
        WARN("Rejected request: " << valid.error()->what());
        return make_error<PortfolioSuggestion>(valid.error()->code(), valid.error()->what(),
                                               "PortfolioAdvisor");
    }

    auto strategies = parse_strategies(request.strategies);
    if (strategies.is_error()) {
        WARN("Rejected request: " << strategies.error()->what());
        return make_error<PortfolioSuggestion>(strategies.error()->code(),
                                               strategies.error()->what(), "PortfolioAdvisor");
    }

    FundamentalsMap fundamentals;
    if (resolver_.needs_fundamentals(strategies.value())) {
        auto fetched = provider_->get_fundamentals(config_.candidate_universe);
        if (fetched.is_ok()) {
            fundamentals = fetched.value();
        } else {
            WARN("Fundamentals unavailable, screening without them: "
                 << fetched.error()->what());
        }
    }

    auto tickers =
        resolver_.resolve(strategies.value(), config_.candidate_universe, fundamentals);
    if (tickers.is_error()) {
        return make_error<PortfolioSuggestion>(tickers.error()->code(), tickers.error()->what(),
                                               tickers.error()->component());
    }
    if (tickers.value().empty()) {
        return make_error<PortfolioSuggestion>(ErrorCode::EMPTY_TICKER_LIST,
                                               "No valid tickers found for the given strategies",
                                               "PortfolioAdvisor");
    }

    auto prices = provider_->get_live_prices(tickers.value());
    if (prices.is_error()) {
        return make_error<PortfolioSuggestion>(
            ErrorCode::MARKET_DATA_ERROR,
            std::string("Failed to fetch live prices: ") + prices.error()->what(),
            "PortfolioAdvisor");
    }

    auto history = provider_->get_historical_closes(tickers.value());
    if (history.is_error()) {
        return make_error<PortfolioSuggestion>(
            ErrorCode::MARKET_DATA_ERROR,
            std::string("Failed to fetch historical data: ") + history.error()->what(),
            "PortfolioAdvisor");
    }

    const PriceHistory* weighting_history =
        config_.use_trend_weighting ? &history.value() : nullptr;
    auto allocation =
        allocator_.allocate(request.investment_amount, tickers.value(), prices.value(),
                            weighting_history);
    if (allocation.is_error()) {
        return make_error<PortfolioSuggestion>(allocation.error()->code(),
                                               allocation.error()->what(),
                                               allocation.error()->component());
    }

    const AllocationResult& allocated = allocation.value();

    PortfolioSuggestion suggestion;
    for (const auto& holding : allocated.holdings) {
        suggestion.suggested_holdings.emplace_back(holding.symbol,
                                                   round_to_cents(holding.allocated_usd),
                                                   holding.shares_purchased, holding.weight_pct);
    }
    suggestion.current_total_value_usd =
        round_to_cents(Valuation::value(allocated, prices.value()));
    suggestion.weekly_value_trend = trend_.trend(allocated, history.value());
    suggestion.leftover_cash_usd = round_to_cents(allocated.leftover_cash);

    INFO("Suggested " << suggestion.suggested_holdings.size() << " holdings worth "
                      << suggestion.current_total_value_usd << " with "
                      << suggestion.leftover_cash_usd << " left over");
    return Result<PortfolioSuggestion>(std::move(suggestion));
}

}  // namespace stock_advisor
