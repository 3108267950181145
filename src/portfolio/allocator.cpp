// src/portfolio/allocator.cpp
#include "stock_advisor/portfolio/allocator.hpp"
#include <cmath>
#include <limits>
#include "stock_advisor/core/logger.hpp"

namespace stock_advisor {

nlohmann::json AllocatorConfig::to_json() const {
    nlohmann::json j;
    j["lookback_window"] = lookback_window;
    j["min_periods"] = min_periods;
    j["trend_exponent"] = trend_exponent;
    return j;
}

void AllocatorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("lookback_window"))
        lookback_window = j.at("lookback_window").get<int>();
    if (j.contains("min_periods"))
        min_periods = j.at("min_periods").get<int>();
    if (j.contains("trend_exponent"))
        trend_exponent = j.at("trend_exponent").get<double>();
}

Allocator::Allocator(AllocatorConfig config) : config_(std::move(config)) {}

std::optional<double> Allocator::moving_average(const PriceSeries& closes) const {
    if (closes.empty() || config_.lookback_window <= 0) {
        return std::nullopt;
    }

    size_t window = static_cast<size_t>(config_.lookback_window);
    size_t start = closes.size() > window ? closes.size() - window : 0;

    double sum = 0.0;
    int count = 0;
    for (size_t i = start; i < closes.size(); ++i) {
        if (closes[i].has_value()) {
            sum += *closes[i];
            ++count;
        }
    }

    if (count == 0 || count < config_.min_periods) {
        return std::nullopt;
    }
    return sum / count;
}

std::vector<std::pair<std::string, double>> Allocator::compute_weights(
    const std::vector<std::string>& tickers, const PriceQuote& prices,
    const PriceHistory* history) const {
    std::vector<std::pair<std::string, double>> weights;
    weights.reserve(tickers.size());

    const bool trend = history != nullptr && !history->empty();
    const bool sole = tickers.size() == 1;

    for (const auto& ticker : tickers) {
        double weight = 1.0;

        auto quote = prices.find(ticker);
        if (trend && quote != prices.end()) {
            auto sma = moving_average(history->closes(ticker, sole));
            if (sma.has_value() && *sma > 0.0) {
                double score = quote->second / *sma;
                weight = std::pow(score, config_.trend_exponent);
                TRACE(ticker << " price/sma=" << score << " weight=" << weight);
            }
        }
        weights.emplace_back(ticker, weight);
    }

    double total = 0.0;
    for (const auto& [_, weight] : weights) {
        total += weight;
    }

    for (auto& [_, weight] : weights) {
        weight = total > 0.0 ? weight / total : 1.0 / static_cast<double>(weights.size());
    }
    return weights;
}

Result<AllocationResult> Allocator::allocate(double amount,
                                             const std::vector<std::string>& tickers,
                                             const PriceQuote& prices,
                                             const PriceHistory* history) const {
    Logger::register_component("Allocator");

    if (tickers.empty()) {
        return make_error<AllocationResult>(ErrorCode::EMPTY_TICKER_LIST,
                                            "Tickers list cannot be empty", "Allocator");
    }
    if (!std::isfinite(amount) || amount <= 0.0) {
        return make_error<AllocationResult>(ErrorCode::INVALID_ARGUMENT,
                                            "Amount must be positive, got " +
                                                std::to_string(amount),
                                            "Allocator");
    }

    AllocationResult result;
    result.weights = compute_weights(tickers, prices, history);

    double total_used = 0.0;
    for (const auto& [ticker, weight] : result.weights) {
        auto quote = prices.find(ticker);
        if (quote == prices.end()) {
            WARN("No live price for " << ticker << ", skipping");
            continue;
        }

        double price = quote->second;
        if (!(price > 0.0)) {
            WARN("Non-positive price " << price << " for " << ticker << ", skipping");
            continue;
        }

        double target = amount * weight;
        double whole_shares = std::floor(target / price);
        if (!std::isfinite(whole_shares) ||
            whole_shares >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            WARN("Share count for " << ticker << " at " << price
                                    << " is not representable, skipping");
            continue;
        }

        auto shares = static_cast<int64_t>(whole_shares);
        if (shares <= 0) {
            DEBUG(ticker << " at " << price << " does not fit target " << target);
            continue;
        }

        double allocated = static_cast<double>(shares) * price;
        total_used += allocated;
        result.holdings.emplace_back(ticker, allocated, shares, round_to_cents(weight * 100.0));
    }

    result.leftover_cash = amount - total_used;

    INFO("Allocated " << total_used << " of " << amount << " across " << result.holdings.size()
                      << " holdings, leftover " << result.leftover_cash);
    return Result<AllocationResult>(std::move(result));
}

}  // namespace stock_advisor
