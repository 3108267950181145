// src/data/snapshot_provider.cpp
#include "stock_advisor/data/snapshot_provider.hpp"
#include <fstream>
#include "stock_advisor/core/logger.hpp"
#include "stock_advisor/core/time_utils.hpp"
#include "stock_advisor/data/price_history_loader.hpp"

namespace stock_advisor {

namespace {

std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

Fundamentals parse_fundamentals(const nlohmann::json& j) {
    Fundamentals info;
    if (j.contains("sector") && j.at("sector").is_string()) {
        info.sector = j.at("sector").get<std::string>();
    }
    info.revenue_growth = optional_number(j, "revenueGrowth");
    info.return_on_equity = optional_number(j, "returnOnEquity");
    info.debt_to_equity = optional_number(j, "debtToEquity");
    info.trailing_pe = optional_number(j, "trailingPE");
    return info;
}

Result<PriceHistory> parse_history(const nlohmann::json& j) {
    std::vector<Timestamp> dates;
    for (const auto& label : j.value("dates", nlohmann::json::array())) {
        Timestamp ts;
        if (!core::parse_date(label.get<std::string>(), ts)) {
            return make_error<PriceHistory>(ErrorCode::INVALID_DATA,
                                            "Unparseable history date: " + label.dump(),
                                            "SnapshotMarketDataProvider");
        }
        dates.push_back(ts);
    }

    FlatByTicker flat;
    if (j.contains("closes")) {
        for (const auto& [ticker, values] : j.at("closes").items()) {
            PriceSeries series;
            for (const auto& value : values) {
                series.push_back(value.is_null() ? std::nullopt
                                                 : std::optional<double>(value.get<double>()));
            }
            flat.columns.emplace(ticker, std::move(series));
        }
    }

    return PriceHistory::create(std::move(dates), std::move(flat));
}

}  // namespace

SnapshotMarketDataProvider::SnapshotMarketDataProvider(PriceQuote prices,
                                                       FundamentalsMap fundamentals,
                                                       PriceHistory history)
    : prices_(std::move(prices)),
      fundamentals_(std::move(fundamentals)),
      history_(std::move(history)) {}

Result<std::shared_ptr<SnapshotMarketDataProvider>> SnapshotMarketDataProvider::from_json(
    const nlohmann::json& j) {
    using ProviderPtr = std::shared_ptr<SnapshotMarketDataProvider>;

    try {
        PriceQuote prices;
        if (j.contains("prices")) {
            for (const auto& [ticker, price] : j.at("prices").items()) {
                if (!price.is_null())
                    prices[ticker] = price.get<double>();
            }
        }

        FundamentalsMap fundamentals;
        if (j.contains("fundamentals")) {
            for (const auto& [ticker, info] : j.at("fundamentals").items()) {
                if (info.is_object() && !info.empty())
                    fundamentals[ticker] = parse_fundamentals(info);
            }
        }

        PriceHistory history;
        if (j.contains("history")) {
            auto parsed = parse_history(j.at("history"));
            if (parsed.is_error()) {
                return make_error<ProviderPtr>(parsed.error()->code(), parsed.error()->what(),
                                               "SnapshotMarketDataProvider");
            }
            history = parsed.value();
        }

        return Result<ProviderPtr>(std::make_shared<SnapshotMarketDataProvider>(
            std::move(prices), std::move(fundamentals), std::move(history)));
    } catch (const nlohmann::json::exception& e) {
        return make_error<ProviderPtr>(ErrorCode::INVALID_DATA,
                                       std::string("Malformed snapshot: ") + e.what(),
                                       "SnapshotMarketDataProvider");
    }
}

Result<std::shared_ptr<SnapshotMarketDataProvider>> SnapshotMarketDataProvider::load(
    const std::string& snapshot_path, const std::optional<std::string>& history_csv) {
    using ProviderPtr = std::shared_ptr<SnapshotMarketDataProvider>;
    Logger::register_component("SnapshotMarketDataProvider");

    std::ifstream file(snapshot_path);
    if (!file.is_open()) {
        return make_error<ProviderPtr>(ErrorCode::FILE_NOT_FOUND,
                                       "Failed to open snapshot: " + snapshot_path,
                                       "SnapshotMarketDataProvider");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<ProviderPtr>(ErrorCode::JSON_PARSE_ERROR,
                                       "Malformed snapshot " + snapshot_path + ": " + e.what(),
                                       "SnapshotMarketDataProvider");
    }

    auto provider = from_json(j);
    if (provider.is_error() || !history_csv.has_value()) {
        return provider;
    }

    auto history = PriceHistoryLoader::from_csv(*history_csv);
    if (history.is_error()) {
        return make_error<ProviderPtr>(history.error()->code(), history.error()->what(),
                                       "SnapshotMarketDataProvider");
    }
    provider.value()->history_ = history.value();

    INFO("Loaded snapshot with " << provider.value()->prices_.size() << " quotes and "
                                 << provider.value()->history_.num_rows() << " history rows");
    return provider;
}

Result<PriceQuote> SnapshotMarketDataProvider::get_live_prices(
    const std::vector<std::string>& tickers) {
    PriceQuote quotes;
    for (const auto& ticker : tickers) {
        auto it = prices_.find(ticker);
        if (it != prices_.end()) {
            quotes.emplace(it->first, it->second);
        } else {
            DEBUG("No quote for " << ticker << " in snapshot");
        }
    }
    return Result<PriceQuote>(std::move(quotes));
}

Result<PriceHistory> SnapshotMarketDataProvider::get_historical_closes(
    const std::vector<std::string>& tickers) {
    return Result<PriceHistory>(history_.select(tickers));
}

Result<FundamentalsMap> SnapshotMarketDataProvider::get_fundamentals(
    const std::vector<std::string>& tickers) {
    FundamentalsMap subset;
    for (const auto& ticker : tickers) {
        auto it = fundamentals_.find(ticker);
        if (it != fundamentals_.end()) {
            subset.emplace(it->first, it->second);
        }
    }
    return Result<FundamentalsMap>(std::move(subset));
}

}  // namespace stock_advisor
