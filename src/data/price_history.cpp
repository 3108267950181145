// src/data/price_history.cpp
#include "stock_advisor/data/price_history.hpp"
#include <algorithm>
#include <numeric>
#include "stock_advisor/core/time_utils.hpp"

namespace stock_advisor {

namespace {

PriceSeries reorder(const PriceSeries& series, const std::vector<size_t>& order) {
    PriceSeries out;
    out.reserve(order.size());
    for (size_t idx : order) {
        out.push_back(series[idx]);
    }
    return out;
}

}  // namespace

std::string shape_to_string(PriceHistory::Shape shape) {
    switch (shape) {
        case PriceHistory::Shape::FLAT_BY_TICKER:
            return "FLAT_BY_TICKER";
        case PriceHistory::Shape::COMPOSITE_KEYED:
            return "COMPOSITE_KEYED";
        case PriceHistory::Shape::SINGLE_SERIES:
            return "SINGLE_SERIES";
        default:
            return "UNKNOWN";
    }
}

Result<PriceHistory> PriceHistory::create(std::vector<Timestamp> dates, Table table) {
    const size_t rows = dates.size();
    auto length_error = [rows](const std::string& column, size_t length) {
        return make_error<PriceHistory>(ErrorCode::INVALID_DATA,
                                        "Column " + column + " has " + std::to_string(length) +
                                            " values for " + std::to_string(rows) + " dates",
                                        "PriceHistory");
    };

    if (auto* flat = std::get_if<FlatByTicker>(&table)) {
        for (const auto& [ticker, series] : flat->columns) {
            if (series.size() != rows)
                return length_error(ticker, series.size());
        }
    } else if (auto* composite = std::get_if<CompositeKeyed>(&table)) {
        for (const auto& [key, series] : composite->columns) {
            if (series.size() != rows)
                return length_error(key.first + "/" + key.second, series.size());
        }
    } else if (auto* single = std::get_if<SingleSeries>(&table)) {
        if (single->close.size() != rows)
            return length_error(CLOSE_FIELD, single->close.size());
    }

    if (!std::is_sorted(dates.begin(), dates.end())) {
        std::vector<size_t> order(rows);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&dates](size_t a, size_t b) { return dates[a] < dates[b]; });

        std::vector<Timestamp> sorted_dates;
        sorted_dates.reserve(rows);
        for (size_t idx : order) {
            sorted_dates.push_back(dates[idx]);
        }
        dates = std::move(sorted_dates);

        if (auto* flat = std::get_if<FlatByTicker>(&table)) {
            for (auto& [_, series] : flat->columns)
                series = reorder(series, order);
        } else if (auto* composite = std::get_if<CompositeKeyed>(&table)) {
            for (auto& [_, series] : composite->columns)
                series = reorder(series, order);
        } else if (auto* single = std::get_if<SingleSeries>(&table)) {
            single->close = reorder(single->close, order);
        }
    }

    return Result<PriceHistory>(PriceHistory(std::move(dates), std::move(table)));
}

bool PriceHistory::empty() const {
    if (dates_.empty()) {
        return true;
    }
    if (auto* flat = std::get_if<FlatByTicker>(&table_)) {
        return flat->columns.empty();
    }
    if (auto* composite = std::get_if<CompositeKeyed>(&table_)) {
        return composite->columns.empty();
    }
    return false;
}

PriceHistory::Shape PriceHistory::shape() const {
    if (std::holds_alternative<CompositeKeyed>(table_)) {
        return Shape::COMPOSITE_KEYED;
    }
    if (std::holds_alternative<SingleSeries>(table_)) {
        return Shape::SINGLE_SERIES;
    }
    return Shape::FLAT_BY_TICKER;
}

const PriceSeries* PriceHistory::find_series(const std::string& ticker, bool sole_holding) const {
    if (auto* flat = std::get_if<FlatByTicker>(&table_)) {
        auto it = flat->columns.find(ticker);
        return it != flat->columns.end() ? &it->second : nullptr;
    }

    if (auto* composite = std::get_if<CompositeKeyed>(&table_)) {
        auto it = composite->columns.find(std::make_pair(ticker, std::string(CLOSE_FIELD)));
        if (it != composite->columns.end()) {
            return &it->second;
        }
        // No Close field for this ticker: use its first recorded field
        auto fields = composite->fields.find(ticker);
        if (fields == composite->fields.end() || fields->second.empty()) {
            return nullptr;
        }
        auto first = composite->columns.find(std::make_pair(ticker, fields->second.front()));
        return first != composite->columns.end() ? &first->second : nullptr;
    }

    const auto& single = std::get<SingleSeries>(table_);
    if (single.symbol.has_value()) {
        return (*single.symbol == ticker || sole_holding) ? &single.close : nullptr;
    }
    return sole_holding ? &single.close : nullptr;
}

std::optional<double> PriceHistory::close_at(const std::string& ticker, size_t row,
                                             bool sole_holding) const {
    if (row >= dates_.size()) {
        return std::nullopt;
    }
    const PriceSeries* series = find_series(ticker, sole_holding);
    if (series == nullptr) {
        return std::nullopt;
    }
    return (*series)[row];
}

PriceSeries PriceHistory::closes(const std::string& ticker, bool sole_holding) const {
    const PriceSeries* series = find_series(ticker, sole_holding);
    return series ? *series : PriceSeries{};
}

std::string PriceHistory::date_label(size_t row) const {
    if (row >= dates_.size()) {
        return "";
    }
    return core::format_date(dates_[row]);
}

std::vector<std::string> PriceHistory::symbols() const {
    std::vector<std::string> out;
    if (auto* flat = std::get_if<FlatByTicker>(&table_)) {
        for (const auto& [ticker, _] : flat->columns)
            out.push_back(ticker);
        std::sort(out.begin(), out.end());
    } else if (auto* composite = std::get_if<CompositeKeyed>(&table_)) {
        for (const auto& [ticker, _] : composite->fields)
            out.push_back(ticker);
        std::sort(out.begin(), out.end());
    } else if (auto* single = std::get_if<SingleSeries>(&table_)) {
        if (single->symbol.has_value())
            out.push_back(*single->symbol);
    }
    return out;
}

PriceHistory PriceHistory::select(const std::vector<std::string>& tickers) const {
    if (auto* flat = std::get_if<FlatByTicker>(&table_)) {
        FlatByTicker subset;
        for (const auto& ticker : tickers) {
            auto it = flat->columns.find(ticker);
            if (it != flat->columns.end())
                subset.columns.emplace(it->first, it->second);
        }
        return PriceHistory(dates_, std::move(subset));
    }

    if (auto* composite = std::get_if<CompositeKeyed>(&table_)) {
        CompositeKeyed subset;
        for (const auto& ticker : tickers) {
            auto fields = composite->fields.find(ticker);
            if (fields == composite->fields.end())
                continue;
            for (const auto& field : fields->second) {
                subset.add(ticker, field, composite->columns.at(std::make_pair(ticker, field)));
            }
        }
        return PriceHistory(dates_, std::move(subset));
    }

    return *this;
}

}  // namespace stock_advisor
