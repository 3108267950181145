// include/stock_advisor/data/price_history.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/core/types.hpp"

namespace stock_advisor {

/**
 * @brief One column of closing prices, aligned with PriceHistory::dates()
 * A missing observation is nullopt
 */
using PriceSeries = std::vector<std::optional<double>>;

/**
 * @brief Columns keyed directly by ticker
 */
struct FlatByTicker {
    std::unordered_map<std::string, PriceSeries> columns;
};

/**
 * @brief Columns keyed by (ticker, field), e.g. ("AAPL", "Close")
 */
struct CompositeKeyed {
    std::map<std::pair<std::string, std::string>, PriceSeries> columns;
    std::unordered_map<std::string, std::vector<std::string>> fields;  // Per ticker, in table order

    void add(const std::string& ticker, const std::string& field, PriceSeries series) {
        auto key = std::make_pair(ticker, field);
        if (columns.find(key) == columns.end()) {
            fields[ticker].push_back(field);
        }
        columns[key] = std::move(series);
    }
};

/**
 * @brief A single unlabeled "Close" column
 * symbol is set when the producer knows which instrument the column belongs to
 */
struct SingleSeries {
    std::optional<std::string> symbol;
    PriceSeries close;
};

/**
 * @brief Historical closing prices, ascending by date
 *
 * The table shape is fixed when the history is built, so lookups dispatch on the variant
 * instead of probing column names.
 */
class PriceHistory {
public:
    enum class Shape { FLAT_BY_TICKER, COMPOSITE_KEYED, SINGLE_SERIES };
    using Table = std::variant<FlatByTicker, CompositeKeyed, SingleSeries>;

    static constexpr const char* CLOSE_FIELD = "Close";

    PriceHistory() = default;

    /**
     * @brief Build a history, sorting rows ascending by date
     * @return INVALID_DATA if any column length differs from the number of dates
     */
    static Result<PriceHistory> create(std::vector<Timestamp> dates, Table table);

    size_t num_rows() const { return dates_.size(); }

    /**
     * @brief True when there are no rows or no price columns
     */
    bool empty() const;

    Shape shape() const;

    const std::vector<Timestamp>& dates() const { return dates_; }
    const Table& table() const { return table_; }

    /**
     * @brief Closing price of a ticker on a row
     * @param sole_holding Lets a SingleSeries without a symbol answer for any ticker
     * @return nullopt when the ticker, the row or the observation is missing
     */
    std::optional<double> close_at(const std::string& ticker, size_t row,
                                   bool sole_holding = false) const;

    /**
     * @brief Full close series of a ticker, empty if the ticker is not in the table
     */
    PriceSeries closes(const std::string& ticker, bool sole_holding = false) const;

    /**
     * @brief Row date as YYYY-MM-DD
     */
    std::string date_label(size_t row) const;

    /**
     * @brief Tickers the table can answer for by name
     */
    std::vector<std::string> symbols() const;

    /**
     * @brief Copy restricted to the given tickers; a SingleSeries is kept as is
     */
    PriceHistory select(const std::vector<std::string>& tickers) const;

private:
    PriceHistory(std::vector<Timestamp> dates, Table table)
        : dates_(std::move(dates)), table_(std::move(table)) {}

    const PriceSeries* find_series(const std::string& ticker, bool sole_holding) const;

    std::vector<Timestamp> dates_;
    Table table_;
};

std::string shape_to_string(PriceHistory::Shape shape);

}  // namespace stock_advisor
