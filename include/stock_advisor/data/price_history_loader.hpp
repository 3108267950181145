// include/stock_advisor/data/price_history_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include "stock_advisor/core/error.hpp"
#include "stock_advisor/core/types.hpp"
#include "stock_advisor/data/price_history.hpp"

namespace stock_advisor {

/**
 * @brief Builds PriceHistory from Arrow tables, detecting the table shape once
 *
 * Recognised layouts, checked in this order:
 * - any struct column: COMPOSITE_KEYED, column name is the ticker, child fields are price
 *   fields such as "Close"
 * - exactly one numeric column, named "Close": SINGLE_SERIES
 * - otherwise every numeric column except the date: FLAT_BY_TICKER
 *
 * The date column is the first of Date, date, Datetime, time, timestamp and may be an
 * Arrow timestamp, date32, date64 or YYYY-MM-DD string column.
 */
class PriceHistoryLoader {
public:
    /**
     * @brief Convert an Arrow table
     * @param table Table with a date column and price columns
     * @param symbol_hint Instrument a SINGLE_SERIES table belongs to, if known
     * @return INVALID_ARGUMENT for a null table, INVALID_DATA for a missing date column,
     *         unparseable dates or no price columns
     */
    static Result<PriceHistory> from_table(const std::shared_ptr<arrow::Table>& table,
                                           const std::optional<std::string>& symbol_hint =
                                               std::nullopt);

    /**
     * @brief Read a CSV file with Arrow's CSV reader and convert it
     * @return FILE_NOT_FOUND / FILE_IO_ERROR on I/O failures, else as from_table
     */
    static Result<PriceHistory> from_csv(const std::string& path,
                                         const std::optional<std::string>& symbol_hint =
                                             std::nullopt);

private:
    static Result<std::vector<Timestamp>> extract_dates(
        const std::shared_ptr<arrow::Array>& array);

    static Result<PriceSeries> extract_prices(const std::shared_ptr<arrow::Array>& array,
                                              const std::string& column);

    static bool is_numeric(const std::shared_ptr<arrow::DataType>& type);
};

}  // namespace stock_advisor
