// src/data/price_history_loader.cpp
#include "stock_advisor/data/price_history_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/type_traits.h>
#include <cmath>
#include <filesystem>
#include "stock_advisor/core/logger.hpp"
#include "stock_advisor/core/time_utils.hpp"

namespace stock_advisor {

namespace {

const std::vector<std::string> DATE_COLUMNS = {"Date", "date", "Datetime", "time", "timestamp"};

std::shared_ptr<arrow::Array> first_chunk(const std::shared_ptr<arrow::ChunkedArray>& column) {
    if (!column || column->num_chunks() == 0) {
        return nullptr;
    }
    return column->chunk(0);
}

template <typename Duration>
Timestamp to_timestamp(int64_t value) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(Duration(value)));
}

}  // namespace

bool PriceHistoryLoader::is_numeric(const std::shared_ptr<arrow::DataType>& type) {
    switch (type->id()) {
        case arrow::Type::DOUBLE:
        case arrow::Type::FLOAT:
        case arrow::Type::INT64:
        case arrow::Type::INT32:
            return true;
        default:
            return false;
    }
}

Result<std::vector<Timestamp>> PriceHistoryLoader::extract_dates(
    const std::shared_ptr<arrow::Array>& array) {
    std::vector<Timestamp> dates;
    if (!array) {
        return Result<std::vector<Timestamp>>(std::move(dates));
    }
    dates.reserve(array->length());

    for (int64_t i = 0; i < array->length(); ++i) {
        if (array->IsNull(i)) {
            return make_error<std::vector<Timestamp>>(
                ErrorCode::INVALID_DATA, "Null date at row " + std::to_string(i),
                "PriceHistoryLoader");
        }

        switch (array->type_id()) {
            case arrow::Type::TIMESTAMP: {
                auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
                auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
                int64_t value = ts_array->Value(i);
                switch (ts_type->unit()) {
                    case arrow::TimeUnit::SECOND:
                        dates.push_back(to_timestamp<std::chrono::seconds>(value));
                        break;
                    case arrow::TimeUnit::MILLI:
                        dates.push_back(to_timestamp<std::chrono::milliseconds>(value));
                        break;
                    case arrow::TimeUnit::MICRO:
                        dates.push_back(to_timestamp<std::chrono::microseconds>(value));
                        break;
                    case arrow::TimeUnit::NANO:
                        dates.push_back(to_timestamp<std::chrono::nanoseconds>(value));
                        break;
                }
                break;
            }
            case arrow::Type::DATE32: {
                auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
                dates.push_back(to_timestamp<std::chrono::hours>(
                    static_cast<int64_t>(date_array->Value(i)) * 24));
                break;
            }
            case arrow::Type::DATE64: {
                auto date_array = std::static_pointer_cast<arrow::Date64Array>(array);
                dates.push_back(to_timestamp<std::chrono::milliseconds>(date_array->Value(i)));
                break;
            }
            case arrow::Type::STRING: {
                auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
                Timestamp parsed;
                if (!core::parse_date(string_array->GetString(i), parsed)) {
                    return make_error<std::vector<Timestamp>>(
                        ErrorCode::INVALID_DATA,
                        "Unparseable date '" + string_array->GetString(i) + "' at row " +
                            std::to_string(i),
                        "PriceHistoryLoader");
                }
                dates.push_back(parsed);
                break;
            }
            default:
                return make_error<std::vector<Timestamp>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Unsupported date column type: " + array->type()->ToString(),
                    "PriceHistoryLoader");
        }
    }

    return Result<std::vector<Timestamp>>(std::move(dates));
}

Result<PriceSeries> PriceHistoryLoader::extract_prices(const std::shared_ptr<arrow::Array>& array,
                                                       const std::string& column) {
    PriceSeries series;
    if (!array) {
        return Result<PriceSeries>(std::move(series));
    }
    series.reserve(array->length());

    for (int64_t i = 0; i < array->length(); ++i) {
        if (array->IsNull(i)) {
            series.push_back(std::nullopt);
            continue;
        }

        double value = 0.0;
        switch (array->type_id()) {
            case arrow::Type::DOUBLE:
                value = std::static_pointer_cast<arrow::DoubleArray>(array)->Value(i);
                break;
            case arrow::Type::FLOAT:
                value = std::static_pointer_cast<arrow::FloatArray>(array)->Value(i);
                break;
            case arrow::Type::INT64:
                value = static_cast<double>(
                    std::static_pointer_cast<arrow::Int64Array>(array)->Value(i));
                break;
            case arrow::Type::INT32:
                value = std::static_pointer_cast<arrow::Int32Array>(array)->Value(i);
                break;
            default:
                return make_error<PriceSeries>(
                    ErrorCode::CONVERSION_ERROR,
                    "Column " + column + " is not numeric: " + array->type()->ToString(),
                    "PriceHistoryLoader");
        }

        // NaN is a missing observation, same as null
        series.push_back(std::isnan(value) ? std::nullopt : std::optional<double>(value));
    }

    return Result<PriceSeries>(std::move(series));
}

Result<PriceHistory> PriceHistoryLoader::from_table(const std::shared_ptr<arrow::Table>& input,
                                                    const std::optional<std::string>& symbol_hint) {
    Logger::register_component("PriceHistoryLoader");

    if (!input) {
        return make_error<PriceHistory>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                        "PriceHistoryLoader");
    }

    auto combined = input->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<PriceHistory>(ErrorCode::CONVERSION_ERROR,
                                        "Failed to combine chunks: " + combined.status().ToString(),
                                        "PriceHistoryLoader");
    }
    std::shared_ptr<arrow::Table> table = *combined;
    const auto& fields = table->schema()->fields();

    int date_index = -1;
    for (const auto& name : DATE_COLUMNS) {
        date_index = table->schema()->GetFieldIndex(name);
        if (date_index >= 0)
            break;
    }
    if (date_index < 0) {
        return make_error<PriceHistory>(ErrorCode::INVALID_DATA,
                                        "History table has no date column",
                                        "PriceHistoryLoader");
    }

    auto dates_result = extract_dates(first_chunk(table->column(date_index)));
    if (dates_result.is_error()) {
        return make_error<PriceHistory>(dates_result.error()->code(), dates_result.error()->what(),
                                        "PriceHistoryLoader");
    }
    std::vector<Timestamp> dates = dates_result.value();

    bool has_struct = false;
    std::vector<int> numeric_columns;
    for (int i = 0; i < static_cast<int>(fields.size()); ++i) {
        if (i == date_index)
            continue;
        if (fields[i]->type()->id() == arrow::Type::STRUCT)
            has_struct = true;
        else if (is_numeric(fields[i]->type()))
            numeric_columns.push_back(i);
    }

    PriceHistory::Table shaped;

    if (has_struct) {
        CompositeKeyed composite;
        for (int i = 0; i < static_cast<int>(fields.size()); ++i) {
            if (fields[i]->type()->id() != arrow::Type::STRUCT)
                continue;

            const std::string& ticker = fields[i]->name();
            auto chunk = first_chunk(table->column(i));
            if (!chunk) {
                for (const auto& child : fields[i]->type()->fields()) {
                    if (is_numeric(child->type()))
                        composite.add(ticker, child->name(), PriceSeries{});
                }
                continue;
            }

            auto struct_array = std::static_pointer_cast<arrow::StructArray>(chunk);
            for (int f = 0; f < struct_array->num_fields(); ++f) {
                const auto& child_field = struct_array->struct_type()->field(f);
                if (!is_numeric(child_field->type()))
                    continue;

                auto flattened = struct_array->GetFlattenedField(f);
                if (!flattened.ok()) {
                    return make_error<PriceHistory>(ErrorCode::CONVERSION_ERROR,
                                                    "Failed to read " + ticker + "." +
                                                        child_field->name() + ": " +
                                                        flattened.status().ToString(),
                                                    "PriceHistoryLoader");
                }

                auto series = extract_prices(*flattened, ticker + "." + child_field->name());
                if (series.is_error()) {
                    return make_error<PriceHistory>(series.error()->code(),
                                                    series.error()->what(),
                                                    "PriceHistoryLoader");
                }
                composite.add(ticker, child_field->name(), series.value());
            }
        }
        shaped = std::move(composite);
    } else if (numeric_columns.size() == 1 &&
               fields[numeric_columns.front()]->name() == PriceHistory::CLOSE_FIELD) {
        auto series = extract_prices(first_chunk(table->column(numeric_columns.front())),
                                     PriceHistory::CLOSE_FIELD);
        if (series.is_error()) {
            return make_error<PriceHistory>(series.error()->code(), series.error()->what(),
                                            "PriceHistoryLoader");
        }
        shaped = SingleSeries{symbol_hint, series.value()};
    } else if (!numeric_columns.empty()) {
        FlatByTicker flat;
        for (int i : numeric_columns) {
            auto series = extract_prices(first_chunk(table->column(i)), fields[i]->name());
            if (series.is_error()) {
                return make_error<PriceHistory>(series.error()->code(), series.error()->what(),
                                                "PriceHistoryLoader");
            }
            flat.columns.emplace(fields[i]->name(), series.value());
        }
        shaped = std::move(flat);
    } else {
        return make_error<PriceHistory>(ErrorCode::INVALID_DATA,
                                        "History table has no price columns",
                                        "PriceHistoryLoader");
    }

    auto history = PriceHistory::create(std::move(dates), std::move(shaped));
    if (history.is_ok()) {
        DEBUG("Loaded " << history.value().num_rows() << " history rows as "
                        << shape_to_string(history.value().shape()));
    }
    return history;
}

Result<PriceHistory> PriceHistoryLoader::from_csv(const std::string& path,
                                                  const std::optional<std::string>& symbol_hint) {
    if (!std::filesystem::exists(path)) {
        return make_error<PriceHistory>(ErrorCode::FILE_NOT_FOUND,
                                        "History file not found: " + path, "PriceHistoryLoader");
    }

    auto input = arrow::io::ReadableFile::Open(path);
    if (!input.ok()) {
        return make_error<PriceHistory>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open " + path + ": " +
                                            input.status().ToString(),
                                        "PriceHistoryLoader");
    }

    auto reader = arrow::csv::TableReader::Make(
        arrow::io::default_io_context(), *input, arrow::csv::ReadOptions::Defaults(),
        arrow::csv::ParseOptions::Defaults(), arrow::csv::ConvertOptions::Defaults());
    if (!reader.ok()) {
        return make_error<PriceHistory>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to create CSV reader for " + path + ": " +
                                            reader.status().ToString(),
                                        "PriceHistoryLoader");
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<PriceHistory>(ErrorCode::INVALID_DATA,
                                        "Failed to parse " + path + ": " +
                                            table.status().ToString(),
                                        "PriceHistoryLoader");
    }

    return from_table(*table, symbol_hint);
}

}  // namespace stock_advisor
