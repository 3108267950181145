#include "test_data_utils.hpp"
#include <arrow/util/logging.h>
#include <stdexcept>
#include "stock_advisor/core/time_utils.hpp"

namespace stock_advisor {
namespace testing {

Timestamp make_date(const std::string& label) {
    Timestamp ts;
    if (!core::parse_date(label, ts)) {
        throw std::invalid_argument("Bad test date: " + label);
    }
    return ts;
}

std::shared_ptr<arrow::Array> make_price_array(const PriceSeries& values) {
    arrow::DoubleBuilder builder;
    for (const auto& value : values) {
        if (value.has_value()) {
            ARROW_CHECK_OK(builder.Append(*value));
        } else {
            ARROW_CHECK_OK(builder.AppendNull());
        }
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_CHECK_OK(builder.Finish(&array));
    return array;
}

std::shared_ptr<arrow::Array> make_string_array(const std::vector<std::string>& values) {
    arrow::StringBuilder builder;
    for (const auto& value : values) {
        ARROW_CHECK_OK(builder.Append(value));
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_CHECK_OK(builder.Finish(&array));
    return array;
}

std::shared_ptr<arrow::Array> make_date32_array(const std::vector<std::string>& dates) {
    arrow::Date32Builder builder;
    for (const auto& label : dates) {
        auto hours = std::chrono::duration_cast<std::chrono::hours>(
                         make_date(label).time_since_epoch())
                         .count();
        ARROW_CHECK_OK(builder.Append(static_cast<int32_t>(hours / 24)));
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_CHECK_OK(builder.Finish(&array));
    return array;
}

std::shared_ptr<arrow::Array> make_timestamp_array(const std::vector<std::string>& dates) {
    arrow::TimestampBuilder builder(arrow::timestamp(arrow::TimeUnit::SECOND),
                                    arrow::default_memory_pool());
    for (const auto& label : dates) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           make_date(label).time_since_epoch())
                           .count();
        ARROW_CHECK_OK(builder.Append(seconds));
    }
    std::shared_ptr<arrow::Array> array;
    ARROW_CHECK_OK(builder.Finish(&array));
    return array;
}

std::shared_ptr<arrow::Table> create_flat_table(const std::vector<std::string>& dates,
                                                const NamedSeries& columns) {
    arrow::FieldVector fields = {arrow::field("Date", arrow::utf8())};
    arrow::ArrayVector arrays = {make_string_array(dates)};

    for (const auto& [ticker, series] : columns) {
        fields.push_back(arrow::field(ticker, arrow::float64()));
        arrays.push_back(make_price_array(series));
    }
    return arrow::Table::Make(arrow::schema(fields), arrays);
}

std::shared_ptr<arrow::Table> create_composite_table(
    const std::vector<std::string>& dates,
    const std::vector<std::pair<std::string, NamedSeries>>& tickers) {
    arrow::FieldVector fields = {
        arrow::field("Date", arrow::timestamp(arrow::TimeUnit::SECOND))};
    arrow::ArrayVector arrays = {make_timestamp_array(dates)};

    for (const auto& [ticker, ticker_fields] : tickers) {
        arrow::ArrayVector children;
        std::vector<std::string> names;
        for (const auto& [field, series] : ticker_fields) {
            names.push_back(field);
            children.push_back(make_price_array(series));
        }

        auto struct_array = arrow::StructArray::Make(children, names);
        ARROW_CHECK_OK(struct_array.status());
        fields.push_back(arrow::field(ticker, (*struct_array)->type()));
        arrays.push_back(*struct_array);
    }
    return arrow::Table::Make(arrow::schema(fields), arrays);
}

std::shared_ptr<arrow::Table> create_single_close_table(const std::vector<std::string>& dates,
                                                        const PriceSeries& closes) {
    auto schema = arrow::schema({arrow::field("Date", arrow::date32()),
                                 arrow::field("Close", arrow::float64())});
    return arrow::Table::Make(schema, {make_date32_array(dates), make_price_array(closes)});
}

PriceHistory make_flat_history(const std::vector<std::string>& dates, const NamedSeries& columns) {
    std::vector<Timestamp> stamps;
    for (const auto& label : dates) {
        stamps.push_back(make_date(label));
    }

    FlatByTicker flat;
    for (const auto& [ticker, series] : columns) {
        flat.columns.emplace(ticker, series);
    }

    auto history = PriceHistory::create(std::move(stamps), std::move(flat));
    if (history.is_error()) {
        throw *history.error();
    }
    return history.value();
}

}  // namespace testing
}  // namespace stock_advisor
