#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "stock_advisor/data/price_history_loader.hpp"
#include "test_data_utils.hpp"

using namespace stock_advisor;
using namespace stock_advisor::testing;

class PriceHistoryLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        temp_dir_ = std::filesystem::temp_directory_path() / "stock_advisor_loader_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
        TestBase::TearDown();
    }

    std::string write_csv(const std::string& name, const std::string& contents) {
        auto path = (temp_dir_ / name).string();
        std::ofstream file(path);
        file << contents;
        return path;
    }

    std::filesystem::path temp_dir_;
    const std::vector<std::string> dates_{"2024-03-04", "2024-03-05", "2024-03-06"};
};

TEST_F(PriceHistoryLoaderTest, FlatTableWithStringDates) {
    auto table = create_flat_table(dates_, {{"AAPL", {170.0, 171.0, 172.0}},
                                            {"MSFT", {400.0, std::nullopt, 402.0}}});

    auto result = PriceHistoryLoader::from_table(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& history = result.value();
    EXPECT_EQ(history.shape(), PriceHistory::Shape::FLAT_BY_TICKER);
    EXPECT_EQ(history.num_rows(), 3u);
    EXPECT_EQ(history.date_label(0), "2024-03-04");
    EXPECT_DOUBLE_EQ(*history.close_at("AAPL", 2), 172.0);
    EXPECT_FALSE(history.close_at("MSFT", 1).has_value());
}

TEST_F(PriceHistoryLoaderTest, StructColumnsBecomeComposite) {
    auto table = create_composite_table(
        dates_, {{"AAPL", {{"Open", {1.0, 2.0, 3.0}}, {"Close", {10.0, 11.0, 12.0}}}},
                 {"KO", {{"Close", {60.0, 61.0, 62.0}}}}});

    auto result = PriceHistoryLoader::from_table(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& history = result.value();
    EXPECT_EQ(history.shape(), PriceHistory::Shape::COMPOSITE_KEYED);
    EXPECT_EQ(history.date_label(1), "2024-03-05");
    EXPECT_DOUBLE_EQ(*history.close_at("AAPL", 1), 11.0);
    EXPECT_DOUBLE_EQ(*history.close_at("KO", 2), 62.0);
}

TEST_F(PriceHistoryLoaderTest, SoleCloseColumnIsSingleSeries) {
    auto table = create_single_close_table(dates_, {400.0, 401.0, 402.0});

    auto untagged = PriceHistoryLoader::from_table(table);
    ASSERT_TRUE(untagged.is_ok()) << untagged.error()->what();
    EXPECT_EQ(untagged.value().shape(), PriceHistory::Shape::SINGLE_SERIES);
    EXPECT_EQ(untagged.value().date_label(2), "2024-03-06");
    EXPECT_FALSE(untagged.value().close_at("MSFT", 0).has_value());
    EXPECT_DOUBLE_EQ(*untagged.value().close_at("MSFT", 0, true), 400.0);

    auto tagged = PriceHistoryLoader::from_table(table, std::string("MSFT"));
    ASSERT_TRUE(tagged.is_ok());
    EXPECT_DOUBLE_EQ(*tagged.value().close_at("MSFT", 1), 401.0);
}

TEST_F(PriceHistoryLoaderTest, TableWithoutDateColumnIsRejected) {
    auto schema = arrow::schema({arrow::field("AAPL", arrow::float64())});
    auto table = arrow::Table::Make(schema, {make_price_array({1.0, 2.0})});

    auto result = PriceHistoryLoader::from_table(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(PriceHistoryLoaderTest, TableWithoutPricesIsRejected) {
    auto schema = arrow::schema({arrow::field("Date", arrow::utf8()),
                                 arrow::field("Note", arrow::utf8())});
    auto table =
        arrow::Table::Make(schema, {make_string_array({"2024-03-04"}), make_string_array({"x"})});

    auto result = PriceHistoryLoader::from_table(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(PriceHistoryLoaderTest, NullTableIsRejected) {
    auto result = PriceHistoryLoader::from_table(nullptr);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PriceHistoryLoaderTest, ReadsCsvFile) {
    auto path = write_csv("closes.csv",
                          "Date,AAPL,MSFT\n"
                          "2024-03-05,171.0,401.0\n"
                          "2024-03-04,170.0,400.0\n"
                          "2024-03-06,172.0,\n");

    auto result = PriceHistoryLoader::from_csv(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& history = result.value();
    EXPECT_EQ(history.shape(), PriceHistory::Shape::FLAT_BY_TICKER);
    EXPECT_EQ(history.num_rows(), 3u);
    EXPECT_EQ(history.date_label(0), "2024-03-04");
    EXPECT_DOUBLE_EQ(*history.close_at("AAPL", 0), 170.0);
    EXPECT_DOUBLE_EQ(*history.close_at("MSFT", 1), 401.0);
    EXPECT_FALSE(history.close_at("MSFT", 2).has_value());
}

TEST_F(PriceHistoryLoaderTest, MissingCsvIsReported) {
    auto result = PriceHistoryLoader::from_csv((temp_dir_ / "absent.csv").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}
