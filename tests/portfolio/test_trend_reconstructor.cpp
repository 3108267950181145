#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../data/test_data_utils.hpp"
#include "stock_advisor/portfolio/trend_reconstructor.hpp"

using namespace stock_advisor;
using namespace stock_advisor::testing;

class TrendReconstructorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        allocation_.holdings.emplace_back("AAPL", 1000.0, 10, 50.0);
        allocation_.holdings.emplace_back("KO", 600.0, 10, 50.0);

        history_ = make_flat_history(
            dates_, {{"AAPL", {90.0, 95.0, 100.0, 101.0, 102.0, 103.0, 104.0}},
                     {"KO", {58.0, 59.0, 60.0, std::nullopt, 61.0, 62.0, 63.0}}});
    }

    const std::vector<std::string> dates_{"2024-03-01", "2024-03-04", "2024-03-05",
                                          "2024-03-06", "2024-03-07", "2024-03-08",
                                          "2024-03-11"};
    AllocationResult allocation_;
    PriceHistory history_;
    TrendReconstructor reconstructor_;
};

TEST_F(TrendReconstructorTest, ReplaysLastFiveRows) {
    auto points = reconstructor_.trend(allocation_, history_);
    ASSERT_EQ(points.size(), 5u);

    EXPECT_EQ(points.front().date, "2024-03-05");
    EXPECT_DOUBLE_EQ(points.front().portfolio_value_usd, 1600.0);
    // KO is missing on this day and contributes nothing
    EXPECT_EQ(points[1].date, "2024-03-06");
    EXPECT_DOUBLE_EQ(points[1].portfolio_value_usd, 1010.0);
    EXPECT_EQ(points.back().date, "2024-03-11");
    EXPECT_DOUBLE_EQ(points.back().portfolio_value_usd, 1670.0);
}

TEST_F(TrendReconstructorTest, ShortHistoryUsesAllRows) {
    auto short_history = make_flat_history({"2024-03-04", "2024-03-05"},
                                           {{"AAPL", {10.0, 11.0}}, {"KO", {1.0, 1.0}}});
    auto points = reconstructor_.trend(allocation_, short_history);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_DOUBLE_EQ(points[0].portfolio_value_usd, 110.0);
    EXPECT_DOUBLE_EQ(points[1].portfolio_value_usd, 120.0);
}

TEST_F(TrendReconstructorTest, EmptyInputsGiveEmptyTrend) {
    EXPECT_TRUE(reconstructor_.trend(AllocationResult(), history_).empty());
    EXPECT_TRUE(reconstructor_.trend(allocation_, PriceHistory()).empty());
}

TEST_F(TrendReconstructorTest, SingleSeriesValuesSoleHolding) {
    AllocationResult sole;
    sole.holdings.emplace_back("MSFT", 4000.0, 10, 100.0);

    SingleSeries single;
    single.close = {400.0, 401.255};
    auto history = PriceHistory::create({make_date("2024-03-04"), make_date("2024-03-05")},
                                        single);
    ASSERT_TRUE(history.is_ok());

    auto points = reconstructor_.trend(sole, history.value());
    ASSERT_EQ(points.size(), 2u);
    EXPECT_DOUBLE_EQ(points[0].portfolio_value_usd, 4000.0);
    EXPECT_DOUBLE_EQ(points[1].portfolio_value_usd, 4012.55);
}

TEST_F(TrendReconstructorTest, ConfigurableDayCount) {
    TrendConfig config;
    config.trend_days = 2;
    TrendReconstructor reconstructor(config);

    auto points = reconstructor.trend(allocation_, history_);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0].date, "2024-03-08");
}
