#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "stock_advisor/portfolio/valuation.hpp"

using namespace stock_advisor;
using namespace stock_advisor::testing;

class ValuationTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        allocation_.holdings.emplace_back("AAPL", 5100.0, 30, 50.0);
        allocation_.holdings.emplace_back("MSFT", 4000.0, 10, 50.0);
    }

    AllocationResult allocation_;
};

TEST_F(ValuationTest, MarksHoldingsAtLivePrices) {
    double value = Valuation::value(allocation_, {{"AAPL", 175.0}, {"MSFT", 410.5}});
    EXPECT_DOUBLE_EQ(value, 30 * 175.0 + 10 * 410.5);
}

TEST_F(ValuationTest, MissingQuoteCountsAsZero) {
    double value = Valuation::value(allocation_, {{"AAPL", 175.0}});
    EXPECT_DOUBLE_EQ(value, 5250.0);
}

TEST_F(ValuationTest, EmptyAllocationIsWorthNothing) {
    EXPECT_DOUBLE_EQ(Valuation::value(AllocationResult(), {{"AAPL", 175.0}}), 0.0);
}
