#include <gtest/gtest.h>
#include "transfer_breakdown.hpp"

namespace {

Decimal d(const char* text) {
    return Decimal::parse(text);
}

}  // namespace

TEST(TransferBreakdownTest, DirectContributionsOnly) {
    std::vector<ResolvedExpense> expenses = {
        {"dinner", "alice", d("30"), std::nullopt, {{"alice", d("10")}, {"bob", d("10")}, {"carol", d("10")}}},
        {"taxi", "bob", d("8"), std::nullopt, {{"alice", d("4")}, {"bob", d("4")}}},
        {"museum", "carol", d("20"), std::nullopt, {{"bob", d("10")}, {"carol", d("10")}}},
    };

    auto breakdown = TransferBreakdownCalculator::calculate("bob", "alice", d("6"), expenses);

    ASSERT_EQ(breakdown.contributions.size(), 3);
    EXPECT_EQ(breakdown.total_amount, d("6"));

    const auto& dinner = breakdown.contributions[0];
    EXPECT_EQ(dinner.to_paid, d("30"));
    EXPECT_EQ(dinner.from_owes, d("10"));
    EXPECT_EQ(dinner.net_contribution, d("10"));

    const auto& taxi = breakdown.contributions[1];
    EXPECT_EQ(taxi.from_paid, d("8"));
    EXPECT_EQ(taxi.net_contribution, d("-4"));

    EXPECT_TRUE(breakdown.contributions[2].net_contribution.is_zero());

    auto relevant = breakdown.relevant();
    ASSERT_EQ(relevant.size(), 2);
    EXPECT_EQ(relevant[1].expense_id, "taxi");
    EXPECT_EQ(breakdown.total_positive(), d("10"));
    EXPECT_EQ(breakdown.total_negative(), d("4"));
    EXPECT_EQ(breakdown.total_positive() - breakdown.total_negative(), breakdown.total_amount);
}

TEST(TransferBreakdownTest, NoExpenses) {
    auto breakdown = TransferBreakdownCalculator::calculate("bob", "alice", d("0"), {});

    EXPECT_TRUE(breakdown.contributions.empty());
    EXPECT_TRUE(breakdown.total_positive().is_zero());
    EXPECT_TRUE(breakdown.total_negative().is_zero());
}
