#include <gtest/gtest.h>
#include "pairwise_netting.hpp"

namespace {

Decimal d(const char* text) {
    return Decimal::parse(text);
}

ResolvedExpense resolved(const std::string& id, const std::string& payer, const char* amount, ShareList shares) {
    return ResolvedExpense{id, payer, d(amount), std::nullopt, std::move(shares)};
}

}  // namespace

TEST(PairwiseNettingTest, SingleExpense) {
    std::vector<ResolvedExpense> expenses = {resolved("e1", "alice", "100", {{"alice", d("50")}, {"bob", d("50")}})};

    auto debts = PairwiseNettingEngine::calculate(expenses, d("0.01"), "trip", "2024-01-01T00:00:00Z");

    ASSERT_EQ(debts.size(), 1);
    EXPECT_EQ(debts[0].from_user_id, "bob");
    EXPECT_EQ(debts[0].to_user_id, "alice");
    EXPECT_EQ(debts[0].netted_base, d("50"));
    EXPECT_EQ(debts[0].id, "trip:bob->alice");
    EXPECT_EQ(debts[0].computed_at, "2024-01-01T00:00:00Z");
}

TEST(PairwiseNettingTest, OpposingDebtsNet) {
    std::vector<ResolvedExpense> expenses = {
        resolved("e1", "alice", "100", {{"alice", d("50")}, {"bob", d("50")}}),
        resolved("e2", "bob", "60", {{"alice", d("30")}, {"bob", d("30")}}),
    };

    auto debts = PairwiseNettingEngine::calculate(expenses, d("0.01"), "trip", "");

    ASSERT_EQ(debts.size(), 1);
    EXPECT_EQ(debts[0].from_user_id, "bob");
    EXPECT_EQ(debts[0].netted_base, d("20"));
}

TEST(PairwiseNettingTest, FullyNettedPairOmitted) {
    std::vector<ResolvedExpense> expenses = {
        resolved("e1", "alice", "20", {{"alice", d("10")}, {"bob", d("10")}}),
        resolved("e2", "bob", "20.01", {{"alice", d("10.005")}, {"bob", d("10.005")}}),
    };

    auto debts = PairwiseNettingEngine::calculate(expenses, d("0.01"), "trip", "");

    EXPECT_TRUE(debts.empty());
}

TEST(PairwiseNettingTest, NoSimplificationAcrossPeople) {
    // alice -> bob -> carol stays two debts
    std::vector<ResolvedExpense> expenses = {
        resolved("e1", "bob", "10", {{"alice", d("10")}}),
        resolved("e2", "carol", "10", {{"bob", d("10")}}),
    };

    auto debts = PairwiseNettingEngine::calculate(expenses, d("0.01"), "trip", "");

    ASSERT_EQ(debts.size(), 2);
    EXPECT_EQ(debts[0].from_user_id, "alice");
    EXPECT_EQ(debts[0].to_user_id, "bob");
    EXPECT_EQ(debts[1].from_user_id, "bob");
    EXPECT_EQ(debts[1].to_user_id, "carol");
}

TEST(PairwiseNettingTest, PayerShareIsNotADebt) {
    auto debts = PairwiseNettingEngine::accumulate_debts(
        {resolved("e1", "alice", "30", {{"alice", d("10")}, {"bob", d("20")}})});

    ASSERT_EQ(debts.size(), 1);
    EXPECT_EQ((debts.at({"bob", "alice"})), d("20"));
}
