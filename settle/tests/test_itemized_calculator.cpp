#include <gtest/gtest.h>
#include "itemized_calculator.hpp"
#include <nlohmann/json.hpp>

namespace {

Decimal d(const char* text) {
    return Decimal::parse(text);
}

LineItem item(const std::string& id, const char* price, std::vector<std::string> users) {
    LineItem result;
    result.id = id;
    result.name = id;
    result.unit_price = d(price);
    result.assignment.users = std::move(users);
    return result;
}

Extra percent(const char* rate, std::optional<PercentBase> base = std::nullopt) {
    return Extra{ExtraType::PERCENT, d(rate), base};
}

bool has_code(const ItemizedResult& result, IssueCode code) {
    for (const auto& issue : result.issues) {
        if (issue.code == code) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST(ItemizedCalculatorTest, TaxAndPostTaxTip) {
    ItemizedInput input;
    input.items = {item("entree", "20.00", {"alice", "bob"})};
    input.extras.tax = percent("10", PercentBase::PRE_TAX_ITEM_SUBTOTALS);
    input.extras.tip = percent("20", PercentBase::POST_TAX_SUBTOTALS);
    input.participants = {"alice", "bob"};
    input.payer_id = "alice";

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_EQ(result.participant_amounts.at("alice"), d("13.20"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("13.20"));
    EXPECT_EQ(result.grand_total, d("26.40"));

    const auto& breakdown = result.participant_breakdown.at("alice");
    EXPECT_EQ(breakdown.items_subtotal, d("10"));
    EXPECT_EQ(breakdown.extras_allocated.at("tax"), d("1"));
    EXPECT_EQ(breakdown.extras_allocated.at("tip"), d("2.2"));
    EXPECT_TRUE(breakdown.rounding_adjustment.is_zero());
    ASSERT_EQ(breakdown.items.size(), 1);
    EXPECT_EQ(breakdown.items[0].assigned_share, d("0.5"));
}

TEST(ItemizedCalculatorTest, ZeroDecimalCurrencyRemainder) {
    ItemizedInput input;
    input.items = {item("hotpot", "1000", {"alice", "bob", "carol"})};
    input.allocation.rounding.precision = d("1");
    input.allocation.rounding.remainder_policy = RemainderPolicy::LARGEST_SHARE;
    input.currency = "VND";

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_EQ(result.participant_amounts.at("alice"), d("334"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("333"));
    EXPECT_EQ(result.participant_amounts.at("carol"), d("333"));
    EXPECT_EQ(result.grand_total, d("1000"));
    EXPECT_EQ(result.participant_breakdown.at("alice").rounding_adjustment, d("334") - Decimal(1000) / Decimal(3));
}

TEST(ItemizedCalculatorTest, UnassignedItemBlocks) {
    ItemizedInput input;
    input.items = {item("entree", "20.00", {"alice"}), item("dessert", "8.00", {})};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(result.blocked());
    EXPECT_TRUE(has_code(result, IssueCode::UNASSIGNED_ITEM));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, CustomSharesMustSumToOne) {
    LineItem wine = item("wine", "40", {"alice", "bob"});
    wine.assignment.mode = AssignmentMode::CUSTOM;
    wine.assignment.shares = {{"alice", d("0.5")}, {"bob", d("0.4")}};
    ItemizedInput input;
    input.items = {wine};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(has_code(result, IssueCode::SHARES_DO_NOT_SUM_TO_ONE));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, RepeatedCustomAssigneeBlocks) {
    LineItem wine = item("wine", "40.00", {"alice", "alice"});
    wine.assignment.mode = AssignmentMode::CUSTOM;
    wine.assignment.shares = {{"alice", d("1")}};
    ItemizedInput input;
    input.items = {wine};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(result.blocked());
    EXPECT_TRUE(has_code(result, IssueCode::INVALID_LINE_ITEM));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, RepeatedEvenAssigneeBlocks) {
    ItemizedInput input;
    input.items = {item("pizza", "30.00", {"alice", "alice", "bob"})};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(result.blocked());
    EXPECT_TRUE(has_code(result, IssueCode::INVALID_LINE_ITEM));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, SplitShortOfReceiptIsMismatch) {
    // Shares sum to 0.99995, inside the share tolerance but 0.05 short on 1000
    LineItem room = item("room", "1000.00", {"alice", "bob"});
    room.assignment.mode = AssignmentMode::CUSTOM;
    room.assignment.shares = {{"alice", d("0.5")}, {"bob", d("0.49995")}};
    ItemizedInput input;
    input.items = {room};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_FALSE(has_code(result, IssueCode::SHARES_DO_NOT_SUM_TO_ONE));
    EXPECT_TRUE(has_code(result, IssueCode::COMPUTATION_MISMATCH));
    EXPECT_EQ(result.grand_total, d("1000"));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, CustomSharesSplitItem) {
    LineItem wine = item("wine", "40", {"alice", "bob"});
    wine.assignment.mode = AssignmentMode::CUSTOM;
    wine.assignment.shares = {{"alice", d("0.75")}, {"bob", d("0.25")}};
    ItemizedInput input;
    input.items = {wine};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_EQ(result.participant_amounts.at("alice"), d("30"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("10"));
}

TEST(ItemizedCalculatorTest, TaxOnlyOnTaxableItems) {
    LineItem food = item("food", "10", {"alice"});
    LineItem gift = item("gift", "10", {"bob"});
    gift.taxable = false;
    ItemizedInput input;
    input.items = {food, gift};
    input.extras.tax = percent("10", PercentBase::TAXABLE_ITEM_SUBTOTALS_ONLY);

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_EQ(result.participant_amounts.at("alice"), d("11"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("10"));
}

TEST(ItemizedCalculatorTest, DiscountReducesTaxBase) {
    ItemizedInput input;
    input.items = {item("a", "30", {"alice"}), item("b", "10", {"bob"})};
    input.extras.discounts = {NamedExtra{"d1", "coupon", ExtraType::ABSOLUTE, d("8"), std::nullopt}};
    input.extras.tax = percent("10", PercentBase::POST_DISCOUNT_ITEM_SUBTOTALS);

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    // Discount proportional to subtotals: 6 and 2
    EXPECT_EQ(result.participant_breakdown.at("alice").extras_allocated.at("discount_coupon"), d("6"));
    EXPECT_EQ(result.participant_amounts.at("alice"), d("26.4"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("8.8"));
    EXPECT_EQ(result.grand_total, d("35.2"));
}

TEST(ItemizedCalculatorTest, FeeSplitEvenly) {
    ItemizedInput input;
    input.items = {item("a", "30", {"alice"}), item("b", "10", {"bob"})};
    input.extras.fees = {NamedExtra{"f1", "delivery", ExtraType::ABSOLUTE, d("5"), std::nullopt}};
    input.allocation.absolute_split = AbsoluteSplitMode::EVEN_ACROSS_ASSIGNED_PEOPLE;

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_EQ(result.participant_breakdown.at("bob").extras_allocated.at("fee_delivery"), d("2.5"));
    EXPECT_EQ(result.participant_amounts.at("alice"), d("32.5"));
    EXPECT_EQ(result.participant_amounts.at("bob"), d("12.5"));
}

TEST(ItemizedCalculatorTest, PercentBaseMustPrecedeStage) {
    ItemizedInput input;
    input.items = {item("a", "30", {"alice"})};
    input.extras.tax = percent("10", PercentBase::POST_FEES_SUBTOTALS);

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(has_code(result, IssueCode::INVALID_EXTRA));
    EXPECT_TRUE(result.participant_amounts.empty());
}

TEST(ItemizedCalculatorTest, ZeroTaxAllowed) {
    ItemizedInput input;
    input.items = {item("a", "10", {"alice"})};
    input.extras.tax = percent("0");

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    EXPECT_FALSE(has_code(result, IssueCode::INVALID_EXTRA));
    EXPECT_EQ(result.participant_amounts.at("alice"), d("10"));
    EXPECT_TRUE(result.participant_breakdown.at("alice").extras_allocated.at("tax").is_zero());
}

TEST(ItemizedCalculatorTest, NegativeTaxBlocks) {
    ItemizedInput input;
    input.items = {item("a", "10", {"alice"})};
    input.extras.tax = percent("-5");

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(has_code(result, IssueCode::INVALID_EXTRA));
}

TEST(ItemizedCalculatorTest, ExtremeTipIsWarningOnly) {
    ItemizedInput input;
    input.items = {item("a", "10", {"alice"})};
    input.extras.tip = percent("60");

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_FALSE(result.blocked());
    EXPECT_TRUE(has_code(result, IssueCode::EXTREME_PERCENTAGE));
    EXPECT_EQ(result.participant_amounts.at("alice"), d("16"));
}

TEST(ItemizedCalculatorTest, DiscountLargerThanItemsIsNegative) {
    ItemizedInput input;
    input.items = {item("a", "5", {"alice"})};
    input.extras.discounts = {NamedExtra{"d1", "voucher", ExtraType::ABSOLUTE, d("8"), std::nullopt}};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(has_code(result, IssueCode::NEGATIVE_TOTAL));
    EXPECT_TRUE(result.participant_amounts.empty());
    EXPECT_EQ(result.participant_breakdown.at("alice").total, d("-3"));
}

TEST(ItemizedCalculatorTest, InvalidLineItems) {
    LineItem nameless = item("x", "5", {"alice"});
    nameless.name = "  ";
    LineItem zero_quantity = item("y", "5", {"alice"});
    zero_quantity.quantity = 0;
    ItemizedInput input;
    input.items = {nameless, zero_quantity};
    input.allocation.rounding.precision = 0;

    auto issues = ItemizedCalculator::validate_input(input, EngineOptions{});

    int line_item_issues = 0;
    bool rounding_issue = false;
    for (const auto& issue : issues) {
        line_item_issues += issue.code == IssueCode::INVALID_LINE_ITEM ? 1 : 0;
        rounding_issue = rounding_issue || issue.code == IssueCode::INVALID_ROUNDING_CONFIG;
    }
    EXPECT_EQ(line_item_issues, 2);
    EXPECT_TRUE(rounding_issue);
}

TEST(ItemizedCalculatorTest, UnknownParticipantBlocks) {
    ItemizedInput input;
    input.items = {item("a", "5", {"alice", "mallory"})};
    input.participants = {"alice", "bob"};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_TRUE(has_code(result, IssueCode::UNKNOWN_PARTICIPANT));
}

TEST(ItemizedCalculatorTest, ParticipantOrderFollowsList) {
    ItemizedInput input;
    input.items = {item("a", "5", {"carol"}), item("b", "5", {"alice"})};
    input.participants = {"alice", "bob", "carol"};

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_EQ(result.participant_order.size(), 2);
    EXPECT_EQ(result.participant_order[0], "alice");
    EXPECT_EQ(result.participant_order[1], "carol");
    EXPECT_EQ(result.participant_amounts.count("bob"), 0);
}

TEST(ItemizedCalculatorTest, Idempotent) {
    ItemizedInput input;
    input.items = {item("a", "10.01", {"alice", "bob", "carol"}), item("b", "3.33", {"bob"})};
    input.extras.tax = percent("8.875");
    input.extras.tip = percent("18", PercentBase::POST_TAX_SUBTOTALS);

    nlohmann::json first = ItemizedCalculator::calculate(input, EngineOptions{});
    nlohmann::json second = ItemizedCalculator::calculate(input, EngineOptions{});

    EXPECT_EQ(first.dump(), second.dump());
}

TEST(ItemizedCalculatorTest, AmountsSumToGrandTotal) {
    ItemizedInput input;
    input.items = {item("a", "10.01", {"alice", "bob", "carol"}), item("b", "3.33", {"bob"})};
    input.extras.tax = percent("8.875");
    input.extras.tip = percent("18", PercentBase::POST_TAX_SUBTOTALS);

    auto result = ItemizedCalculator::calculate(input, EngineOptions{});

    ASSERT_FALSE(result.blocked());
    Decimal total;
    for (const auto& [user, amount] : result.participant_amounts) {
        total += amount;
    }
    EXPECT_EQ(total, result.grand_total);
}
