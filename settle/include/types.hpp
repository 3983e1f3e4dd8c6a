#pragma once

#include "decimal.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

enum class RoundingMode {
    ROUND_HALF_UP,
    ROUND_HALF_EVEN,
    FLOOR,
    CEIL
};

enum class RemainderPolicy {
    LARGEST_SHARE,
    PAYER,
    FIRST_LISTED,
    DETERMINISTIC
};

// Subtotal a percent-based extra is computed against
enum class PercentBase {
    PRE_TAX_ITEM_SUBTOTALS,
    TAXABLE_ITEM_SUBTOTALS_ONLY,
    POST_DISCOUNT_ITEM_SUBTOTALS,
    POST_TAX_SUBTOTALS,
    POST_FEES_SUBTOTALS
};

enum class AbsoluteSplitMode {
    PROPORTIONAL_TO_ITEMS_SUBTOTAL,
    EVEN_ACROSS_ASSIGNED_PEOPLE
};

enum class ExtraType {
    PERCENT,
    ABSOLUTE
};

enum class AssignmentMode {
    EVEN,
    CUSTOM
};

enum class SplitType {
    EQUAL,
    WEIGHTED,
    ITEMIZED
};

enum class TransferStrategyKind {
    PAIRWISE_NET,
    GREEDY_MINIMAL
};

// Add nlohmann::json serializer for std::optional
namespace nlohmann {
    template <typename T>
    struct adl_serializer<std::optional<T>> {
        static void to_json(json& j, const std::optional<T>& opt) {
            if (opt == std::nullopt) {
                j = nullptr;
            } else {
                j = *opt;
            }
        }

        static void from_json(const json& j, std::optional<T>& opt) {
            if (j.is_null()) {
                opt = std::nullopt;
            } else {
                opt = j.get<T>();
            }
        }
    };

    // Money crosses the boundary as an exact decimal string, never a binary float
    template <>
    struct adl_serializer<Decimal> {
        static void to_json(json& j, const Decimal& value) {
            j = value.to_string();
        }

        static void from_json(const json& j, Decimal& value) {
            if (j.is_string()) {
                value = Decimal::parse(j.get<std::string>());
            } else if (j.is_number_unsigned()) {
                value = Decimal(Decimal::Integer(j.get<std::uint64_t>()));
            } else if (j.is_number_integer()) {
                value = Decimal(j.get<long long>());
            } else {
                throw std::invalid_argument("Decimal values must be strings or integers, got: " + j.dump());
            }
        }
    };
}

// JSON conversions for Enums
NLOHMANN_JSON_SERIALIZE_ENUM(RoundingMode, {
    {RoundingMode::ROUND_HALF_UP, "ROUND_HALF_UP"},
    {RoundingMode::ROUND_HALF_EVEN, "ROUND_HALF_EVEN"},
    {RoundingMode::FLOOR, "FLOOR"},
    {RoundingMode::CEIL, "CEIL"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(RemainderPolicy, {
    {RemainderPolicy::LARGEST_SHARE, "LARGEST_SHARE"},
    {RemainderPolicy::PAYER, "PAYER"},
    {RemainderPolicy::FIRST_LISTED, "FIRST_LISTED"},
    {RemainderPolicy::DETERMINISTIC, "DETERMINISTIC"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(PercentBase, {
    {PercentBase::PRE_TAX_ITEM_SUBTOTALS, "PRE_TAX_ITEM_SUBTOTALS"},
    {PercentBase::TAXABLE_ITEM_SUBTOTALS_ONLY, "TAXABLE_ITEM_SUBTOTALS_ONLY"},
    {PercentBase::POST_DISCOUNT_ITEM_SUBTOTALS, "POST_DISCOUNT_ITEM_SUBTOTALS"},
    {PercentBase::POST_TAX_SUBTOTALS, "POST_TAX_SUBTOTALS"},
    {PercentBase::POST_FEES_SUBTOTALS, "POST_FEES_SUBTOTALS"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(AbsoluteSplitMode, {
    {AbsoluteSplitMode::PROPORTIONAL_TO_ITEMS_SUBTOTAL, "PROPORTIONAL_TO_ITEMS_SUBTOTAL"},
    {AbsoluteSplitMode::EVEN_ACROSS_ASSIGNED_PEOPLE, "EVEN_ACROSS_ASSIGNED_PEOPLE"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(ExtraType, {
    {ExtraType::PERCENT, "PERCENT"},
    {ExtraType::ABSOLUTE, "ABSOLUTE"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(AssignmentMode, {
    {AssignmentMode::EVEN, "EVEN"},
    {AssignmentMode::CUSTOM, "CUSTOM"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(SplitType, {
    {SplitType::EQUAL, "EQUAL"},
    {SplitType::WEIGHTED, "WEIGHTED"},
    {SplitType::ITEMIZED, "ITEMIZED"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(TransferStrategyKind, {
    {TransferStrategyKind::PAIRWISE_NET, "PAIRWISE_NET"},
    {TransferStrategyKind::GREEDY_MINIMAL, "GREEDY_MINIMAL"}
})

struct ItemAssignment {
    AssignmentMode mode = AssignmentMode::EVEN;
    std::vector<std::string> users;
    // CUSTOM only; fractions of the item keyed by user, summing to 1
    std::map<std::string, Decimal> shares;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ItemAssignment, mode, users, shares)
};

struct LineItem {
    std::string id;
    std::string name;
    Decimal quantity = 1;
    Decimal unit_price;
    bool taxable = true;
    bool service_chargeable = false;
    ItemAssignment assignment;

    Decimal item_total() const { return quantity * unit_price; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(LineItem, id, name, quantity, unit_price, taxable,
                                                service_chargeable, assignment)
};

// Tax or tip. For PERCENT, value is a rate such as 8.875 for 8.875%.
struct Extra {
    ExtraType type = ExtraType::PERCENT;
    Decimal value;
    // Falls back to AllocationRule::percent_base when unset
    std::optional<PercentBase> base;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Extra, type, value, base)
};

// Fee or discount
struct NamedExtra {
    std::string id;
    std::string name;
    ExtraType type = ExtraType::ABSOLUTE;
    Decimal value;
    std::optional<PercentBase> base;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(NamedExtra, id, name, type, value, base)
};

struct Extras {
    std::optional<Extra> tax;
    std::optional<Extra> tip;
    std::vector<NamedExtra> fees;
    std::vector<NamedExtra> discounts;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Extras, tax, tip, fees, discounts)
};

struct RoundingConfig {
    Decimal precision = Decimal::pow10(-2);
    RoundingMode mode = RoundingMode::ROUND_HALF_UP;
    RemainderPolicy remainder_policy = RemainderPolicy::LARGEST_SHARE;
    // Seed for RemainderPolicy::DETERMINISTIC
    std::uint32_t seed = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(RoundingConfig, precision, mode, remainder_policy, seed)
};

struct AllocationRule {
    PercentBase percent_base = PercentBase::PRE_TAX_ITEM_SUBTOTALS;
    AbsoluteSplitMode absolute_split = AbsoluteSplitMode::PROPORTIONAL_TO_ITEMS_SUBTOTAL;
    RoundingConfig rounding;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(AllocationRule, percent_base, absolute_split, rounding)
};

struct ItemContribution {
    std::string item_id;
    std::string item_name;
    Decimal quantity;
    Decimal unit_price;
    Decimal assigned_share;
    Decimal contribution_amount;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ItemContribution, item_id, item_name, quantity, unit_price,
                                   assigned_share, contribution_amount)
};

// Audit trail for one participant of an itemized expense
struct ParticipantBreakdown {
    std::string user_id;
    Decimal items_subtotal;
    // "tax", "tip", "fee_<name>", "discount_<name>"; discounts are positive
    std::map<std::string, Decimal> extras_allocated;
    Decimal rounding_adjustment;
    Decimal total;
    std::vector<ItemContribution> items;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ParticipantBreakdown, user_id, items_subtotal, extras_allocated,
                                   rounding_adjustment, total, items)
};

struct ParticipantWeight {
    std::string user_id;
    Decimal weight = 1;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ParticipantWeight, user_id, weight)
};

struct EqualSplit {};

struct WeightedSplit {};

struct ItemizedSplit {
    // Canonical output of the itemized calculator; never recomputed when present
    std::map<std::string, Decimal> participant_amounts;
    std::vector<LineItem> items;
    Extras extras;
    std::optional<AllocationRule> allocation;
};

using SplitDetails = std::variant<EqualSplit, WeightedSplit, ItemizedSplit>;

struct Expense {
    std::string id;
    std::string payer_user_id;
    std::string currency = "USD";
    Decimal amount;
    std::optional<std::string> category_id;
    // Ordered; the order drives first-listed remainder distribution
    std::vector<ParticipantWeight> participants;
    SplitDetails split;

    SplitType split_type() const;

    // nullptr unless the expense is itemized
    const ItemizedSplit* itemized() const { return std::get_if<ItemizedSplit>(&split); }
};

struct Category {
    std::string id;
    std::string name;
    std::optional<std::string> color;
    std::optional<std::string> icon;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Category, id, name, color, icon)
};

using ShareList = std::vector<std::pair<std::string, Decimal>>;

// An expense with its per-participant shares settled to exact amounts
struct ResolvedExpense {
    std::string expense_id;
    std::string payer_user_id;
    Decimal amount;
    std::optional<std::string> category_id;
    ShareList shares;
};

struct PersonSummary {
    std::string user_id;
    Decimal total_paid_base;
    Decimal total_owed_base;
    Decimal net_base;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PersonSummary, user_id, total_paid_base, total_owed_base,
                                                net_base)
};

struct PairwiseDebt {
    std::string id;
    std::string trip_id;
    std::string from_user_id;
    std::string to_user_id;
    Decimal netted_base;
    std::string computed_at;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(PairwiseDebt, id, trip_id, from_user_id, to_user_id, netted_base,
                                   computed_at)
};

struct MinimalTransfer {
    std::string id;
    std::string trip_id;
    std::string from_user_id;
    std::string to_user_id;
    Decimal amount_base;
    std::optional<std::string> currency;
    std::string computed_at;
    bool is_settled = false;
    std::optional<std::string> settled_at;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(MinimalTransfer, id, trip_id, from_user_id, to_user_id,
                                                amount_base, currency, computed_at, is_settled, settled_at)
};

struct CategorySpending {
    std::string category_id;
    std::string category_name;
    Decimal amount;
    std::optional<std::string> color;
    std::optional<std::string> icon;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(CategorySpending, category_id, category_name, amount, color, icon)
};

struct PersonCategorySpending {
    std::string user_id;
    Decimal total_paid_base;
    Decimal total_owed_base;
    Decimal net_base;
    // Descending by amount
    std::vector<CategorySpending> category_breakdown;

    Decimal total_category_spending() const;
    Decimal spending_for_category(const std::string& category_id) const;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(PersonCategorySpending, user_id, total_paid_base, total_owed_base,
                                   net_base, category_breakdown)
};

// Request-level settings
struct EngineOptions {
    TransferStrategyKind strategy = TransferStrategyKind::PAIRWISE_NET;
    // Tax or tip rates above this percentage raise a warning
    Decimal extreme_percent_threshold = 50;
    // Stamped on every debt and transfer; supplied by the caller
    std::string computed_at;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(EngineOptions, strategy, extreme_percent_threshold, computed_at)
};

void to_json(nlohmann::json& j, const Expense& expense);
void from_json(const nlohmann::json& j, Expense& expense);
