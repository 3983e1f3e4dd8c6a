#include "itemized_calculator.hpp"
#include "currency.hpp"
#include "rounding_service.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace {

const Decimal kHundred = 100;
const Decimal kShareTolerance = Decimal::parse("0.0001");

// Extras are applied in this order; a percent base must exist before its stage
enum class Stage {
    DISCOUNT,
    TAX,
    FEE,
    TIP
};

struct ParticipantState {
    std::string user_id;
    Decimal item_subtotal;
    Decimal taxable_subtotal;
    Decimal discounts;
    Decimal tax;
    Decimal fees;
    Decimal tip;
    std::map<std::string, Decimal> extras_allocated;
    std::vector<ItemContribution> contributions;

    Decimal base(PercentBase base) const {
        switch (base) {
            case PercentBase::PRE_TAX_ITEM_SUBTOTALS:
                return item_subtotal;
            case PercentBase::TAXABLE_ITEM_SUBTOTALS_ONLY:
                return taxable_subtotal;
            case PercentBase::POST_DISCOUNT_ITEM_SUBTOTALS:
                return item_subtotal - discounts;
            case PercentBase::POST_TAX_SUBTOTALS:
                return item_subtotal - discounts + tax;
            case PercentBase::POST_FEES_SUBTOTALS:
                return item_subtotal - discounts + tax + fees;
        }
        return item_subtotal;
    }

    Decimal unrounded_total() const {
        return item_subtotal - discounts + tax + fees + tip;
    }
};

bool base_available(PercentBase base, Stage stage) {
    switch (base) {
        case PercentBase::PRE_TAX_ITEM_SUBTOTALS:
        case PercentBase::TAXABLE_ITEM_SUBTOTALS_ONLY:
            return true;
        case PercentBase::POST_DISCOUNT_ITEM_SUBTOTALS:
            return stage != Stage::DISCOUNT;
        case PercentBase::POST_TAX_SUBTOTALS:
            return stage == Stage::FEE || stage == Stage::TIP;
        case PercentBase::POST_FEES_SUBTOTALS:
            return stage == Stage::TIP;
    }
    return false;
}

std::string base_name(PercentBase base) {
    return nlohmann::json(base).get<std::string>();
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

void check_extra(
    const std::string& label,
    ExtraType type,
    const Decimal& value,
    const std::optional<PercentBase>& base,
    bool allow_zero,
    Stage stage,
    const AllocationRule& allocation,
    std::vector<ValidationIssue>& issues
) {
    if (allow_zero ? value.sign() < 0 : value.sign() <= 0) {
        issues.push_back(blocking_issue(IssueCode::INVALID_EXTRA,
                                        label + " value must be " + (allow_zero ? "non-negative" : "positive") +
                                            ", got " + value.to_string(),
                                        label));
    }
    if (type == ExtraType::ABSOLUTE && base.has_value()) {
        issues.push_back(blocking_issue(IssueCode::INVALID_EXTRA, label + " is absolute and cannot have a base", label));
    }
    if (type == ExtraType::PERCENT) {
        PercentBase effective = base.value_or(allocation.percent_base);
        if (!base_available(effective, stage)) {
            issues.push_back(blocking_issue(IssueCode::INVALID_EXTRA,
                                            label + " cannot use base " + base_name(effective) +
                                                " before that subtotal exists",
                                            label));
        }
    }
}

void check_named_extras(
    const std::string& kind,
    const std::vector<NamedExtra>& extras,
    Stage stage,
    const AllocationRule& allocation,
    std::vector<ValidationIssue>& issues
) {
    for (std::size_t i = 0; i < extras.size(); ++i) {
        const auto& extra = extras[i];
        std::string label = kind + " " + std::to_string(i + 1);
        if (is_blank(extra.id) || is_blank(extra.name)) {
            issues.push_back(blocking_issue(IssueCode::INVALID_EXTRA, label + " needs an id and a name", label));
        }
        check_extra(label, extra.type, extra.value, extra.base, false, stage, allocation, issues);
    }
}

std::vector<std::string> allocation_order(const ItemizedInput& input) {
    std::vector<std::string> assigned;
    std::set<std::string> seen;
    for (const auto& item : input.items) {
        for (const auto& user : item.assignment.users) {
            if (seen.insert(user).second) {
                assigned.push_back(user);
            }
        }
    }
    if (input.participants.empty()) {
        return assigned;
    }

    std::vector<std::string> order;
    for (const auto& user : input.participants) {
        if (seen.count(user) && std::find(order.begin(), order.end(), user) == order.end()) {
            order.push_back(user);
        }
    }
    return order;
}

// Splits an absolute amount across participants per the allocation rule
std::vector<Decimal> split_absolute(
    const Decimal& amount,
    const std::vector<ParticipantState>& states,
    AbsoluteSplitMode mode
) {
    std::vector<Decimal> shares(states.size());
    Decimal items_total;
    for (const auto& state : states) {
        items_total += state.item_subtotal;
    }

    if (mode == AbsoluteSplitMode::EVEN_ACROSS_ASSIGNED_PEOPLE || items_total.is_zero()) {
        Decimal each = amount / Decimal(static_cast<long long>(states.size()));
        std::fill(shares.begin(), shares.end(), each);
        return shares;
    }

    for (std::size_t i = 0; i < states.size(); ++i) {
        shares[i] = amount * states[i].item_subtotal / items_total;
    }
    return shares;
}

std::vector<Decimal> allocate_extra(
    ExtraType type,
    const Decimal& value,
    const std::optional<PercentBase>& base,
    const std::vector<ParticipantState>& states,
    const AllocationRule& allocation
) {
    if (type == ExtraType::ABSOLUTE) {
        return split_absolute(value, states, allocation.absolute_split);
    }

    PercentBase effective = base.value_or(allocation.percent_base);
    std::vector<Decimal> shares;
    shares.reserve(states.size());
    for (const auto& state : states) {
        shares.push_back(state.base(effective) * value / kHundred);
    }
    return shares;
}

// Same extra applied once to the whole receipt
Decimal receipt_extra(
    ExtraType type,
    const Decimal& value,
    const std::optional<PercentBase>& base,
    const ParticipantState& receipt,
    const AllocationRule& allocation
) {
    if (type == ExtraType::ABSOLUTE) {
        return value;
    }
    return receipt.base(base.value_or(allocation.percent_base)) * value / kHundred;
}

}  // namespace

std::vector<ValidationIssue> ItemizedCalculator::validate_input(
    const ItemizedInput& input,
    const EngineOptions& options
) {
    std::vector<ValidationIssue> issues;
    const auto& allocation = input.allocation;

    if (allocation.rounding.precision.sign() <= 0) {
        issues.push_back(blocking_issue(IssueCode::INVALID_ROUNDING_CONFIG,
                                        "Rounding precision must be positive, got " +
                                            allocation.rounding.precision.to_string()));
    }

    std::set<std::string> known(input.participants.begin(), input.participants.end());
    for (const auto& item : input.items) {
        const std::string subject = item.id.empty() ? item.name : item.id;
        if (is_blank(item.name)) {
            issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM, "Item name cannot be empty", subject));
        }
        if (item.quantity.sign() <= 0) {
            issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM,
                                            "Quantity must be greater than 0, got " + item.quantity.to_string(),
                                            subject));
        }
        if (item.unit_price.sign() < 0) {
            issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM,
                                            "Unit price cannot be negative, got " + item.unit_price.to_string(),
                                            subject));
        }

        const auto& assignment = item.assignment;
        if (assignment.users.empty()) {
            issues.push_back(blocking_issue(IssueCode::UNASSIGNED_ITEM,
                                            "Item '" + item.name + "' is not assigned to anyone", subject));
            continue;
        }
        std::set<std::string> distinct;
        for (const auto& user : assignment.users) {
            if (!distinct.insert(user).second) {
                issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM,
                                                "Item '" + item.name + "' lists '" + user + "' more than once",
                                                subject));
            }
        }
        if (!input.participants.empty()) {
            for (const auto& user : assignment.users) {
                if (!known.count(user)) {
                    issues.push_back(blocking_issue(IssueCode::UNKNOWN_PARTICIPANT,
                                                    "Item '" + item.name + "' is assigned to unknown participant '" +
                                                        user + "'",
                                                    user));
                }
            }
        }

        if (assignment.mode == AssignmentMode::CUSTOM) {
            std::set<std::string> users(assignment.users.begin(), assignment.users.end());
            std::set<std::string> keys;
            Decimal sum;
            bool negative = false;
            for (const auto& [user, share] : assignment.shares) {
                keys.insert(user);
                sum += share;
                negative = negative || share.sign() < 0;
            }
            if (keys != users) {
                issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM,
                                                "Custom share keys must match the assigned users", subject));
            }
            if (negative) {
                issues.push_back(blocking_issue(IssueCode::INVALID_LINE_ITEM, "Custom shares cannot be negative",
                                                subject));
            }
            if ((sum - 1).abs() > kShareTolerance) {
                issues.push_back(blocking_issue(IssueCode::SHARES_DO_NOT_SUM_TO_ONE,
                                                "Shares of item '" + item.name + "' sum to " + sum.to_string(),
                                                subject));
            }
        }
    }

    const auto& extras = input.extras;
    check_named_extras("Discount", extras.discounts, Stage::DISCOUNT, allocation, issues);
    if (extras.tax) {
        check_extra("Tax", extras.tax->type, extras.tax->value, extras.tax->base, true, Stage::TAX, allocation, issues);
    }
    check_named_extras("Fee", extras.fees, Stage::FEE, allocation, issues);
    if (extras.tip) {
        check_extra("Tip", extras.tip->type, extras.tip->value, extras.tip->base, true, Stage::TIP, allocation, issues);
    }

    // Advisory only
    if (extras.tax && extras.tax->type == ExtraType::PERCENT && extras.tax->value > options.extreme_percent_threshold) {
        issues.push_back(warning_issue(IssueCode::EXTREME_PERCENTAGE,
                                       "Tax rate " + extras.tax->value.to_string() + "% exceeds " +
                                           options.extreme_percent_threshold.to_string() + "%",
                                       "Tax"));
    }
    if (extras.tip && extras.tip->type == ExtraType::PERCENT && extras.tip->value > options.extreme_percent_threshold) {
        issues.push_back(warning_issue(IssueCode::EXTREME_PERCENTAGE,
                                       "Tip rate " + extras.tip->value.to_string() + "% exceeds " +
                                           options.extreme_percent_threshold.to_string() + "%",
                                       "Tip"));
    }

    return issues;
}

ItemizedResult ItemizedCalculator::calculate(const ItemizedInput& input, const EngineOptions& options) {
    ItemizedResult result;
    result.issues = validate_input(input, options);
    if (result.blocked()) {
        return result;
    }

    const auto& allocation = input.allocation;
    result.participant_order = allocation_order(input);
    std::vector<ParticipantState> states;
    std::map<std::string, std::size_t> index_of;
    for (const auto& user : result.participant_order) {
        index_of[user] = states.size();
        states.push_back(ParticipantState{user, 0, 0, 0, 0, 0, 0, {}, {}});
    }
    if (states.empty()) {
        return result;
    }

    // Receipt-level totals, computed without the per-participant split
    ParticipantState receipt{"", 0, 0, 0, 0, 0, 0, {}, {}};

    // 1. Item subtotals with contribution audit trail
    for (const auto& item : input.items) {
        const Decimal item_total = item.item_total();
        receipt.item_subtotal += item_total;
        if (item.taxable) {
            receipt.taxable_subtotal += item_total;
        }
        const auto& assignment = item.assignment;
        for (const auto& user : assignment.users) {
            Decimal share = assignment.mode == AssignmentMode::EVEN
                ? Decimal(1) / Decimal(static_cast<long long>(assignment.users.size()))
                : assignment.shares.at(user);
            Decimal amount = item_total * share;

            auto& state = states[index_of.at(user)];
            state.item_subtotal += amount;
            if (item.taxable) {
                state.taxable_subtotal += amount;
            }
            state.contributions.push_back({item.id, item.name, item.quantity, item.unit_price, share, amount});
        }
    }

    const auto& extras = input.extras;

    // 2. Discounts reduce subtotals before tax
    for (const auto& discount : extras.discounts) {
        receipt.discounts += receipt_extra(discount.type, discount.value, discount.base, receipt, allocation);
        auto shares = allocate_extra(discount.type, discount.value, discount.base, states, allocation);
        for (std::size_t i = 0; i < states.size(); ++i) {
            states[i].discounts += shares[i];
            states[i].extras_allocated["discount_" + discount.name] += shares[i];
        }
    }

    // 3. Tax
    if (extras.tax) {
        receipt.tax += receipt_extra(extras.tax->type, extras.tax->value, extras.tax->base, receipt, allocation);
        auto shares = allocate_extra(extras.tax->type, extras.tax->value, extras.tax->base, states, allocation);
        for (std::size_t i = 0; i < states.size(); ++i) {
            states[i].tax += shares[i];
            states[i].extras_allocated["tax"] = shares[i];
        }
    }

    // 4. Fees, each with its own base
    for (const auto& fee : extras.fees) {
        receipt.fees += receipt_extra(fee.type, fee.value, fee.base, receipt, allocation);
        auto shares = allocate_extra(fee.type, fee.value, fee.base, states, allocation);
        for (std::size_t i = 0; i < states.size(); ++i) {
            states[i].fees += shares[i];
            states[i].extras_allocated["fee_" + fee.name] += shares[i];
        }
    }

    // 5. Tip
    if (extras.tip) {
        receipt.tip += receipt_extra(extras.tip->type, extras.tip->value, extras.tip->base, receipt, allocation);
        auto shares = allocate_extra(extras.tip->type, extras.tip->value, extras.tip->base, states, allocation);
        for (std::size_t i = 0; i < states.size(); ++i) {
            states[i].tip += shares[i];
            states[i].extras_allocated["tip"] = shares[i];
        }
    }

    // 6. Unrounded totals
    ShareList unrounded;
    Decimal unrounded_sum;
    for (const auto& state : states) {
        Decimal total = state.unrounded_total();
        unrounded.emplace_back(state.user_id, total);
        unrounded_sum += total;
    }

    // 7-8. Round independently, then place the remainder on one participant
    result.grand_total = RoundingService::round(receipt.unrounded_total(), allocation.rounding.precision,
                                                allocation.rounding.mode);
    auto rounded = RoundingService::round_amounts(unrounded, unrounded_sum, allocation.rounding, input.payer_id);
    if (rounded.issue) {
        result.issues.push_back(*rounded.issue);
    }

    // 9. Output validation
    Decimal distributed;
    for (std::size_t i = 0; i < states.size(); ++i) {
        const auto& state = states[i];
        const auto& entry = rounded.entries[i];
        distributed += entry.rounded;
        if (entry.rounded.sign() < 0) {
            result.issues.push_back(blocking_issue(IssueCode::NEGATIVE_TOTAL,
                                                   "Total for '" + state.user_id + "' is negative: " +
                                                       entry.rounded.to_string(),
                                                   state.user_id));
        }

        result.participant_breakdown[state.user_id] = ParticipantBreakdown{
            state.user_id,
            state.item_subtotal,
            state.extras_allocated,
            entry.rounded - entry.raw,
            entry.rounded,
            state.contributions,
        };
    }

    // The split must reproduce the receipt total
    if ((distributed - result.grand_total).abs() >= Currency::smallest_unit(input.currency)) {
        result.issues.push_back(blocking_issue(IssueCode::COMPUTATION_MISMATCH,
                                               "Distributed " + distributed.to_string() + " but grand total is " +
                                                   result.grand_total.to_string()));
    }

    // 10. Amounts are only usable without blocking issues
    if (!result.blocked()) {
        for (const auto& entry : rounded.entries) {
            result.participant_amounts[entry.user_id] = entry.rounded;
        }
    }
    return result;
}
