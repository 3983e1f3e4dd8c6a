#include "expense_shares.hpp"
#include "currency.hpp"
#include "itemized_calculator.hpp"
#include "rounding_service.hpp"
#include <set>

namespace {

RoundingConfig currency_rounding(const std::string& currency) {
    RoundingConfig config;
    config.precision = Currency::smallest_unit(currency);
    config.mode = RoundingMode::ROUND_HALF_UP;
    config.remainder_policy = RemainderPolicy::FIRST_LISTED;
    return config;
}

ShareList round_to_currency(const Expense& expense, const ShareList& raw) {
    auto rounded = RoundingService::round_amounts(raw, expense.amount, currency_rounding(expense.currency),
                                                  expense.payer_user_id);
    ShareList shares;
    for (const auto& entry : rounded.entries) {
        shares.emplace_back(entry.user_id, entry.rounded);
    }
    return shares;
}

ShareList equal_shares(const Expense& expense) {
    const Decimal each = expense.amount / Decimal(static_cast<long long>(expense.participants.size()));
    ShareList raw;
    for (const auto& participant : expense.participants) {
        raw.emplace_back(participant.user_id, each);
    }
    return round_to_currency(expense, raw);
}

ShareList weighted_shares(const Expense& expense, const Decimal& total_weight) {
    ShareList raw;
    for (const auto& participant : expense.participants) {
        raw.emplace_back(participant.user_id, expense.amount * participant.weight / total_weight);
    }
    return round_to_currency(expense, raw);
}

}  // namespace

ExpenseShares::Result ExpenseShares::resolve(const Expense& expense, const EngineOptions& options) {
    Result result;
    result.expense.expense_id = expense.id;
    result.expense.payer_user_id = expense.payer_user_id;
    result.expense.amount = expense.amount;
    result.expense.category_id = expense.category_id;

    if (expense.amount.sign() <= 0) {
        result.issues.push_back(blocking_issue(IssueCode::INVALID_EXPENSE,
                                               "Expense amount must be greater than 0, got " + expense.amount.to_string(),
                                               expense.id));
        return result;
    }

    std::set<std::string> seen;
    for (const auto& participant : expense.participants) {
        if (!seen.insert(participant.user_id).second) {
            result.issues.push_back(blocking_issue(IssueCode::INVALID_EXPENSE,
                                                   "Participant '" + participant.user_id + "' is listed more than once",
                                                   expense.id));
        }
    }
    if (result.blocked()) {
        return result;
    }

    if (const auto* itemized = expense.itemized()) {
        if (!itemized->participant_amounts.empty()) {
            // Canonical amounts, in participant order where listed
            for (const auto& participant : expense.participants) {
                auto it = itemized->participant_amounts.find(participant.user_id);
                if (it != itemized->participant_amounts.end()) {
                    result.expense.shares.emplace_back(it->first, it->second);
                }
            }
            for (const auto& [user_id, amount] : itemized->participant_amounts) {
                bool listed = false;
                for (const auto& share : result.expense.shares) {
                    listed = listed || share.first == user_id;
                }
                if (!listed) {
                    result.expense.shares.emplace_back(user_id, amount);
                }
            }
        } else if (!itemized->items.empty() && itemized->allocation) {
            ItemizedInput input;
            input.items = itemized->items;
            input.extras = itemized->extras;
            input.allocation = *itemized->allocation;
            for (const auto& participant : expense.participants) {
                input.participants.push_back(participant.user_id);
            }
            input.payer_id = expense.payer_user_id;
            input.currency = expense.currency;

            auto calculated = ItemizedCalculator::calculate(input, options);
            for (auto& issue : calculated.issues) {
                if (issue.subject.empty()) {
                    issue.subject = expense.id;
                }
                result.issues.push_back(issue);
            }
            for (const auto& user_id : calculated.participant_order) {
                auto it = calculated.participant_amounts.find(user_id);
                if (it != calculated.participant_amounts.end()) {
                    result.expense.shares.emplace_back(user_id, it->second);
                }
            }
            if (result.blocked()) {
                result.expense.shares.clear();
                return result;
            }
        } else {
            result.issues.push_back(blocking_issue(IssueCode::INVALID_EXPENSE,
                                                   "Itemized expense has neither participant amounts nor items "
                                                   "with an allocation rule",
                                                   expense.id));
            return result;
        }
    } else {
        if (expense.participants.empty()) {
            result.issues.push_back(blocking_issue(IssueCode::INVALID_EXPENSE,
                                                   "At least one participant is required", expense.id));
            return result;
        }
        if (expense.split_type() == SplitType::EQUAL) {
            result.expense.shares = equal_shares(expense);
        } else {
            Decimal total_weight;
            for (const auto& participant : expense.participants) {
                if (participant.weight.sign() <= 0) {
                    result.issues.push_back(blocking_issue(IssueCode::INVALID_EXPENSE,
                                                           "Weight for '" + participant.user_id +
                                                               "' must be greater than 0",
                                                           expense.id));
                }
                total_weight += participant.weight;
            }
            if (result.blocked()) {
                return result;
            }
            result.expense.shares = weighted_shares(expense, total_weight);
        }
    }

    Decimal share_sum;
    for (const auto& share : result.expense.shares) {
        share_sum += share.second;
    }
    if ((share_sum - expense.amount).abs() >= Currency::smallest_unit(expense.currency)) {
        result.issues.push_back(blocking_issue(IssueCode::COMPUTATION_MISMATCH,
                                               "Shares sum to " + share_sum.to_string() + " but expense amount is " +
                                                   expense.amount.to_string(),
                                               expense.id));
    }
    return result;
}

ExpenseShares::BatchResult ExpenseShares::resolve_all(const std::vector<Expense>& expenses,
                                                      const EngineOptions& options) {
    BatchResult batch;
    for (const auto& expense : expenses) {
        auto resolved = resolve(expense, options);
        batch.issues.insert(batch.issues.end(), resolved.issues.begin(), resolved.issues.end());
        if (!resolved.blocked()) {
            batch.expenses.push_back(std::move(resolved.expense));
        }
    }
    return batch;
}
