#include "settlement_aggregator.hpp"
#include "currency.hpp"
#include "expense_shares.hpp"
#include "pairwise_netting.hpp"
#include "transfer_strategy.hpp"
#include <algorithm>

namespace {

CategorySpending decorate(const std::string& category_id, const Decimal& amount,
                          const std::vector<Category>& categories) {
    auto it = std::find_if(categories.begin(), categories.end(),
                           [&](const Category& c) { return c.id == category_id; });
    if (it != categories.end()) {
        return {category_id, it->name, amount, it->color, it->icon};
    }
    std::string name = category_id == LedgerBuilder::kUncategorized ? "Uncategorized" : category_id;
    return {category_id, name, amount, std::nullopt, std::nullopt};
}

}  // namespace

LedgerBuilder::LedgerBuilder(const std::vector<std::string>& participants,
                             const std::optional<std::vector<Category>>& categories)
    : categories_(categories) {
    for (const auto& user_id : participants) {
        totals_for(user_id);
    }
}

LedgerBuilder::Totals& LedgerBuilder::totals_for(const std::string& user_id) {
    return totals_[user_id];
}

void LedgerBuilder::add(const ResolvedExpense& expense) {
    totals_for(expense.payer_user_id).paid += expense.amount;

    const std::string category = expense.category_id.value_or(kUncategorized);
    for (const auto& [user_id, share] : expense.shares) {
        auto& totals = totals_for(user_id);
        totals.owed += share;
        if (categories_) {
            totals.by_category[category] += share;
        }
    }
}

Ledger LedgerBuilder::finalize() && {
    Ledger ledger;
    if (categories_) {
        ledger.category_spending.emplace();
    }

    for (auto& [user_id, totals] : totals_) {
        PersonSummary summary{user_id, totals.paid, totals.owed, totals.paid - totals.owed};
        ledger.person_summaries[user_id] = summary;

        if (categories_) {
            std::vector<CategorySpending> breakdown;
            for (const auto& [category_id, amount] : totals.by_category) {
                breakdown.push_back(decorate(category_id, amount, *categories_));
            }
            std::sort(breakdown.begin(), breakdown.end(), [](const CategorySpending& lhs, const CategorySpending& rhs) {
                if (lhs.amount != rhs.amount) {
                    return lhs.amount > rhs.amount;
                }
                return lhs.category_id < rhs.category_id;
            });
            (*ledger.category_spending)[user_id] = PersonCategorySpending{
                user_id, summary.total_paid_base, summary.total_owed_base, summary.net_base, std::move(breakdown)};
        }
    }
    totals_.clear();
    return ledger;
}

std::map<std::string, PersonSummary> SettlementAggregator::person_summaries(
    const std::vector<ResolvedExpense>& expenses,
    const std::vector<std::string>& participants
) {
    LedgerBuilder builder(participants, std::nullopt);
    for (const auto& expense : expenses) {
        builder.add(expense);
    }
    return std::move(builder).finalize().person_summaries;
}

std::optional<ValidationIssue> SettlementAggregator::validate_balances(
    const std::map<std::string, PersonSummary>& summaries,
    const Decimal& epsilon
) {
    Decimal sum;
    for (const auto& [user_id, summary] : summaries) {
        sum += summary.net_base;
    }
    if (sum.abs() < epsilon) {
        return std::nullopt;
    }
    return blocking_issue(IssueCode::BALANCE_CONSERVATION_VIOLATION,
                          "Net balances sum to " + sum.to_string() + " instead of zero");
}

SettlementResult SettlementAggregator::settle(const SettlementRequest& request, const EngineOptions& options) {
    SettlementResult result;
    const Decimal epsilon = Currency::smallest_unit(request.base_currency);

    // 1. Resolve shares; currency conversion is not supported
    for (const auto& expense : request.expenses) {
        if (expense.currency != request.base_currency) {
            result.issues.push_back(blocking_issue(IssueCode::CURRENCY_MISMATCH,
                                                   "Expense currency " + expense.currency +
                                                       " differs from trip currency " + request.base_currency,
                                                   expense.id));
        }
    }
    auto resolved = ExpenseShares::resolve_all(request.expenses, options);
    result.issues.insert(result.issues.end(), resolved.issues.begin(), resolved.issues.end());
    if (result.blocked()) {
        return result;
    }

    // 2. Single pass for summaries and category buckets
    LedgerBuilder builder(request.participants, request.categories);
    for (const auto& expense : resolved.expenses) {
        builder.add(expense);
    }
    Ledger ledger = std::move(builder).finalize();

    // 3. Conservation must hold before any transfer is trusted
    if (auto violation = validate_balances(ledger.person_summaries, epsilon)) {
        result.issues.push_back(*violation);
        return result;
    }
    result.person_summaries = std::move(ledger.person_summaries);
    result.category_spending = std::move(ledger.category_spending);

    // 4. Debts and transfers
    result.pairwise_debts = PairwiseNettingEngine::calculate(resolved.expenses, epsilon, request.trip_id,
                                                             options.computed_at);
    TransferContext context{request.trip_id, request.base_currency, epsilon, options.computed_at,
                            resolved.expenses, result.person_summaries};
    result.transfers = make_transfer_strategy(options.strategy)->compute(context);
    return result;
}
