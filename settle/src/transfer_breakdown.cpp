#include "transfer_breakdown.hpp"

namespace {

Decimal share_of(const ResolvedExpense& expense, const std::string& user_id) {
    Decimal total;
    for (const auto& [participant, share] : expense.shares) {
        if (participant == user_id) {
            total += share;
        }
    }
    return total;
}

}  // namespace

std::vector<ExpenseContribution> TransferBreakdown::relevant() const {
    std::vector<ExpenseContribution> result;
    for (const auto& contribution : contributions) {
        if (!contribution.net_contribution.is_zero()) {
            result.push_back(contribution);
        }
    }
    return result;
}

Decimal TransferBreakdown::total_positive() const {
    Decimal total;
    for (const auto& contribution : contributions) {
        if (contribution.net_contribution.sign() > 0) {
            total += contribution.net_contribution;
        }
    }
    return total;
}

Decimal TransferBreakdown::total_negative() const {
    Decimal total;
    for (const auto& contribution : contributions) {
        if (contribution.net_contribution.sign() < 0) {
            total -= contribution.net_contribution;
        }
    }
    return total;
}

TransferBreakdown TransferBreakdownCalculator::calculate(
    const std::string& from_user_id,
    const std::string& to_user_id,
    const Decimal& transfer_amount,
    const std::vector<ResolvedExpense>& expenses
) {
    TransferBreakdown breakdown{from_user_id, to_user_id, transfer_amount, {}};

    for (const auto& expense : expenses) {
        ExpenseContribution contribution;
        contribution.expense_id = expense.expense_id;
        contribution.category_id = expense.category_id;
        contribution.from_paid = expense.payer_user_id == from_user_id ? expense.amount : Decimal();
        contribution.to_paid = expense.payer_user_id == to_user_id ? expense.amount : Decimal();
        contribution.from_owes = share_of(expense, from_user_id);
        contribution.to_owes = share_of(expense, to_user_id);

        if (expense.payer_user_id == to_user_id) {
            contribution.net_contribution = contribution.from_owes;
        } else if (expense.payer_user_id == from_user_id) {
            contribution.net_contribution = -contribution.to_owes;
        }

        breakdown.contributions.push_back(std::move(contribution));
    }
    return breakdown;
}
