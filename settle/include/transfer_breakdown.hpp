#pragma once

#include "types.hpp"
#include <string>
#include <vector>

// How one expense moves the debt between two people
struct ExpenseContribution {
    std::string expense_id;
    std::optional<std::string> category_id;
    Decimal from_paid;
    Decimal from_owes;
    Decimal to_paid;
    Decimal to_owes;
    // Positive increases the from -> to debt, negative reduces it
    Decimal net_contribution;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ExpenseContribution, expense_id, category_id, from_paid, from_owes, to_paid,
                                   to_owes, net_contribution)
};

struct TransferBreakdown {
    std::string from_user_id;
    std::string to_user_id;
    Decimal total_amount;
    std::vector<ExpenseContribution> contributions;

    // Contributions with a non-zero net effect
    std::vector<ExpenseContribution> relevant() const;
    Decimal total_positive() const;
    // Absolute value
    Decimal total_negative() const;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferBreakdown, from_user_id, to_user_id, total_amount, contributions)
};

class TransferBreakdownCalculator {
public:
    // Only direct debts count: a third-party payer contributes zero
    static TransferBreakdown calculate(
        const std::string& from_user_id,
        const std::string& to_user_id,
        const Decimal& transfer_amount,
        const std::vector<ResolvedExpense>& expenses
    );
};
