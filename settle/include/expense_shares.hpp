#pragma once

#include "types.hpp"
#include "validation.hpp"
#include <vector>

// Turns an expense into exact per-participant shares. Equal and weighted
// splits are rounded to the expense currency with the remainder on the first
// listed participant; itemized participant amounts are taken verbatim.
class ExpenseShares {
public:
    struct Result {
        ResolvedExpense expense;
        std::vector<ValidationIssue> issues;

        bool blocked() const { return has_blocking(issues); }
    };

    struct BatchResult {
        std::vector<ResolvedExpense> expenses;
        std::vector<ValidationIssue> issues;

        bool blocked() const { return has_blocking(issues); }
    };

    static Result resolve(const Expense& expense, const EngineOptions& options);

    static BatchResult resolve_all(const std::vector<Expense>& expenses, const EngineOptions& options);
};
