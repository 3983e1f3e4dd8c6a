#pragma once

#include "types.hpp"
#include "validation.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct SettlementRequest {
    std::string trip_id;
    std::string base_currency = "USD";
    // Trip members; each gets a summary even without expenses
    std::vector<std::string> participants;
    std::vector<Expense> expenses;
    // Display metadata; category spending is only produced when present
    std::optional<std::vector<Category>> categories;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SettlementRequest, trip_id, base_currency, participants,
                                                expenses, categories)
};

struct SettlementResult {
    std::map<std::string, PersonSummary> person_summaries;
    std::vector<PairwiseDebt> pairwise_debts;
    std::vector<MinimalTransfer> transfers;
    std::optional<std::map<std::string, PersonCategorySpending>> category_spending;
    std::vector<ValidationIssue> issues;

    bool blocked() const { return has_blocking(issues); }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(SettlementResult, person_summaries, pairwise_debts, transfers,
                                   category_spending, issues)
};

// Totals accumulated in one pass over resolved expenses
struct Ledger {
    std::map<std::string, PersonSummary> person_summaries;
    std::optional<std::map<std::string, PersonCategorySpending>> category_spending;
};

// Accumulates paid/owed totals and category buckets; finalize() is called once
class LedgerBuilder {
public:
    static constexpr const char* kUncategorized = "uncategorized";

    LedgerBuilder(const std::vector<std::string>& participants,
                  const std::optional<std::vector<Category>>& categories);

    void add(const ResolvedExpense& expense);

    Ledger finalize() &&;

private:
    struct Totals {
        Decimal paid;
        Decimal owed;
        std::map<std::string, Decimal> by_category;
    };

    Totals& totals_for(const std::string& user_id);

    std::map<std::string, Totals> totals_;
    std::optional<std::vector<Category>> categories_;
};

class SettlementAggregator {
public:
    static SettlementResult settle(const SettlementRequest& request, const EngineOptions& options);

    static std::map<std::string, PersonSummary> person_summaries(
        const std::vector<ResolvedExpense>& expenses,
        const std::vector<std::string>& participants
    );

    // Conservation check: the net balances must cancel out within epsilon
    static std::optional<ValidationIssue> validate_balances(
        const std::map<std::string, PersonSummary>& summaries,
        const Decimal& epsilon
    );
};
