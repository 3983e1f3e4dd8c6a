#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

// (debtor, creditor) -> accumulated raw debt
using DirectedDebts = std::map<std::pair<std::string, std::string>, Decimal>;

class PairwiseNettingEngine {
public:
    // Every non-payer participant owes their share to the payer
    static DirectedDebts accumulate_debts(const std::vector<ResolvedExpense>& expenses);

    // One debt per pair in the net debtor's direction; pairs whose net is
    // below epsilon are settled and omitted. Ordered by (from, to).
    static std::vector<PairwiseDebt> net_debts(
        const DirectedDebts& debts,
        const Decimal& epsilon,
        const std::string& trip_id,
        const std::string& computed_at
    );

    static std::vector<PairwiseDebt> calculate(
        const std::vector<ResolvedExpense>& expenses,
        const Decimal& epsilon,
        const std::string& trip_id,
        const std::string& computed_at
    );

    static std::string pair_id(const std::string& trip_id, const std::string& from, const std::string& to);
};
