#include "pairwise_netting.hpp"
#include <algorithm>
#include <set>
#include <tuple>

DirectedDebts PairwiseNettingEngine::accumulate_debts(const std::vector<ResolvedExpense>& expenses) {
    DirectedDebts debts;
    for (const auto& expense : expenses) {
        for (const auto& [user_id, share] : expense.shares) {
            // The payer does not owe themselves
            if (user_id == expense.payer_user_id) {
                continue;
            }
            debts[{user_id, expense.payer_user_id}] += share;
        }
    }
    return debts;
}

std::vector<PairwiseDebt> PairwiseNettingEngine::net_debts(
    const DirectedDebts& debts,
    const Decimal& epsilon,
    const std::string& trip_id,
    const std::string& computed_at
) {
    std::vector<PairwiseDebt> netted;
    std::set<std::pair<std::string, std::string>> processed;

    for (const auto& [key, amount] : debts) {
        const auto& [user_a, user_b] = key;
        std::pair<std::string, std::string> reverse{user_b, user_a};
        if (processed.count(key)) {
            continue;
        }
        processed.insert(key);
        processed.insert(reverse);

        auto it = debts.find(reverse);
        Decimal net = amount - (it == debts.end() ? Decimal() : it->second);
        if (net.abs() < epsilon) {
            continue;
        }

        if (net.sign() > 0) {
            netted.push_back({pair_id(trip_id, user_a, user_b), trip_id, user_a, user_b, net, computed_at});
        } else {
            netted.push_back({pair_id(trip_id, user_b, user_a), trip_id, user_b, user_a, net.abs(), computed_at});
        }
    }

    std::sort(netted.begin(), netted.end(), [](const PairwiseDebt& lhs, const PairwiseDebt& rhs) {
        return std::tie(lhs.from_user_id, lhs.to_user_id) < std::tie(rhs.from_user_id, rhs.to_user_id);
    });
    return netted;
}

std::vector<PairwiseDebt> PairwiseNettingEngine::calculate(
    const std::vector<ResolvedExpense>& expenses,
    const Decimal& epsilon,
    const std::string& trip_id,
    const std::string& computed_at
) {
    return net_debts(accumulate_debts(expenses), epsilon, trip_id, computed_at);
}

std::string PairwiseNettingEngine::pair_id(const std::string& trip_id, const std::string& from, const std::string& to) {
    return trip_id + ":" + from + "->" + to;
}
