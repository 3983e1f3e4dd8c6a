#include "settlement_validator.hpp"
#include <utility>

namespace {

Decimal net_sum(const std::map<std::string, PersonSummary>& person_summaries) {
    Decimal total;
    for (const auto& [user_id, summary] : person_summaries) {
        total += summary.net_base;
    }
    return total;
}

}  // namespace

SettlementValidator::Result SettlementValidator::validate(
    const std::map<std::string, PersonSummary>& person_summaries,
    const std::vector<MinimalTransfer>& transfers,
    const Decimal& epsilon
) {
    std::vector<std::string> issues;

    // Check 1: Conservation of money
    Decimal total = net_sum(person_summaries);
    if (total.abs() >= epsilon) {
        issues.push_back("Conservation of money violated: sum of balances = " + total.to_string() +
                         " (tolerance: " + epsilon.to_string() + ")");
    }

    std::map<std::pair<std::string, std::string>, std::vector<std::string>> ids_by_pair;
    std::map<std::string, Decimal> transfer_net;
    for (const auto& transfer : transfers) {
        // Check 2: Endpoints
        if (person_summaries.count(transfer.from_user_id) == 0) {
            issues.push_back("Transfer " + transfer.id + " has unknown payer: " + transfer.from_user_id);
        }
        if (person_summaries.count(transfer.to_user_id) == 0) {
            issues.push_back("Transfer " + transfer.id + " has unknown receiver: " + transfer.to_user_id);
        }
        if (transfer.from_user_id == transfer.to_user_id) {
            issues.push_back("Transfer " + transfer.id + " has same payer and receiver: " + transfer.from_user_id);
        }

        // Check 3: Amount > 0
        if (transfer.amount_base.is_zero()) {
            issues.push_back("Transfer " + transfer.id + " has zero amount");
        } else if (transfer.amount_base.sign() < 0) {
            issues.push_back("Transfer " + transfer.id + " has negative amount: " + transfer.amount_base.to_string());
        }

        ids_by_pair[{transfer.from_user_id, transfer.to_user_id}].push_back(transfer.id);
        transfer_net[transfer.to_user_id] += transfer.amount_base;
        transfer_net[transfer.from_user_id] -= transfer.amount_base;
    }

    // Check 4: One transfer per directed pair
    for (const auto& [pair, ids] : ids_by_pair) {
        if (ids.size() > 1) {
            std::string joined;
            for (const auto& id : ids) {
                joined += joined.empty() ? id : ", " + id;
            }
            issues.push_back("Duplicate transfers for pair " + pair.first + "->" + pair.second + ": " +
                             std::to_string(ids.size()) + " found (" + joined + ")");
        }
    }

    // Check 5: incoming - outgoing matches each net balance
    const Decimal tolerance = epsilon * Decimal(static_cast<long long>(person_summaries.size()));
    for (const auto& [user_id, summary] : person_summaries) {
        Decimal from_transfers = transfer_net[user_id];
        Decimal difference = (from_transfers - summary.net_base).abs();
        if (difference > tolerance) {
            issues.push_back("Balance mismatch for " + user_id + ": transfers give " + from_transfers.to_string() +
                             ", summary gives " + summary.net_base.to_string() +
                             " (difference: " + difference.to_string() + ")");
        }
    }

    return {issues.empty(), std::move(issues)};
}

bool SettlementValidator::quick_validate(const std::map<std::string, PersonSummary>& person_summaries,
                                         const Decimal& epsilon) {
    return net_sum(person_summaries).abs() < epsilon;
}
