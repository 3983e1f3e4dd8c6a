#include "transfer_strategy.hpp"
#include "pairwise_netting.hpp"
#include <algorithm>

namespace {

struct Balance {
    std::string user_id;
    Decimal amount;
};

void sort_descending(std::vector<Balance>& balances) {
    std::sort(balances.begin(), balances.end(), [](const Balance& lhs, const Balance& rhs) {
        if (lhs.amount != rhs.amount) {
            return lhs.amount > rhs.amount;
        }
        return lhs.user_id < rhs.user_id;
    });
}

MinimalTransfer make_transfer(const TransferContext& context, const std::string& from, const std::string& to,
                              const Decimal& amount) {
    MinimalTransfer transfer;
    transfer.id = PairwiseNettingEngine::pair_id(context.trip_id, from, to);
    transfer.trip_id = context.trip_id;
    transfer.from_user_id = from;
    transfer.to_user_id = to;
    transfer.amount_base = amount;
    if (!context.currency.empty()) {
        transfer.currency = context.currency;
    }
    transfer.computed_at = context.computed_at;
    return transfer;
}

}  // namespace

std::vector<MinimalTransfer> PairwiseNetTransferStrategy::compute(const TransferContext& context) const {
    std::vector<MinimalTransfer> transfers;
    auto debts = PairwiseNettingEngine::calculate(context.expenses, context.epsilon, context.trip_id,
                                                  context.computed_at);
    for (const auto& debt : debts) {
        transfers.push_back(make_transfer(context, debt.from_user_id, debt.to_user_id, debt.netted_base));
    }
    return transfers;
}

std::vector<MinimalTransfer> GreedyMinimalTransferStrategy::compute(const TransferContext& context) const {
    std::vector<MinimalTransfer> transfers;

    // 1. Partition into creditors and debtors
    std::vector<Balance> creditors;
    std::vector<Balance> debtors;
    for (const auto& [user_id, summary] : context.person_summaries) {
        if (summary.net_base.sign() > 0) {
            creditors.push_back({user_id, summary.net_base});
        } else if (summary.net_base.sign() < 0) {
            debtors.push_back({user_id, summary.net_base.abs()});
        }
    }

    // 2. Largest first
    sort_descending(creditors);
    sort_descending(debtors);

    // 3. Match the heads until one side is exhausted
    std::size_t c = 0;
    std::size_t d = 0;
    while (c < creditors.size() && d < debtors.size()) {
        auto& creditor = creditors[c];
        auto& debtor = debtors[d];
        Decimal amount = std::min(creditor.amount, debtor.amount);

        transfers.push_back(make_transfer(context, debtor.user_id, creditor.user_id, amount));

        creditor.amount -= amount;
        debtor.amount -= amount;
        if (creditor.amount < context.epsilon) {
            ++c;
        }
        if (debtor.amount < context.epsilon) {
            ++d;
        }
    }
    return transfers;
}

std::unique_ptr<TransferStrategy> make_transfer_strategy(TransferStrategyKind kind) {
    switch (kind) {
        case TransferStrategyKind::GREEDY_MINIMAL:
            return std::make_unique<GreedyMinimalTransferStrategy>();
        case TransferStrategyKind::PAIRWISE_NET:
            break;
    }
    return std::make_unique<PairwiseNetTransferStrategy>();
}
