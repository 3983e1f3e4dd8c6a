#pragma once

#include "types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct TransferContext {
    std::string trip_id;
    std::string currency;
    Decimal epsilon;
    std::string computed_at;
    const std::vector<ResolvedExpense>& expenses;
    const std::map<std::string, PersonSummary>& person_summaries;
};

// Turns balances into payable transfers
class TransferStrategy {
public:
    virtual ~TransferStrategy() = default;

    virtual std::vector<MinimalTransfer> compute(const TransferContext& context) const = 0;

    virtual TransferStrategyKind kind() const = 0;
};

// At most one transfer per pair, each traceable to that pair's expenses
class PairwiseNetTransferStrategy : public TransferStrategy {
public:
    std::vector<MinimalTransfer> compute(const TransferContext& context) const override;

    TransferStrategyKind kind() const override { return TransferStrategyKind::PAIRWISE_NET; }
};

// Legacy greedy matching of largest creditor against largest debtor.
// Ties on amount are broken by user id.
class GreedyMinimalTransferStrategy : public TransferStrategy {
public:
    std::vector<MinimalTransfer> compute(const TransferContext& context) const override;

    TransferStrategyKind kind() const override { return TransferStrategyKind::GREEDY_MINIMAL; }
};

std::unique_ptr<TransferStrategy> make_transfer_strategy(TransferStrategyKind kind);
