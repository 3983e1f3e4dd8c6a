#pragma once

#include "types.hpp"
#include "validation.hpp"
#include <map>
#include <string>
#include <vector>

struct ItemizedInput {
    std::vector<LineItem> items;
    Extras extras;
    AllocationRule allocation;
    // Output order and tie-break order. When empty, users are taken in the
    // order they first appear in item assignments.
    std::vector<std::string> participants;
    std::string payer_id;
    std::string currency = "USD";

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ItemizedInput, items, extras, allocation, participants,
                                                payer_id, currency)
};

struct ItemizedResult {
    // Empty whenever a blocking issue is present
    std::map<std::string, Decimal> participant_amounts;
    std::map<std::string, ParticipantBreakdown> participant_breakdown;
    // Participants in allocation order
    std::vector<std::string> participant_order;
    Decimal grand_total;
    std::vector<ValidationIssue> issues;

    bool blocked() const { return has_blocking(issues); }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ItemizedResult, participant_amounts, participant_breakdown,
                                   participant_order, grand_total, issues)
};

class ItemizedCalculator {
public:
    // Distributes line items and extras across participants in a fixed order:
    // items, discounts, tax, fees, tip, rounding, remainder, validation.
    // Identical inputs always produce identical results.
    static ItemizedResult calculate(const ItemizedInput& input, const EngineOptions& options);

    // Input checks only; returns every problem found
    static std::vector<ValidationIssue> validate_input(const ItemizedInput& input, const EngineOptions& options);
};
