#pragma once

#include "decimal.hpp"
#include "types.hpp"
#include "validation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One participant's amount before and after rounding
struct RoundingEntry {
    std::string user_id;
    Decimal raw;
    Decimal rounded;
};

class RoundingService {
public:
    struct Result {
        std::vector<RoundingEntry> entries;
        // Empty when there was no remainder to place
        std::string recipient;
        std::optional<ValidationIssue> issue;
    };

    // Rounds to the nearest multiple of precision. Throws std::invalid_argument
    // if precision is not positive.
    static Decimal round(const Decimal& amount, const Decimal& precision, RoundingMode mode);

    // Adds the whole remainder to exactly one entry chosen by policy
    static Result distribute_remainder(
        std::vector<RoundingEntry> entries,
        const Decimal& remainder,
        RemainderPolicy policy,
        const std::string& payer_id,
        std::uint32_t seed
    );

    // Rounds each raw amount and places the remainder so the rounded amounts
    // add up to round(target_total)
    static Result round_amounts(
        const ShareList& raw_amounts,
        const Decimal& target_total,
        const RoundingConfig& config,
        const std::string& payer_id
    );
};
