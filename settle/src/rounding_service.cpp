#include "rounding_service.hpp"
#include <random>
#include <stdexcept>

namespace {

const Decimal kHalf = Decimal(1) / Decimal(2);

Decimal round_to_integer(const Decimal& value, RoundingMode mode) {
    switch (mode) {
        case RoundingMode::FLOOR:
            return value.floor();
        case RoundingMode::CEIL:
            return value.ceil();
        case RoundingMode::ROUND_HALF_UP: {
            // Ties away from zero
            Decimal magnitude = value.abs();
            Decimal lower = magnitude.floor();
            Decimal result = (magnitude - lower >= kHalf) ? lower + 1 : lower;
            return value.sign() < 0 ? -result : result;
        }
        case RoundingMode::ROUND_HALF_EVEN: {
            Decimal lower = value.floor();
            Decimal fraction = value - lower;
            if (fraction > kHalf) {
                return lower + 1;
            }
            if (fraction < kHalf) {
                return lower;
            }
            Decimal half_lower = lower / 2;
            return half_lower.is_integer() ? lower : lower + 1;
        }
    }
    throw std::invalid_argument("Unknown rounding mode");
}

}  // namespace

Decimal RoundingService::round(const Decimal& amount, const Decimal& precision, RoundingMode mode) {
    if (precision.sign() <= 0) {
        throw std::invalid_argument("Rounding precision must be positive, got " + precision.to_string());
    }
    return round_to_integer(amount / precision, mode) * precision;
}

RoundingService::Result RoundingService::distribute_remainder(
    std::vector<RoundingEntry> entries,
    const Decimal& remainder,
    RemainderPolicy policy,
    const std::string& payer_id,
    std::uint32_t seed
) {
    Result result{std::move(entries), "", std::nullopt};
    if (remainder.is_zero()) {
        return result;
    }
    if (result.entries.empty()) {
        result.issue = blocking_issue(IssueCode::COMPUTATION_MISMATCH,
                                      "Remainder " + remainder.to_string() + " has no participant to absorb it");
        return result;
    }

    std::size_t index = 0;
    switch (policy) {
        case RemainderPolicy::LARGEST_SHARE:
            // Strict comparison keeps the first listed among equal shares
            for (std::size_t i = 1; i < result.entries.size(); ++i) {
                if (result.entries[i].raw > result.entries[index].raw) {
                    index = i;
                }
            }
            break;
        case RemainderPolicy::PAYER: {
            bool found = false;
            for (std::size_t i = 0; i < result.entries.size(); ++i) {
                if (result.entries[i].user_id == payer_id) {
                    index = i;
                    found = true;
                    break;
                }
            }
            if (!found) {
                result.issue = blocking_issue(IssueCode::PAYER_NOT_PARTICIPANT,
                                              "Payer '" + payer_id + "' holds no share to absorb the remainder",
                                              payer_id);
                return result;
            }
            break;
        }
        case RemainderPolicy::FIRST_LISTED:
            index = 0;
            break;
        case RemainderPolicy::DETERMINISTIC: {
            // mt19937 output is fixed by the standard, so the pick is portable
            std::mt19937 generator(seed);
            index = static_cast<std::size_t>(generator() % result.entries.size());
            break;
        }
    }

    result.entries[index].rounded += remainder;
    result.recipient = result.entries[index].user_id;
    return result;
}

RoundingService::Result RoundingService::round_amounts(
    const ShareList& raw_amounts,
    const Decimal& target_total,
    const RoundingConfig& config,
    const std::string& payer_id
) {
    std::vector<RoundingEntry> entries;
    entries.reserve(raw_amounts.size());
    Decimal rounded_sum;
    for (const auto& [user_id, raw] : raw_amounts) {
        Decimal rounded = round(raw, config.precision, config.mode);
        rounded_sum += rounded;
        entries.push_back({user_id, raw, rounded});
    }

    Decimal remainder = round(target_total, config.precision, config.mode) - rounded_sum;
    return distribute_remainder(std::move(entries), remainder, config.remainder_policy, payer_id, config.seed);
}
