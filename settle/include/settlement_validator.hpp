#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

// Checks a computed settlement before it is shown or persisted
class SettlementValidator {
public:
    struct Result {
        bool valid;
        std::vector<std::string> issues;
    };

    // Runs every check and collects all problems found. Balance differences
    // are tolerated up to epsilon for each participant.
    static Result validate(
        const std::map<std::string, PersonSummary>& person_summaries,
        const std::vector<MinimalTransfer>& transfers,
        const Decimal& epsilon
    );

    // Conservation only
    static bool quick_validate(const std::map<std::string, PersonSummary>& person_summaries, const Decimal& epsilon);
};
