#include <ctime>
#include <iostream>
#include <string>
#include <vector>
#include "types.hpp"
#include "expense_shares.hpp"
#include "itemized_calculator.hpp"
#include "settlement_aggregator.hpp"
#include "settlement_validator.hpp"
#include "currency.hpp"
#include "transfer_breakdown.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string utc_now() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

void report_issues(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        std::cerr << (issue.is_blocking() ? "Blocking: " : "Warning: ") << json(issue.code).get<std::string>()
                  << " " << issue.message << std::endl;
    }
}

int run_itemize(const json& input, const EngineOptions& options) {
    auto result = ItemizedCalculator::calculate(input.at("input").get<ItemizedInput>(), options);
    report_issues(result.issues);
    std::cout << json(result).dump(4) << std::endl;
    return result.blocked() ? 1 : 0;
}

int run_settle(const json& input, const EngineOptions& options) {
    auto request = input.at("request").get<SettlementRequest>();
    auto result = SettlementAggregator::settle(request, options);
    report_issues(result.issues);
    if (result.blocked()) {
        std::cout << json(result).dump(4) << std::endl;
        return 1;
    }

    auto check = SettlementValidator::validate(result.person_summaries, result.transfers,
                                               Currency::smallest_unit(request.base_currency));
    if (!check.valid) {
        for (const auto& issue : check.issues) {
            std::cerr << "Settlement Check Failed: " << issue << std::endl;
        }
        json error_output = {
            {"status", "error"},
            {"issues", check.issues}
        };
        std::cout << error_output.dump(4) << std::endl;
        return 1;
    }

    std::cout << json(result).dump(4) << std::endl;
    return 0;
}

int run_validate(const json& input) {
    auto summaries = input.at("person_summaries").get<std::map<std::string, PersonSummary>>();
    auto transfers = input.at("transfers").get<std::vector<MinimalTransfer>>();
    auto epsilon = Currency::smallest_unit(input.value("currency", std::string("USD")));

    auto check = SettlementValidator::validate(summaries, transfers, epsilon);
    json output = {
        {"valid", check.valid},
        {"issues", check.issues}
    };
    std::cout << output.dump(4) << std::endl;
    return check.valid ? 0 : 1;
}

int run_breakdown(const json& input, const EngineOptions& options) {
    auto expenses = input.at("expenses").get<std::vector<Expense>>();
    auto resolved = ExpenseShares::resolve_all(expenses, options);
    report_issues(resolved.issues);
    if (resolved.blocked()) {
        json error_output = {
            {"status", "error"},
            {"issues", resolved.issues}
        };
        std::cout << error_output.dump(4) << std::endl;
        return 1;
    }

    auto breakdown = TransferBreakdownCalculator::calculate(
        input.at("from_user_id").get<std::string>(),
        input.at("to_user_id").get<std::string>(),
        input.at("amount").get<Decimal>(),
        resolved.expenses
    );
    json output = breakdown;
    output["total_positive"] = breakdown.total_positive();
    output["total_negative"] = breakdown.total_negative();
    std::cout << output.dump(4) << std::endl;
    return 0;
}

}  // namespace

int main() {
    // 1. Read Input (Stdin)
    json input;
    try {
        std::cin >> input;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing JSON input: " << e.what() << std::endl;
        return 1;
    }

    // 2. Dispatch Command
    try {
        EngineOptions options;
        if (input.contains("options")) {
            options = input["options"].get<EngineOptions>();
        }
        if (options.computed_at.empty()) {
            options.computed_at = utc_now();
        }

        const std::string command = input.value("command", std::string());
        if (command == "itemize") {
            return run_itemize(input, options);
        }
        if (command == "settle") {
            return run_settle(input, options);
        }
        if (command == "validate") {
            return run_validate(input);
        }
        if (command == "breakdown") {
            return run_breakdown(input, options);
        }
        std::cerr << "Unknown command: '" << command << "'" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error extracting data from JSON: " << e.what() << std::endl;
        return 1;
    }
}
