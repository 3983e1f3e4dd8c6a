#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class IssueCode {
    UNASSIGNED_ITEM,
    SHARES_DO_NOT_SUM_TO_ONE,
    NEGATIVE_TOTAL,
    COMPUTATION_MISMATCH,
    EXTREME_PERCENTAGE,
    BALANCE_CONSERVATION_VIOLATION,
    INVALID_LINE_ITEM,
    INVALID_EXTRA,
    INVALID_ROUNDING_CONFIG,
    INVALID_EXPENSE,
    UNKNOWN_PARTICIPANT,
    PAYER_NOT_PARTICIPANT,
    CURRENCY_MISMATCH
};

enum class Severity {
    BLOCKING,
    WARNING
};

NLOHMANN_JSON_SERIALIZE_ENUM(IssueCode, {
    {IssueCode::UNASSIGNED_ITEM, "UNASSIGNED_ITEM"},
    {IssueCode::SHARES_DO_NOT_SUM_TO_ONE, "SHARES_DO_NOT_SUM_TO_ONE"},
    {IssueCode::NEGATIVE_TOTAL, "NEGATIVE_TOTAL"},
    {IssueCode::COMPUTATION_MISMATCH, "COMPUTATION_MISMATCH"},
    {IssueCode::EXTREME_PERCENTAGE, "EXTREME_PERCENTAGE"},
    {IssueCode::BALANCE_CONSERVATION_VIOLATION, "BALANCE_CONSERVATION_VIOLATION"},
    {IssueCode::INVALID_LINE_ITEM, "INVALID_LINE_ITEM"},
    {IssueCode::INVALID_EXTRA, "INVALID_EXTRA"},
    {IssueCode::INVALID_ROUNDING_CONFIG, "INVALID_ROUNDING_CONFIG"},
    {IssueCode::INVALID_EXPENSE, "INVALID_EXPENSE"},
    {IssueCode::UNKNOWN_PARTICIPANT, "UNKNOWN_PARTICIPANT"},
    {IssueCode::PAYER_NOT_PARTICIPANT, "PAYER_NOT_PARTICIPANT"},
    {IssueCode::CURRENCY_MISMATCH, "CURRENCY_MISMATCH"}
})

NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {
    {Severity::BLOCKING, "BLOCKING"},
    {Severity::WARNING, "WARNING"}
})

// Errors are returned as data. A BLOCKING issue means the accompanying
// result must not be persisted or trusted; a WARNING is advisory.
struct ValidationIssue {
    IssueCode code;
    Severity severity;
    std::string message;
    // Item, extra, expense or user the issue refers to
    std::string subject;

    bool is_blocking() const { return severity == Severity::BLOCKING; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ValidationIssue, code, severity, message, subject)
};

ValidationIssue blocking_issue(IssueCode code, std::string message, std::string subject = "");
ValidationIssue warning_issue(IssueCode code, std::string message, std::string subject = "");

bool has_blocking(const std::vector<ValidationIssue>& issues);
