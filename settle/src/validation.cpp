#include "validation.hpp"
#include <algorithm>
#include <utility>

ValidationIssue blocking_issue(IssueCode code, std::string message, std::string subject) {
    return {code, Severity::BLOCKING, std::move(message), std::move(subject)};
}

ValidationIssue warning_issue(IssueCode code, std::string message, std::string subject) {
    return {code, Severity::WARNING, std::move(message), std::move(subject)};
}

bool has_blocking(const std::vector<ValidationIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const ValidationIssue& issue) { return issue.is_blocking(); });
}
