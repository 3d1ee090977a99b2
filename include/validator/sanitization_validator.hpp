#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace piiguard {

struct ValidationReport {
    bool safe = true;
    std::vector<std::string> failed_checks;  // "email", "ssn", "phone", "privacy_score"
};

/**
 * @brief Post-hoc residual-leak gate for sanitized output
 *
 * Fails if sanitized_text still contains an email, SSN or phone pattern,
 * or if privacy_score is below 0.70. Callers run it before persisting and
 * decide whether to retry at a stricter level; it is never run implicitly.
 */
class SanitizationValidator {
public:
    static constexpr double kMinPrivacyScore = 0.70;

    SanitizationValidator();

    [[nodiscard]] bool is_safe(const SanitizationResult& result) const;

    [[nodiscard]] ValidationReport validate(const SanitizationResult& result) const;

private:
    // Compiled once; std::regex_search on a const regex is thread-safe
    std::regex email_regex_;
    std::regex ssn_regex_;
    std::regex phone_regex_;
};

} // namespace piiguard
