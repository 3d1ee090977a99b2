#include "validator/sanitization_validator.hpp"

namespace piiguard {

SanitizationValidator::SanitizationValidator()
    : email_regex_(R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)"),
      ssn_regex_(R"(\b\d{3}-?\d{2}-?\d{4}\b)"),
      phone_regex_(R"((\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4})") {}

ValidationReport SanitizationValidator::validate(const SanitizationResult& result) const {
    ValidationReport report;
    const auto& text = result.sanitized_text;

    if (std::regex_search(text, email_regex_)) {
        report.failed_checks.emplace_back("email");
    }
    if (std::regex_search(text, ssn_regex_)) {
        report.failed_checks.emplace_back("ssn");
    }
    if (std::regex_search(text, phone_regex_)) {
        report.failed_checks.emplace_back("phone");
    }
    if (result.privacy_score < kMinPrivacyScore) {
        report.failed_checks.emplace_back("privacy_score");
    }

    report.safe = report.failed_checks.empty();
    return report;
}

bool SanitizationValidator::is_safe(const SanitizationResult& result) const {
    return validate(result).safe;
}

} // namespace piiguard
