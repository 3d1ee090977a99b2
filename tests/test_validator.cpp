#include <catch2/catch_test_macros.hpp>
#include "validator/sanitization_validator.hpp"
#include "sanitizer/local_sanitizer.hpp"

#include <algorithm>

using namespace piiguard;

namespace {

SanitizationResult make_result(std::string text, double score) {
    SanitizationResult result;
    result.sanitized_text = std::move(text);
    result.privacy_score = score;
    return result;
}

bool has_check(const ValidationReport& report, const std::string& name) {
    return std::find(report.failed_checks.begin(), report.failed_checks.end(), name) !=
           report.failed_checks.end();
}

} // anonymous namespace

TEST_CASE("Validator: sanitized SSN text is safe", "[validator]") {
    const LocalSanitizer sanitizer;
    const SanitizationValidator validator;
    CHECK(validator.is_safe(sanitizer.sanitize("My SSN is 123-45-6789", PrivacyLevel::STANDARD)));
}

TEST_CASE("Validator: contextual output passes its own checks", "[validator]") {
    const LocalSanitizer sanitizer;
    const SanitizationValidator validator;
    const auto result = sanitizer.sanitize(
        "Reach Jane Roe at jr@corp.io or 212-555-0188", PrivacyLevel::STANDARD);
    CHECK(validator.validate(result).failed_checks.empty());
}

TEST_CASE("Validator: residual patterns fail", "[validator]") {
    const SanitizationValidator validator;

    SECTION("email") {
        const auto report = validator.validate(make_result("write to a@b.io", 0.95));
        CHECK_FALSE(report.safe);
        CHECK(has_check(report, "email"));
    }
    SECTION("ssn") {
        const auto report = validator.validate(make_result("ssn 123-45-6789", 0.95));
        CHECK_FALSE(report.safe);
        CHECK(has_check(report, "ssn"));
    }
    SECTION("phone") {
        const auto report = validator.validate(make_result("call 555.123.4567", 0.95));
        CHECK_FALSE(report.safe);
        CHECK(has_check(report, "phone"));
    }
}

TEST_CASE("Validator: low score fails even with clean text", "[validator]") {
    const SanitizationValidator validator;
    const auto report = validator.validate(make_result("nothing here", 0.69));
    CHECK_FALSE(report.safe);
    REQUIRE(report.failed_checks.size() == 1);
    CHECK(report.failed_checks[0] == "privacy_score");

    CHECK(validator.is_safe(make_result("nothing here", 0.70)));
}

TEST_CASE("Validator: every failed check is listed", "[validator]") {
    const SanitizationValidator validator;
    const auto report = validator.validate(make_result("a@b.io 123-45-6789 (555) 123-4567", 0.5));
    CHECK(report.failed_checks.size() == 4);
}
