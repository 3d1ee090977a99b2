#include "catalog/pattern_catalog.hpp"

#include <algorithm>
#include <cctype>

namespace piiguard {

namespace {

std::string digits_of(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

constexpr std::string_view kMonths =
    "January|February|March|April|May|June|July|August|September|October|November|December";

constexpr std::string_view kCities =
    "New York|Los Angeles|Chicago|Houston|Phoenix|Philadelphia|San Antonio|San Diego|Dallas|"
    "San Jose|Austin|Jacksonville|Fort Worth|Columbus|Charlotte|San Francisco|Indianapolis|"
    "Seattle|Denver|Washington|Boston|El Paso|Nashville|Detroit|Oklahoma City|Portland|"
    "Las Vegas|Memphis|Louisville|Baltimore|Milwaukee|Albuquerque|Tucson|Fresno|Sacramento|"
    "Mesa|Kansas City|Atlanta|Long Beach|Colorado Springs|Raleigh|Miami|Virginia Beach|Omaha|"
    "Oakland|Minneapolis|Tulsa|Arlington|Tampa|New Orleans";

} // anonymous namespace

// ============================================================================
// PatternRule
// ============================================================================

PatternRule::PatternRule(EntityType type, std::string regex_source, bool case_insensitive,
                         std::function<bool(std::string_view)> check)
    : entity_type(type),
      pattern(regex_source,
              case_insensitive ? (std::regex::ECMAScript | std::regex::icase)
                               : std::regex::ECMAScript),
      source(std::move(regex_source)),
      validator(std::move(check)) {}

// ============================================================================
// Validators
// ============================================================================

bool PatternCatalog::luhn_valid(std::string_view number) {
    const std::string digits = digits_of(number);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_digit = !double_digit;
    }
    return (sum % 10) == 0;
}

bool PatternCatalog::ssn_valid(std::string_view value) {
    const std::string digits = digits_of(value);
    if (digits.size() != 9) {
        return false;
    }

    // Area cannot be 000, 666 or 9xx; group cannot be 00; serial cannot be 0000
    const int area = std::stoi(digits.substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) return false;
    if (std::stoi(digits.substr(3, 2)) == 0) return false;
    if (std::stoi(digits.substr(5, 4)) == 0) return false;
    return true;
}

// ============================================================================
// Catalog Construction
// ============================================================================

std::vector<PatternRule> PatternCatalog::default_rules() {
    std::vector<PatternRule> rules;
    rules.reserve(kEntityTypeCount);

    // All repetitions are bounded. libstdc++ regex recursion depth grows with
    // the length of one repeated run and would overflow the stack on long input.
    rules.emplace_back(EntityType::PERSON_NAME,
        R"(\b[A-Z][a-z]{1,40} [A-Z][a-z]{1,40}\b)");

    rules.emplace_back(EntityType::EMAIL,
        R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)");

    rules.emplace_back(EntityType::PHONE,
        R"((\+?1[-.\s]?)?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4})");

    rules.emplace_back(EntityType::ADDRESS,
        R"(\b\d{1,6}\s{1,4}[A-Za-z\s]{1,64}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Place|Pl)\b)",
        true);

    rules.emplace_back(EntityType::SSN,
        R"(\b\d{3}-?\d{2}-?\d{4}\b)");

    rules.emplace_back(EntityType::CREDIT_CARD,
        R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)");

    rules.emplace_back(EntityType::DATE,
        std::string(R"(\b(?:)") + std::string(kMonths) + R"()\s{1,4}\d{1,2},?\s{1,4}\d{4}\b)");

    rules.emplace_back(EntityType::LOCATION,
        std::string(R"(\b(?:)") + std::string(kCities) + R"()\b)");

    rules.emplace_back(EntityType::GENERIC_NUMBER,
        R"(\b\d{4,256}\b)");

    return rules;
}

PatternCatalog::PatternCatalog(std::vector<PatternRule> rules)
    : rules_(std::move(rules)) {
    std::stable_sort(rules_.begin(), rules_.end(),
        [](const PatternRule& a, const PatternRule& b) {
            return static_cast<int>(a.entity_type) < static_cast<int>(b.entity_type);
        });

    type_info_[static_cast<size_t>(EntityType::PERSON_NAME)]    = {0.75, "[PERSON_NAME]"};
    type_info_[static_cast<size_t>(EntityType::EMAIL)]          = {0.95, "[EMAIL_ADDRESS]"};
    type_info_[static_cast<size_t>(EntityType::PHONE)]          = {0.90, "[PHONE_NUMBER]"};
    type_info_[static_cast<size_t>(EntityType::ADDRESS)]        = {0.85, "[ADDRESS]"};
    type_info_[static_cast<size_t>(EntityType::SSN)]            = {0.98, "[SSN]"};
    type_info_[static_cast<size_t>(EntityType::CREDIT_CARD)]    = {0.95, "[CREDIT_CARD]"};
    type_info_[static_cast<size_t>(EntityType::DATE)]           = {0.70, "[DATE]"};
    type_info_[static_cast<size_t>(EntityType::LOCATION)]       = {0.80, "[CITY]"};
    type_info_[static_cast<size_t>(EntityType::GENERIC_NUMBER)] = {0.60, "[NUMBER]"};
}

std::shared_ptr<const PatternCatalog> PatternCatalog::make_default() {
    return std::make_shared<const PatternCatalog>(default_rules());
}

std::shared_ptr<const PatternCatalog> PatternCatalog::make_with(
    std::vector<PatternRule> extra_rules) {
    auto rules = default_rules();
    rules.reserve(rules.size() + extra_rules.size());
    for (auto& rule : extra_rules) {
        rules.emplace_back(std::move(rule));
    }
    return std::make_shared<const PatternCatalog>(std::move(rules));
}

PatternCatalog::RuleList PatternCatalog::rules_for(PrivacyLevel level) const {
    RuleList active;
    active.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (is_active(rule.entity_type, level)) {
            active.emplace_back(std::cref(rule));
        }
    }
    return active;
}

} // namespace piiguard
