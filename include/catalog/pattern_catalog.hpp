#pragma once

#include "core/types.hpp"

#include <array>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief One detection rule: a compiled regex plus an optional post-match check.
 *
 * The validator receives the matched substring; returning false drops the
 * match (e.g. a 16-digit run that fails Luhn is not a credit card).
 */
struct PatternRule {
    EntityType entity_type = EntityType::GENERIC_NUMBER;
    std::regex pattern;
    std::string source;       // Regex text, kept for diagnostics
    std::function<bool(std::string_view)> validator;

    PatternRule() = default;
    PatternRule(EntityType type, std::string regex_source, bool case_insensitive = false,
                std::function<bool(std::string_view)> check = {});
};

/**
 * @brief Per-type presentation and scoring data
 */
struct EntityTypeInfo {
    double confidence = 0.5;   // Static base weight reported on every Replacement
    std::string placeholder;   // Token used when context is not preserved
};

/**
 * @brief Immutable, ordered table of detection rules.
 *
 * Rules are kept in catalog order (PERSON_NAME → EMAIL → PHONE → ADDRESS →
 * SSN → CREDIT_CARD → DATE → LOCATION → GENERIC_NUMBER); within one type,
 * rules keep insertion order. Built once and shared as
 * std::shared_ptr<const PatternCatalog>; all lookups are const and
 * safe to call concurrently.
 */
class PatternCatalog {
public:
    using RuleList = std::vector<std::reference_wrapper<const PatternRule>>;

    /**
     * @brief Build a catalog from rules; rules are stably re-ordered by type.
     */
    explicit PatternCatalog(std::vector<PatternRule> rules);

    /**
     * @brief Built-in rule set with the standard confidence weights
     */
    [[nodiscard]] static std::shared_ptr<const PatternCatalog> make_default();

    /**
     * @brief Built-in rule set extended with additional rules
     */
    [[nodiscard]] static std::shared_ptr<const PatternCatalog> make_with(
        std::vector<PatternRule> extra_rules);

    /**
     * @brief Rules whose type is active at the given level, in catalog order
     */
    [[nodiscard]] RuleList rules_for(PrivacyLevel level) const;

    [[nodiscard]] const EntityTypeInfo& info(EntityType type) const {
        return type_info_[static_cast<size_t>(type)];
    }

    [[nodiscard]] double confidence(EntityType type) const { return info(type).confidence; }
    [[nodiscard]] const std::string& placeholder(EntityType type) const { return info(type).placeholder; }

    [[nodiscard]] size_t size() const { return rules_.size(); }

    // Validators shared by the built-in catalog and config-defined rules
    [[nodiscard]] static bool luhn_valid(std::string_view number);
    [[nodiscard]] static bool ssn_valid(std::string_view value);

private:
    [[nodiscard]] static std::vector<PatternRule> default_rules();

    std::vector<PatternRule> rules_;
    std::array<EntityTypeInfo, kEntityTypeCount> type_info_;
};

} // namespace piiguard
