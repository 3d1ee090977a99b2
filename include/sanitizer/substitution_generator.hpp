#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/random.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief How synthetic values relate across repeated mentions in one text
 *
 * PER_OCCURRENCE: every match draws a fresh synthetic value.
 * CONSISTENT:     the same (type, original) pair maps to the same
 *                 replacement for the duration of one call.
 */
enum class IdentityPolicy : uint8_t {
    PER_OCCURRENCE,
    CONSISTENT
};

[[nodiscard]] inline const char* identity_policy_to_string(IdentityPolicy policy) {
    switch (policy) {
        case IdentityPolicy::PER_OCCURRENCE: return "per_occurrence";
        case IdentityPolicy::CONSISTENT:     return "consistent";
        default:                             return "unknown";
    }
}

struct SubstitutionOutput {
    std::string sanitized_text;
    std::vector<Replacement> replacements;
};

/**
 * @brief Rebuilds text with every matched span replaced
 *
 * Works on spans in a single left-to-right pass: copy the gap before each
 * match, splice in its replacement, continue after the match. Identical
 * substrings outside a matched span are never touched.
 *
 * Replacement styles:
 * - preserve_context = false: fixed placeholder per type ("[EMAIL_ADDRESS]")
 * - preserve_context = true:  synthetic value of the same kind (fake person
 *   name, address/phone/date templates, length-matched "[XXXX]" for numbers)
 */
class SubstitutionGenerator {
public:
    SubstitutionGenerator(std::shared_ptr<const PatternCatalog> catalog,
                          std::shared_ptr<RandomSource> random,
                          IdentityPolicy policy = IdentityPolicy::PER_OCCURRENCE);

    /**
     * @brief Apply replacements for matches (sorted, non-overlapping)
     * @throws std::invalid_argument if a span is out of range or out of order
     */
    [[nodiscard]] SubstitutionOutput substitute(const std::string& text,
                                                const std::vector<EntityMatch>& matches,
                                                bool preserve_context) const;

    [[nodiscard]] IdentityPolicy identity_policy() const { return policy_; }

    [[nodiscard]] static const std::vector<std::string>& synthetic_first_names();
    [[nodiscard]] static const std::vector<std::string>& synthetic_last_names();

private:
    [[nodiscard]] std::string contextual_value(const EntityMatch& match) const;
    [[nodiscard]] std::string synthetic_person_name() const;

    std::shared_ptr<const PatternCatalog> catalog_;
    std::shared_ptr<RandomSource> random_;
    IdentityPolicy policy_;
};

} // namespace piiguard
