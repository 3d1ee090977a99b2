#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Scans text against the active rules of a PatternCatalog
 *
 * Every rule runs over the original text (never a partially substituted
 * copy). When spans from two rules overlap, the rule earlier in catalog
 * order keeps its match and the later one is discarded. The returned
 * matches are sorted by start offset.
 *
 * Deterministic and const: the same (text, level) always yields the same
 * matches. May throw std::regex_error if the regex engine gives up on
 * pathological input, or whatever a rule validator throws.
 */
class EntityDetector {
public:
    explicit EntityDetector(std::shared_ptr<const PatternCatalog> catalog);

    [[nodiscard]] std::vector<EntityMatch> detect(const std::string& text,
                                                  PrivacyLevel level) const;

    [[nodiscard]] const PatternCatalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<const PatternCatalog> catalog_;
};

} // namespace piiguard
