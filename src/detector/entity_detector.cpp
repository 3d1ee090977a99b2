#include "detector/entity_detector.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace piiguard {

EntityDetector::EntityDetector(std::shared_ptr<const PatternCatalog> catalog)
    : catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw std::invalid_argument("EntityDetector requires a pattern catalog");
    }
}

std::vector<EntityMatch> EntityDetector::detect(const std::string& text,
                                                PrivacyLevel level) const {
    std::vector<EntityMatch> accepted;
    if (text.empty()) {
        return accepted;
    }

    const auto overlaps_accepted = [&accepted](const Span& span) {
        return std::any_of(accepted.begin(), accepted.end(),
            [&span](const EntityMatch& m) { return m.span.overlaps(span); });
    };

    // Rules arrive in catalog order, so anything already accepted outranks
    // the rule being scanned.
    for (const PatternRule& rule : catalog_->rules_for(level)) {
        const auto begin = std::sregex_iterator(text.begin(), text.end(), rule.pattern);
        const auto end = std::sregex_iterator();

        for (auto it = begin; it != end; ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;

            const Span span{static_cast<size_t>(m.position(0)),
                            static_cast<size_t>(m.position(0) + m.length(0))};
            std::string matched = m.str(0);

            if (rule.validator && !rule.validator(matched)) continue;
            if (overlaps_accepted(span)) continue;

            accepted.push_back({span, std::move(matched), rule.entity_type});
        }
    }

    std::sort(accepted.begin(), accepted.end(),
        [](const EntityMatch& a, const EntityMatch& b) {
            return a.span.start < b.span.start;
        });

    return accepted;
}

} // namespace piiguard
