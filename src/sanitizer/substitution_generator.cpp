#include "sanitizer/substitution_generator.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <stdexcept>
#include <utility>

namespace piiguard {

static constexpr size_t kMaxMaskedDigits = 6;

SubstitutionGenerator::SubstitutionGenerator(std::shared_ptr<const PatternCatalog> catalog,
                                             std::shared_ptr<RandomSource> random,
                                             IdentityPolicy policy)
    : catalog_(std::move(catalog)),
      random_(std::move(random)),
      policy_(policy) {
    if (!catalog_ || !random_) {
        throw std::invalid_argument("SubstitutionGenerator requires a catalog and a random source");
    }
}

const std::vector<std::string>& SubstitutionGenerator::synthetic_first_names() {
    static const std::vector<std::string> names = {
        "Alex", "Jordan", "Taylor", "Casey", "Morgan", "Riley", "Avery", "Quinn"
    };
    return names;
}

const std::vector<std::string>& SubstitutionGenerator::synthetic_last_names() {
    static const std::vector<std::string> names = {
        "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis"
    };
    return names;
}

std::string SubstitutionGenerator::synthetic_person_name() const {
    const auto& first = synthetic_first_names();
    const auto& last = synthetic_last_names();
    return std::format("{} {}", first[random_->pick(first.size())],
                       last[random_->pick(last.size())]);
}

std::string SubstitutionGenerator::contextual_value(const EntityMatch& match) const {
    switch (match.entity_type) {
        case EntityType::PERSON_NAME:
            return synthetic_person_name();
        case EntityType::EMAIL:
            return "[USER]@[DOMAIN].com";
        case EntityType::PHONE:
            // Digit-free so residual-leak checks never flag the template itself
            return "(XXX) XXX-XXXX";
        case EntityType::ADDRESS:
            return "123 [STREET_NAME] Street";
        case EntityType::DATE:
            return "[MONTH] [DAY], [YEAR]";
        case EntityType::LOCATION:
            return "[CITY_NAME]";
        case EntityType::GENERIC_NUMBER: {
            const size_t width = std::min(match.original_text.size(), kMaxMaskedDigits);
            return "[" + std::string(width, 'X') + "]";
        }
        case EntityType::SSN:
        case EntityType::CREDIT_CARD:
            break;
    }
    return catalog_->placeholder(match.entity_type);
}

SubstitutionOutput SubstitutionGenerator::substitute(const std::string& text,
                                                     const std::vector<EntityMatch>& matches,
                                                     bool preserve_context) const {
    SubstitutionOutput out;
    out.replacements.reserve(matches.size());

    // Per-call identity map (CONSISTENT policy only)
    std::map<std::pair<EntityType, std::string>, std::string> identities;

    std::vector<std::string> values;
    values.reserve(matches.size());

    size_t cursor = 0;
    size_t final_size = text.size();
    for (const auto& match : matches) {
        if (match.span.start < cursor || match.span.end > text.size() ||
            match.span.start > match.span.end) {
            throw std::invalid_argument(std::format(
                "Match span [{}, {}) is out of order or outside the text",
                match.span.start, match.span.end));
        }
        cursor = match.span.end;

        std::string value;
        if (!preserve_context) {
            value = catalog_->placeholder(match.entity_type);
        } else if (policy_ == IdentityPolicy::CONSISTENT) {
            const auto key = std::make_pair(match.entity_type, match.original_text);
            const auto it = identities.find(key);
            if (it != identities.end()) {
                value = it->second;
            } else {
                value = contextual_value(match);
                identities.emplace(key, value);
            }
        } else {
            value = contextual_value(match);
        }

        final_size = final_size - match.span.length() + value.size();
        values.emplace_back(std::move(value));
    }

    // Single pass: gap, replacement, gap, replacement, ..., tail
    out.sanitized_text.reserve(final_size);
    cursor = 0;
    for (size_t i = 0; i < matches.size(); ++i) {
        const auto& match = matches[i];
        out.sanitized_text.append(text, cursor, match.span.start - cursor);
        out.sanitized_text.append(values[i]);
        cursor = match.span.end;

        out.replacements.push_back({
            match.original_text,
            values[i],
            match.entity_type,
            catalog_->confidence(match.entity_type),
            entity_type_to_string(match.entity_type)
        });
    }
    out.sanitized_text.append(text, cursor, std::string::npos);

    return out;
}

} // namespace piiguard
