#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace piiguard {

std::optional<EntityType> parse_entity_type(std::string_view name) {
    static const std::unordered_map<std::string, EntityType> lookup = {
        {"person_name",    EntityType::PERSON_NAME},
        {"email",          EntityType::EMAIL},
        {"phone",          EntityType::PHONE},
        {"address",        EntityType::ADDRESS},
        {"ssn",            EntityType::SSN},
        {"credit_card",    EntityType::CREDIT_CARD},
        {"date",           EntityType::DATE},
        {"location",       EntityType::LOCATION},
        {"generic_number", EntityType::GENERIC_NUMBER},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<PrivacyLevel> parse_privacy_level(std::string_view name) {
    static const std::unordered_map<std::string, PrivacyLevel> lookup = {
        {"standard", PrivacyLevel::STANDARD},
        {"enhanced", PrivacyLevel::ENHANCED},
        {"maximum",  PrivacyLevel::MAXIMUM},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace piiguard
