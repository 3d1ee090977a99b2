#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Closed set of PII categories the local detector recognizes.
 *
 * Declaration order is catalog order: earlier types win span conflicts.
 */
enum class EntityType : uint8_t {
    PERSON_NAME,
    EMAIL,
    PHONE,
    ADDRESS,
    SSN,
    CREDIT_CARD,
    DATE,
    LOCATION,
    GENERIC_NUMBER
};

inline constexpr size_t kEntityTypeCount = 9;

inline constexpr std::array<EntityType, kEntityTypeCount> kAllEntityTypes = {
    EntityType::PERSON_NAME, EntityType::EMAIL, EntityType::PHONE,
    EntityType::ADDRESS, EntityType::SSN, EntityType::CREDIT_CARD,
    EntityType::DATE, EntityType::LOCATION, EntityType::GENERIC_NUMBER
};

/**
 * @brief Ordinal privacy level: STANDARD < ENHANCED < MAXIMUM
 */
enum class PrivacyLevel : uint8_t {
    STANDARD,
    ENHANCED,
    MAXIMUM
};

/**
 * @brief Identifies which formula produced a privacy score.
 * Scores from different models are not numerically comparable.
 */
enum class ScoreModel : uint8_t {
    LOCAL_DENSITY,
    REMOTE_SERVICE
};

// Active-type bitmask per level. Checking membership is a single AND.
namespace level_mask {
    inline constexpr uint16_t bit(EntityType t) noexcept {
        return static_cast<uint16_t>(1u << static_cast<int>(t));
    }
    inline constexpr uint16_t kStandard =
        bit(EntityType::PERSON_NAME) | bit(EntityType::EMAIL) | bit(EntityType::PHONE) |
        bit(EntityType::ADDRESS) | bit(EntityType::SSN) | bit(EntityType::CREDIT_CARD);
    inline constexpr uint16_t kEnhanced = kStandard | bit(EntityType::LOCATION);
    inline constexpr uint16_t kMaximum =
        kEnhanced | bit(EntityType::DATE) | bit(EntityType::GENERIC_NUMBER);

    [[nodiscard]] inline constexpr uint16_t for_level(PrivacyLevel level) noexcept {
        switch (level) {
            case PrivacyLevel::STANDARD: return kStandard;
            case PrivacyLevel::ENHANCED: return kEnhanced;
            case PrivacyLevel::MAXIMUM:  return kMaximum;
        }
        return kStandard;
    }
}

[[nodiscard]] inline constexpr bool is_active(EntityType type, PrivacyLevel level) noexcept {
    return (level_mask::for_level(level) & level_mask::bit(type)) != 0;
}

// ============================================================================
// Data Model
// ============================================================================

/**
 * @brief Half-open byte range [start, end) into the original text
 */
struct Span {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t length() const { return end - start; }
    [[nodiscard]] bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }
    bool operator==(const Span&) const = default;
};

struct EntityMatch {
    Span span;
    std::string original_text;
    EntityType entity_type = EntityType::GENERIC_NUMBER;

    bool operator==(const EntityMatch&) const = default;
};

struct Replacement {
    std::string original;
    std::string replacement;
    EntityType entity_type = EntityType::GENERIC_NUMBER;
    double confidence = 0.0;
    std::string label;  // Wire label; differs from entity_type name for remote-only types
};

struct SanitizationResult {
    std::string sanitized_text;
    std::vector<Replacement> replacements;
    double privacy_score = 0.0;
    bool context_preserved = false;
    int64_t processing_time_ms = 0;
    ScoreModel score_model = ScoreModel::LOCAL_DENSITY;
};

struct PrivacyConfig {
    bool enable_token_substitution = true;
    bool enable_differential_privacy = false;
    PrivacyLevel privacy_level = PrivacyLevel::STANDARD;
    bool preserve_context = true;

    /**
     * @brief Build the per-call config for a level.
     * Differential privacy is enabled only for MAXIMUM.
     */
    [[nodiscard]] static PrivacyConfig for_level(PrivacyLevel level, bool preserve_context = true) {
        PrivacyConfig cfg;
        cfg.privacy_level = level;
        cfg.enable_differential_privacy = (level == PrivacyLevel::MAXIMUM);
        cfg.preserve_context = preserve_context;
        return cfg;
    }
};

// ============================================================================
// String Conversions
// ============================================================================

inline const char* entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::PERSON_NAME:    return "PERSON_NAME";
        case EntityType::EMAIL:          return "EMAIL";
        case EntityType::PHONE:          return "PHONE";
        case EntityType::ADDRESS:        return "ADDRESS";
        case EntityType::SSN:            return "SSN";
        case EntityType::CREDIT_CARD:    return "CREDIT_CARD";
        case EntityType::DATE:           return "DATE";
        case EntityType::LOCATION:       return "LOCATION";
        case EntityType::GENERIC_NUMBER: return "GENERIC_NUMBER";
        default:                         return "UNKNOWN";
    }
}

inline const char* privacy_level_to_string(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::STANDARD: return "standard";
        case PrivacyLevel::ENHANCED: return "enhanced";
        case PrivacyLevel::MAXIMUM:  return "maximum";
        default:                     return "standard";
    }
}

inline const char* score_model_to_string(ScoreModel model) {
    switch (model) {
        case ScoreModel::LOCAL_DENSITY:  return "local_density";
        case ScoreModel::REMOTE_SERVICE: return "remote_service";
        default:                         return "unknown";
    }
}

[[nodiscard]] std::optional<EntityType> parse_entity_type(std::string_view name);
[[nodiscard]] std::optional<PrivacyLevel> parse_privacy_level(std::string_view name);

} // namespace piiguard
