#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"
#include "core/utils.hpp"

using namespace piiguard;

TEST_CASE("PrivacyLevel: STANDARD activates the six high-sensitivity types", "[types][level]") {
    CHECK(is_active(EntityType::PERSON_NAME, PrivacyLevel::STANDARD));
    CHECK(is_active(EntityType::EMAIL, PrivacyLevel::STANDARD));
    CHECK(is_active(EntityType::PHONE, PrivacyLevel::STANDARD));
    CHECK(is_active(EntityType::ADDRESS, PrivacyLevel::STANDARD));
    CHECK(is_active(EntityType::SSN, PrivacyLevel::STANDARD));
    CHECK(is_active(EntityType::CREDIT_CARD, PrivacyLevel::STANDARD));

    CHECK_FALSE(is_active(EntityType::LOCATION, PrivacyLevel::STANDARD));
    CHECK_FALSE(is_active(EntityType::DATE, PrivacyLevel::STANDARD));
    CHECK_FALSE(is_active(EntityType::GENERIC_NUMBER, PrivacyLevel::STANDARD));
}

TEST_CASE("PrivacyLevel: ENHANCED adds LOCATION only", "[types][level]") {
    CHECK(is_active(EntityType::LOCATION, PrivacyLevel::ENHANCED));
    CHECK_FALSE(is_active(EntityType::DATE, PrivacyLevel::ENHANCED));
    CHECK_FALSE(is_active(EntityType::GENERIC_NUMBER, PrivacyLevel::ENHANCED));
}

TEST_CASE("PrivacyLevel: active sets are nested", "[types][level]") {
    for (const auto type : kAllEntityTypes) {
        if (is_active(type, PrivacyLevel::STANDARD)) {
            CHECK(is_active(type, PrivacyLevel::ENHANCED));
        }
        if (is_active(type, PrivacyLevel::ENHANCED)) {
            CHECK(is_active(type, PrivacyLevel::MAXIMUM));
        }
        CHECK(is_active(type, PrivacyLevel::MAXIMUM));
    }
}

TEST_CASE("PrivacyConfig: differential privacy only at MAXIMUM", "[types][config]") {
    CHECK_FALSE(PrivacyConfig::for_level(PrivacyLevel::STANDARD).enable_differential_privacy);
    CHECK_FALSE(PrivacyConfig::for_level(PrivacyLevel::ENHANCED).enable_differential_privacy);
    CHECK(PrivacyConfig::for_level(PrivacyLevel::MAXIMUM).enable_differential_privacy);

    const auto cfg = PrivacyConfig::for_level(PrivacyLevel::ENHANCED, false);
    CHECK(cfg.enable_token_substitution);
    CHECK(cfg.privacy_level == PrivacyLevel::ENHANCED);
    CHECK_FALSE(cfg.preserve_context);
}

TEST_CASE("Span: half-open overlap", "[types][span]") {
    const Span a{0, 5};
    CHECK(a.overlaps(Span{4, 8}));
    CHECK_FALSE(a.overlaps(Span{5, 8}));
    CHECK(a.overlaps(Span{1, 2}));
    CHECK(a.length() == 5);
}

TEST_CASE("Parsing: entity types and levels are case-insensitive", "[types][parse]") {
    CHECK(parse_entity_type("credit_card") == EntityType::CREDIT_CARD);
    CHECK(parse_entity_type("PERSON_NAME") == EntityType::PERSON_NAME);
    CHECK_FALSE(parse_entity_type("passport").has_value());

    CHECK(parse_privacy_level("Maximum") == PrivacyLevel::MAXIMUM);
    CHECK(parse_privacy_level("standard") == PrivacyLevel::STANDARD);
    CHECK_FALSE(parse_privacy_level("strict").has_value());
}

TEST_CASE("Utils: word_count splits on any whitespace", "[types][utils]") {
    CHECK(utils::word_count("") == 0);
    CHECK(utils::word_count("   ") == 0);
    CHECK(utils::word_count("one") == 1);
    CHECK(utils::word_count("  one\ttwo\n three  ") == 3);
}

TEST_CASE("Utils: is_blank", "[types][utils]") {
    CHECK(utils::is_blank(""));
    CHECK(utils::is_blank(" \t\r\n"));
    CHECK_FALSE(utils::is_blank(" x "));
}
