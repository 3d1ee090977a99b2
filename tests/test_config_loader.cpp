#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace piiguard;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.remote.enabled);
    CHECK(cfg.remote.endpoint == "http://localhost:8000");
    CHECK(cfg.remote.timeout_ms == 10000);
    CHECK(cfg.sanitizer.privacy_level == "standard");
    CHECK(cfg.sanitizer.preserve_context);
    CHECK(cfg.sanitizer.batch_workers == 4);
    CHECK(cfg.circuit_breaker.failure_threshold == 5);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.custom_patterns.empty());
    CHECK(ConfigLoader::default_level(cfg) == PrivacyLevel::STANDARD);
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    const std::string toml = R"(
[remote]
enabled = true
endpoint = "https://anonymizer.internal:8443/v1"
api_key = "k-123"
timeout_ms = 2500
connect_timeout_ms = 500
health_timeout_ms = 1000

[sanitizer]
privacy_level = "maximum"
preserve_context = false
identity_policy = "consistent"
max_text_length = 4096
batch_workers = 8

[circuit_breaker]
enabled = true
failure_threshold = 3
success_threshold = 1
timeout_ms = 15000
half_open_max_calls = 2

[logging]
level = "warn"

[[custom_patterns]]
type = "generic_number"
regex = '\bEMP-\d{6}\b'
case_insensitive = true

[[custom_patterns]]
type = "credit_card"
regex = '\b\d{16}\b'
validator = "luhn"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.remote.endpoint == "https://anonymizer.internal:8443/v1");
    CHECK(cfg.remote.api_key == "k-123");
    CHECK(cfg.sanitizer.identity_policy == "consistent");
    CHECK(cfg.logging.level == "warn");
    REQUIRE(cfg.custom_patterns.size() == 2);
    CHECK(cfg.custom_patterns[0].case_insensitive);
    CHECK(cfg.custom_patterns[1].validator == "luhn");

    CHECK(ConfigLoader::default_level(cfg) == PrivacyLevel::MAXIMUM);

    const auto remote = ConfigLoader::to_remote_config(cfg);
    CHECK(remote.timeout_ms == 2500);
    CHECK(remote.connect_timeout_ms == 500);
    CHECK(remote.health_timeout_ms == 1000);
    REQUIRE(remote.custom_entities.size() == 2);
    CHECK(remote.custom_entities[0] == R"(\bEMP-\d{6}\b)");
    CHECK(remote.custom_entities[1] == R"(\b\d{16}\b)");

    const auto breaker = ConfigLoader::to_breaker_config(cfg);
    CHECK(breaker.failure_threshold == 3);
    CHECK(breaker.success_threshold == 1);
    CHECK(breaker.open_timeout == std::chrono::milliseconds(15000));
    CHECK(breaker.half_open_max_calls == 2);

    const auto orch = ConfigLoader::to_orchestrator_config(cfg);
    CHECK_FALSE(orch.preserve_context);
    CHECK(orch.max_text_length == 4096);
    CHECK(orch.batch_workers == 8);

    CHECK(ConfigLoader::to_sanitizer_options(cfg).identity_policy == IdentityPolicy::CONSISTENT);
}

TEST_CASE("ConfigLoader: env var expansion", "[config][env]") {
    ::setenv("PIIGUARD_TEST_API_KEY", "s3cret", 1);

    const std::string toml = R"(
[remote]
api_key = "Bearer-${PIIGUARD_TEST_API_KEY}"
endpoint = "http://${PIIGUARD_TEST_MISSING_HOST_XYZ}localhost:9000"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.remote.api_key == "Bearer-s3cret");
    CHECK(result.config.remote.endpoint == "http://localhost:9000");

    ::unsetenv("PIIGUARD_TEST_API_KEY");
}

TEST_CASE("ConfigLoader: unclosed ${ is a parse error", "[config][env]") {
    const std::string toml = R"(
[remote]
api_key = "${UNCLOSED"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[remote\nendpoint = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/piiguard.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigValidation: every problem is listed", "[config][validation]") {
    const std::string toml = R"(
[remote]
endpoint = "ftp://example.com"
timeout_ms = 0

[sanitizer]
privacy_level = "paranoid"
identity_policy = "sticky"
batch_workers = 0

[circuit_breaker]
failure_threshold = 0

[logging]
level = "verbose"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:"));
    CHECK(msg.find("remote.endpoint") != std::string::npos);
    CHECK(msg.find("remote.timeout_ms") != std::string::npos);
    CHECK(msg.find("sanitizer.privacy_level") != std::string::npos);
    CHECK(msg.find("sanitizer.identity_policy") != std::string::npos);
    CHECK(msg.find("sanitizer.batch_workers") != std::string::npos);
    CHECK(msg.find("circuit_breaker.failure_threshold") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: values too large for the component fields are rejected",
          "[config][validation]") {
    const std::string toml = R"(
[remote]
timeout_ms = 5000000000
connect_timeout_ms = 4294967296

[sanitizer]
batch_workers = 100000

[circuit_breaker]
failure_threshold = 4294967297
timeout_ms = 9000000000
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("remote.timeout_ms must be <= 3600000, got 5000000000") != std::string::npos);
    CHECK(msg.find("remote.connect_timeout_ms") != std::string::npos);
    CHECK(msg.find("sanitizer.batch_workers") != std::string::npos);
    CHECK(msg.find("circuit_breaker.failure_threshold") != std::string::npos);
    CHECK(msg.find("circuit_breaker.timeout_ms") != std::string::npos);
    CHECK(msg.find("remote.health_timeout_ms") == std::string::npos);
}

TEST_CASE("ConfigValidation: disabled sections are not checked", "[config][validation]") {
    const std::string toml = R"(
[remote]
enabled = false
endpoint = ""

[circuit_breaker]
enabled = false
failure_threshold = 0
)";
    const auto result = ConfigLoader::load_from_string(toml);
    CHECK(result.success);
}

TEST_CASE("ConfigValidation: bad custom patterns", "[config][validation]") {
    const std::string toml = R"(
[[custom_patterns]]
type = "passport"
regex = '[unclosed'
validator = "mod97"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("custom_patterns[0].type") != std::string::npos);
    CHECK(result.error_message.find("custom_patterns[0].regex") != std::string::npos);
    CHECK(result.error_message.find("custom_patterns[0].validator") != std::string::npos);
}

TEST_CASE("ConfigLoader: custom rules extend the catalog", "[config][catalog]") {
    const std::string toml = R"(
[[custom_patterns]]
type = "credit_card"
regex = '\b\d{16}\b'
validator = "luhn"

[[custom_patterns]]
type = "person_name"
regex = '\bagent [a-z]+\b'
case_insensitive = true
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto rules = ConfigLoader::build_custom_rules(result.config);
    REQUIRE(rules.size() == 2);
    CHECK(rules[0].entity_type == EntityType::CREDIT_CARD);
    REQUIRE(rules[0].validator);
    CHECK(rules[0].validator("4111111111111111"));
    CHECK_FALSE(rules[0].validator("4111111111111112"));
    CHECK_FALSE(rules[1].validator);

    const auto catalog = PatternCatalog::make_with(ConfigLoader::build_custom_rules(result.config));
    const LocalSanitizer sanitizer(catalog, ThreadLocalRandomSource::shared());
    const auto config = PrivacyConfig::for_level(PrivacyLevel::STANDARD, false);

    CHECK(sanitizer.sanitize("ask AGENT smith", config).sanitized_text == "ask [PERSON_NAME]");

    // Custom rules alone, so the built-in phone rule cannot claim the digits first
    const LocalSanitizer custom_only(
        std::make_shared<const PatternCatalog>(ConfigLoader::build_custom_rules(result.config)),
        ThreadLocalRandomSource::shared());
    CHECK(custom_only.sanitize("card 4111111111111111", config).sanitized_text ==
          "card [CREDIT_CARD]");
    CHECK(custom_only.sanitize("card 4111111111111112", config).sanitized_text ==
          "card 4111111111111112");
}

TEST_CASE("ConfigLoader: unknown type in build_custom_rules throws", "[config][catalog]") {
    PiiGuardConfig cfg;
    cfg.custom_patterns.push_back({"passport", R"(\d+)", false, ""});
    CHECK_THROWS_AS(ConfigLoader::build_custom_rules(cfg), std::invalid_argument);
}

TEST_CASE("ConfigLoader: identity policy names", "[config]") {
    CHECK(ConfigLoader::parse_identity_policy("per_occurrence") == IdentityPolicy::PER_OCCURRENCE);
    CHECK(ConfigLoader::parse_identity_policy("CONSISTENT") == IdentityPolicy::CONSISTENT);
    CHECK_FALSE(ConfigLoader::parse_identity_policy("sticky").has_value());
}
