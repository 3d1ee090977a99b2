#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"
#include "orchestrator/sanitization_orchestrator.hpp"
#include "remote/circuit_breaker.hpp"
#include "remote/remote_anonymizer.hpp"
#include "sanitizer/local_sanitizer.hpp"

#include <toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// Remote Service Config
// ============================================================================

struct RemoteServiceConfig {
    bool enabled = true;
    std::string endpoint = "http://localhost:8000";
    std::string api_key;
    int64_t timeout_ms = 10000;
    int64_t connect_timeout_ms = 2000;
    int64_t health_timeout_ms = 5000;
};

// ============================================================================
// Sanitizer Config
// ============================================================================

struct SanitizerConfig {
    std::string privacy_level = "standard";
    bool preserve_context = true;
    std::string identity_policy = "per_occurrence";
    int64_t max_text_length = 262144;
    int64_t batch_workers = 4;
};

// ============================================================================
// Circuit Breaker Config
// ============================================================================

struct CircuitBreakerConfig {
    bool enabled = true;
    int64_t failure_threshold = 5;
    int64_t success_threshold = 2;
    int64_t timeout_ms = 30000;
    int64_t half_open_max_calls = 1;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Custom Detection Rules ([[custom_patterns]])
// ============================================================================

struct CustomPatternConfig {
    std::string type;
    std::string regex;
    bool case_insensitive = false;
    std::string validator;   // "", "luhn" or "ssn"
};

struct PiiGuardConfig {
    RemoteServiceConfig remote;
    SanitizerConfig sanitizer;
    CircuitBreakerConfig circuit_breaker;
    LoggingConfig logging;
    std::vector<CustomPatternConfig> custom_patterns;
};

/**
 * @brief Loads piiguard.toml
 *
 * String values may reference environment variables as ${VAR}. Every
 * validation problem is reported, not just the first.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        PiiGuardConfig config;

        static LoadResult ok(PiiGuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems found in config; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PiiGuardConfig& config);

    // ---- Conversions (config must have passed validation) ----------------

    [[nodiscard]] static PrivacyLevel default_level(const PiiGuardConfig& config);
    [[nodiscard]] static RemoteAnonymizer::Config to_remote_config(const PiiGuardConfig& config);
    [[nodiscard]] static CircuitBreaker::Config to_breaker_config(const PiiGuardConfig& config);
    [[nodiscard]] static SanitizationOrchestrator::Config to_orchestrator_config(
        const PiiGuardConfig& config);
    [[nodiscard]] static LocalSanitizer::Options to_sanitizer_options(const PiiGuardConfig& config);

    /**
     * @brief Compile [[custom_patterns]] into catalog rules
     * @throws std::regex_error or std::invalid_argument for input validation would reject
     */
    [[nodiscard]] static std::vector<PatternRule> build_custom_rules(const PiiGuardConfig& config);

    [[nodiscard]] static std::optional<IdentityPolicy> parse_identity_policy(std::string_view name);

private:
    static PiiGuardConfig extract_all_sections(const toml::table& tbl);
    static RemoteServiceConfig extract_remote(const toml::table& root);
    static SanitizerConfig extract_sanitizer(const toml::table& root);
    static CircuitBreakerConfig extract_circuit_breaker(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static std::vector<CustomPatternConfig> extract_custom_patterns(const toml::table& root);

    static LoadResult validate_and_return(PiiGuardConfig config);
};

} // namespace piiguard
