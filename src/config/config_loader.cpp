#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_map>

using namespace std::string_literals;

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* t = node.as_table()) {
        expand_env_vars_recursive(*t);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

bool is_known_validator(const std::string& name) {
    return name.empty() || name == "luhn" || name == "ssn";
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

RemoteServiceConfig ConfigLoader::extract_remote(const toml::table& root) {
    RemoteServiceConfig cfg;
    const auto* r = root["remote"].as_table();
    if (!r) return cfg;

    cfg.enabled = (*r)["enabled"].value_or(true);
    cfg.endpoint = (*r)["endpoint"].value_or("http://localhost:8000"s);
    cfg.api_key = (*r)["api_key"].value_or(""s);
    cfg.timeout_ms = (*r)["timeout_ms"].value_or(int64_t{10000});
    cfg.connect_timeout_ms = (*r)["connect_timeout_ms"].value_or(int64_t{2000});
    cfg.health_timeout_ms = (*r)["health_timeout_ms"].value_or(int64_t{5000});
    return cfg;
}

SanitizerConfig ConfigLoader::extract_sanitizer(const toml::table& root) {
    SanitizerConfig cfg;
    const auto* s = root["sanitizer"].as_table();
    if (!s) return cfg;

    cfg.privacy_level = (*s)["privacy_level"].value_or("standard"s);
    cfg.preserve_context = (*s)["preserve_context"].value_or(true);
    cfg.identity_policy = (*s)["identity_policy"].value_or("per_occurrence"s);
    cfg.max_text_length = (*s)["max_text_length"].value_or(int64_t{262144});
    cfg.batch_workers = (*s)["batch_workers"].value_or(int64_t{4});
    return cfg;
}

CircuitBreakerConfig ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.enabled = (*cb)["enabled"].value_or(true);
    cfg.failure_threshold = (*cb)["failure_threshold"].value_or(int64_t{5});
    cfg.success_threshold = (*cb)["success_threshold"].value_or(int64_t{2});
    cfg.timeout_ms = (*cb)["timeout_ms"].value_or(int64_t{30000});
    cfg.half_open_max_calls = (*cb)["half_open_max_calls"].value_or(int64_t{1});
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or("info"s);
    }
    return cfg;
}

std::vector<CustomPatternConfig> ConfigLoader::extract_custom_patterns(const toml::table& root) {
    std::vector<CustomPatternConfig> patterns;
    const auto* arr = root["custom_patterns"].as_array();
    if (!arr) return patterns;

    patterns.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) continue;

        CustomPatternConfig cfg;
        cfg.type = (*p)["type"].value_or(""s);
        cfg.regex = (*p)["regex"].value_or(""s);
        cfg.case_insensitive = (*p)["case_insensitive"].value_or(false);
        cfg.validator = (*p)["validator"].value_or(""s);
        patterns.push_back(std::move(cfg));
    }
    return patterns;
}

PiiGuardConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PiiGuardConfig config;
    config.remote = extract_remote(tbl);
    config.sanitizer = extract_sanitizer(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.logging = extract_logging(tbl);
    config.custom_patterns = extract_custom_patterns(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PiiGuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::optional<IdentityPolicy> ConfigLoader::parse_identity_policy(std::string_view name) {
    static const std::unordered_map<std::string, IdentityPolicy> lookup = {
        {"per_occurrence", IdentityPolicy::PER_OCCURRENCE},
        {"consistent",     IdentityPolicy::CONSISTENT},
    };
    const auto it = lookup.find(utils::to_lower(name));
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

namespace {

// Upper bounds keep every value representable in the narrower component fields
constexpr int64_t kMaxTimeoutMs = 3'600'000;
constexpr int64_t kMaxBreakerCount = 1'000'000;
constexpr int64_t kMaxBatchWorkers = 256;
constexpr int64_t kMaxTextLength = 16 * 1024 * 1024;

} // anonymous namespace

std::vector<std::string> ConfigLoader::validate_config(const PiiGuardConfig& config) {
    std::vector<std::string> errors;

    const auto check_range = [&errors](std::string_view name, int64_t value, int64_t max) {
        if (value <= 0) {
            errors.push_back(std::format("{} must be > 0", name));
        } else if (value > max) {
            errors.push_back(std::format("{} must be <= {}, got {}", name, max, value));
        }
    };

    if (config.remote.enabled) {
        if (config.remote.endpoint.empty()) {
            errors.push_back("remote.endpoint required when remote is enabled");
        } else if (!config.remote.endpoint.starts_with("http://") &&
                   !config.remote.endpoint.starts_with("https://")) {
            errors.push_back(std::format(
                "remote.endpoint must start with http:// or https://, got '{}'",
                config.remote.endpoint));
        }
        check_range("remote.timeout_ms", config.remote.timeout_ms, kMaxTimeoutMs);
        check_range("remote.connect_timeout_ms", config.remote.connect_timeout_ms, kMaxTimeoutMs);
        check_range("remote.health_timeout_ms", config.remote.health_timeout_ms, kMaxTimeoutMs);
    }

    if (!parse_privacy_level(config.sanitizer.privacy_level)) {
        errors.push_back(std::format(
            "sanitizer.privacy_level must be standard, enhanced or maximum, got '{}'",
            config.sanitizer.privacy_level));
    }
    if (!parse_identity_policy(config.sanitizer.identity_policy)) {
        errors.push_back(std::format(
            "sanitizer.identity_policy must be per_occurrence or consistent, got '{}'",
            config.sanitizer.identity_policy));
    }
    check_range("sanitizer.max_text_length", config.sanitizer.max_text_length, kMaxTextLength);
    check_range("sanitizer.batch_workers", config.sanitizer.batch_workers, kMaxBatchWorkers);

    if (config.circuit_breaker.enabled) {
        check_range("circuit_breaker.failure_threshold",
                    config.circuit_breaker.failure_threshold, kMaxBreakerCount);
        check_range("circuit_breaker.success_threshold",
                    config.circuit_breaker.success_threshold, kMaxBreakerCount);
        check_range("circuit_breaker.timeout_ms", config.circuit_breaker.timeout_ms, kMaxTimeoutMs);
        check_range("circuit_breaker.half_open_max_calls",
                    config.circuit_breaker.half_open_max_calls, kMaxBreakerCount);
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    for (size_t i = 0; i < config.custom_patterns.size(); ++i) {
        const auto& p = config.custom_patterns[i];
        if (!parse_entity_type(p.type)) {
            errors.push_back(std::format("custom_patterns[{}].type '{}' is not an entity type",
                                         i, p.type));
        }
        if (p.regex.empty()) {
            errors.push_back(std::format("custom_patterns[{}].regex must not be empty", i));
        } else {
            try {
                const auto flags = p.case_insensitive
                    ? std::regex::ECMAScript | std::regex::icase
                    : std::regex::ECMAScript;
                const std::regex compiled(p.regex, flags);
                (void)compiled;
            } catch (const std::regex_error& e) {
                errors.push_back(std::format("custom_patterns[{}].regex does not compile: {}",
                                             i, e.what()));
            }
        }
        if (!is_known_validator(p.validator)) {
            errors.push_back(std::format(
                "custom_patterns[{}].validator must be luhn or ssn, got '{}'", i, p.validator));
        }
    }

    return errors;
}

// ============================================================================
// Conversions
// ============================================================================

PrivacyLevel ConfigLoader::default_level(const PiiGuardConfig& config) {
    return parse_privacy_level(config.sanitizer.privacy_level).value_or(PrivacyLevel::STANDARD);
}

RemoteAnonymizer::Config ConfigLoader::to_remote_config(const PiiGuardConfig& config) {
    RemoteAnonymizer::Config cfg;
    cfg.endpoint = config.remote.endpoint;
    cfg.api_key = config.remote.api_key;
    cfg.timeout_ms = static_cast<uint32_t>(config.remote.timeout_ms);
    cfg.connect_timeout_ms = static_cast<uint32_t>(config.remote.connect_timeout_ms);
    cfg.health_timeout_ms = static_cast<uint32_t>(config.remote.health_timeout_ms);
    for (const auto& pattern : config.custom_patterns) {
        cfg.custom_entities.push_back(pattern.regex);
    }
    return cfg;
}

CircuitBreaker::Config ConfigLoader::to_breaker_config(const PiiGuardConfig& config) {
    CircuitBreaker::Config cfg;
    cfg.enabled = config.circuit_breaker.enabled;
    cfg.failure_threshold = static_cast<uint32_t>(config.circuit_breaker.failure_threshold);
    cfg.success_threshold = static_cast<uint32_t>(config.circuit_breaker.success_threshold);
    cfg.open_timeout = std::chrono::milliseconds(config.circuit_breaker.timeout_ms);
    cfg.half_open_max_calls = static_cast<uint32_t>(config.circuit_breaker.half_open_max_calls);
    return cfg;
}

SanitizationOrchestrator::Config ConfigLoader::to_orchestrator_config(
    const PiiGuardConfig& config) {
    SanitizationOrchestrator::Config cfg;
    cfg.preserve_context = config.sanitizer.preserve_context;
    cfg.max_text_length = static_cast<size_t>(config.sanitizer.max_text_length);
    cfg.batch_workers = static_cast<unsigned>(config.sanitizer.batch_workers);
    return cfg;
}

LocalSanitizer::Options ConfigLoader::to_sanitizer_options(const PiiGuardConfig& config) {
    LocalSanitizer::Options options;
    options.identity_policy = parse_identity_policy(config.sanitizer.identity_policy)
                                  .value_or(IdentityPolicy::PER_OCCURRENCE);
    return options;
}

std::vector<PatternRule> ConfigLoader::build_custom_rules(const PiiGuardConfig& config) {
    std::vector<PatternRule> rules;
    rules.reserve(config.custom_patterns.size());

    for (const auto& p : config.custom_patterns) {
        const auto type = parse_entity_type(p.type);
        if (!type) {
            throw std::invalid_argument(std::format("Unknown entity type '{}'", p.type));
        }

        std::function<bool(std::string_view)> check;
        if (p.validator == "luhn") {
            check = &PatternCatalog::luhn_valid;
        } else if (p.validator == "ssn") {
            check = &PatternCatalog::ssn_valid;
        }
        rules.emplace_back(*type, p.regex, p.case_insensitive, std::move(check));
    }
    return rules;
}

} // namespace piiguard
