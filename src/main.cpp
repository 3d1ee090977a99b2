#include "catalog/pattern_catalog.hpp"
#include "config/config_loader.hpp"
#include "core/random.hpp"
#include "core/utils.hpp"
#include "orchestrator/sanitization_orchestrator.hpp"
#include "remote/circuit_breaker.hpp"
#include "remote/remote_anonymizer.hpp"
#include "sanitizer/local_sanitizer.hpp"
#include "validator/sanitization_validator.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace piiguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUnsafe = 2;

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<PrivacyLevel> level;
    bool batch = false;
    bool local_only = false;
    bool validate = false;
};

void print_usage() {
    std::cerr << "usage: piiguard [--config FILE] [--level standard|enhanced|maximum]\n"
                 "                [--batch] [--local-only] [--validate]\n"
                 "Reads text from stdin; with --batch each non-empty line is one item.\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--level" && i + 1 < argc) {
            opts.level = parse_privacy_level(argv[++i]);
            if (!opts.level) {
                utils::log::error(std::format("Unknown privacy level '{}'", argv[i]));
                return std::nullopt;
            }
        } else if (arg == "--batch") {
            opts.batch = true;
        } else if (arg == "--local-only") {
            opts.local_only = true;
        } else if (arg == "--validate") {
            opts.validate = true;
        } else {
            utils::log::error(std::format("Unknown argument '{}'", arg));
            return std::nullopt;
        }
    }
    return opts;
}

// Same field names as the remote contract. Originals are not echoed.
nlohmann::json result_to_json(const SanitizationResult& result, PrivacyLevel level,
                              bool degraded, bool safe) {
    auto entities = nlohmann::json::array();
    for (const auto& r : result.replacements) {
        entities.push_back({
            {"replacement", r.replacement},
            {"entity_type", r.label.empty() ? entity_type_to_string(r.entity_type) : r.label},
            {"confidence", r.confidence},
        });
    }
    return {
        {"sanitized_text", result.sanitized_text},
        {"privacy_score", result.privacy_score},
        {"entities_found", std::move(entities)},
        {"processing_time_ms", result.processing_time_ms},
        {"privacy_level", privacy_level_to_string(level)},
        {"context_preserved", result.context_preserved},
        {"score_model", score_model_to_string(result.score_model)},
        {"degraded", degraded},
        {"safe", safe},
    };
}

// Input bytes that are not UTF-8 are printed as U+FFFD
std::string pretty(const nlohmann::json& doc) {
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> split_lines(const std::string& input) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= input.size()) {
        size_t end = input.find('\n', start);
        if (end == std::string::npos) end = input.size();
        std::string line = input.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!utils::is_blank(line)) lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return kExitError;
    }

    try {
        // Configuration
        PiiGuardConfig config;
        if (opts->config_file) {
            auto loaded = ConfigLoader::load_from_file(*opts->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitError;
            }
            config = std::move(loaded.config);
        }
        if (const auto log_level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*log_level);
        }
        const PrivacyLevel level = opts->level.value_or(ConfigLoader::default_level(config));

        // Engines
        const auto catalog = config.custom_patterns.empty()
            ? PatternCatalog::make_default()
            : PatternCatalog::make_with(ConfigLoader::build_custom_rules(config));
        auto local = std::make_shared<const LocalSanitizer>(
            catalog, ThreadLocalRandomSource::shared(),
            ConfigLoader::to_sanitizer_options(config));

        std::shared_ptr<IRemoteAnonymizer> remote;
        std::shared_ptr<CircuitBreaker> breaker;
        if (config.remote.enabled && !opts->local_only) {
            remote = std::make_shared<RemoteAnonymizer>(ConfigLoader::to_remote_config(config));
            breaker = std::make_shared<CircuitBreaker>(
                "remote-anonymizer", ConfigLoader::to_breaker_config(config));
            utils::log::info(std::format("Remote anonymizer at {}", config.remote.endpoint));
        } else {
            utils::log::info("Remote anonymizer disabled, local engine only");
        }

        SanitizationOrchestrator orchestrator(remote, local, breaker,
                                              ConfigLoader::to_orchestrator_config(config));
        const SanitizationValidator validator;

        const std::string input{std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>()};

        if (!opts->batch) {
            const auto outcome = orchestrator.sanitize(input, level);
            if (outcome.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(outcome.error_category()), outcome.error_message()));
                return kExitError;
            }
            const auto& value = outcome.value();
            const bool safe = validator.is_safe(value.result);
            std::cout << pretty(result_to_json(value.result, level, value.degraded, safe)) << "\n";
            return (opts->validate && !safe) ? kExitUnsafe : kExitOk;
        }

        const auto outcome = orchestrator.sanitize_batch(split_lines(input), level);
        if (outcome.is_error()) {
            utils::log::error(std::format("{}: {}",
                error_category_to_string(outcome.error_category()), outcome.error_message()));
            return kExitError;
        }

        const auto& batch = outcome.value();
        bool all_safe = true;
        auto results = nlohmann::json::array();
        for (const auto& item : batch.items) {
            if (!item.ok) {
                results.push_back({
                    {"error", item.error},
                    {"error_category", error_category_to_string(item.error_category)},
                });
                continue;
            }
            const bool safe = validator.is_safe(item.result);
            all_safe = all_safe && safe;
            results.push_back(result_to_json(item.result, level, item.degraded, safe));
        }

        const nlohmann::json doc = {
            {"results", std::move(results)},
            {"average_privacy_score", batch.average_privacy_score},
            {"failed_items", batch.failed_items},
            {"degraded", batch.degraded},
        };
        std::cout << pretty(doc) << "\n";

        if (batch.failed_items > 0) return kExitError;
        return (opts->validate && !all_safe) ? kExitUnsafe : kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }
}
