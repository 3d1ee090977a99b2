#include "remote/remote_anonymizer.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <cmath>
#include <format>
#include <unordered_map>

namespace piiguard {

namespace {

// Splits "http://host:8000/api/v1" into "http://host:8000" and "/api/v1"
void split_endpoint(const std::string& endpoint, std::string& base, std::string& prefix) {
    const auto scheme_end = endpoint.find("://");
    const size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    const auto path_start = endpoint.find('/', host_start);

    if (path_start == std::string::npos) {
        base = endpoint;
        prefix.clear();
        return;
    }
    base = endpoint.substr(0, path_start);
    prefix = endpoint.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

// Entities with an unknown label, or a type inactive at the requested level,
// are left out of replacements; they count toward dropped_entities.
Result<SanitizationResult> parse_item(const nlohmann::json& item, PrivacyLevel level,
                                      bool preserve_format, size_t& dropped_entities) {
    if (!item.is_object()) {
        return Result<SanitizationResult>::error(
            ErrorCategory::REMOTE_PROTOCOL_ERROR, "Response item is not an object");
    }

    try {
        SanitizationResult result;
        result.sanitized_text = item.at("sanitized_text").get<std::string>();
        result.privacy_score = item.at("privacy_score").get<double>();
        // Services report fractional milliseconds
        result.processing_time_ms = static_cast<int64_t>(
            std::llround(item.value("processing_time_ms", 0.0)));
        result.context_preserved = preserve_format;
        result.score_model = ScoreModel::REMOTE_SERVICE;

        if (const auto it = item.find("entities_found"); it != item.end()) {
            if (!it->is_array()) {
                return Result<SanitizationResult>::error(
                    ErrorCategory::REMOTE_PROTOCOL_ERROR, "entities_found is not an array");
            }
            result.replacements.reserve(it->size());
            for (const auto& entity : *it) {
                Replacement r;
                r.original = entity.at("original").get<std::string>();
                r.replacement = entity.at("replacement").get<std::string>();
                r.label = entity.at("entity_type").get<std::string>();
                r.confidence = entity.value("confidence", 0.0);

                const auto type = RemoteAnonymizer::map_remote_entity(r.label);
                if (!type || !is_active(*type, level)) {
                    ++dropped_entities;
                    continue;
                }
                r.entity_type = *type;
                result.replacements.push_back(std::move(r));
            }
        }
        return Result<SanitizationResult>::ok(std::move(result));
    } catch (const nlohmann::json::exception& e) {
        return Result<SanitizationResult>::error(
            ErrorCategory::REMOTE_PROTOCOL_ERROR,
            std::format("Malformed response item: {}", e.what()));
    }
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

RemoteAnonymizer::RemoteAnonymizer() : RemoteAnonymizer(Config{}) {}

RemoteAnonymizer::RemoteAnonymizer(Config config)
    : config_(std::move(config)) {
    split_endpoint(config_.endpoint, base_url_, path_prefix_);
}

// ============================================================================
// Wire Mapping
// ============================================================================

const char* RemoteAnonymizer::to_remote_level(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::STANDARD: return "standard";
        case PrivacyLevel::ENHANCED: return "standard";
        case PrivacyLevel::MAXIMUM:  return "strict";
        default:                     return "standard";
    }
}

std::optional<EntityType> RemoteAnonymizer::map_remote_entity(std::string_view label) {
    static const std::unordered_map<std::string_view, EntityType> kLabels = {
        {"PERSON",         EntityType::PERSON_NAME},
        {"PERSON_NAME",    EntityType::PERSON_NAME},
        {"EMAIL",          EntityType::EMAIL},
        {"EMAIL_ADDRESS",  EntityType::EMAIL},
        {"PHONE",          EntityType::PHONE},
        {"PHONE_NUMBER",   EntityType::PHONE},
        {"ADDRESS",        EntityType::ADDRESS},
        {"SSN",            EntityType::SSN},
        {"CREDIT_CARD",    EntityType::CREDIT_CARD},
        {"DATE",           EntityType::DATE},
        {"TIME",           EntityType::DATE},
        {"GPE",            EntityType::LOCATION},
        {"LOC",            EntityType::LOCATION},
        {"LOCATION",       EntityType::LOCATION},
    };
    const auto it = kLabels.find(label);
    if (it == kLabels.end()) return std::nullopt;
    return it->second;
}

nlohmann::json RemoteAnonymizer::build_request(
    const std::string& text, PrivacyLevel level, bool preserve_format,
    const std::vector<std::string>& custom_entities) {
    nlohmann::json request = {
        {"text", text},
        {"privacy_level", to_remote_level(level)},
        {"preserve_format", preserve_format},
    };
    if (!custom_entities.empty()) {
        request["custom_entities"] = custom_entities;
    }
    return request;
}

std::string RemoteAnonymizer::to_wire(const nlohmann::json& body) {
    // Invalid UTF-8 in user text becomes U+FFFD instead of a type_error
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<SanitizationResult> RemoteAnonymizer::parse_response(
    const std::string& body, PrivacyLevel level, bool preserve_format,
    size_t* dropped_entities) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return Result<SanitizationResult>::error(
            ErrorCategory::REMOTE_PROTOCOL_ERROR, "Response body is not valid JSON");
    }
    size_t dropped = 0;
    auto parsed = parse_item(j, level, preserve_format, dropped);
    if (dropped_entities) *dropped_entities += dropped;
    return parsed;
}

Result<std::vector<RemoteBatchItem>> RemoteAnonymizer::parse_batch_response(
    const std::string& body, size_t expected_count, PrivacyLevel level, bool preserve_format,
    size_t* dropped_entities) {
    using R = Result<std::vector<RemoteBatchItem>>;

    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return R::error(ErrorCategory::REMOTE_PROTOCOL_ERROR,
                        "Batch response body is not valid JSON");
    }
    if (!j.is_object() || !j.contains("results") || !j["results"].is_array()) {
        return R::error(ErrorCategory::REMOTE_PROTOCOL_ERROR,
                        "Batch response has no results array");
    }

    const auto& results = j["results"];
    if (results.size() != expected_count) {
        return R::error(ErrorCategory::REMOTE_PROTOCOL_ERROR,
                        std::format("Batch length mismatch: sent {}, received {}",
                                    expected_count, results.size()));
    }

    size_t dropped = 0;
    std::vector<RemoteBatchItem> items;
    items.reserve(results.size());
    for (const auto& entry : results) {
        RemoteBatchItem item;
        if (entry.is_object() && entry.contains("error")) {
            const auto& err = entry["error"];
            item.error = err.is_string() ? err.get<std::string>() : err.dump();
        } else {
            auto parsed = parse_item(entry, level, preserve_format, dropped);
            if (parsed.is_ok()) {
                item.success = true;
                item.result = std::move(parsed.value());
            } else {
                item.error = parsed.error_message();
            }
        }
        items.push_back(std::move(item));
    }
    if (dropped_entities) *dropped_entities += dropped;
    return R::ok(std::move(items));
}

std::optional<RemoteStats> RemoteAnonymizer::parse_stats(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    try {
        RemoteStats stats;
        stats.total_mappings = j.value("total_mappings", int64_t{0});
        stats.spacy_model_loaded = j.value("spacy_model_loaded", false);
        stats.supported_entities =
            j.value("supported_entities", std::vector<std::string>{});
        stats.privacy_levels = j.value("privacy_levels", std::vector<std::string>{});
        return stats;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HTTP
// ============================================================================

RemoteAnonymizer::HttpReply RemoteAnonymizer::post_json(
    const std::string& path, const std::string& body) const {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));
    // Read/write timeouts are per socket operation; this bounds the whole request
    cli.set_max_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers = {
        {"X-Request-Id", utils::generate_request_id()},
    };
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    HttpReply reply;
    const auto res = cli.Post(path_prefix_ + path, headers, body, "application/json");
    if (!res) {
        reply.error = httplib::to_string(res.error());
        return reply;
    }
    reply.transport_ok = true;
    reply.status = res->status;
    reply.body = res->body;
    return reply;
}

RemoteAnonymizer::HttpReply RemoteAnonymizer::get(
    const std::string& path, std::chrono::milliseconds deadline) const {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(deadline);
    cli.set_read_timeout(deadline);
    cli.set_write_timeout(deadline);
    cli.set_max_timeout(deadline);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    HttpReply reply;
    const auto res = cli.Get(path_prefix_ + path, headers);
    if (!res) {
        reply.error = httplib::to_string(res.error());
        return reply;
    }
    reply.transport_ok = true;
    reply.status = res->status;
    reply.body = res->body;
    return reply;
}

template<typename T>
Result<T> RemoteAnonymizer::check_reply(const HttpReply& reply, std::string_view what) {
    if (!reply.transport_ok) {
        transport_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<T>::error(ErrorCategory::REMOTE_UNAVAILABLE,
                                std::format("{} request failed: {}", what, reply.error));
    }
    if (!is_success_status(reply.status)) {
        protocol_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<T>::error(ErrorCategory::REMOTE_PROTOCOL_ERROR,
                                std::format("{} returned HTTP {}", what, reply.status));
    }
    return Result<T>::ok(T{});
}

// ============================================================================
// Core API
// ============================================================================

Result<SanitizationResult> RemoteAnonymizer::sanitize_remote(
    const std::string& text, PrivacyLevel level, bool preserve_format) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto reply = post_json("/anonymize",
                                 to_wire(build_request(text, level, preserve_format,
                                                       config_.custom_entities)));
    auto status = check_reply<SanitizationResult>(reply, "anonymize");
    if (status.is_error()) {
        return status;
    }

    size_t dropped = 0;
    auto parsed = parse_response(reply.body, level, preserve_format, &dropped);
    dropped_entities_.fetch_add(dropped, std::memory_order_relaxed);
    if (parsed.is_error()) {
        protocol_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return parsed;
}

Result<std::vector<RemoteBatchItem>> RemoteAnonymizer::sanitize_remote_batch(
    const std::vector<std::string>& texts, PrivacyLevel level, bool preserve_format) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    auto payload = nlohmann::json::array();
    for (const auto& text : texts) {
        payload.push_back(build_request(text, level, preserve_format, config_.custom_entities));
    }

    const auto reply = post_json("/batch-anonymize", to_wire(payload));
    auto status = check_reply<std::vector<RemoteBatchItem>>(reply, "batch-anonymize");
    if (status.is_error()) {
        return status;
    }

    size_t dropped = 0;
    auto parsed = parse_batch_response(reply.body, texts.size(), level, preserve_format, &dropped);
    dropped_entities_.fetch_add(dropped, std::memory_order_relaxed);
    if (parsed.is_error()) {
        protocol_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return parsed;
}

bool RemoteAnonymizer::is_healthy() {
    const auto reply = get("/health", std::chrono::milliseconds(config_.health_timeout_ms));
    return reply.transport_ok && is_success_status(reply.status);
}

std::optional<RemoteStats> RemoteAnonymizer::get_stats() {
    const auto reply = get("/stats", std::chrono::milliseconds(config_.health_timeout_ms));
    if (!reply.transport_ok || !is_success_status(reply.status)) {
        return std::nullopt;
    }
    return parse_stats(reply.body);
}

RemoteAnonymizer::Stats RemoteAnonymizer::get_client_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        transport_errors_.load(std::memory_order_relaxed),
        protocol_errors_.load(std::memory_order_relaxed),
        dropped_entities_.load(std::memory_order_relaxed),
    };
}

} // namespace piiguard
