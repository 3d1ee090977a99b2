#pragma once

#include "remote/iremote_anonymizer.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief HTTP client for the anonymization service wire contract
 *
 * Endpoints:
 *   POST /anonymize        {text, privacy_level, preserve_format}
 *   POST /batch-anonymize  [ {...}, ... ]  →  {results: [...]}
 *   GET  /health
 *   GET  /stats
 *
 * Uses httplib::Client. Every request carries connection, read and write
 * timeouts plus an overall deadline of timeout_ms (health_timeout_ms for the
 * probes), so a service that trickles its reply still cannot block the caller. Level mapping
 * is lossy: STANDARD and ENHANCED both send "standard", MAXIMUM sends "strict".
 */
class RemoteAnonymizer : public IRemoteAnonymizer {
public:
    struct Config {
        std::string endpoint = "http://localhost:8000";
        std::string api_key;
        uint32_t timeout_ms = 10000;
        uint32_t connect_timeout_ms = 2000;
        uint32_t health_timeout_ms = 5000;
        std::vector<std::string> custom_entities;   // sent as custom_entities when non-empty
    };

    RemoteAnonymizer();
    explicit RemoteAnonymizer(Config config);

    [[nodiscard]] Result<SanitizationResult> sanitize_remote(
        const std::string& text, PrivacyLevel level, bool preserve_format) override;

    [[nodiscard]] Result<std::vector<RemoteBatchItem>> sanitize_remote_batch(
        const std::vector<std::string>& texts, PrivacyLevel level, bool preserve_format) override;

    [[nodiscard]] bool is_healthy() override;

    [[nodiscard]] std::optional<RemoteStats> get_stats() override;

    // Wire mapping (public for testing without a live service)
    [[nodiscard]] static const char* to_remote_level(PrivacyLevel level);
    // nullopt for labels with no local counterpart (ORG, MONEY, NORP, ...)
    [[nodiscard]] static std::optional<EntityType> map_remote_entity(std::string_view label);
    [[nodiscard]] static nlohmann::json build_request(
        const std::string& text, PrivacyLevel level, bool preserve_format,
        const std::vector<std::string>& custom_entities = {});
    [[nodiscard]] static std::string to_wire(const nlohmann::json& body);
    /**
     * Entities whose label has no local type, or whose type is inactive at
     * level, are left out of replacements and added to *dropped_entities.
     */
    [[nodiscard]] static Result<SanitizationResult> parse_response(
        const std::string& body, PrivacyLevel level, bool preserve_format,
        size_t* dropped_entities = nullptr);
    [[nodiscard]] static Result<std::vector<RemoteBatchItem>> parse_batch_response(
        const std::string& body, size_t expected_count, PrivacyLevel level,
        bool preserve_format, size_t* dropped_entities = nullptr);
    [[nodiscard]] static std::optional<RemoteStats> parse_stats(const std::string& body);

    struct Stats {
        uint64_t requests = 0;
        uint64_t transport_errors = 0;
        uint64_t protocol_errors = 0;
        uint64_t dropped_entities = 0;
    };

    [[nodiscard]] Stats get_client_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct HttpReply {
        bool transport_ok = false;
        int status = 0;
        std::string body;
        std::string error;
    };

    [[nodiscard]] HttpReply post_json(const std::string& path, const std::string& body) const;
    [[nodiscard]] HttpReply get(const std::string& path,
                                std::chrono::milliseconds deadline) const;

    template<typename T>
    [[nodiscard]] Result<T> check_reply(const HttpReply& reply, std::string_view what);

    Config config_;
    std::string base_url_;     // scheme://host[:port]
    std::string path_prefix_;  // optional path below the host, no trailing slash

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> transport_errors_{0};
    std::atomic<uint64_t> protocol_errors_{0};
    std::atomic<uint64_t> dropped_entities_{0};
};

} // namespace piiguard
