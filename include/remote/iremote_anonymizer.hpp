#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief One positional entry of a remote batch response
 *
 * success = false means the service reported an error for this item only;
 * the orchestrator falls back locally for it.
 */
struct RemoteBatchItem {
    bool success = false;
    SanitizationResult result;
    std::string error;
};

/**
 * @brief Informational service statistics (GET /stats)
 */
struct RemoteStats {
    int64_t total_mappings = 0;
    bool spacy_model_loaded = false;
    std::vector<std::string> supported_entities;
    std::vector<std::string> privacy_levels;
};

/**
 * @brief Abstract client for the external anonymization service
 *
 * Implementations report transport failures and timeouts as
 * REMOTE_UNAVAILABLE and bad statuses/bodies as REMOTE_PROTOCOL_ERROR.
 * They never throw.
 */
class IRemoteAnonymizer {
public:
    virtual ~IRemoteAnonymizer() = default;

    [[nodiscard]] virtual Result<SanitizationResult> sanitize_remote(
        const std::string& text, PrivacyLevel level, bool preserve_format) = 0;

    /**
     * @brief One batched request; results map back to texts positionally
     */
    [[nodiscard]] virtual Result<std::vector<RemoteBatchItem>> sanitize_remote_batch(
        const std::vector<std::string>& texts, PrivacyLevel level, bool preserve_format) = 0;

    [[nodiscard]] virtual bool is_healthy() = 0;

    [[nodiscard]] virtual std::optional<RemoteStats> get_stats() = 0;
};

} // namespace piiguard
