#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "remote/circuit_breaker.hpp"
#include "remote/iremote_anonymizer.hpp"
#include "sanitizer/local_sanitizer.hpp"
#include "validator/sanitization_validator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Result of one orchestrated sanitization
 *
 * degraded = true means the local engine produced the result because the
 * remote attempt failed or was skipped by the circuit breaker.
 */
struct SanitizeOutcome {
    SanitizationResult result;
    bool degraded = false;
    std::string remote_error;
};

struct BatchItemOutcome {
    bool ok = false;
    SanitizationResult result;   // sanitized_text empty when !ok
    bool degraded = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error;
};

struct BatchOutcome {
    std::vector<BatchItemOutcome> items;    // same order as the input
    double average_privacy_score = 0.0;     // over successful items
    bool degraded = false;                  // any item fell back
    size_t failed_items = 0;
};

/**
 * @brief Public entry point: remote first, local fallback
 *
 * Per call: Attempting Remote → Succeeded, or
 *           Attempting Remote → Falling Back → Succeeded.
 * The fallback is the local sanitizer run on the same (text, level); it is
 * never retried and never escalates the level. With no remote configured the
 * local sanitizer is the primary engine and results are not flagged degraded.
 */
class SanitizationOrchestrator {
public:
    struct Config {
        bool preserve_context = true;
        size_t max_text_length = 262144;
        unsigned batch_workers = 4;
    };

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t remote_successes = 0;
        uint64_t fallbacks = 0;
        uint64_t rejected_inputs = 0;
        uint64_t batch_requests = 0;
        uint64_t batch_item_failures = 0;
        uint64_t circuit_open_skips = 0;
    };

    /**
     * @param remote  May be null (local-only mode)
     * @param local   Required
     * @param breaker May be null (every call attempts the remote)
     */
    SanitizationOrchestrator(std::shared_ptr<IRemoteAnonymizer> remote,
                             std::shared_ptr<const LocalSanitizer> local,
                             std::shared_ptr<CircuitBreaker> breaker,
                             Config config);

    SanitizationOrchestrator(std::shared_ptr<IRemoteAnonymizer> remote,
                             std::shared_ptr<const LocalSanitizer> local);

    /**
     * @brief Sanitize one text
     * @return INVALID_INPUT for empty, blank or oversized text;
     *         INTERNAL_ERROR if the local engine throws
     */
    [[nodiscard]] Result<SanitizeOutcome> sanitize(const std::string& text, PrivacyLevel level);

    /**
     * @brief Sanitize many texts with one remote request
     *
     * Items are isolated: an invalid or throwing item is reported in its slot
     * and does not affect the others. Only an empty batch is rejected.
     */
    [[nodiscard]] Result<BatchOutcome> sanitize_batch(const std::vector<std::string>& texts,
                                                      PrivacyLevel level);

    /**
     * @brief sanitize() followed by the validator; VALIDATION_FAILED if unsafe
     */
    [[nodiscard]] Result<SanitizeOutcome> sanitize_validated(
        const std::string& text, PrivacyLevel level, const SanitizationValidator& validator);

    /**
     * @brief Local detection preview, nothing is substituted
     */
    [[nodiscard]] Result<std::vector<EntityMatch>> detect(const std::string& text,
                                                          PrivacyLevel level) const;

    [[nodiscard]] bool is_remote_healthy();

    [[nodiscard]] bool has_remote() const { return remote_ != nullptr; }

    [[nodiscard]] Stats get_stats() const;

private:
    // Reason the text is rejected, nullopt if acceptable
    [[nodiscard]] std::optional<std::string> input_error(const std::string& text) const;

    // Remote calls with any escaping exception mapped to REMOTE_PROTOCOL_ERROR
    [[nodiscard]] Result<SanitizationResult> call_remote(const std::string& text,
                                                         PrivacyLevel level);
    [[nodiscard]] Result<std::vector<RemoteBatchItem>> call_remote_batch(
        const std::vector<std::string>& texts, PrivacyLevel level);

    [[nodiscard]] SanitizationResult run_local(const std::string& text, PrivacyLevel level) const;

    /**
     * @brief Local sanitization of the given slots, spread over batch_workers tasks
     */
    void fallback_items(const std::vector<std::string>& texts,
                        const std::vector<size_t>& slots,
                        PrivacyLevel level,
                        std::vector<BatchItemOutcome>& items) const;

    std::shared_ptr<IRemoteAnonymizer> remote_;
    std::shared_ptr<const LocalSanitizer> local_;
    std::shared_ptr<CircuitBreaker> breaker_;
    Config config_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> remote_successes_{0};
    std::atomic<uint64_t> fallbacks_{0};
    mutable std::atomic<uint64_t> rejected_inputs_{0};
    std::atomic<uint64_t> batch_requests_{0};
    std::atomic<uint64_t> batch_item_failures_{0};
    std::atomic<uint64_t> circuit_open_skips_{0};
};

} // namespace piiguard
