#pragma once

#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace piiguard {

enum class BreakerState : uint8_t {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline const char* breaker_state_to_string(BreakerState state) {
    switch (state) {
        case BreakerState::CLOSED:    return "closed";
        case BreakerState::OPEN:      return "open";
        case BreakerState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

/**
 * @brief Circuit breaker guarding the remote anonymization service
 *
 * - CLOSED → OPEN:      consecutive remote failures >= failure_threshold
 * - OPEN → HALF_OPEN:   open_timeout elapsed (next allow_request)
 * - HALF_OPEN → CLOSED: successes >= success_threshold
 * - HALF_OPEN → OPEN:   any remote failure
 *
 * While OPEN the orchestrator skips the remote call and goes straight to
 * the local sanitizer. Only REMOTE_UNAVAILABLE and REMOTE_PROTOCOL_ERROR
 * count as failures; input errors say nothing about service health.
 */
class CircuitBreaker {
public:
    struct Config {
        bool enabled = true;
        uint32_t failure_threshold = 5;
        uint32_t success_threshold = 2;
        std::chrono::milliseconds open_timeout{30000};
        uint32_t half_open_max_calls = 1;
    };

    struct Stats {
        BreakerState state = BreakerState::CLOSED;
        uint64_t consecutive_failures = 0;
        uint64_t times_opened = 0;
        uint64_t rejected_requests = 0;
    };

    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CircuitBreaker(std::string name);
    explicit CircuitBreaker(std::string name, Config config, Clock clock = {});

    /**
     * @brief true if the remote may be called now
     *
     * Every true answer must be followed by record_success or record_failure.
     */
    [[nodiscard]] bool allow_request();

    void record_success();

    /**
     * @brief Record a failed remote call; non-remote categories are ignored
     */
    void record_failure(ErrorCategory category);

    [[nodiscard]] BreakerState state() const;

    [[nodiscard]] Stats get_stats() const;

    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void trip_locked(std::chrono::steady_clock::time_point now);

    [[nodiscard]] std::chrono::steady_clock::time_point now() const;

    std::string name_;
    Config config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::atomic<BreakerState> state_{BreakerState::CLOSED};
    uint64_t consecutive_failures_ = 0;
    uint32_t half_open_successes_ = 0;
    uint32_t half_open_in_flight_ = 0;
    std::chrono::steady_clock::time_point opened_at_{};

    std::atomic<uint64_t> times_opened_{0};
    std::atomic<uint64_t> rejected_requests_{0};
};

} // namespace piiguard
