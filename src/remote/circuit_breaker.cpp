#include "remote/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace piiguard {

CircuitBreaker::CircuitBreaker(std::string name)
    : CircuitBreaker(std::move(name), Config{}) {}

CircuitBreaker::CircuitBreaker(std::string name, Config config, Clock clock)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point CircuitBreaker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool CircuitBreaker::allow_request() {
    if (!config_.enabled) return true;

    std::lock_guard lock(mutex_);
    switch (state_.load(std::memory_order_acquire)) {
        case BreakerState::CLOSED:
            return true;

        case BreakerState::OPEN: {
            if (now() - opened_at_ < config_.open_timeout) {
                rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            state_.store(BreakerState::HALF_OPEN, std::memory_order_release);
            half_open_successes_ = 0;
            half_open_in_flight_ = 1;
            utils::log::info(std::format("Circuit '{}' half-open, probing remote", name_));
            return true;
        }

        case BreakerState::HALF_OPEN:
            if (half_open_in_flight_ >= config_.half_open_max_calls) {
                rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            ++half_open_in_flight_;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    if (!config_.enabled) return;

    std::lock_guard lock(mutex_);
    switch (state_.load(std::memory_order_acquire)) {
        case BreakerState::CLOSED:
            consecutive_failures_ = 0;
            break;

        case BreakerState::HALF_OPEN:
            if (half_open_in_flight_ > 0) --half_open_in_flight_;
            if (++half_open_successes_ >= config_.success_threshold) {
                state_.store(BreakerState::CLOSED, std::memory_order_release);
                consecutive_failures_ = 0;
                half_open_successes_ = 0;
                half_open_in_flight_ = 0;
                utils::log::info(std::format("Circuit '{}' closed, remote recovered", name_));
            }
            break;

        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::record_failure(ErrorCategory category) {
    if (!config_.enabled) return;
    if (category != ErrorCategory::REMOTE_UNAVAILABLE &&
        category != ErrorCategory::REMOTE_PROTOCOL_ERROR) {
        return;
    }

    std::lock_guard lock(mutex_);
    const auto t = now();
    switch (state_.load(std::memory_order_acquire)) {
        case BreakerState::CLOSED:
            if (++consecutive_failures_ >= config_.failure_threshold) {
                trip_locked(t);
            }
            break;

        case BreakerState::HALF_OPEN:
            trip_locked(t);
            break;

        case BreakerState::OPEN:
            break;
    }
}

void CircuitBreaker::trip_locked(std::chrono::steady_clock::time_point now) {
    state_.store(BreakerState::OPEN, std::memory_order_release);
    opened_at_ = now;
    half_open_successes_ = 0;
    half_open_in_flight_ = 0;
    times_opened_.fetch_add(1, std::memory_order_relaxed);
    utils::log::warn(std::format(
        "Circuit '{}' opened (consecutive failures: {}); using local sanitizer for {}ms",
        name_, consecutive_failures_, config_.open_timeout.count()));
}

BreakerState CircuitBreaker::state() const {
    return state_.load(std::memory_order_acquire);
}

CircuitBreaker::Stats CircuitBreaker::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        state_.load(std::memory_order_acquire),
        consecutive_failures_,
        times_opened_.load(std::memory_order_relaxed),
        rejected_requests_.load(std::memory_order_relaxed),
    };
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_.store(BreakerState::CLOSED, std::memory_order_release);
    consecutive_failures_ = 0;
    half_open_successes_ = 0;
    half_open_in_flight_ = 0;
    opened_at_ = {};
}

} // namespace piiguard
