#include "orchestrator/sanitization_orchestrator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <stdexcept>

namespace piiguard {

SanitizationOrchestrator::SanitizationOrchestrator(
    std::shared_ptr<IRemoteAnonymizer> remote,
    std::shared_ptr<const LocalSanitizer> local,
    std::shared_ptr<CircuitBreaker> breaker,
    Config config)
    : remote_(std::move(remote)),
      local_(std::move(local)),
      breaker_(std::move(breaker)),
      config_(config) {
    if (!local_) {
        throw std::invalid_argument("SanitizationOrchestrator requires a local sanitizer");
    }
}

SanitizationOrchestrator::SanitizationOrchestrator(
    std::shared_ptr<IRemoteAnonymizer> remote,
    std::shared_ptr<const LocalSanitizer> local)
    : SanitizationOrchestrator(std::move(remote), std::move(local), nullptr, Config{}) {}

// ============================================================================
// Input Checks
// ============================================================================

std::optional<std::string> SanitizationOrchestrator::input_error(const std::string& text) const {
    std::optional<std::string> reason;
    if (text.empty()) {
        reason = "Input text is empty";
    } else if (utils::is_blank(text)) {
        reason = "Input text is whitespace only";
    } else if (text.size() > config_.max_text_length) {
        reason = std::format("Input text is {} bytes, limit is {}",
                             text.size(), config_.max_text_length);
    }
    if (reason) {
        rejected_inputs_.fetch_add(1, std::memory_order_relaxed);
    }
    return reason;
}

SanitizationResult SanitizationOrchestrator::run_local(const std::string& text,
                                                       PrivacyLevel level) const {
    return local_->sanitize(text, PrivacyConfig::for_level(level, config_.preserve_context));
}

Result<SanitizationResult> SanitizationOrchestrator::call_remote(const std::string& text,
                                                              PrivacyLevel level) {
    try {
        return remote_->sanitize_remote(text, level, config_.preserve_context);
    } catch (const std::exception& e) {
        return Result<SanitizationResult>::error(
            ErrorCategory::REMOTE_PROTOCOL_ERROR, std::format("Remote adapter threw: {}", e.what()));
    }
}

Result<std::vector<RemoteBatchItem>> SanitizationOrchestrator::call_remote_batch(
    const std::vector<std::string>& texts, PrivacyLevel level) {
    try {
        return remote_->sanitize_remote_batch(texts, level, config_.preserve_context);
    } catch (const std::exception& e) {
        return Result<std::vector<RemoteBatchItem>>::error(
            ErrorCategory::REMOTE_PROTOCOL_ERROR, std::format("Remote adapter threw: {}", e.what()));
    }
}

// ============================================================================
// Single Item
// ============================================================================

Result<SanitizeOutcome> SanitizationOrchestrator::sanitize(const std::string& text,
                                                           PrivacyLevel level) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (auto reason = input_error(text)) {
        return Result<SanitizeOutcome>::error(ErrorCategory::INVALID_INPUT, std::move(*reason));
    }

    SanitizeOutcome outcome;

    if (remote_) {
        if (breaker_ && !breaker_->allow_request()) {
            circuit_open_skips_.fetch_add(1, std::memory_order_relaxed);
            outcome.remote_error = std::format("circuit '{}' is open", breaker_->name());
        } else {
            auto remote = call_remote(text, level);
            if (remote.is_ok()) {
                if (breaker_) breaker_->record_success();
                remote_successes_.fetch_add(1, std::memory_order_relaxed);
                outcome.result = std::move(remote.value());
                return Result<SanitizeOutcome>::ok(std::move(outcome));
            }
            if (breaker_) breaker_->record_failure(remote.error_category());
            outcome.remote_error = std::format("{}: {}",
                error_category_to_string(remote.error_category()), remote.error_message());
        }

        outcome.degraded = true;
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "Remote sanitization unavailable ({}); using local engine for {} bytes",
            outcome.remote_error, text.size()));
    }

    try {
        outcome.result = run_local(text, level);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Local sanitization failed: {}", e.what()));
        return Result<SanitizeOutcome>::error(
            ErrorCategory::INTERNAL_ERROR, std::format("Local sanitization failed: {}", e.what()));
    }
    return Result<SanitizeOutcome>::ok(std::move(outcome));
}

Result<SanitizeOutcome> SanitizationOrchestrator::sanitize_validated(
    const std::string& text, PrivacyLevel level, const SanitizationValidator& validator) {
    auto outcome = sanitize(text, level);
    if (outcome.is_error()) {
        return outcome;
    }

    const auto report = validator.validate(outcome.value().result);
    if (!report.safe) {
        std::string checks;
        for (const auto& check : report.failed_checks) {
            if (!checks.empty()) checks += ", ";
            checks += check;
        }
        return Result<SanitizeOutcome>::error(
            ErrorCategory::VALIDATION_FAILED,
            std::format("Sanitized output failed checks: {}", checks));
    }
    return outcome;
}

Result<std::vector<EntityMatch>> SanitizationOrchestrator::detect(const std::string& text,
                                                                  PrivacyLevel level) const {
    if (auto reason = input_error(text)) {
        return Result<std::vector<EntityMatch>>::error(ErrorCategory::INVALID_INPUT,
                                                       std::move(*reason));
    }
    try {
        return Result<std::vector<EntityMatch>>::ok(local_->detect(text, level));
    } catch (const std::exception& e) {
        return Result<std::vector<EntityMatch>>::error(
            ErrorCategory::INTERNAL_ERROR, std::format("Detection failed: {}", e.what()));
    }
}

// ============================================================================
// Batch
// ============================================================================

void SanitizationOrchestrator::fallback_items(const std::vector<std::string>& texts,
                                              const std::vector<size_t>& slots,
                                              PrivacyLevel level,
                                              std::vector<BatchItemOutcome>& items) const {
    // Each task owns a disjoint range of slots
    auto run_range = [&](size_t begin, size_t end) {
        for (size_t k = begin; k < end; ++k) {
            auto& item = items[slots[k]];
            try {
                item.result = run_local(texts[slots[k]], level);
                item.ok = true;
                item.error_category = ErrorCategory::NONE;
                item.error.clear();
            } catch (const std::exception& e) {
                item.ok = false;
                item.result = SanitizationResult{};
                item.error_category = ErrorCategory::INTERNAL_ERROR;
                item.error = std::format("Local sanitization failed: {}", e.what());
                utils::log::error(std::format("Batch item {} failed: {}", slots[k], e.what()));
            }
        }
    };

    const size_t n = slots.size();
    const size_t workers = std::min<size_t>(std::max(config_.batch_workers, 1u), n);

    if (workers > 1) {
        const size_t chunk = (n + workers - 1) / workers;
        std::vector<std::future<void>> futures;
        futures.reserve(workers);

        for (size_t w = 0; w < workers; ++w) {
            const size_t start = w * chunk;
            if (start >= n) break;
            const size_t end = std::min(start + chunk, n);
            futures.push_back(std::async(std::launch::async, run_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        run_range(0, n);
    }
}

Result<BatchOutcome> SanitizationOrchestrator::sanitize_batch(
    const std::vector<std::string>& texts, PrivacyLevel level) {
    if (texts.empty()) {
        rejected_inputs_.fetch_add(1, std::memory_order_relaxed);
        return Result<BatchOutcome>::error(ErrorCategory::INVALID_INPUT, "Batch is empty");
    }
    batch_requests_.fetch_add(1, std::memory_order_relaxed);
    total_requests_.fetch_add(texts.size(), std::memory_order_relaxed);

    BatchOutcome out;
    out.items.resize(texts.size());

    std::vector<size_t> valid;
    valid.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        if (auto reason = input_error(texts[i])) {
            out.items[i].error_category = ErrorCategory::INVALID_INPUT;
            out.items[i].error = std::move(*reason);
        } else {
            valid.push_back(i);
        }
    }

    std::vector<size_t> needs_local;
    if (remote_ && !valid.empty()) {
        if (breaker_ && !breaker_->allow_request()) {
            circuit_open_skips_.fetch_add(1, std::memory_order_relaxed);
            needs_local = valid;
            utils::log::warn(std::format(
                "Circuit '{}' is open; using local engine for {} batch items",
                breaker_->name(), valid.size()));
        } else {
            std::vector<std::string> payload;
            payload.reserve(valid.size());
            for (const size_t slot : valid) payload.push_back(texts[slot]);

            auto remote = call_remote_batch(payload, level);
            if (remote.is_ok() && remote.value().size() != valid.size()) {
                remote = Result<std::vector<RemoteBatchItem>>::error(
                    ErrorCategory::REMOTE_PROTOCOL_ERROR,
                    std::format("Batch length mismatch: sent {}, received {}",
                                valid.size(), remote.value().size()));
            }
            if (remote.is_ok()) {
                if (breaker_) breaker_->record_success();
                auto& results = remote.value();
                for (size_t k = 0; k < valid.size(); ++k) {
                    auto& item = out.items[valid[k]];
                    if (results[k].success) {
                        item.ok = true;
                        item.result = std::move(results[k].result);
                        remote_successes_.fetch_add(1, std::memory_order_relaxed);
                    } else {
                        needs_local.push_back(valid[k]);
                    }
                }
                if (!needs_local.empty()) {
                    utils::log::warn(std::format(
                        "Remote service rejected {} of {} batch items; using local engine for them",
                        needs_local.size(), valid.size()));
                }
            } else {
                if (breaker_) breaker_->record_failure(remote.error_category());
                needs_local = valid;
                utils::log::warn(std::format(
                    "Remote batch sanitization unavailable ({}: {}); using local engine for {} items",
                    error_category_to_string(remote.error_category()),
                    remote.error_message(), valid.size()));
            }
        }
    } else {
        needs_local = valid;
    }

    fallback_items(texts, needs_local, level, out.items);

    if (remote_) {
        fallbacks_.fetch_add(needs_local.size(), std::memory_order_relaxed);
        for (const size_t slot : needs_local) out.items[slot].degraded = true;
    }

    double score_sum = 0.0;
    size_t succeeded = 0;
    for (const auto& item : out.items) {
        if (item.ok) {
            score_sum += item.result.privacy_score;
            ++succeeded;
        } else {
            ++out.failed_items;
        }
        out.degraded = out.degraded || item.degraded;
    }
    out.average_privacy_score = succeeded > 0 ? score_sum / static_cast<double>(succeeded) : 0.0;
    batch_item_failures_.fetch_add(out.failed_items, std::memory_order_relaxed);

    return Result<BatchOutcome>::ok(std::move(out));
}

// ============================================================================
// Probes & Stats
// ============================================================================

bool SanitizationOrchestrator::is_remote_healthy() {
    return remote_ && remote_->is_healthy();
}

SanitizationOrchestrator::Stats SanitizationOrchestrator::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        remote_successes_.load(std::memory_order_relaxed),
        fallbacks_.load(std::memory_order_relaxed),
        rejected_inputs_.load(std::memory_order_relaxed),
        batch_requests_.load(std::memory_order_relaxed),
        batch_item_failures_.load(std::memory_order_relaxed),
        circuit_open_skips_.load(std::memory_order_relaxed),
    };
}

} // namespace piiguard
