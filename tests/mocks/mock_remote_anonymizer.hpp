#pragma once

#include "remote/iremote_anonymizer.hpp"

#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace piiguard::testing {

/**
 * @brief Scriptable remote service for orchestrator tests
 *
 * On success every item comes back as "[REMOTE]" with one PERSON
 * replacement and score 0.88. Failures use the configured category.
 */
class MockRemoteAnonymizer : public IRemoteAnonymizer {
public:
    explicit MockRemoteAnonymizer(bool should_succeed = true)
        : should_succeed_(should_succeed) {}

    [[nodiscard]] Result<SanitizationResult> sanitize_remote(
        const std::string& text, PrivacyLevel /*level*/, bool preserve_format) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        if (should_throw_) throw std::runtime_error("Mock adapter exception");
        if (!should_succeed_) {
            return Result<SanitizationResult>::error(failure_category_, "Mock failure");
        }
        return Result<SanitizationResult>::ok(make_result(text, preserve_format));
    }

    [[nodiscard]] Result<std::vector<RemoteBatchItem>> sanitize_remote_batch(
        const std::vector<std::string>& texts, PrivacyLevel /*level*/,
        bool preserve_format) override {
        batch_call_count_.fetch_add(1, std::memory_order_relaxed);
        last_batch_size_ = texts.size();
        if (should_throw_) throw std::runtime_error("Mock adapter exception");
        if (!should_succeed_) {
            return Result<std::vector<RemoteBatchItem>>::error(failure_category_, "Mock failure");
        }

        std::vector<RemoteBatchItem> items;
        for (size_t i = 0; i < texts.size(); ++i) {
            RemoteBatchItem item;
            if (item_errors_.contains(i)) {
                item.error = "Mock item failure";
            } else {
                item.success = true;
                item.result = make_result(texts[i], preserve_format);
            }
            items.push_back(std::move(item));
        }
        if (truncate_batch_ && !items.empty()) {
            items.pop_back();
        }
        return Result<std::vector<RemoteBatchItem>>::ok(std::move(items));
    }

    [[nodiscard]] bool is_healthy() override { return should_succeed_; }

    [[nodiscard]] std::optional<RemoteStats> get_stats() override {
        if (!should_succeed_) return std::nullopt;
        RemoteStats stats;
        stats.total_mappings = 3;
        stats.spacy_model_loaded = true;
        return stats;
    }

    void set_should_succeed(bool v) { should_succeed_ = v; }
    void set_should_throw(bool v) { should_throw_ = v; }
    void set_failure_category(ErrorCategory c) { failure_category_ = c; }
    void set_item_errors(std::set<size_t> indices) { item_errors_ = std::move(indices); }
    void set_truncate_batch(bool v) { truncate_batch_ = v; }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t batch_call_count() const {
        return batch_call_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t last_batch_size() const { return last_batch_size_; }

private:
    static SanitizationResult make_result(const std::string& text, bool preserve_format) {
        SanitizationResult result;
        result.sanitized_text = "[REMOTE]";
        result.privacy_score = 0.88;
        result.context_preserved = preserve_format;
        result.processing_time_ms = 12;
        result.score_model = ScoreModel::REMOTE_SERVICE;
        result.replacements.push_back({text, "[REMOTE]", EntityType::PERSON_NAME, 0.9, "PERSON"});
        return result;
    }

    bool should_succeed_;
    bool should_throw_ = false;
    ErrorCategory failure_category_ = ErrorCategory::REMOTE_UNAVAILABLE;
    std::set<size_t> item_errors_;
    bool truncate_batch_ = false;
    size_t last_batch_size_ = 0;
    std::atomic<uint64_t> call_count_{0};
    std::atomic<uint64_t> batch_call_count_{0};
};

} // namespace piiguard::testing
