#pragma once

#include <cstddef>
#include <string_view>

namespace piiguard {

/**
 * @brief Replacement-density privacy score (ScoreModel::LOCAL_DENSITY)
 *
 * score = 0.95; ratio = replacements / max(1, words(original))
 *   ratio < 0.05  → score - 0.10
 *   ratio > 0.15  → min(0.99, score + 0.05)
 * Result is clamped to [0.70, 0.99].
 *
 * A coarse heuristic: it cannot tell "no PII present" from "PII of an
 * inactive type present".
 */
class PrivacyScoreCalculator {
public:
    static constexpr double kBaseScore = 0.95;
    static constexpr double kMinScore = 0.70;
    static constexpr double kMaxScore = 0.99;
    static constexpr double kSparseRatio = 0.05;
    static constexpr double kDenseRatio = 0.15;
    static constexpr double kSparsePenalty = 0.10;
    static constexpr double kDenseBonus = 0.05;

    [[nodiscard]] static double score(std::string_view original_text,
                                      std::string_view sanitized_text,
                                      size_t replacement_count);
};

} // namespace piiguard
