#include "sanitizer/privacy_score.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace piiguard {

double PrivacyScoreCalculator::score(std::string_view original_text,
                                     std::string_view /*sanitized_text*/,
                                     size_t replacement_count) {
    const size_t words = std::max<size_t>(1, utils::word_count(original_text));
    const double ratio = static_cast<double>(replacement_count) / static_cast<double>(words);

    double result = kBaseScore;
    if (ratio < kSparseRatio) {
        result -= kSparsePenalty;
    }
    if (ratio > kDenseRatio) {
        result = std::min(kMaxScore, result + kDenseBonus);
    }

    return std::clamp(result, kMinScore, kMaxScore);
}

} // namespace piiguard
