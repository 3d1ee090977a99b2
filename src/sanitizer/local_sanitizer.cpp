#include "sanitizer/local_sanitizer.hpp"
#include "sanitizer/privacy_score.hpp"
#include "core/utils.hpp"

namespace piiguard {

LocalSanitizer::LocalSanitizer()
    : LocalSanitizer(PatternCatalog::make_default(), ThreadLocalRandomSource::shared()) {}

LocalSanitizer::LocalSanitizer(std::shared_ptr<const PatternCatalog> catalog,
                               std::shared_ptr<RandomSource> random)
    : LocalSanitizer(std::move(catalog), std::move(random), Options{}) {}

LocalSanitizer::LocalSanitizer(std::shared_ptr<const PatternCatalog> catalog,
                               std::shared_ptr<RandomSource> random,
                               Options options)
    : detector_(catalog),
      substitution_(catalog, random, options.identity_policy),
      noise_(random, options.noise_scale, options.noise_threshold) {}

SanitizationResult LocalSanitizer::sanitize(const std::string& text, PrivacyLevel level) const {
    return sanitize(text, PrivacyConfig::for_level(level));
}

SanitizationResult LocalSanitizer::sanitize(const std::string& text,
                                            const PrivacyConfig& config) const {
    utils::Timer timer;

    SanitizationResult result;
    result.context_preserved = config.preserve_context;
    result.score_model = ScoreModel::LOCAL_DENSITY;

    if (config.enable_token_substitution) {
        const auto matches = detector_.detect(text, config.privacy_level);
        auto substituted = substitution_.substitute(text, matches, config.preserve_context);
        result.sanitized_text = std::move(substituted.sanitized_text);
        result.replacements = std::move(substituted.replacements);
    } else {
        result.sanitized_text = text;
    }

    if (config.enable_differential_privacy && config.privacy_level == PrivacyLevel::MAXIMUM) {
        result.sanitized_text = noise_.inject_noise(result.sanitized_text);
    }

    result.privacy_score = PrivacyScoreCalculator::score(
        text, result.sanitized_text, result.replacements.size());
    result.processing_time_ms = timer.elapsed_ms().count();
    return result;
}

std::vector<EntityMatch> LocalSanitizer::detect(const std::string& text,
                                                PrivacyLevel level) const {
    return detector_.detect(text, level);
}

} // namespace piiguard
