#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/random.hpp"
#include "core/types.hpp"
#include "detector/entity_detector.hpp"
#include "sanitizer/noise_injector.hpp"
#include "sanitizer/substitution_generator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief In-process sanitization engine and the fallback for the remote service
 *
 * Pipeline: detect → substitute → (MAXIMUM only) noise → score.
 * Holds no mutable state; concurrent calls are safe as long as the injected
 * RandomSource is (ThreadLocalRandomSource is).
 */
class LocalSanitizer {
public:
    struct Options {
        IdentityPolicy identity_policy = IdentityPolicy::PER_OCCURRENCE;
        double noise_scale = 1.0;
        int64_t noise_threshold = 100;
    };

    LocalSanitizer();
    LocalSanitizer(std::shared_ptr<const PatternCatalog> catalog,
                   std::shared_ptr<RandomSource> random,
                   Options options);
    LocalSanitizer(std::shared_ptr<const PatternCatalog> catalog,
                   std::shared_ptr<RandomSource> random);

    /**
     * @brief Sanitize with the default per-level config (context preserved)
     */
    [[nodiscard]] SanitizationResult sanitize(const std::string& text, PrivacyLevel level) const;

    [[nodiscard]] SanitizationResult sanitize(const std::string& text,
                                              const PrivacyConfig& config) const;

    /**
     * @brief Detection only, no substitution (preview/debugging)
     */
    [[nodiscard]] std::vector<EntityMatch> detect(const std::string& text,
                                                  PrivacyLevel level) const;

    [[nodiscard]] const PatternCatalog& catalog() const { return detector_.catalog(); }

private:
    EntityDetector detector_;
    SubstitutionGenerator substitution_;
    NoiseInjector noise_;
};

} // namespace piiguard
