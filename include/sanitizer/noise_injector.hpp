#pragma once

#include "core/random.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace piiguard {

/**
 * @brief Perturbs standalone integer tokens with Laplace noise
 *
 * Every whole-word integer greater than the threshold (default 100) becomes
 * max(0, round(value + Laplace(0, scale))). Smaller values and integers too
 * large for int64 pass through unchanged. Only used at MAXIMUM level, after
 * substitution. This is informal perturbation, not a formal (ε,δ) mechanism.
 */
class NoiseInjector {
public:
    explicit NoiseInjector(std::shared_ptr<RandomSource> random,
                           double scale = 1.0,
                           int64_t threshold = 100);

    [[nodiscard]] std::string inject_noise(const std::string& text) const;

    /**
     * @brief Draw one Laplace(mu, b) sample
     */
    [[nodiscard]] double laplace(double mu, double b) const;

    /**
     * @brief Inverse-CDF transform: mu - b * sign(u) * ln(1 - 2|u|), u in (-0.5, 0.5)
     */
    [[nodiscard]] static double laplace_from_uniform(double u, double mu, double b);

private:
    std::shared_ptr<RandomSource> random_;
    double scale_;
    int64_t threshold_;
};

} // namespace piiguard
