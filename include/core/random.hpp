#pragma once

#include <cstddef>
#include <memory>
#include <random>

namespace piiguard {

/**
 * @brief Source of randomness for synthetic names and Laplace noise.
 *
 * Implementations must be safe to call from concurrent sanitizations.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Uniform double in [lo, hi)
     */
    [[nodiscard]] virtual double uniform(double lo, double hi) = 0;

    /**
     * @brief Uniform index in [0, n). n must be > 0.
     */
    [[nodiscard]] virtual size_t pick(size_t n) = 0;
};

/**
 * @brief Default source: one mt19937_64 per thread, seeded from random_device.
 * Needs no locking because no engine is ever shared between threads.
 */
class ThreadLocalRandomSource final : public RandomSource {
public:
    [[nodiscard]] double uniform(double lo, double hi) override {
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(engine());
    }

    [[nodiscard]] size_t pick(size_t n) override {
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(engine());
    }

    [[nodiscard]] static std::shared_ptr<RandomSource> shared() {
        static const auto instance = std::make_shared<ThreadLocalRandomSource>();
        return instance;
    }

private:
    static std::mt19937_64& engine() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        return gen;
    }
};

} // namespace piiguard
