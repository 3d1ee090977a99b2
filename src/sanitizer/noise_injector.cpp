#include "sanitizer/noise_injector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace piiguard {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

NoiseInjector::NoiseInjector(std::shared_ptr<RandomSource> random,
                             double scale,
                             int64_t threshold)
    : random_(std::move(random)),
      scale_(scale),
      threshold_(threshold) {
    if (!random_) {
        throw std::invalid_argument("NoiseInjector requires a random source");
    }
}

double NoiseInjector::laplace_from_uniform(double u, double mu, double b) {
    const double sign = (u > 0.0) ? 1.0 : ((u < 0.0) ? -1.0 : 0.0);
    return mu - b * sign * std::log(1.0 - 2.0 * std::abs(u));
}

double NoiseInjector::laplace(double mu, double b) const {
    double u = random_->uniform(-0.5, 0.5);
    // u = -0.5 would give ln(0); the interval is open on both ends
    while (u <= -0.5) {
        u = random_->uniform(-0.5, 0.5);
    }
    return laplace_from_uniform(u, mu, b);
}

std::string NoiseInjector::inject_noise(const std::string& text) const {
    std::string out;
    out.reserve(text.size());

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const bool token_start = is_digit(text[i]) && (i == 0 || !is_word_char(text[i - 1]));
        if (!token_start) {
            out += text[i++];
            continue;
        }

        size_t j = i;
        while (j < n && is_digit(text[j])) ++j;

        // Digits glued to letters ("abc123", "123abc") are not standalone numbers
        if (j < n && is_word_char(text[j])) {
            while (j < n && is_word_char(text[j])) ++j;
            out.append(text, i, j - i);
            i = j;
            continue;
        }

        const std::string_view token(text.data() + i, j - i);
        const auto value = utils::try_parse_int<int64_t>(token);
        if (value && *value > threshold_) {
            const double noisy = static_cast<double>(*value) + laplace(0.0, scale_);
            const auto rounded = static_cast<int64_t>(std::floor(noisy + 0.5));
            out += std::to_string(std::max<int64_t>(0, rounded));
        } else {
            out.append(token);
        }
        i = j;
    }

    return out;
}

} // namespace piiguard
