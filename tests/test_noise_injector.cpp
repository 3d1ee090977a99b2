#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sanitizer/noise_injector.hpp"
#include "mocks/sequence_random_source.hpp"

#include <cmath>

using namespace piiguard;
using piiguard::testing::SequenceRandomSource;

TEST_CASE("NoiseInjector: inverse-CDF transform", "[noise]") {
    CHECK(NoiseInjector::laplace_from_uniform(0.0, 0.0, 1.0) == Catch::Approx(0.0));
    CHECK(NoiseInjector::laplace_from_uniform(0.25, 0.0, 1.0) == Catch::Approx(std::log(2.0)));
    CHECK(NoiseInjector::laplace_from_uniform(-0.25, 0.0, 1.0) == Catch::Approx(-std::log(2.0)));
    CHECK(NoiseInjector::laplace_from_uniform(0.25, 10.0, 2.0) == Catch::Approx(10.0 + 2.0 * std::log(2.0)));
}

TEST_CASE("NoiseInjector: perturbs only standalone integers above the threshold", "[noise]") {
    // u = 0.25 → noise = +ln 2 ≈ 0.69
    const NoiseInjector injector(std::make_shared<SequenceRandomSource>(std::vector<double>{0.25}));

    CHECK(injector.inject_noise("Order 500 items, 50 left") == "Order 501 items, 50 left");
    CHECK(injector.inject_noise("exactly 100") == "exactly 100");
    CHECK(injector.inject_noise("just 101") == "just 102");
    CHECK(injector.inject_noise("code A1234 and 1234abc") == "code A1234 and 1234abc");
    CHECK(injector.inject_noise("no digits at all") == "no digits at all");
    CHECK(injector.inject_noise("") == "");
}

TEST_CASE("NoiseInjector: result is clamped at zero", "[noise]") {
    const NoiseInjector injector(
        std::make_shared<SequenceRandomSource>(std::vector<double>{-0.4999999}), 1000.0);
    CHECK(injector.inject_noise("balance 101") == "balance 0");
}

TEST_CASE("NoiseInjector: u = -0.5 is redrawn", "[noise]") {
    auto random = std::make_shared<SequenceRandomSource>(std::vector<double>{-0.5, 0.25});
    const NoiseInjector injector(random);

    CHECK(injector.inject_noise("200") == "201");
    CHECK(random->uniform_calls() == 2);
}

TEST_CASE("NoiseInjector: integers beyond int64 are left alone", "[noise]") {
    const NoiseInjector injector(std::make_shared<SequenceRandomSource>(std::vector<double>{0.25}));
    CHECK(injector.inject_noise("id 99999999999999999999") == "id 99999999999999999999");
}

TEST_CASE("NoiseInjector: null random source rejected", "[noise]") {
    CHECK_THROWS_AS(NoiseInjector(nullptr), std::invalid_argument);
}
