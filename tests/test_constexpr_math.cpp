#include <cmath>

#include "constexpr_math.hpp"
#include "doctest.h"

TEST_SUITE("constexpr_math") {
    TEST_CASE("vmath::sqrt matches std::sqrt") {
        CHECK(vmath::sqrt(0.0) == doctest::Approx(std::sqrt(0.0)));
        CHECK(vmath::sqrt(1.0) == doctest::Approx(std::sqrt(1.0)));
        CHECK(vmath::sqrt(2.0) == doctest::Approx(std::sqrt(2.0)));
        CHECK(vmath::sqrt(0.25) == doctest::Approx(std::sqrt(0.25)));
        CHECK(vmath::sqrt(1e-10) == doctest::Approx(std::sqrt(1e-10)));
        CHECK(vmath::sqrt(1e10) == doctest::Approx(std::sqrt(1e10)));

        // Float
        CHECK(vmath::sqrt(2.0f) == doctest::Approx(std::sqrt(2.0)));
        CHECK(vmath::sqrt(0.5f) == doctest::Approx(std::sqrt(0.5)));
    }

    TEST_CASE("vmath::sqrt of a negative value is zero") {
        CHECK(vmath::sqrt(-1.0) == 0.0);
        CHECK(vmath::sqrt(-1e-18) == 0.0);

        constexpr double ct = vmath::sqrt(-4.0);
        CHECK(ct == 0.0);
    }

    TEST_CASE("vmath::abs matches std::abs") {
        CHECK(vmath::abs(0.0) == std::abs(0.0));
        CHECK(vmath::abs(-1.0) == std::abs(-1.0));
        CHECK(vmath::abs(3.14159) == std::abs(3.14159));
        CHECK(vmath::abs(-1e-15) == std::abs(-1e-15));
        CHECK(vmath::abs(-1e15) == std::abs(-1e15));
    }

    TEST_CASE("vmath::max, clamp and sign") {
        CHECK(vmath::max({1.0, -3.0, 2.5}) == 2.5);
        CHECK(vmath::max({-1.0, -3.0}) == -1.0);
        CHECK(vmath::max({7.0f}) == 7.0f);

        CHECK(vmath::clamp(1.5, -1.0, 1.0) == 1.0);
        CHECK(vmath::clamp(-1.5, -1.0, 1.0) == -1.0);
        CHECK(vmath::clamp(0.25, -1.0, 1.0) == 0.25);

        CHECK(vmath::sign(0.0) == 1.0);
        CHECK(vmath::sign(2.0) == 1.0);
        CHECK(vmath::sign(-0.1) == -1.0);
    }

    TEST_CASE("constexpr verification") {
        constexpr double sqrt_val = vmath::sqrt(4.0);
        constexpr double sqrt_two = vmath::sqrt(2.0);
        constexpr double abs_val = vmath::abs(-5.0);
        constexpr double max_val = vmath::max({1.0, 4.0, 2.0});
        constexpr double clamp_val = vmath::clamp(3.0, 0.0, 1.0);

        CHECK(sqrt_val == doctest::Approx(2.0));
        CHECK(sqrt_two == doctest::Approx(std::sqrt(2.0)));
        CHECK(abs_val == doctest::Approx(5.0));
        CHECK(max_val == 4.0);
        CHECK(clamp_val == 1.0);
    }
}
