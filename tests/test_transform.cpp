#include <cmath>
#include <numbers>

#include "doctest.h"
#include "transform.hpp"

using namespace versor;

constexpr double kPiD = std::numbers::pi_v<double>;

namespace {

void check_vec(const Vec3d& actual, const Vec3d& expected) {
    CHECK(actual[0] == doctest::Approx(expected[0]).epsilon(1e-9));
    CHECK(actual[1] == doctest::Approx(expected[1]).epsilon(1e-9));
    CHECK(actual[2] == doctest::Approx(expected[2]).epsilon(1e-9));
}

} // namespace

TEST_SUITE("Transform") {
    TEST_CASE("Identity transform") {
        Transform<double> T;
        CHECK(T == Transform<double>::identity());
        CHECK(T(3, 3) == 1.0);
        check_vec(T.translation(), Vec3d{});
        check_vec(T.right_vector(), Vec3d::unit_x());
        check_vec(T.up_vector(), Vec3d::unit_y());
        check_vec(T.look_vector(), Vec3d{0, 0, -1});
    }

    TEST_CASE("Rotation and translation parts") {
        const auto R = DCM<double>::rotate_y(0.4);
        const auto T = Transform<double>::from_rotation_translation(R, Vec3d{1, 2, 3});

        check_vec(T.translation(), Vec3d{1, 2, 3});
        CHECK(T.rotation() == R);
        CHECK(T(3, 0) == 0.0);
        CHECK(T(3, 3) == 1.0);

        // Look vector is the negated back column
        check_vec(T.look_vector(), -R.back());
    }

    TEST_CASE("Points are rotated then translated, vectors only rotated") {
        const auto T = Transform<double>::from_rotation_translation(DCM<double>::rotate_z(kPiD / 2), Vec3d{10, 0, 0});

        check_vec(T.transform_point(Vec3d{1, 0, 0}), Vec3d{10, 1, 0});
        check_vec(T.transform_vector(Vec3d{1, 0, 0}), Vec3d{0, 1, 0});
    }

    TEST_CASE("Composition applies the right operand first") {
        const auto A = Transform<double>::from_translation(Vec3d{0, 0, 5});
        const auto B = Transform<double>::from_rotation_translation(DCM<double>::rotate_x(kPiD / 2), Vec3d{});

        // B rotates Y onto Z, then A moves along Z
        check_vec((A * B).transform_point(Vec3d{0, 1, 0}), Vec3d{0, 0, 6});
        // A first, then B rotates the translated point
        check_vec((B * A).transform_point(Vec3d{0, 1, 0}), Vec3d{0, -5, 1});
    }

    TEST_CASE("Rigid inverse") {
        const auto T = Transform<double>::from_rotation_translation(DCM<double>::rotate_z(0.3) * DCM<double>::rotate_x(-0.8), Vec3d{1, -2, 4});
        const auto I = T * T.inverse();

        for (size_t r = 0; r < 4; ++r) {
            for (size_t c = 0; c < 4; ++c) {
                CHECK(I(r, c) == doctest::Approx(r == c ? 1.0 : 0.0).epsilon(1e-12));
            }
        }

        const Vec3d p{0.5, 0.25, -3};
        check_vec(T.inverse().transform_point(T.transform_point(p)), p);
    }
}
