#include <cmath>
#include <numbers>

#include "doctest.h"
#include "quaternion.hpp"

using namespace versor;

constexpr double kPiD = std::numbers::pi_v<double>;

namespace {

Quatd rot_z(double angle) { return Quatd::from_axis_angle(Vec3d::unit_z(), angle); }

} // namespace

TEST_SUITE("Geodesic distance") {
    TEST_CASE("Intrinsic distance") {
        CHECK(Quatd::distance(Quatd::identity(), Quatd::identity()) == 0.0);
        CHECK(Quatd::distance(Quatd::identity(), rot_z(0.5)) == doctest::Approx(0.5));
        CHECK(Quatd::distance(rot_z(0.2), rot_z(0.9)) == doctest::Approx(0.7));

        // No sign resolution: the long way round is reported
        CHECK(Quatd::distance(Quatd::identity(), rot_z(1.5 * kPiD)) == doctest::Approx(1.5 * kPiD));
    }

    TEST_CASE("Symmetrized distance takes the shorter arc") {
        CHECK(Quatd::distance_sym(Quatd::identity(), rot_z(1.5 * kPiD)) == doctest::Approx(0.5 * kPiD));
        CHECK(Quatd::distance_sym(rot_z(0.5), -rot_z(0.9)) == doctest::Approx(0.4));

        const Quatd q = Quatd::from_axis_angle(Vec3d{1, -2, 0.5}, 1.1);
        CHECK(Quatd::distance_sym(q, -q) == doctest::Approx(0.0).epsilon(1e-12));

        // q and -q are the same distance from a third rotation
        const Quatd p = Quatd::from_axis_angle(Vec3d{0, 1, 1}, -0.6);
        CHECK(Quatd::distance_sym(q, p) == doctest::Approx(Quatd::distance_sym(-q, p)));
        CHECK(Quatd::distance_sym(q, p) == doctest::Approx(Quatd::distance_sym(p, q)));
    }

    TEST_CASE("Chord distance") {
        CHECK(Quatd::distance_chord(Quatd::identity(), rot_z(0.5)) == doctest::Approx(2.0 * std::sin(0.25)));
        CHECK(Quatd::distance_chord(rot_z(0.3), -rot_z(0.3)) == doctest::Approx(0.0).epsilon(1e-12));
    }

    TEST_CASE("Absolute distance") {
        const Quatd q = rot_z(0.8);
        CHECK(Quatd::distance_abs(q, -q) == 0.0);
        CHECK(Quatd::distance_abs(q, q) == 0.0);

        const double expected = (Quatd::identity() - q).length();
        CHECK(Quatd::distance_abs(Quatd::identity(), q) == doctest::Approx(expected));
        CHECK(Quatd::distance_abs(Quatd::identity(), -q) == doctest::Approx(expected));
    }

    TEST_CASE("Approximate equality is sign-insensitive") {
        const Quatd q = Quatd::from_axis_angle(Vec3d{3, 1, 2}, 2.5);
        CHECK(Quatd::approx_eq(q, q));
        CHECK(Quatd::approx_eq(q, -q));
        CHECK(Quatd::approx_eq(Quatd::identity(), rot_z(1e-8)));
        CHECK_FALSE(Quatd::approx_eq(Quatd::identity(), rot_z(1e-3)));
        CHECK(Quatd::approx_eq(Quatd::identity(), rot_z(1e-3), 1e-2));
    }
}

TEST_SUITE("Exponential and logarithm maps") {
    TEST_CASE("Difference reaches the target up to sign") {
        const Quatd q0 = Quatd::from_axis_angle(Vec3d{1, 0, 1}, 0.7);
        const Quatd q1 = Quatd::from_axis_angle(Vec3d{0, 1, -1}, 2.2);

        CHECK(Quatd::approx_eq(q0 * Quatd::difference(q0, q1), q1));
        CHECK(Quatd::approx_eq(q0 * Quatd::difference(q0, -q1), q1));

        // Minimal: the difference is never more than a half turn
        const auto aa = Quatd::difference(q0, -q1).normalized().to_axis_angle();
        CHECK(aa.angle <= kPiD + 1e-12);
        CHECK(Quatd::difference(q0, -q1).w() >= 0.0);
    }

    TEST_CASE("Exponential map inverts the logarithm map") {
        const Quatd base = Quatd::from_axis_angle(Vec3d{1, 2, 3}, 0.9);
        const Quatd q = Quatd::from_axis_angle(Vec3d{-1, 0, 2}, 1.7);

        const Quatd tangent = Quatd::log_map(base, q);
        CHECK(tangent.w() == doctest::Approx(0.0).epsilon(1e-12));
        CHECK(Quatd::approx_eq(Quatd::exp_map(base, tangent), q));

        const Quatd tangent_sym = Quatd::log_map_sym(base, q);
        CHECK(Quatd::approx_eq(Quatd::exp_map_sym(base, tangent_sym), q));
    }

    TEST_CASE("Logarithm map at identity is the plain logarithm") {
        const Quatd q = rot_z(0.6);
        const Quatd a = Quatd::log_map(Quatd::identity(), q);
        const Quatd b = q.log();
        CHECK(a.z() == doctest::Approx(b.z()));
        CHECK(a.z() == doctest::Approx(0.3));

        const Quatd c = Quatd::log_map_sym(Quatd::identity(), q);
        CHECK(c.z() == doctest::Approx(0.3));
    }

    TEST_CASE("log_inv") {
        const Quatd q0 = rot_z(0.9);
        const Quatd q1 = rot_z(0.3);
        const Quatd l = Quatd::log_inv(q0, q1);
        CHECK(l.z() == doctest::Approx(0.3));
        CHECK(l.x() == doctest::Approx(0.0));
        CHECK(l.w() == doctest::Approx(0.0).epsilon(1e-12));
    }
}
