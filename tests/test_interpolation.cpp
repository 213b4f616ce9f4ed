#include <cmath>
#include <numbers>

#include "doctest.h"
#include "interpolation.hpp"
#include "quaternion.hpp"

using namespace versor;

constexpr double kPiD = std::numbers::pi_v<double>;

namespace {

Quatd rot_z(double angle) { return Quatd::from_axis_angle(Vec3d::unit_z(), angle); }

} // namespace

TEST_SUITE("Slerp") {
    TEST_CASE("Endpoints") {
        const Quatd q0 = Quatd::from_axis_angle(Vec3d{1, 1, 0}, 0.4);
        const Quatd q1 = Quatd::from_axis_angle(Vec3d{0, -1, 2}, 2.0);

        CHECK(Quatd::approx_eq(Quatd::slerp(q0, q1, 0.0), q0));
        CHECK(Quatd::approx_eq(Quatd::slerp(q0, q1, 1.0), q1));
        CHECK(Quatd::slerp(q0, q1, 0.3).is_unit());
    }

    TEST_CASE("Identical endpoints") {
        const Quatd q = Quatd::from_axis_angle(Vec3d{2, 0, 1}, 1.3);
        CHECK(Quatd::approx_eq(Quatd::slerp(q, q, 0.0), q));
        CHECK(Quatd::approx_eq(Quatd::slerp(q, q, 0.37), q));
        CHECK(Quatd::approx_eq(Quatd::slerp(q, q, 1.0), q));
    }

    TEST_CASE("Constant angular velocity") {
        CHECK(Quatd::approx_eq(Quatd::slerp(Quatd::identity(), rot_z(1.0), 0.5), rot_z(0.5)));
        CHECK(Quatd::approx_eq(Quatd::slerp(Quatd::identity(), rot_z(1.0), 0.25), rot_z(0.25)));
        CHECK(Quatd::approx_eq(Quatd::slerp(rot_z(0.2), rot_z(1.0), 0.5), rot_z(0.6)));
    }

    TEST_CASE("Shorter arc is taken") {
        // rot_z(1.5 pi) is the same rotation as rot_z(-0.5 pi)
        const Quatd mid = Quatd::slerp(Quatd::identity(), rot_z(1.5 * kPiD), 0.5);
        CHECK(Quatd::approx_eq(mid, rot_z(-0.25 * kPiD)));

        const Quatd q0 = rot_z(0.3);
        const Quatd q1 = rot_z(0.9);
        CHECK(Quatd::approx_eq(Quatd::slerp(q0, -q1, 0.5), rot_z(0.6)));
        CHECK(Quatd::approx_eq(Quatd::slerp(-q0, q1, 0.5), rot_z(0.6)));
    }

    TEST_CASE("Alpha outside [0, 1] extrapolates") {
        CHECK(Quatd::approx_eq(Quatd::slerp(Quatd::identity(), rot_z(1.0), 2.0), rot_z(2.0)));
        CHECK(Quatd::approx_eq(Quatd::slerp(Quatd::identity(), rot_z(1.0), -0.5), rot_z(-0.5)));
    }

    TEST_CASE("Non-unit endpoints are normalized") {
        CHECK(Quatd::approx_eq(Quatd::slerp(Quatd::identity() * 3.0, rot_z(1.0) * 0.5, 0.5), rot_z(0.5)));
    }

    TEST_CASE("Identity slerp matches slerp from identity") {
        const Quatd q1 = Quatd::from_axis_angle(Vec3d{1, -3, 2}, 2.4);
        for (double alpha : {0.0, 0.1, 0.5, 0.9, 1.0, 1.5}) {
            CHECK(Quatd::approx_eq(Quatd::identity_slerp(q1, alpha), Quatd::slerp(Quatd::identity(), q1, alpha)));
        }

        // Negative real part: sign resolved against -identity
        CHECK(Quatd::approx_eq(Quatd::identity_slerp(rot_z(1.5 * kPiD), 0.5), rot_z(-0.25 * kPiD)));
        CHECK(Quatd::approx_eq(Quatd::identity_slerp(Quatd::identity(), 0.5), Quatd::identity()));
    }
}

TEST_SUITE("SlerpFunction") {
    TEST_CASE("Matches slerp") {
        const Quatd q0 = Quatd::from_axis_angle(Vec3d{0, 1, 0}, -0.7);
        const Quatd q1 = Quatd::from_axis_angle(Vec3d{1, 1, 1}, 2.9);

        const auto slerp = slerp_function(q0, q1);
        for (double alpha : {-0.25, 0.0, 0.2, 0.5, 0.8, 1.0, 1.25}) {
            const Quatd a = slerp(alpha);
            const Quatd b = Quatd::slerp(q0, q1, alpha);
            CHECK(a.x() == doctest::Approx(b.x()).epsilon(1e-12));
            CHECK(a.y() == doctest::Approx(b.y()).epsilon(1e-12));
            CHECK(a.z() == doctest::Approx(b.z()).epsilon(1e-12));
            CHECK(a.w() == doctest::Approx(b.w()).epsilon(1e-12));
        }
    }

    TEST_CASE("Endpoints are normalized and sign resolved") {
        const SlerpFunction<double> slerp(rot_z(0.2) * 2.0, -rot_z(0.4));
        CHECK(slerp.start().is_unit());
        CHECK(dot(slerp.start(), slerp.end()) >= 0.0);
        CHECK(slerp.arc_angle() == doctest::Approx(0.1));
    }

    TEST_CASE("Coincident endpoints") {
        const Quatd q = Quatd::identity();
        const auto  slerp = slerp_function(q, q);
        CHECK(slerp(0.5) == q);
        CHECK(slerp.arc_angle() == 0.0);
    }
}

TEST_SUITE("Intermediates") {
    TEST_CASE("Evenly spaced interior points") {
        const Quatd q1 = rot_z(1.0);
        const auto  steps = intermediates(Quatd::identity(), q1, 3);

        REQUIRE(steps.size() == 3);
        CHECK(Quatd::approx_eq(steps[0], rot_z(0.25)));
        CHECK(Quatd::approx_eq(steps[1], rot_z(0.5)));
        CHECK(Quatd::approx_eq(steps[2], rot_z(0.75)));
    }

    TEST_CASE("Endpoints included") {
        const Quatd q0 = Quatd{0.0, 0.0, 0.0, 2.0};
        const Quatd q1 = rot_z(1.0);
        const auto  steps = intermediates(q0, q1, 3, true);

        REQUIRE(steps.size() == 5);
        // Endpoints are returned as passed in
        CHECK(steps.front() == q0);
        CHECK(steps.back() == q1);
        CHECK(Quatd::approx_eq(steps[2], rot_z(0.5)));
    }

    TEST_CASE("No interior points") {
        CHECK(intermediates(Quatd::identity(), rot_z(1.0), 0).empty());
        CHECK(intermediates(Quatd::identity(), rot_z(1.0), 0, true).size() == 2);
    }
}

TEST_SUITE("Rate integration") {
    TEST_CASE("Derivative") {
        const Quatd d = Quatd::derivative(Quatd::identity(), Vec3d{0, 0, 2});
        CHECK(d == Quatd{0.0, 0.0, 1.0, 0.0});

        // Derivative of a unit quaternion is orthogonal to it
        const Quatd q = Quatd::from_axis_angle(Vec3d{1, 2, 0}, 0.8);
        CHECK(dot(q, Quatd::derivative(q, Vec3d{0.3, -1, 2})) == doctest::Approx(0.0).epsilon(1e-12));
    }

    TEST_CASE("Integration step") {
        CHECK(Quatd::approx_eq(Quatd::integrate(Quatd::identity(), Vec3d{0, 0, 1}, 0.5), rot_z(0.5)));
        CHECK(Quatd::approx_eq(Quatd::integrate(rot_z(0.2), Vec3d{0, 0, 2}, 0.25), rot_z(0.7)));
        CHECK(Quatd::integrate(rot_z(0.2) * 4.0, Vec3d{1, 1, 1}, 0.1).is_unit());
    }

    TEST_CASE("Zero rotation returns the normalized start") {
        CHECK(Quatd::integrate(Quatd{0.0, 0.0, 0.0, 2.0}, Vec3d{}, 1.0) == Quatd::identity());
        CHECK(Quatd::integrate(rot_z(0.3), Vec3d{1, 2, 3}, 0.0) == rot_z(0.3).normalized());
    }

    TEST_CASE("Integration agrees with the derivative for small steps") {
        const Quatd q0 = Quatd::from_axis_angle(Vec3d{-1, 0.5, 2}, 1.1);
        const Vec3d rate{0.4, -0.2, 1.5};
        const double h = 1e-6;

        const Quatd finite = (Quatd::integrate(q0, rate, h) - q0) / h;
        const Quatd d = Quatd::derivative(q0, rate);
        CHECK(finite.x() == doctest::Approx(d.x()).epsilon(1e-4));
        CHECK(finite.y() == doctest::Approx(d.y()).epsilon(1e-4));
        CHECK(finite.z() == doctest::Approx(d.z()).epsilon(1e-4));
        CHECK(finite.w() == doctest::Approx(d.w()).epsilon(1e-4));
    }
}
