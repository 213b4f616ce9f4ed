#include <numbers>

#include "fmt/core.h"
#include "versor.hpp"

int main() {
    using namespace versor;

    fmt::print("=== Slerp Between Two Orientations ===\n\n");

    const Quatd start = Quatd::from_axis_angle(Vec3d{0.0, 1.0, 0.0}, 0.2);
    const Quatd end = Quatd::from_axis_angle(Vec3d{1.0, 1.0, 0.0}, 2.4);

    fmt::print("Start: {}\n", to_string(start, 4));
    fmt::print("End:   {}\n", to_string(end, 4));
    fmt::print("Geodesic distance: {:.4f} rad\n\n", Quatd::distance_sym(start, end));

    const auto steps = intermediates(start, end, 5, true);
    for (size_t i = 0; i < steps.size(); ++i) {
        fmt::print("  step {}: {}  (from start {:.4f} rad)\n", i, to_string(steps[i], 4), Quatd::distance_sym(start, steps[i]));
    }

    fmt::print("\n=== Constant-Rate Integration ===\n");
    const Vec3d  rate{0.0, 0.0, std::numbers::pi / 2}; // 90 deg/s about Z
    const double dt = 0.1;
    Quatd        q = Quatd::identity();
    for (int i = 1; i <= 10; ++i) {
        q = Quatd::integrate(q, rate, dt);
        if (i % 5 == 0) {
            const Vec3d x_axis = q * Vec3d::unit_x();
            fmt::print("t = {:.1f} s: {}  x -> ({:.3f}, {:.3f}, {:.3f})\n", i * dt, to_string(q, 4), x_axis[0], x_axis[1], x_axis[2]);
        }
    }

    fmt::print("\n=== Random Rotations ===\n");
    RandomRotation<double> rng(2024);
    for (int i = 0; i < 3; ++i) {
        const Quatd r = rng.next();
        fmt::print("  {}  |q| = {:.6f}\n", to_string(r, 4), r.length());
    }

    return 0;
}
