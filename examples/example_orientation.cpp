#include <numbers>

#include "fmt/core.h"
#include "versor.hpp"

int main() {
    using namespace versor;

    constexpr double kDeg = std::numbers::pi / 180.0;

    fmt::print("=== Orientation Conversions Demo ===\n\n");

    // Yaw 30 deg, pitch 10 deg, roll 0 as an orientation (YXZ)
    const Quatd q = Quatd::from_orientation(10.0 * kDeg, 30.0 * kDeg, 0.0);
    fmt::print("Orientation quaternion: {}\n", q);
    fmt::print("Rounded:                {}\n\n", to_string(q, 4));

    const auto aa = q.to_axis_angle();
    fmt::print("Axis-angle: axis = ({:.4f}, {:.4f}, {:.4f}), angle = {:.2f} deg\n\n", aa.axis[0], aa.axis[1], aa.axis[2], aa.angle / kDeg);

    fmt::print("=== Euler Decompositions ===\n");
    for (EulerOrder order : kEulerOrders) {
        const auto e = q.to_euler(order);
        fmt::print("{}: ({:7.2f}, {:7.2f}, {:7.2f}) deg\n", order, e.x / kDeg, e.y / kDeg, e.z / kDeg);
    }

    fmt::print("\n=== Rotation Matrix ===\n");
    const auto R = q.to_dcm();
    for (size_t r = 0; r < 3; ++r) {
        fmt::print("{:>10.4f}{:>10.4f}{:>10.4f}\n", R(r, 0), R(r, 1), R(r, 2));
    }

    fmt::print("\n=== Look-At ===\n");
    const Vec3d eye{0.0, 2.0, 5.0};
    const Vec3d target{1.0, 0.0, 0.0};
    const Quatd camera = Quatd::look_at(eye, target);
    const Vec3d forward = camera * Vec3d{0.0, 0.0, -1.0};
    fmt::print("Camera quaternion: {}\n", to_string(camera, 4));
    fmt::print("Forward vector:    ({:.4f}, {:.4f}, {:.4f})\n", forward[0], forward[1], forward[2]);

    const auto frame = camera.to_transform(eye);
    const Vec3d look = frame.look_vector();
    fmt::print("Transform look:    ({:.4f}, {:.4f}, {:.4f})\n", look[0], look[1], look[2]);
    fmt::print("Recovered:         {}\n", to_string(Quatd::from_transform(frame), 4));

    return 0;
}
