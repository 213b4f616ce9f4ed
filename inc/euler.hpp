#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>

namespace versor {

// Euler rotation order enumeration.
// Order ABC composes the quaternion as qA * qB * qC, so the C rotation is applied first.
enum class EulerOrder {
    XYZ, // Default order
    XZY,
    YXZ, // Orientation order (yaw about Y, then pitch, then roll)
    YZX,
    ZXY,
    ZYX,
};

inline constexpr std::array<EulerOrder, 6> kEulerOrders = {
    EulerOrder::XYZ, EulerOrder::XZY, EulerOrder::YXZ, EulerOrder::YZX, EulerOrder::ZXY, EulerOrder::ZYX,
};

[[nodiscard]] constexpr std::string_view to_string(EulerOrder order) {
    switch (order) {
        case EulerOrder::XYZ: return "XYZ";
        case EulerOrder::XZY: return "XZY";
        case EulerOrder::YXZ: return "YXZ";
        case EulerOrder::YZX: return "YZX";
        case EulerOrder::ZXY: return "ZXY";
        case EulerOrder::ZYX: return "ZYX";
    }
    return "XYZ";
}

/**
 * @brief Parse a rotation order tag such as "ZYX"
 *
 * @return The matching order, or nullopt for an unknown tag
 */
[[nodiscard]] constexpr std::optional<EulerOrder> parse_euler_order(std::string_view tag) {
    for (EulerOrder order : kEulerOrders) {
        if (to_string(order) == tag) {
            return order;
        }
    }
    return std::nullopt;
}

// ============================================================================
// EulerAngles: rotation about each principal axis, in radians
// ============================================================================
template<typename T>
struct EulerAngles {
    using value_type = T;

    static_assert(std::is_floating_point_v<T>, "EulerAngles element type must be floating point");

    T x{}; // Rotation about X
    T y{}; // Rotation about Y
    T z{}; // Rotation about Z

    constexpr EulerAngles() = default;
    constexpr EulerAngles(T rx, T ry, T rz) : x(rx), y(ry), z(rz) {}

    [[nodiscard]] constexpr bool operator==(const EulerAngles&) const = default;
};

using EulerAnglesf = EulerAngles<float>;
using EulerAnglesd = EulerAngles<double>;

} // namespace versor
