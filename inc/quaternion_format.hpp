#pragma once

#include <optional>
#include <string>

#include "euler.hpp"
#include "quaternion.hpp"

// ============================================================================
// Quaternion formatting for fmt::format
#include "fmt/format.h"

namespace versor {

/**
 * @brief Render the components as "x, y, z, w"
 *
 * @param decimals Fixed number of decimal places (negative clamps to 0), or
 *                 shortest round-trip formatting when omitted
 */
template<typename T>
[[nodiscard]] std::string to_string(const Quaternion<T>& q, std::optional<int> decimals = std::nullopt) {
    if (decimals) {
        const int places = *decimals < 0 ? 0 : *decimals;
        return fmt::format("{:.{}f}, {:.{}f}, {:.{}f}, {:.{}f}", q.x(), places, q.y(), places, q.z(), places, q.w(), places);
    }
    return fmt::format("{}, {}, {}, {}", q.x(), q.y(), q.z(), q.w());
}

template<typename T>
[[nodiscard]] std::string to_string(const EulerAngles<T>& e) {
    return fmt::format("{}, {}, {}", e.x, e.y, e.z);
}

} // namespace versor

template<typename T>
struct fmt::formatter<versor::Quaternion<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const versor::Quaternion<T>& q, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", versor::to_string(q));
    }
};

template<typename T>
struct fmt::formatter<versor::EulerAngles<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const versor::EulerAngles<T>& e, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", versor::to_string(e));
    }
};

template<>
struct fmt::formatter<versor::EulerOrder> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(versor::EulerOrder order, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", versor::to_string(order));
    }
};
