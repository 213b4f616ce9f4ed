#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

#include "quaternion.hpp"

namespace versor {

/**
 * @brief Precomputed slerp between two fixed endpoints
 *
 * Normalization, sign resolution and the arc angle are computed once at
 * construction. operator()(alpha) matches Quaternion<T>::slerp(q0, q1, alpha).
 *
 * @tparam T Element type (floating-point)
 */
template<typename T>
class SlerpFunction {
public:
    constexpr SlerpFunction(const Quaternion<T>& q0, const Quaternion<T>& q1) : q0_(q0.normalized()), q1_(q1.normalized()) {
        cos_theta0_ = dot(q0_, q1_);
        if (cos_theta0_ < T{0}) {
            q0_ = -q0_;
            cos_theta0_ = -cos_theta0_;
        }

        linear_ = cos_theta0_ >= T{1};
        if (!linear_) {
            theta0_ = std::acos(cos_theta0_);
            sin_theta0_ = std::sin(theta0_);
        }
    }

    [[nodiscard]] constexpr Quaternion<T> operator()(T alpha) const {
        if (linear_) {
            return (q0_ + (q1_ - q0_) * alpha).normalized();
        }

        const T theta = theta0_ * alpha;
        const T sin_theta = std::sin(theta);
        const T s0 = std::cos(theta) - cos_theta0_ * sin_theta / sin_theta0_;
        const T s1 = sin_theta / sin_theta0_;
        return (s0 * q0_ + s1 * q1_).normalized();
    }

    // Endpoints after normalization and sign resolution
    [[nodiscard]] constexpr const Quaternion<T>& start() const { return q0_; }
    [[nodiscard]] constexpr const Quaternion<T>& end() const { return q1_; }

    // Arc angle between the endpoints on the unit hypersphere
    [[nodiscard]] constexpr T arc_angle() const { return theta0_; }

private:
    Quaternion<T> q0_;
    Quaternion<T> q1_;
    T             cos_theta0_{};
    T             theta0_{};
    T             sin_theta0_{};
    bool          linear_{false};
};

template<typename T>
[[nodiscard]] constexpr SlerpFunction<T> slerp_function(const Quaternion<T>& q0, const Quaternion<T>& q1) {
    return SlerpFunction<T>(q0, q1);
}

/**
 * @brief n evenly spaced rotations strictly between q0 and q1
 *
 * Element k (1-based) is slerp at alpha = k / (n + 1). With @p include_endpoints
 * the result starts with q0 and ends with q1 exactly as passed in (n + 2 elements).
 */
template<typename T>
[[nodiscard]] std::vector<Quaternion<T>> intermediates(const Quaternion<T>& q0, const Quaternion<T>& q1, size_t n, bool include_endpoints = false) {
    std::vector<Quaternion<T>> steps;
    steps.reserve(include_endpoints ? n + 2 : n);

    if (include_endpoints) {
        steps.push_back(q0);
    }

    const SlerpFunction<T> slerp(q0, q1);
    const T                step_size = T{1} / static_cast<T>(n + 1);
    for (size_t i = 1; i <= n; ++i) {
        steps.push_back(slerp(step_size * static_cast<T>(i)));
    }

    if (include_endpoints) {
        steps.push_back(q1);
    }
    return steps;
}

} // namespace versor
