#pragma once

#include <type_traits>

#include "dcm.hpp"
#include "matrix.hpp"

namespace versor {

// ============================================================================
// Transform: rigid transform (rotation + translation) as a 4x4 homogeneous matrix
// ============================================================================
template<typename T>
struct Transform : public Mat4<T> {
    using value_type = T;

    static_assert(std::is_floating_point_v<T>, "Transform element type must be floating point");

    constexpr Transform() : Mat4<T>(Mat4<T>::identity()) {}
    constexpr Transform(const Transform&) = default;
    constexpr Transform& operator=(const Transform&) = default;
    constexpr Transform(Transform&&) = default;
    constexpr Transform& operator=(Transform&&) = default;
    constexpr ~Transform() = default;

    [[nodiscard]] static constexpr Transform identity() { return Transform{}; }

    [[nodiscard]] static constexpr Transform from_rotation_translation(const DCM<T>& R, const Vec3<T>& t) {
        Transform result;
        for (size_t r = 0; r < 3; ++r) {
            for (size_t c = 0; c < 3; ++c) {
                result(r, c) = R(r, c);
            }
            result(r, 3) = t[r];
        }
        return result;
    }

    [[nodiscard]] static constexpr Transform from_translation(const Vec3<T>& t) {
        return from_rotation_translation(DCM<T>::identity(), t);
    }

    [[nodiscard]] constexpr DCM<T> rotation() const {
        DCM<T> R;
        for (size_t r = 0; r < 3; ++r) {
            for (size_t c = 0; c < 3; ++c) {
                R(r, c) = (*this)(r, c);
            }
        }
        return R;
    }

    [[nodiscard]] constexpr Vec3<T> translation() const {
        return Vec3<T>{(*this)(0, 3), (*this)(1, 3), (*this)(2, 3)};
    }

    // Basis vectors of the rotation. The look vector points down the negative back axis.
    [[nodiscard]] constexpr Vec3<T> right_vector() const { return Vec3<T>{(*this)(0, 0), (*this)(1, 0), (*this)(2, 0)}; }
    [[nodiscard]] constexpr Vec3<T> up_vector() const { return Vec3<T>{(*this)(0, 1), (*this)(1, 1), (*this)(2, 1)}; }
    [[nodiscard]] constexpr Vec3<T> look_vector() const { return Vec3<T>{-(*this)(0, 2), -(*this)(1, 2), -(*this)(2, 2)}; }

    [[nodiscard]] constexpr Vec3<T> transform_point(const Vec3<T>& p) const {
        return rotation() * p + translation();
    }

    [[nodiscard]] constexpr Vec3<T> transform_vector(const Vec3<T>& v) const {
        return rotation() * v;
    }

    // Compose: (A * B) applies B first
    [[nodiscard]] constexpr Transform operator*(const Transform& rhs) const {
        Transform result;
        static_cast<Mat4<T>&>(result) = static_cast<const Mat4<T>&>(*this) * static_cast<const Mat4<T>&>(rhs);
        return result;
    }

    // Rigid inverse: [R^T, -R^T t]
    [[nodiscard]] constexpr Transform inverse() const {
        const DCM<T> Rt = rotation().transpose();
        return from_rotation_translation(Rt, -(Rt * translation()));
    }
};

using Transformf = Transform<float>;
using Transformd = Transform<double>;

} // namespace versor
