#pragma once

#include <cmath>
#include <type_traits>

#include "matrix.hpp"

namespace versor {

// Orthonormalization falls back to another axis below this cross-product length
template<typename T>
inline constexpr T kBasisEpsilon = T{1e-6};

// ============================================================================
// Basis: the three columns of a rotation matrix
// ============================================================================
template<typename T>
struct Basis {
    Vec3<T> right{Vec3<T>::unit_x()}; // column 0
    Vec3<T> up{Vec3<T>::unit_y()};    // column 1
    Vec3<T> back{Vec3<T>::unit_z()};  // column 2
};

/**
 * @brief Gram-Schmidt style orthonormalization of a right/up/back triple
 *
 * Right is kept (normalized, X axis if degenerate), back is rebuilt as right x up,
 * and up as back x right. When right and up are parallel, right x Y is tried,
 * then the X axis is used. Back keeps the hemisphere of the supplied back vector.
 */
template<typename T>
[[nodiscard]] constexpr Basis<T> orthonormalize(const Basis<T>& in) {
    const Vec3<T> x_axis = Vec3<T>::unit_x();
    const Vec3<T> y_axis = Vec3<T>::unit_y();

    Vec3<T> x_basis = in.right.normalized_or(x_axis);
    Vec3<T> up = in.up.normalized_or(y_axis);

    Vec3<T> z_basis = x_basis.cross(up);
    if (z_basis.norm() > kBasisEpsilon<T>) {
        z_basis = z_basis.normalized();
    } else {
        z_basis = x_basis.cross(y_axis);
        if (z_basis.norm() > kBasisEpsilon<T>) {
            z_basis = z_basis.normalized();
        } else {
            z_basis = x_axis;
        }
    }

    Vec3<T> y_basis = z_basis.cross(x_basis).normalized();
    if (dot(z_basis, in.back) < T{0}) {
        z_basis = -z_basis;
    }
    return Basis<T>{x_basis, y_basis, z_basis};
}

// ============================================================================
// DCM: Direction Cosine Matrix (3x3 rotation matrix wrapper)
// ============================================================================
template<typename T>
struct DCM : public Mat3<T> {
    using value_type = T;

    static_assert(std::is_floating_point_v<T>, "DCM element type must be floating point");

    constexpr DCM() : Mat3<T>(Mat3<T>::identity()) {}
    constexpr DCM(const DCM&) = default;
    constexpr DCM& operator=(const DCM&) = default;
    constexpr DCM(DCM&&) = default;
    constexpr DCM& operator=(DCM&&) = default;
    constexpr ~DCM() = default;

    // Construct from raw Mat3
    constexpr explicit DCM(const Mat3<T>& m) : Mat3<T>(m) {}

    // Construct from the three columns
    [[nodiscard]] static constexpr DCM from_columns(const Vec3<T>& right, const Vec3<T>& up, const Vec3<T>& back) {
        DCM R;
        for (size_t r = 0; r < 3; ++r) {
            R(r, 0) = right[r];
            R(r, 1) = up[r];
            R(r, 2) = back[r];
        }
        return R;
    }

    [[nodiscard]] static constexpr DCM from_basis(const Basis<T>& basis) {
        return from_columns(basis.right, basis.up, basis.back);
    }

    // Identity rotation
    [[nodiscard]] static constexpr DCM identity() { return DCM{}; }

    // Basic rotation matrices about principal axes
    [[nodiscard]] static constexpr DCM rotate_x(T angle) {
        T   c = std::cos(angle);
        T   s = std::sin(angle);
        DCM R;
        R(1, 1) = c;
        R(1, 2) = -s;
        R(2, 1) = s;
        R(2, 2) = c;
        return R;
    }

    [[nodiscard]] static constexpr DCM rotate_y(T angle) {
        T   c = std::cos(angle);
        T   s = std::sin(angle);
        DCM R;
        R(0, 0) = c;
        R(0, 2) = s;
        R(2, 0) = -s;
        R(2, 2) = c;
        return R;
    }

    [[nodiscard]] static constexpr DCM rotate_z(T angle) {
        T   c = std::cos(angle);
        T   s = std::sin(angle);
        DCM R;
        R(0, 0) = c;
        R(0, 1) = -s;
        R(1, 0) = s;
        R(1, 1) = c;
        return R;
    }

    // Columns
    [[nodiscard]] constexpr Vec3<T> right() const { return Vec3<T>(this->col(0)); }
    [[nodiscard]] constexpr Vec3<T> up() const { return Vec3<T>(this->col(1)); }
    [[nodiscard]] constexpr Vec3<T> back() const { return Vec3<T>(this->col(2)); }

    [[nodiscard]] constexpr Basis<T> basis() const { return Basis<T>{right(), up(), back()}; }

    // Compose rotations
    [[nodiscard]] constexpr DCM operator*(const DCM& rhs) const {
        return DCM(static_cast<const Mat3<T>&>(*this) * static_cast<const Mat3<T>&>(rhs));
    }

    // Rotate a vector
    [[nodiscard]] constexpr Vec3<T> operator*(const Vec3<T>& v) const {
        return Vec3<T>(static_cast<const Mat3<T>&>(*this) * static_cast<const Matrix<3, 1, T>&>(v));
    }

    // Transpose (inverse for orthonormal)
    [[nodiscard]] constexpr DCM transpose() const {
        return DCM(Mat3<T>::transpose());
    }

    [[nodiscard]] constexpr DCM inverse() const {
        return transpose();
    }

    [[nodiscard]] constexpr const Mat3<T>& matrix() const { return *this; }
};

using DCMf = DCM<float>;
using DCMd = DCM<double>;

} // namespace versor
