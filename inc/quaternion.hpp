#pragma once

#include <array>
#include <cmath>
#include <concepts>
#include <limits>
#include <numbers>
#include <optional>
#include <type_traits>

#include "constexpr_math.hpp"
#include "dcm.hpp"
#include "euler.hpp"
#include "matrix.hpp"
#include "transform.hpp"

namespace versor {

// Tolerance shared by unit checks, approximate equality and the degenerate-case branches
template<typename T>
inline constexpr T kEpsilon = T{1e-6};

// XYZ extraction switches to its gimbal-lock branch above this |test|
template<typename T>
inline constexpr T kEulerXYZSingularity = T{0.499999};

template<typename T>
struct AxisAngle {
    Vec3<T> axis{Vec3<T>::unit_x()};
    T       angle{};
};

// ============================================================================
// Quaternion: immutable (x, y, z, w) value, imaginary part (x, y, z), real part w
// ============================================================================
/**
 * @brief Rotation quaternion value type
 *
 * Components are fixed at construction; there are no setters and no compound
 * assignment operators, every operation returns a new value. A quaternion is not
 * normalized on construction. Operations that need a rotation (conversions,
 * slerp, vector rotation) normalize internally.
 *
 * q and -q describe the same rotation. slerp(), difference() and the symmetrized
 * distances pick the shorter arc; the remaining operations do not.
 *
 * @tparam T Element type (floating-point)
 */
template<typename T>
struct Quaternion {
    using value_type = T;

    static_assert(std::is_floating_point_v<T>, "Quaternion element type must be floating point");

    // Default constructor (identity)
    constexpr Quaternion() = default;
    constexpr Quaternion(const Quaternion&) = default;
    constexpr Quaternion& operator=(const Quaternion&) = default;
    constexpr Quaternion(Quaternion&&) = default;
    constexpr Quaternion& operator=(Quaternion&&) = default;
    constexpr ~Quaternion() = default;

    // Missing components default to (0, 0, 0, 1)
    constexpr explicit Quaternion(T x, T y = T{0}, T z = T{0}, T w = T{1}) : x_(x), y_(y), z_(z), w_(w) {}

    // Components in (x, y, z, w) order
    constexpr explicit Quaternion(const std::array<T, 4>& xyzw) : x_(xyzw[0]), y_(xyzw[1]), z_(xyzw[2]), w_(xyzw[3]) {}

    template<typename U>
        requires(!std::is_same_v<U, T>)
    constexpr explicit Quaternion(const Quaternion<U>& other)
        : x_(static_cast<T>(other.x())), y_(static_cast<T>(other.y())), z_(static_cast<T>(other.z())), w_(static_cast<T>(other.w())) {}

    // Component accessors
    [[nodiscard]] constexpr T x() const { return x_; }
    [[nodiscard]] constexpr T y() const { return y_; }
    [[nodiscard]] constexpr T z() const { return z_; }
    [[nodiscard]] constexpr T w() const { return w_; }

    [[nodiscard]] constexpr std::array<T, 4> components() const { return {x_, y_, z_, w_}; }

    // Identity (no rotation)
    [[nodiscard]] static constexpr Quaternion identity() { return Quaternion{T{0}, T{0}, T{0}, T{1}}; }

    // Zero quaternion. Not a rotation.
    [[nodiscard]] static constexpr Quaternion zero() { return Quaternion{T{0}, T{0}, T{0}, T{0}}; }

    // Pure imaginary quaternion (v, 0)
    [[nodiscard]] static constexpr Quaternion from_vector(const Vec3<T>& v) { return Quaternion{v[0], v[1], v[2], T{0}}; }

    // ------------------------------------------------------------------------
    // Projections
    // ------------------------------------------------------------------------
    [[nodiscard]] constexpr Vec3<T>    vector() const { return Vec3<T>{x_, y_, z_}; }
    [[nodiscard]] constexpr Quaternion real() const { return Quaternion{T{0}, T{0}, T{0}, w_}; }
    [[nodiscard]] constexpr Quaternion imaginary() const { return Quaternion{x_, y_, z_, T{0}}; }

    // ------------------------------------------------------------------------
    // Algebra
    // ------------------------------------------------------------------------
    [[nodiscard]] constexpr Quaternion operator+(const Quaternion& rhs) const {
        return Quaternion{x_ + rhs.x_, y_ + rhs.y_, z_ + rhs.z_, w_ + rhs.w_};
    }

    [[nodiscard]] constexpr Quaternion operator-(const Quaternion& rhs) const {
        return Quaternion{x_ - rhs.x_, y_ - rhs.y_, z_ - rhs.z_, w_ - rhs.w_};
    }

    // Negates all four components (compare conjugate())
    [[nodiscard]] constexpr Quaternion operator-() const { return Quaternion{-x_, -y_, -z_, -w_}; }
    [[nodiscard]] constexpr Quaternion negate() const { return -*this; }

    // Hamilton product. Not commutative: (a * b) applies b first.
    [[nodiscard]] constexpr Quaternion operator*(const Quaternion& rhs) const {
        return Quaternion{
            w_ * rhs.x_ + x_ * rhs.w_ + y_ * rhs.z_ - z_ * rhs.y_,
            w_ * rhs.y_ - x_ * rhs.z_ + y_ * rhs.w_ + z_ * rhs.x_,
            w_ * rhs.z_ + x_ * rhs.y_ - y_ * rhs.x_ + z_ * rhs.w_,
            w_ * rhs.w_ - x_ * rhs.x_ - y_ * rhs.y_ - z_ * rhs.z_
        };
    }

    // Scalar multiply/divide
    [[nodiscard]] constexpr Quaternion operator*(T scalar) const {
        return Quaternion{x_ * scalar, y_ * scalar, z_ * scalar, w_ * scalar};
    }

    [[nodiscard]] friend constexpr Quaternion operator*(T scalar, const Quaternion& q) {
        return Quaternion{scalar * q.x_, scalar * q.y_, scalar * q.z_, scalar * q.w_};
    }

    [[nodiscard]] constexpr Quaternion operator/(T scalar) const {
        return Quaternion{x_ / scalar, y_ / scalar, z_ / scalar, w_ / scalar};
    }

    // Divides the scalar by each component
    [[nodiscard]] friend constexpr Quaternion operator/(T scalar, const Quaternion& q) {
        return Quaternion{scalar / q.x_, scalar / q.y_, scalar / q.z_, scalar / q.w_};
    }

    // q0 / q1 == q0 * q1.inverse()
    [[nodiscard]] constexpr Quaternion operator/(const Quaternion& rhs) const {
        return *this * rhs.inverse();
    }

    // Rotate a vector: normalizes, then takes the vector part of q * (v, 0) * conj(q)
    [[nodiscard]] constexpr Vec3<T> operator*(const Vec3<T>& v) const { return rotate(v); }

    [[nodiscard]] constexpr Vec3<T> rotate(const Vec3<T>& v) const {
        const Quaternion qn = normalized();
        return (qn * from_vector(v) * qn.conjugate()).vector();
    }

    // Equivalent to to_transform() * transform
    [[nodiscard]] constexpr Transform<T> operator*(const Transform<T>& transform) const {
        return to_transform() * transform;
    }

    /**
     * @brief Raise to a real power
     *
     * Scales the rotation angle by @p n and raises the magnitude to @p n.
     * A quaternion with no imaginary part (relative to its length) yields (0, 0, 0, |q|^n).
     */
    [[nodiscard]] constexpr Quaternion pow(T n) const {
        const T im = x_ * x_ + y_ * y_ + z_ * z_;
        const T mag = vmath::sqrt(w_ * w_ + im);
        const T im_mag = vmath::sqrt(im);
        const T c_mag = std::pow(mag, n);

        if (im_mag <= kEpsilon<T> * mag) {
            return Quaternion{T{0}, T{0}, T{0}, c_mag};
        }

        const T angle = n * std::atan2(im_mag, w_);
        const T s = c_mag * std::sin(angle) / im_mag;
        return Quaternion{x_ * s, y_ * s, z_ * s, c_mag * std::cos(angle)};
    }

    // Conjugate and inverse
    [[nodiscard]] constexpr Quaternion conjugate() const { return Quaternion{-x_, -y_, -z_, w_}; }

    // The zero quaternion has no inverse and yields inf/NaN components
    [[nodiscard]] constexpr Quaternion inverse() const {
        const T n2 = length_squared();
        return Quaternion{-x_ / n2, -y_ / n2, -z_ / n2, w_ / n2};
    }

    [[nodiscard]] friend constexpr T dot(const Quaternion& q0, const Quaternion& q1) {
        return q0.x_ * q1.x_ + q0.y_ * q1.y_ + q0.z_ * q1.z_ + q0.w_ * q1.w_;
    }

    // Exact component-wise equality
    [[nodiscard]] constexpr bool operator==(const Quaternion& rhs) const {
        return x_ == rhs.x_ && y_ == rhs.y_ && z_ == rhs.z_ && w_ == rhs.w_;
    }

    // Ordering compares length only and carries no rotational meaning
    [[nodiscard]] constexpr bool operator<(const Quaternion& rhs) const { return length() < rhs.length(); }
    [[nodiscard]] constexpr bool operator<=(const Quaternion& rhs) const { return length() <= rhs.length(); }
    [[nodiscard]] constexpr bool operator>(const Quaternion& rhs) const { return length() > rhs.length(); }
    [[nodiscard]] constexpr bool operator>=(const Quaternion& rhs) const { return length() >= rhs.length(); }

    // Norms
    [[nodiscard]] constexpr T length_squared() const { return (x_ * x_) + (y_ * y_) + (z_ * z_) + (w_ * w_); }
    [[nodiscard]] constexpr T length() const { return vmath::sqrt(length_squared()); }

    // Length computed on the components scaled by the largest magnitude, safe from overflow
    [[nodiscard]] constexpr T hypot() const {
        const T max_comp = vmath::max({vmath::abs(x_), vmath::abs(y_), vmath::abs(z_), vmath::abs(w_)});
        if (max_comp > T{0}) {
            return (*this / max_comp).length() * max_comp;
        }
        return T{0};
    }

    // Unit quaternion. The zero quaternion normalizes to identity.
    [[nodiscard]] constexpr Quaternion normalized() const {
        const T len = length();
        if (len > T{0}) {
            return *this / len;
        }
        return identity();
    }

    [[nodiscard]] constexpr bool is_unit(T epsilon = kEpsilon<T>) const {
        return vmath::abs(T{1} - length()) < epsilon;
    }

    [[nodiscard]] constexpr bool is_nan() const {
        return x_ != x_ || y_ != y_ || z_ != z_ || w_ != w_;
    }

    // ------------------------------------------------------------------------
    // Exponential and logarithm
    // ------------------------------------------------------------------------
    [[nodiscard]] constexpr Quaternion exp() const {
        const T m = std::exp(w_);
        const T vv = x_ * x_ + y_ * y_ + z_ * z_;
        if (vv > T{0}) {
            const T v = vmath::sqrt(vv);
            const T s = m * std::sin(v) / v;
            return Quaternion{x_ * s, y_ * s, z_ * s, m * std::cos(v)};
        }
        return Quaternion{T{0}, T{0}, T{0}, m};
    }

    /**
     * @brief Natural logarithm
     *
     * The zero quaternion maps to (0, 0, 0, -inf). A purely real quaternion maps
     * to (0, 0, 0, ln|q|).
     */
    [[nodiscard]] constexpr Quaternion log() const {
        const T vv = x_ * x_ + y_ * y_ + z_ * z_;
        const T mm = w_ * w_ + vv;
        if (mm > T{0}) {
            if (vv > T{0}) {
                const T m = vmath::sqrt(mm);
                const T s = std::acos(vmath::clamp(w_ / m, T{-1}, T{1})) / vmath::sqrt(vv);
                return Quaternion{x_ * s, y_ * s, z_ * s, std::log(m)};
            }
            return Quaternion{T{0}, T{0}, T{0}, std::log(mm) / T{2}};
        }
        return Quaternion{T{0}, T{0}, T{0}, -std::numeric_limits<T>::infinity()};
    }

    // Exponential map at base: base * exp(tangent)
    [[nodiscard]] static constexpr Quaternion exp_map(const Quaternion& base, const Quaternion& tangent) {
        return base * tangent.exp();
    }

    // Symmetrized exponential map: base^0.5 * exp(tangent) * base^0.5
    [[nodiscard]] static constexpr Quaternion exp_map_sym(const Quaternion& base, const Quaternion& tangent) {
        const Quaternion sqrt_base = base.pow(T{0.5});
        return sqrt_base * tangent.exp() * sqrt_base;
    }

    // Logarithm map at base: log(base^-1 * arg)
    [[nodiscard]] static constexpr Quaternion log_map(const Quaternion& base, const Quaternion& arg) {
        return (base.inverse() * arg).log();
    }

    // Symmetrized logarithm map: log(base^-0.5 * arg * base^-0.5)
    [[nodiscard]] static constexpr Quaternion log_map_sym(const Quaternion& base, const Quaternion& arg) {
        const Quaternion inv_sqrt_base = base.pow(T{-0.5});
        return (inv_sqrt_base * arg * inv_sqrt_base).log();
    }

    // log(q0 * q1^-1), no sign resolution
    [[nodiscard]] static constexpr Quaternion log_inv(const Quaternion& q0, const Quaternion& q1) {
        return (q0 * q1.inverse()).log();
    }

    // Minimal rotation taking q0 to q1: q0 * difference(q0, q1) == +-q1
    [[nodiscard]] static constexpr Quaternion difference(const Quaternion& q0, const Quaternion& q1) {
        const Quaternion start = dot(q0, q1) < T{0} ? -q0 : q0;
        return start.inverse() * q1;
    }

    // ------------------------------------------------------------------------
    // Geodesic distances
    // ------------------------------------------------------------------------

    // Intrinsic geodesic distance, [0, 2pi] for unit inputs
    [[nodiscard]] static constexpr T distance(const Quaternion& q0, const Quaternion& q1) {
        return log_map(q0, q1).length() * T{2};
    }

    // Symmetrized geodesic distance, [0, pi] for unit inputs
    [[nodiscard]] static constexpr T distance_sym(const Quaternion& q0, const Quaternion& q1) {
        return difference(q0, q1).log().length() * T{2};
    }

    // Chord length of the shortest arc
    [[nodiscard]] static constexpr T distance_chord(const Quaternion& q0, const Quaternion& q1) {
        return std::sin(distance_sym(q0, q1) / T{2}) * T{2};
    }

    // Euclidean distance to the nearer of q1 and -q1
    [[nodiscard]] static constexpr T distance_abs(const Quaternion& q0, const Quaternion& q1) {
        const T d_minus = (q0 - q1).length();
        const T d_plus = (q0 + q1).length();
        return d_minus < d_plus ? d_minus : d_plus;
    }

    [[nodiscard]] static constexpr bool approx_eq(const Quaternion& q0, const Quaternion& q1, T epsilon = kEpsilon<T>) {
        return distance_sym(q0, q1) < epsilon;
    }

    // ------------------------------------------------------------------------
    // Interpolation
    // ------------------------------------------------------------------------

    /**
     * @brief Spherical linear interpolation along the shorter great-circle arc
     *
     * Both endpoints are normalized. @p alpha is not clamped; values outside
     * [0, 1] extrapolate along the same arc.
     */
    [[nodiscard]] static constexpr Quaternion slerp(const Quaternion& a, const Quaternion& b, T alpha) {
        Quaternion       q0 = a.normalized();
        const Quaternion q1 = b.normalized();

        T cos_theta0 = dot(q0, q1);
        if (cos_theta0 < T{0}) {
            q0 = -q0;
            cos_theta0 = -cos_theta0;
        }

        if (cos_theta0 >= T{1}) {
            return (q0 + (q1 - q0) * alpha).normalized();
        }

        const T theta0 = std::acos(cos_theta0);
        const T sin_theta0 = std::sin(theta0);
        const T theta = theta0 * alpha;
        const T sin_theta = std::sin(theta);
        const T s0 = std::cos(theta) - cos_theta0 * sin_theta / sin_theta0;
        const T s1 = sin_theta / sin_theta0;
        return (s0 * q0 + s1 * q1).normalized();
    }

    // slerp(identity(), b, alpha) with the identity carried as a signed scalar
    [[nodiscard]] static constexpr Quaternion identity_slerp(const Quaternion& b, T alpha) {
        const Quaternion q1 = b.normalized();

        T q0 = T{1};
        T cos_theta0 = q1.w_;
        if (cos_theta0 < T{0}) {
            q0 = T{-1};
            cos_theta0 = -cos_theta0;
        }

        if (cos_theta0 >= T{1}) {
            return Quaternion{q1.x_ * alpha, q1.y_ * alpha, q1.z_ * alpha, (q1.w_ - q0) * alpha + q0}.normalized();
        }

        const T theta0 = std::acos(cos_theta0);
        const T sin_theta0 = std::sin(theta0);
        const T theta = theta0 * alpha;
        const T sin_theta = std::sin(theta);
        const T s0 = std::cos(theta) - cos_theta0 * sin_theta / sin_theta0;
        const T s1 = sin_theta / sin_theta0;
        return Quaternion{q1.x_ * s1, q1.y_ * s1, q1.z_ * s1, q0 * s0 + q1.w_ * s1}.normalized();
    }

    // Derivative of q0 rotating at the body-frame rate vector: 0.5 * q0 * (rate, 0)
    [[nodiscard]] static constexpr Quaternion derivative(const Quaternion& q0, const Vec3<T>& rate) {
        return (T{0.5} * q0) * from_vector(rate);
    }

    /**
     * @brief Advance q0 by a constant rate over one timestep (closed form)
     *
     * The rotation vector rate * timestep becomes an axis-angle step applied as
     * q0 * step. A zero rotation returns q0 normalized.
     */
    [[nodiscard]] static constexpr Quaternion integrate(const Quaternion& q0, const Vec3<T>& rate, T timestep) {
        const Quaternion q0n = q0.normalized();
        const Vec3<T>    rotation = rate * timestep;
        const T          magnitude = rotation.norm();
        if (magnitude > T{0}) {
            const Quaternion step = from_axis_angle(rotation / magnitude, magnitude);
            return (q0n * step).normalized();
        }
        return q0n;
    }

    // ------------------------------------------------------------------------
    // Axis-angle
    // ------------------------------------------------------------------------

    // The axis is normalized; a zero axis falls back to X
    [[nodiscard]] static constexpr Quaternion from_axis_angle(const Vec3<T>& axis, T angle) {
        return from_axis_angle_fast(axis.normalized_or(Vec3<T>::unit_x()), angle);
    }

    // Axis must already be unit length
    [[nodiscard]] static constexpr Quaternion from_axis_angle_fast(const Vec3<T>& axis, T angle) {
        const T half = angle / T{2};
        const T s = std::sin(half);
        return Quaternion{s * axis[0], s * axis[1], s * axis[2], std::cos(half)};
    }

    // Normalizes first. Near zero rotation the raw imaginary part is returned as the axis.
    [[nodiscard]] constexpr AxisAngle<T> to_axis_angle() const {
        const Quaternion qn = normalized();
        const T          angle = T{2} * std::acos(vmath::clamp(qn.w_, T{-1}, T{1}));
        const T          s = vmath::sqrt(T{1} - qn.w_ * qn.w_);
        if (s < kEpsilon<T>) {
            return AxisAngle<T>{qn.vector(), angle};
        }
        return AxisAngle<T>{Vec3<T>{qn.x_ / s, qn.y_ / s, qn.z_ / s}, angle};
    }

    // ------------------------------------------------------------------------
    // Rotation matrix, basis and transform
    // ------------------------------------------------------------------------

    // Rotation matrix of the normalized quaternion
    [[nodiscard]] constexpr DCM<T> to_dcm() const {
        const Quaternion qn = normalized();
        const T          xx = qn.x_ * qn.x_;
        const T          yy = qn.y_ * qn.y_;
        const T          zz = qn.z_ * qn.z_;
        const T          ww = qn.w_ * qn.w_;

        const T xy = qn.x_ * qn.y_;
        const T zw = qn.z_ * qn.w_;
        const T xz = qn.x_ * qn.z_;
        const T yw = qn.y_ * qn.w_;
        const T yz = qn.y_ * qn.z_;
        const T xw = qn.x_ * qn.w_;

        DCM<T> R;
        R(0, 0) = xx - yy - zz + ww;
        R(0, 1) = T{2} * (xy - zw);
        R(0, 2) = T{2} * (xz + yw);

        R(1, 0) = T{2} * (xy + zw);
        R(1, 1) = -xx + yy - zz + ww;
        R(1, 2) = T{2} * (yz - xw);

        R(2, 0) = T{2} * (xz - yw);
        R(2, 1) = T{2} * (yz + xw);
        R(2, 2) = -xx - yy + zz + ww;
        return R;
    }

    // Right, up and back columns of to_dcm()
    [[nodiscard]] constexpr Basis<T> to_basis() const { return to_dcm().basis(); }

    [[nodiscard]] constexpr Transform<T> to_transform(const Vec3<T>& position = Vec3<T>{}) const {
        return Transform<T>::from_rotation_translation(to_dcm(), position);
    }

    // Right/up/back columns are orthonormalized before extraction
    [[nodiscard]] static constexpr Quaternion from_basis(const Vec3<T>& right, const Vec3<T>& up, const Vec3<T>& back) {
        return from_orthonormal_basis(orthonormalize(Basis<T>{right, up, back}));
    }

    /**
     * @brief Construct from the columns of a 3x3 rotation matrix
     *
     * @param right Column 0 (m00, m10, m20)
     * @param up    Column 1 (m01, m11, m21)
     * @param back  Column 2 (m02, m12, m22), right x up when omitted
     */
    [[nodiscard]] static constexpr Quaternion from_matrix(const Vec3<T>&                right,
                                                          const Vec3<T>&                up,
                                                          const std::optional<Vec3<T>>& back = std::nullopt) {
        const Vec3<T> right_n = right.normalized();
        const Vec3<T> up_n = up.normalized();
        const Vec3<T> back_n = back ? back->normalized() : right.cross(up).normalized();
        return from_orthonormal_basis(orthonormalize(Basis<T>{right_n, up_n, back_n}));
    }

    [[nodiscard]] static constexpr Quaternion from_dcm(const DCM<T>& R) {
        return from_matrix(R.right(), R.up(), R.back());
    }

    [[nodiscard]] static constexpr Quaternion from_transform(const Transform<T>& transform) {
        return from_orthonormal_basis(orthonormalize(Basis<T>{transform.right_vector(), transform.up_vector(), -transform.look_vector()}));
    }

    /**
     * @brief Orientation looking from @p from towards @p target
     *
     * The look vector maps to -Z. When the look direction is parallel to @p up the
     * X axis is used to build the right vector, and if that is parallel too the up
     * vector is rebuilt from Z x look.
     */
    [[nodiscard]] static constexpr Quaternion look_at(const Vec3<T>& from, const Vec3<T>& target, const Vec3<T>& up = Vec3<T>::unit_y()) {
        const Vec3<T> look = (target - from).normalized_or(Vec3<T>::unit_z());
        const Vec3<T> up_n = up.normalized_or(Vec3<T>::unit_y());

        const Vec3<T> right = look.cross(up_n);
        if (right.norm() > kBasisEpsilon<T>) {
            const Vec3<T> right_n = right.normalized();
            const Vec3<T> up_vector = right_n.cross(look).normalized();
            return from_orthonormal_basis(Basis<T>{right_n, up_vector, -look});
        }

        const Vec3<T> select = look.cross(Vec3<T>::unit_x());
        if (select.norm() > kBasisEpsilon<T>) {
            const Vec3<T> right_n = select.normalized();
            const Vec3<T> up_vector = right_n.cross(look).normalized();
            return from_orthonormal_basis(Basis<T>{right_n, up_vector, -look});
        }

        Vec3<T> up_vector = Vec3<T>::unit_z().cross(look);
        up_vector = up_vector * dot(up_vector, Vec3<T>::unit_y());
        const Vec3<T> right_n = look.cross(up_vector);
        return from_orthonormal_basis(Basis<T>{right_n, up_vector, -look});
    }

    // ------------------------------------------------------------------------
    // Euler angles. Order ABC builds qA * qB * qC.
    // ------------------------------------------------------------------------
    [[nodiscard]] static constexpr Quaternion from_euler_xyz(T rx, T ry, T rz);
    [[nodiscard]] static constexpr Quaternion from_euler_xzy(T rx, T ry, T rz);
    [[nodiscard]] static constexpr Quaternion from_euler_yxz(T rx, T ry, T rz);
    [[nodiscard]] static constexpr Quaternion from_euler_yzx(T rx, T ry, T rz);
    [[nodiscard]] static constexpr Quaternion from_euler_zxy(T rx, T ry, T rz);
    [[nodiscard]] static constexpr Quaternion from_euler_zyx(T rx, T ry, T rz);

    [[nodiscard]] static constexpr Quaternion from_euler(T rx, T ry, T rz, EulerOrder order = EulerOrder::XYZ) {
        switch (order) {
            case EulerOrder::XYZ: return from_euler_xyz(rx, ry, rz);
            case EulerOrder::XZY: return from_euler_xzy(rx, ry, rz);
            case EulerOrder::YXZ: return from_euler_yxz(rx, ry, rz);
            case EulerOrder::YZX: return from_euler_yzx(rx, ry, rz);
            case EulerOrder::ZXY: return from_euler_zxy(rx, ry, rz);
            case EulerOrder::ZYX: return from_euler_zyx(rx, ry, rz);
        }
        return from_euler_xyz(rx, ry, rz);
    }

    [[nodiscard]] static constexpr Quaternion from_euler(const EulerAngles<T>& e, EulerOrder order = EulerOrder::XYZ) {
        return from_euler(e.x, e.y, e.z, order);
    }

    [[nodiscard]] static constexpr Quaternion angles(T rx, T ry, T rz) { return from_euler_xyz(rx, ry, rz); }
    [[nodiscard]] static constexpr Quaternion from_orientation(T rx, T ry, T rz) { return from_euler_yxz(rx, ry, rz); }

    [[nodiscard]] constexpr EulerAngles<T> to_euler_xyz() const;
    [[nodiscard]] constexpr EulerAngles<T> to_euler_xzy() const;
    [[nodiscard]] constexpr EulerAngles<T> to_euler_yxz() const;
    [[nodiscard]] constexpr EulerAngles<T> to_euler_yzx() const;
    [[nodiscard]] constexpr EulerAngles<T> to_euler_zxy() const;
    [[nodiscard]] constexpr EulerAngles<T> to_euler_zyx() const;

    [[nodiscard]] constexpr EulerAngles<T> to_euler(EulerOrder order = EulerOrder::XYZ) const {
        switch (order) {
            case EulerOrder::XYZ: return to_euler_xyz();
            case EulerOrder::XZY: return to_euler_xzy();
            case EulerOrder::YXZ: return to_euler_yxz();
            case EulerOrder::YZX: return to_euler_yzx();
            case EulerOrder::ZXY: return to_euler_zxy();
            case EulerOrder::ZYX: return to_euler_zyx();
        }
        return to_euler_xyz();
    }

    [[nodiscard]] constexpr EulerAngles<T> to_orientation() const { return to_euler_yxz(); }

private:
    // Trace-based extraction from an orthonormal right/up/back basis. The branch on
    // the largest diagonal term keeps the divisor away from zero near 180 degrees.
    [[nodiscard]] static constexpr Quaternion from_orthonormal_basis(const Basis<T>& basis) {
        const T m00 = basis.right[0], m10 = basis.right[1], m20 = basis.right[2];
        const T m01 = basis.up[0], m11 = basis.up[1], m21 = basis.up[2];
        const T m02 = basis.back[0], m12 = basis.back[1], m22 = basis.back[2];

        const T trace = m00 + m11 + m22;

        if (trace > T{0}) {
            const T S = vmath::sqrt(trace + T{1}) * T{2};
            return Quaternion{(m21 - m12) / S, (m02 - m20) / S, (m10 - m01) / S, T{0.25} * S};
        } else if (m00 > m11 && m00 > m22) {
            const T S = vmath::sqrt(T{1} + m00 - m11 - m22) * T{2};
            return Quaternion{T{0.25} * S, (m01 + m10) / S, (m02 + m20) / S, (m21 - m12) / S};
        } else if (m11 > m22) {
            const T S = vmath::sqrt(T{1} + m11 - m00 - m22) * T{2};
            return Quaternion{(m01 + m10) / S, T{0.25} * S, (m12 + m21) / S, (m02 - m20) / S};
        } else {
            const T S = vmath::sqrt(T{1} + m22 - m00 - m11) * T{2};
            return Quaternion{(m02 + m20) / S, (m12 + m21) / S, T{0.25} * S, (m10 - m01) / S};
        }
    }

    T x_{0};
    T y_{0};
    T z_{0};
    T w_{1};
};

// ============================================================================
// Unsupported operand kinds
// ============================================================================
// Quaternion arithmetic is a closed set: scalar, Quaternion, Vec3 (rotation) and
// Transform (composition) on the right of '*'; scalar or Quaternion elsewhere.
// Every other pairing selects one of these deleted overloads, which names both
// operand types in the diagnostic.

template<typename U, typename T>
concept QuaternionMultiplicand = std::is_arithmetic_v<U> || std::same_as<U, Quaternion<T>> || std::same_as<U, Vec3<T>> || std::same_as<U, Transform<T>>;

template<typename U, typename T>
concept QuaternionScalarOrSelf = std::is_arithmetic_v<U> || std::same_as<U, Quaternion<T>>;

template<typename T, typename U>
    requires(!QuaternionMultiplicand<U, T>)
void operator*(const Quaternion<T>&, const U&) = delete;

template<typename U, typename T>
    requires(!QuaternionScalarOrSelf<U, T>)
void operator*(const U&, const Quaternion<T>&) = delete;

template<typename T, typename U>
    requires(!QuaternionScalarOrSelf<U, T>)
void operator/(const Quaternion<T>&, const U&) = delete;

template<typename U, typename T>
    requires(!QuaternionScalarOrSelf<U, T>)
void operator/(const U&, const Quaternion<T>&) = delete;

// ============================================================================
// Euler angle constructors
// ============================================================================
// Each order is its own closed form of qA * qB * qC on the half-angle sines and cosines.

namespace detail {

template<typename T>
struct HalfAngles {
    T x_sin_y_cos;
    T x_cos_y_sin;
    T x_cos_y_cos;
    T x_sin_y_sin;
    T z_cos;
    T z_sin;

    constexpr HalfAngles(T rx, T ry, T rz) {
        const T x_cos = std::cos(rx / T{2});
        const T x_sin = std::sin(rx / T{2});
        const T y_cos = std::cos(ry / T{2});
        const T y_sin = std::sin(ry / T{2});
        z_cos = std::cos(rz / T{2});
        z_sin = std::sin(rz / T{2});

        x_sin_y_cos = x_sin * y_cos;
        x_cos_y_sin = x_cos * y_sin;
        x_cos_y_cos = x_cos * y_cos;
        x_sin_y_sin = x_sin * y_sin;
    }
};

} // namespace detail

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_xyz(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos + h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos - h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin + h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos - h.x_sin_y_sin * h.z_sin
    };
}

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_xzy(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos - h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos - h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin + h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos + h.x_sin_y_sin * h.z_sin
    };
}

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_yxz(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos + h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos - h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin - h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos + h.x_sin_y_sin * h.z_sin
    };
}

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_yzx(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos + h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos + h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin - h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos - h.x_sin_y_sin * h.z_sin
    };
}

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_zxy(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos - h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos + h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin + h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos - h.x_sin_y_sin * h.z_sin
    };
}

template<typename T>
constexpr Quaternion<T> Quaternion<T>::from_euler_zyx(T rx, T ry, T rz) {
    const detail::HalfAngles<T> h(rx, ry, rz);
    return Quaternion{
        h.x_sin_y_cos * h.z_cos - h.x_cos_y_sin * h.z_sin,
        h.x_cos_y_sin * h.z_cos + h.x_sin_y_cos * h.z_sin,
        h.x_cos_y_cos * h.z_sin - h.x_sin_y_sin * h.z_cos,
        h.x_cos_y_cos * h.z_cos + h.x_sin_y_sin * h.z_sin
    };
}

// ============================================================================
// Euler angle extraction
// ============================================================================
// Every order normalizes first and has its own gimbal-lock test. In the locked
// branch one angle is forced to zero and the remaining rotation is folded into
// the other free angle through atan2 of the raw components.

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_xyz() const {
    const Quaternion q = normalized();
    const T          test = q.y_ * q.w_ + q.x_ * q.z_;
    if (vmath::abs(test) > kEulerXYZSingularity<T>) {
        const T sign = test > T{0} ? T{1} : T{-1};
        return EulerAngles<T>{sign * T{2} * std::atan2(q.z_, q.w_), sign * std::numbers::pi_v<T> / T{2}, T{0}};
    }
    const T sqy = q.y_ * q.y_;
    return EulerAngles<T>{
        std::atan2(T{2} * (q.x_ * q.w_ - q.y_ * q.z_), T{1} - T{2} * (q.x_ * q.x_ + sqy)),
        std::asin(T{2} * test),
        std::atan2(T{2} * (q.z_ * q.w_ - q.x_ * q.y_), T{1} - T{2} * (q.z_ * q.z_ + sqy))
    };
}

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_xzy() const {
    const Quaternion q = normalized();
    const T          test = q.z_ * q.w_ - q.x_ * q.y_;
    if (vmath::abs(test) > T{0.5} - kEpsilon<T>) {
        const T sign = vmath::sign(test);
        return EulerAngles<T>{sign * T{2} * -std::atan2(q.y_, q.w_), T{0}, sign * std::numbers::pi_v<T> / T{2}};
    }
    const T sqz = q.z_ * q.z_;
    return EulerAngles<T>{
        std::atan2(T{2} * (q.x_ * q.w_ + q.y_ * q.z_), T{1} - T{2} * (q.x_ * q.x_ + sqz)),
        std::atan2(T{2} * (q.x_ * q.z_ + q.y_ * q.w_), T{1} - T{2} * (q.y_ * q.y_ + sqz)),
        std::asin(T{2} * test)
    };
}

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_yxz() const {
    const Quaternion q = normalized();
    const T          test = q.x_ * q.w_ - q.y_ * q.z_;
    if (vmath::abs(test) > T{0.5} - kEpsilon<T>) {
        const T sign = vmath::sign(test);
        return EulerAngles<T>{sign * std::numbers::pi_v<T> / T{2}, sign * T{2} * -std::atan2(q.z_, q.w_), T{0}};
    }
    const T sqx = q.x_ * q.x_;
    return EulerAngles<T>{
        std::asin(T{2} * test),
        std::atan2(T{2} * (q.x_ * q.z_ + q.y_ * q.w_), T{1} - T{2} * (q.y_ * q.y_ + sqx)),
        std::atan2(T{2} * (q.x_ * q.y_ + q.z_ * q.w_), T{1} - T{2} * (q.z_ * q.z_ + sqx))
    };
}

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_yzx() const {
    const Quaternion q = normalized();
    const T          test = q.z_ * q.w_ + q.x_ * q.y_;
    if (vmath::abs(test) > T{0.5} - kEpsilon<T>) {
        const T sign = vmath::sign(test);
        return EulerAngles<T>{T{0}, sign * T{2} * std::atan2(q.x_, q.w_), sign * std::numbers::pi_v<T> / T{2}};
    }
    const T sqz = q.z_ * q.z_;
    return EulerAngles<T>{
        std::atan2(T{2} * (q.x_ * q.w_ - q.y_ * q.z_), T{1} - T{2} * (q.x_ * q.x_ + sqz)),
        std::atan2(T{2} * (q.y_ * q.w_ - q.x_ * q.z_), T{1} - T{2} * (q.y_ * q.y_ + sqz)),
        std::asin(T{2} * test)
    };
}

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_zxy() const {
    const Quaternion q = normalized();
    const T          test = q.x_ * q.w_ + q.y_ * q.z_;
    if (vmath::abs(test) > T{0.5} - kEpsilon<T>) {
        const T sign = vmath::sign(test);
        return EulerAngles<T>{sign * std::numbers::pi_v<T> / T{2}, T{0}, sign * T{2} * std::atan2(q.y_, q.w_)};
    }
    const T sqx = q.x_ * q.x_;
    return EulerAngles<T>{
        std::asin(T{2} * test),
        std::atan2(T{2} * (q.y_ * q.w_ - q.x_ * q.z_), T{1} - T{2} * (q.y_ * q.y_ + sqx)),
        std::atan2(T{2} * (q.z_ * q.w_ - q.x_ * q.y_), T{1} - T{2} * (q.z_ * q.z_ + sqx))
    };
}

template<typename T>
constexpr EulerAngles<T> Quaternion<T>::to_euler_zyx() const {
    const Quaternion q = normalized();
    const T          test = q.y_ * q.w_ - q.x_ * q.z_;
    if (vmath::abs(test) > T{0.5} - kEpsilon<T>) {
        const T sign = vmath::sign(test);
        return EulerAngles<T>{T{0}, sign * std::numbers::pi_v<T> / T{2}, sign * T{2} * -std::atan2(q.x_, q.w_)};
    }
    const T sqy = q.y_ * q.y_;
    return EulerAngles<T>{
        std::atan2(T{2} * (q.x_ * q.w_ + q.y_ * q.z_), T{1} - T{2} * (q.x_ * q.x_ + sqy)),
        std::asin(T{2} * test),
        std::atan2(T{2} * (q.x_ * q.y_ + q.z_ * q.w_), T{1} - T{2} * (q.z_ * q.z_ + sqy))
    };
}

// Convenience type aliases
using Quatf = Quaternion<float>;
using Quatd = Quaternion<double>;

} // namespace versor
