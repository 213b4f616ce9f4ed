#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

#include "constexpr_math.hpp"

namespace versor {

/**
 * @ingroup linear_algebra
 * @brief Fixed-size, stack-allocated matrix used for rotation matrices and transforms
 *
 * Provides element access, arithmetic, multiplication, transposition and trace.
 * Supports constexpr evaluation for compile-time matrix computations.
 *
 * @tparam Rows Number of rows
 * @tparam Cols Number of columns
 * @tparam T Element type (floating-point)
 */
template<size_t Rows, size_t Cols, typename T = double>
struct Matrix {
protected:
    std::array<std::array<T, Cols>, Rows> data_{};

    template<size_t, size_t, typename>
    friend struct Matrix;

public:
    static_assert(std::is_floating_point_v<T>, "Matrix element type must be floating-point");

    /**
     * @brief Default constructor, initializes all elements to zero
     */
    constexpr Matrix() = default;
    constexpr Matrix(const Matrix&) = default;
    constexpr Matrix& operator=(const Matrix&) = default;
    constexpr Matrix(Matrix&&) = default;
    constexpr Matrix& operator=(Matrix&&) = default;
    constexpr ~Matrix() = default;

    /**
     * @brief Type conversion constructor from another matrix with different element type
     */
    template<typename U>
    constexpr Matrix(const Matrix<Rows, Cols, U>& other) : Matrix() {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] = static_cast<T>(other.data_[r][c]);
            }
        }
    }

    /**
     * @brief Constructor from nested initializer list (row-major)
     */
    constexpr Matrix(std::initializer_list<std::initializer_list<T>> init) : Matrix() {
        size_t r = 0;
        for (const auto& row : init) {
            size_t c = 0;
            for (const auto& val : row) {
                if (r < Rows && c < Cols) {
                    data_[r][c] = val;
                }
                ++c;
            }
            ++r;
        }
    }

    [[nodiscard]] static constexpr Matrix identity()
        requires(Rows == Cols)
    {
        Matrix result{};
        for (size_t r = 0; r < Rows; ++r) {
            result.data_[r][r] = T{1};
        }
        return result;
    }

    [[nodiscard]] static constexpr size_t rows() { return Rows; }
    [[nodiscard]] static constexpr size_t cols() { return Cols; }

    /**
     * @brief Element access operator
     * @param row Row index
     * @param col Column index
     * @return Reference to element at (row, col)
     */
    constexpr T&       operator()(size_t row, size_t col) { return data_[row][col]; }
    constexpr const T& operator()(size_t row, size_t col) const { return data_[row][col]; }

    constexpr Matrix& operator+=(const Matrix& other) {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] += other.data_[r][c];
            }
        }
        return *this;
    }

    constexpr Matrix& operator-=(const Matrix& other) {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                data_[r][c] -= other.data_[r][c];
            }
        }
        return *this;
    }

    constexpr Matrix& operator*=(T scalar) {
        for (auto& row : data_) {
            for (auto& val : row) {
                val *= scalar;
            }
        }
        return *this;
    }

    constexpr Matrix& operator/=(T scalar) {
        for (auto& row : data_) {
            for (auto& val : row) {
                val /= scalar;
            }
        }
        return *this;
    }

    /**
     * @brief Exact element-wise equality
     */
    [[nodiscard]] constexpr bool operator==(const Matrix& other) const {
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                if (data_[r][c] != other.data_[r][c]) {
                    return false;
                }
            }
        }
        return true;
    }

    [[nodiscard]] constexpr bool operator!=(const Matrix& other) const { return !(*this == other); }

    [[nodiscard]] constexpr Matrix operator-() const {
        Matrix result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                result.data_[r][c] = -data_[r][c];
            }
        }
        return result;
    }

    [[nodiscard]] constexpr Matrix operator+(const Matrix& other) const {
        Matrix result = *this;
        result += other;
        return result;
    }

    [[nodiscard]] constexpr Matrix operator-(const Matrix& other) const {
        Matrix result = *this;
        result -= other;
        return result;
    }

    /**
     * @brief Matrix multiplication operator
     * @tparam P Number of columns in right-hand matrix
     * @param rhs Right-hand matrix (Cols x P)
     * @return Result matrix (Rows x P)
     */
    template<size_t P>
    [[nodiscard]] constexpr Matrix<Rows, P, T> operator*(const Matrix<Cols, P, T>& rhs) const {
        Matrix<Rows, P, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < P; ++c) {
                T accum = T{0};
                for (size_t k = 0; k < Cols; ++k) {
                    accum += data_[r][k] * rhs.data_[k][c];
                }
                result.data_[r][c] = accum;
            }
        }
        return result;
    }

    [[nodiscard]] constexpr Matrix<Cols, Rows, T> transpose() const {
        Matrix<Cols, Rows, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            for (size_t c = 0; c < Cols; ++c) {
                result.data_[c][r] = data_[r][c];
            }
        }
        return result;
    }

    /**
     * @brief Sum of diagonal elements (square matrices only)
     */
    [[nodiscard]] constexpr T trace() const
        requires(Rows == Cols)
    {
        T accum = T{0};
        for (size_t i = 0; i < Rows; ++i) {
            accum += data_[i][i];
        }
        return accum;
    }

    /**
     * @brief Extract a column as a Rows x 1 matrix
     */
    [[nodiscard]] constexpr Matrix<Rows, 1, T> col(size_t c_idx) const {
        Matrix<Rows, 1, T> result;
        for (size_t r = 0; r < Rows; ++r) {
            result.data_[r][0] = data_[r][c_idx];
        }
        return result;
    }
};

template<typename T>
using Mat3 = Matrix<3, 3, T>;

template<typename T>
using Mat4 = Matrix<4, 4, T>;

// Scalar multiplication (scalar * matrix)
template<typename T, size_t N, size_t M, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr Matrix<N, M, T> operator*(Scalar scalar, const Matrix<N, M, T>& mat) {
    Matrix<N, M, T> result = mat;
    result *= static_cast<T>(scalar);
    return result;
}

template<typename T, size_t N, size_t M, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr Matrix<N, M, T> operator*(const Matrix<N, M, T>& mat, Scalar scalar) {
    return scalar * mat;
}

/**
 * @brief Column vector specialization of Matrix<N, 1, T>
 * @ingroup linear_algebra
 *
 * Vec3 is the 3-vector every rotation operation consumes and produces.
 *
 * @tparam N Vector dimension
 * @tparam T Element type
 */
template<size_t N, typename T = double>
struct ColVec : public Matrix<N, 1, T> {
    constexpr ColVec() = default;
    constexpr ColVec(const ColVec&) = default;
    constexpr ColVec& operator=(const ColVec&) = default;
    constexpr ColVec(ColVec&&) = default;
    constexpr ColVec& operator=(ColVec&&) = default;
    constexpr ~ColVec() = default;

    /**
     * @brief Constructor from initializer list
     */
    constexpr ColVec(std::initializer_list<T> values) : Matrix<N, 1, T>() {
        size_t i = 0;
        for (const auto& val : values) {
            if (i < N) {
                this->data_[i][0] = val;
            }
            ++i;
        }
    }

    // Constructor from std::array<T, N> - enables CTAD
    constexpr ColVec(const std::array<T, N>& arr) : Matrix<N, 1, T>() {
        for (size_t i = 0; i < N; ++i) {
            this->data_[i][0] = arr[i];
        }
    }

    template<typename U>
    constexpr ColVec(const ColVec<N, U>& other) : Matrix<N, 1, T>(other) {}

    template<typename U>
    constexpr ColVec(const Matrix<N, 1, U>& other) : Matrix<N, 1, T>(other) {}

    // Unit axes
    [[nodiscard]] static constexpr ColVec unit_x()
        requires(N == 3)
    { return ColVec{T{1}, T{0}, T{0}}; }

    [[nodiscard]] static constexpr ColVec unit_y()
        requires(N == 3)
    { return ColVec{T{0}, T{1}, T{0}}; }

    [[nodiscard]] static constexpr ColVec unit_z()
        requires(N == 3)
    { return ColVec{T{0}, T{0}, T{1}}; }

    constexpr const T& operator[](size_t idx) const { return this->data_[idx][0]; }
    constexpr T&       operator[](size_t idx) { return this->data_[idx][0]; }

    /**
     * @brief Dot product (inner product)
     */
    [[nodiscard]] friend constexpr T dot(const ColVec<N, T>& vec1, const ColVec<N, T>& vec2) {
        T result = 0;
        for (std::size_t i = 0; i < N; ++i) {
            result += vec1.data_[i][0] * vec2.data_[i][0];
        }
        return result;
    }

    /**
     * @brief Cross product for 3D vectors
     * @param other Vector to cross with
     * @return this x other
     */
    template<size_t D = N>
    [[nodiscard]] constexpr ColVec<3, T> cross(const ColVec<3, T>& other) const
        requires(D == 3)
    {
        return ColVec<3, T>{
            this->data_[1][0] * other.data_[2][0] - this->data_[2][0] * other.data_[1][0],
            this->data_[2][0] * other.data_[0][0] - this->data_[0][0] * other.data_[2][0],
            this->data_[0][0] * other.data_[1][0] - this->data_[1][0] * other.data_[0][0]
        };
    }

    /**
     * @brief Euclidean norm (magnitude) of the vector
     */
    [[nodiscard]] constexpr T norm() const { return vmath::sqrt(dot(*this, *this)); }

    /**
     * @brief Normalized vector (unit length)
     *
     * A zero vector is returned unchanged.
     */
    [[nodiscard]] constexpr ColVec normalized() const {
        T n = norm();
        if (n == T{0}) {
            return *this;
        }
        return *this * (T{1} / n);
    }

    /**
     * @brief Normalized vector, or @p fallback when the vector has zero length
     */
    [[nodiscard]] constexpr ColVec normalized_or(const ColVec& fallback) const {
        T n = norm();
        if (n > T{0}) {
            return *this * (T{1} / n);
        }
        return fallback;
    }
};

// Binary operators for ColVec
template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator+(const ColVec<N, T>& lhs, const ColVec<N, T>& rhs) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(lhs) + static_cast<const Matrix<N, 1, T>&>(rhs));
}

template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator-(const ColVec<N, T>& lhs, const ColVec<N, T>& rhs) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(lhs) - static_cast<const Matrix<N, 1, T>&>(rhs));
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator*(const ColVec<N, T>& vec, Scalar scalar) {
    return ColVec<N, T>(static_cast<const Matrix<N, 1, T>&>(vec) * scalar);
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator*(Scalar scalar, const ColVec<N, T>& vec) {
    return vec * scalar;
}

template<typename T, size_t N, typename Scalar>
    requires std::is_arithmetic_v<Scalar>
[[nodiscard]] constexpr ColVec<N, T> operator/(const ColVec<N, T>& vec, Scalar scalar) {
    Matrix<N, 1, T> result = vec;
    result /= static_cast<T>(scalar);
    return ColVec<N, T>(result);
}

template<typename T, size_t N>
[[nodiscard]] constexpr ColVec<N, T> operator-(const ColVec<N, T>& vec) {
    Matrix<N, 1, T> base = vec;
    return ColVec<N, T>(-base);
}

// Template Deduction Guides
// Deduce ColVec<N, T> from variadic constructor arguments, e.g. ColVec vec{1.0f, 2.0f, 3.0f};
// Integer literals deduce to double
template<typename T, typename... Args>
    requires(std::is_integral_v<T> && (std::is_integral_v<Args> && ...))
ColVec(T, Args...) -> ColVec<1 + sizeof...(Args), double>;

template<typename T, typename... Args>
    requires(!std::is_integral_v<T> || !(std::is_integral_v<Args> && ...))
ColVec(T, Args...) -> ColVec<1 + sizeof...(Args), T>;

template<typename U, size_t M>
ColVec(Matrix<M, 1, U>) -> ColVec<M, U>;

template<typename T, size_t N>
ColVec(const std::array<T, N>&) -> ColVec<N, T>;

template<typename T>
using Vec3 = ColVec<3, T>;

using Vec3f = Vec3<float>;
using Vec3d = Vec3<double>;

} // namespace versor
