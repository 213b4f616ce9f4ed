#pragma once

#include <cmath>
#include <initializer_list>
#include <type_traits>

namespace vmath {

/**
 * @brief Compute square root using Newton's method (constexpr)
 *
 * Computes sqrt(x) using iterative Newton-Raphson: x_{n+1} = (x_n + S/x_n) / 2
 * during constant evaluation and defers to std::sqrt at runtime.
 * Returns 0 for negative inputs (NaN not available in constexpr context).
 *
 * @tparam T Floating-point type
 * @param x  Value to compute square root of
 *
 * @return Square root of x, or 0 if x < 0
 */
template<typename T>
constexpr T sqrt(T x) {
    if (!std::is_constant_evaluated())
        return x < T{0} ? T{0} : std::sqrt(x);
    if (x == T{0})
        return T{0};
    if (x < T{0})
        return T{0};

    T guess = x > T{1} ? x / T{2} : T{1};
    for (int i = 0; i < 100; ++i) {
        T next = (guess + x / guess) / T{2};
        if (next == guess)
            break;
        guess = next;
    }
    return guess;
}

/**
 * @brief Compute absolute value (constexpr)
 */
template<typename T>
constexpr T abs(T x) {
    return x >= T{0} ? x : -x;
}

/**
 * @brief Largest of a list of values (constexpr)
 */
template<typename T>
constexpr T max(std::initializer_list<T> values) {
    const T* it = values.begin();
    T        result = *it;
    for (++it; it != values.end(); ++it) {
        if (*it > result)
            result = *it;
    }
    return result;
}

/**
 * @brief Clamp x into [lo, hi] (constexpr)
 */
template<typename T>
constexpr T clamp(T x, T lo, T hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}

// +1 for non-negative input, -1 otherwise
template<typename T>
constexpr T sign(T x) {
    return x >= T{0} ? T{1} : T{-1};
}

} // namespace vmath
