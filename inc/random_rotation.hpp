#pragma once

#include <cmath>
#include <cstdint>
#include <numbers>
#include <random>

#include "quaternion.hpp"

namespace versor {

inline constexpr std::uint32_t kDefaultRandomSeed = 1;

/**
 * @brief Generator of uniformly distributed unit quaternions
 *
 * Owns its engine; two generators built from the same seed produce the same
 * sequence. Uses Shoemake's subgroup algorithm on three uniform samples.
 */
template<typename T>
class RandomRotation {
public:
    explicit RandomRotation(std::uint32_t seed = kDefaultRandomSeed) : engine_(seed) {}

    [[nodiscard]] Quaternion<T> next() {
        const T u = uniform_(engine_);
        const T v = uniform_(engine_);
        const T w = uniform_(engine_);

        const T sqrt_u = std::sqrt(u);
        const T sqrt_one_minus_u = std::sqrt(T{1} - u);
        const T tau_v = T{2} * std::numbers::pi_v<T> * v;
        const T tau_w = T{2} * std::numbers::pi_v<T> * w;

        return Quaternion<T>{
            sqrt_one_minus_u * std::sin(tau_v),
            sqrt_one_minus_u * std::cos(tau_v),
            sqrt_u * std::sin(tau_w),
            sqrt_u * std::cos(tau_w)
        };
    }

    [[nodiscard]] Quaternion<T> operator()() { return next(); }

    // Restart the sequence
    void seed(std::uint32_t value) {
        engine_.seed(value);
        uniform_.reset();
    }

private:
    std::mt19937                      engine_;
    std::uniform_real_distribution<T> uniform_{T{0}, T{1}};
};

} // namespace versor
