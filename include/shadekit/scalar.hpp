/**
 * @file scalar.hpp
 * @brief Scalar capability contract and scalar built-ins
 *
 * Every vector, matrix and noise function in shadekit is generic over a
 * Scalar. float and double are the widths the library instantiates.
 */

#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>

namespace shadekit {

// ============================================================================
// Scalar contract
// ============================================================================

/// A binary floating-point type with ordering, arithmetic, abs, floor,
/// sqrt and pow.
template <typename T>
concept Scalar = std::floating_point<T>;

/// Element types a Vector may hold (floating scalars and integer lattice
/// coordinates / periods)
template <typename T>
concept Component = std::floating_point<T> || std::signed_integral<T>;

// ============================================================================
// Scalar built-ins
// ============================================================================

/// x - floor(x), always in [0, 1)
template <Scalar T>
[[nodiscard]] inline T fract(T x) {
    return x - std::floor(x);
}

/// GLSL modulus: x - y * floor(x / y). Result takes the sign of y.
template <Scalar T>
[[nodiscard]] inline T mod(T x, T y) {
    return x - y * std::floor(x / y);
}

/// Linear interpolation a + t * (b - a)
template <Scalar T>
[[nodiscard]] constexpr T mix(T a, T b, T t) {
    return a + t * (b - a);
}

/// 0 if x < edge, else 1
template <Scalar T>
[[nodiscard]] constexpr T step(T edge, T x) {
    return x < edge ? T(0) : T(1);
}

template <Scalar T>
[[nodiscard]] constexpr T clamp(T x, T lo, T hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
template <Scalar T>
[[nodiscard]] constexpr T fade(T t) {
    return t * t * t * (t * (t * T(6) - T(15)) + T(10));
}

/// Non-negative remainder of i / n for n > 0
[[nodiscard]] constexpr int32_t posMod(int32_t i, int32_t n) {
    int32_t r = i % n;
    return r < 0 ? r + n : r;
}

[[nodiscard]] constexpr int64_t posMod(int64_t i, int64_t n) {
    int64_t r = i % n;
    return r < 0 ? r + n : r;
}

/**
 * @brief Lattice cell of x reduced into [0, n), for n > 0
 *
 * The reduction happens in T, so any finite x is safe to pass: the result
 * never goes through an out-of-range integer conversion. Non-finite input
 * maps to cell 0.
 */
template <Scalar T>
[[nodiscard]] inline int32_t floorMod(T x, int32_t n) {
    const T cell = std::floor(x);
    const T m = static_cast<T>(n);
    T r = cell - m * std::floor(cell / m);
    if (!(r >= T(0))) return 0;
    // Rounding in cell / m can land exactly on m for huge cells
    if (r >= m) r = T(0);
    return static_cast<int32_t>(r);
}

// ============================================================================
// Approximate comparison
// ============================================================================

template <Scalar T>
[[nodiscard]] inline bool isCloseTo(T a, T b, T maxDiff) {
    return std::abs(a - b) <= maxDiff;
}

/// True if a and b differ by no more than machine epsilon
template <Scalar T>
[[nodiscard]] inline bool isApproxEqual(T a, T b) {
    return isCloseTo(a, b, std::numeric_limits<T>::epsilon());
}

}  // namespace shadekit
