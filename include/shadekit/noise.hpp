/**
 * @file noise.hpp
 * @brief Classic Perlin and simplex noise in 1 to 4 dimensions
 *
 * All functions are pure: the same input always yields the same output, and
 * no state is shared beyond the constant tables in noise_tables.hpp.
 *
 * Classic noise stays inside [-1, 1] and is exactly 0 on integer lattice
 * points. Simplex noise uses glm's normalization, which peaks slightly past 1
 * in 3D and 4D (about 1.04 and 1.07). 1D simplex noise is the 2D field along
 * y = 0.
 *
 * Any finite coordinate is accepted. Lattice cells are reduced by the period
 * or the table size before they become integers, so coordinates past the
 * int32_t range repeat with the table instead of overflowing.
 *
 * Periodic variants repeat after `period` units along each axis. A period of
 * 0 (or below) leaves that axis untiled. Periods above 256 (classic) or 289
 * (simplex) alias with the permutation table but are not rejected.
 *
 * The templates are instantiated for float and double.
 *
 * Usage:
 * ```cpp
 * float h = classicNoise(Vec2(x, z) * 0.05f);
 * float tile = simplexNoise(Vec3(u, v, t), IVec3(8, 8, 0));
 * auto [value, gradient] = simplexNoiseDeriv(Vec3(x, y, z));
 * ```
 */

#pragma once

#include "shadekit/scalar.hpp"
#include "shadekit/vector.hpp"

#include <cstdint>

namespace shadekit {

/// A noise value together with its analytic gradient
template <Scalar T, typename Grad>
struct NoiseResult {
    T value = T(0);
    Grad gradient{};
};

// ============================================================================
// Classic (Perlin) noise
// ============================================================================

template <Scalar T> [[nodiscard]] T classicNoise(T x);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<2, T>& p);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<3, T>& p);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<4, T>& p);

template <Scalar T> [[nodiscard]] T classicNoise(T x, int32_t period);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<2, T>& p, const IVec2& period);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<3, T>& p, const IVec3& period);
template <Scalar T> [[nodiscard]] T classicNoise(const Vector<4, T>& p, const IVec4& period);

// ============================================================================
// Simplex noise
// ============================================================================

template <Scalar T> [[nodiscard]] T simplexNoise(T x);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<2, T>& p);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<3, T>& p);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<4, T>& p);

/// Tileable simplex noise on a lattice that is invariant under integer
/// translation along every axis
template <Scalar T> [[nodiscard]] T simplexNoise(T x, int32_t period);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<2, T>& p, const IVec2& period);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<3, T>& p, const IVec3& period);
template <Scalar T> [[nodiscard]] T simplexNoise(const Vector<4, T>& p, const IVec4& period);

/// Simplex noise with its exact partial derivatives
template <Scalar T> [[nodiscard]] NoiseResult<T, T> simplexNoiseDeriv(T x);
template <Scalar T> [[nodiscard]] NoiseResult<T, Vector<2, T>> simplexNoiseDeriv(const Vector<2, T>& p);
template <Scalar T> [[nodiscard]] NoiseResult<T, Vector<3, T>> simplexNoiseDeriv(const Vector<3, T>& p);
template <Scalar T> [[nodiscard]] NoiseResult<T, Vector<4, T>> simplexNoiseDeriv(const Vector<4, T>& p);

// ============================================================================
// GLSL noise built-ins
// ============================================================================
//
// noiseK returns K decorrelated simplex samples taken around x:
//   noise1(x) = n(x)
//   noise2(x) = (n(x), n(-x))
//   noise3(x) = (n(x - 1), n(x), n(x + 1))
//   noise4(x) = (n(x - 1), n(x), n(x + 1), n(x + 2))
//

template <Scalar T>
[[nodiscard]] T noise1(T x) {
    return simplexNoise(x);
}

template <std::size_t N, Scalar T>
[[nodiscard]] T noise1(const Vector<N, T>& x) {
    return simplexNoise(x);
}

template <Scalar T>
[[nodiscard]] Vector<2, T> noise2(T x) {
    return {simplexNoise(x), simplexNoise(-x)};
}

template <std::size_t N, Scalar T>
[[nodiscard]] Vector<2, T> noise2(const Vector<N, T>& x) {
    return {simplexNoise(x), simplexNoise(-x)};
}

template <Scalar T>
[[nodiscard]] Vector<3, T> noise3(T x) {
    return {simplexNoise(x - T(1)), simplexNoise(x), simplexNoise(x + T(1))};
}

template <std::size_t N, Scalar T>
[[nodiscard]] Vector<3, T> noise3(const Vector<N, T>& x) {
    return {simplexNoise(x - T(1)), simplexNoise(x), simplexNoise(x + T(1))};
}

template <Scalar T>
[[nodiscard]] Vector<4, T> noise4(T x) {
    return {simplexNoise(x - T(1)), simplexNoise(x), simplexNoise(x + T(1)),
            simplexNoise(x + T(2))};
}

template <std::size_t N, Scalar T>
[[nodiscard]] Vector<4, T> noise4(const Vector<N, T>& x) {
    return {simplexNoise(x - T(1)), simplexNoise(x), simplexNoise(x + T(1)),
            simplexNoise(x + T(2))};
}

}  // namespace shadekit
