/**
 * @file noise_tables.hpp
 * @brief Permutation and gradient tables shared by the noise evaluators
 *
 * All tables are constant-initialized at compile time and never mutated, so
 * any number of threads may read them concurrently.
 *
 * Two lattices hash differently:
 * - Classic noise folds each lattice index into [0, 255] and chains lookups
 *   through Ken Perlin's doubled 512-entry permutation.
 * - Simplex noise hashes through the 289-entry ring ((34 i + 1) i) mod 289,
 *   folding the last axis first.
 */

#pragma once

#include "shadekit/scalar.hpp"
#include "shadekit/vector.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace shadekit::tables {

// ============================================================================
// Table sizes
// ============================================================================

constexpr int32_t PERLIN_SIZE = 256;
constexpr int32_t SIMPLEX_RING = 289;

constexpr std::size_t CLASSIC_GRAD1_COUNT = 16;
constexpr std::size_t CLASSIC_GRAD2_COUNT = 8;
constexpr std::size_t CLASSIC_GRAD3_COUNT = 16;
constexpr std::size_t CLASSIC_GRAD4_COUNT = 32;

constexpr std::size_t SIMPLEX_GRAD2_COUNT = 41;
constexpr std::size_t SIMPLEX_GRAD3_COUNT = 49;
constexpr std::size_t SIMPLEX_GRAD4_COUNT = 289;

// ============================================================================
// Tables
// ============================================================================

/// Ken Perlin's reference permutation of 0..255, repeated twice
extern const std::array<uint8_t, 2 * PERLIN_SIZE> kPerlinPermutation;

/// ((34 i + 1) i) mod 289 for i in [0, 289)
extern const std::array<int16_t, SIMPLEX_RING> kSimplexPermutation;

/// Classic gradients: +-k/8 for 1D, unit directions for 2D..4D
extern const std::array<double, CLASSIC_GRAD1_COUNT> kClassicGrad1;
extern const std::array<DVec2, CLASSIC_GRAD2_COUNT> kClassicGrad2;
extern const std::array<DVec3, CLASSIC_GRAD3_COUNT> kClassicGrad3;
extern const std::array<DVec4, CLASSIC_GRAD4_COUNT> kClassicGrad4;

/// Simplex gradients with the Taylor inverse-sqrt normalization applied
extern const std::array<DVec2, SIMPLEX_GRAD2_COUNT> kSimplexGrad2;
extern const std::array<DVec3, SIMPLEX_GRAD3_COUNT> kSimplexGrad3;
extern const std::array<DVec4, SIMPLEX_GRAD4_COUNT> kSimplexGrad4;

// ============================================================================
// Index folding and hashing
// ============================================================================

/**
 * @brief Reduce a lattice coordinate to a classic permutation index
 *
 * With period > 0 the coordinate is first wrapped into [0, period); periods
 * above 256 alias. period <= 0 disables wrapping on that axis.
 */
[[nodiscard]] constexpr int32_t foldIndex(int32_t i, int32_t period) {
    return (period > 0 ? posMod(i, period) : i) & (PERLIN_SIZE - 1);
}

[[nodiscard]] inline int32_t perm(int32_t i) {
    return kPerlinPermutation[static_cast<std::size_t>(i & (PERLIN_SIZE - 1))];
}

/// Chained classic hash of already-folded indices, first axis innermost
template <std::size_t N>
[[nodiscard]] inline int32_t classicHash(const Vector<N, int32_t>& folded) {
    int32_t h = kPerlinPermutation[static_cast<std::size_t>(folded[0])];
    for (std::size_t i = 1; i < N; ++i) {
        h = kPerlinPermutation[static_cast<std::size_t>(h + folded[i])];
    }
    return h;
}

[[nodiscard]] inline int32_t simplexPerm(int32_t i) {
    return kSimplexPermutation[static_cast<std::size_t>(posMod(i, SIMPLEX_RING))];
}

/// Simplex lattice hash, last axis folded first
template <std::size_t N>
[[nodiscard]] inline int32_t simplexHash(const Vector<N, int32_t>& corner) {
    int32_t h = 0;
    for (std::size_t i = N; i-- > 0;) {
        h = simplexPerm(h + corner[i]);
    }
    return h;
}

}  // namespace shadekit::tables
