/**
 * @file noise_simplex.cpp
 * @brief Simplex noise, 1D to 4D, with analytic derivatives and tiling
 *
 * Constants, gradient sets and the permutation ring match the GLSL reference
 * noise (Gustavson / McEwan), so a given point evaluates to the same value
 * shaders using that reference produce, up to tie handling.
 *
 * Each corner within radius r contributes m^4 (g . d) with m = r^2 - |d|^2,
 * where d is the offset from the corner and g its gradient. The derivative of
 * that term is m^4 g - 8 m^3 (g . d) d.
 *
 * 1D noise is the 2D field sampled along y = 0.
 */

#include "shadekit/noise.hpp"

#include "shadekit/geometric.hpp"
#include "shadekit/noise_tables.hpp"

#include <array>
#include <cmath>
#include <numbers>

namespace shadekit {

namespace {

using tables::simplexHash;

// ============================================================================
// Lattice constants
// ============================================================================

// Skew (F) and unskew (G) factors, squared falloff radius, output scale
template <Scalar T>
struct Simplex2Constants {
    static constexpr T F = (std::numbers::sqrt3_v<T> - T(1)) / T(2);
    static constexpr T G = (T(3) - std::numbers::sqrt3_v<T>) / T(6);
    static constexpr T R2 = T(0.5);
    static constexpr T K = T(130);
};

template <Scalar T>
struct Simplex3Constants {
    static constexpr T F = T(1) / T(3);
    static constexpr T G = T(1) / T(6);
    static constexpr T R2 = T(0.6);
    static constexpr T K = T(42);
};

// sqrt(5) = 2 phi - 1
template <Scalar T>
struct Simplex4Constants {
    static constexpr T F = (std::numbers::phi_v<T> - T(1)) / T(2);
    static constexpr T G = (T(3) - std::numbers::phi_v<T>) / T(10);
    static constexpr T R2 = T(0.6);
    static constexpr T K = T(49);
};

// Periodic lattices use u = (J - I) x; their cells are shaped differently
// from the skewed lattice above, hence their own radius and scale.
template <Scalar T> constexpr T kPeriodicR2_2 = T(0.5);
template <Scalar T> constexpr T kPeriodicK2 = T(136);
template <Scalar T> constexpr T kPeriodicR2_3 = T(0.6);
template <Scalar T> constexpr T kPeriodicK3 = T(42);
template <Scalar T> constexpr T kPeriodicR2_4 = T(1) / T(3);
template <Scalar T> constexpr T kPeriodicK4 = T(660);

// ============================================================================
// Gradient lookup
// ============================================================================

template <Scalar T>
inline Vector<2, T> gradient(const IVec2& corner) {
    return Vector<2, T>(tables::kSimplexGrad2[static_cast<std::size_t>(
        simplexHash(corner) % static_cast<int32_t>(tables::SIMPLEX_GRAD2_COUNT))]);
}

template <Scalar T>
inline Vector<3, T> gradient(const IVec3& corner) {
    return Vector<3, T>(tables::kSimplexGrad3[static_cast<std::size_t>(
        simplexHash(corner) % static_cast<int32_t>(tables::SIMPLEX_GRAD3_COUNT))]);
}

template <Scalar T>
inline Vector<4, T> gradient(const IVec4& corner) {
    return Vector<4, T>(tables::kSimplexGrad4[static_cast<std::size_t>(simplexHash(corner))]);
}

// ============================================================================
// Corner contribution
// ============================================================================

/// Accumulate one corner's falloff-weighted contribution (and its gradient)
template <std::size_t N, Scalar T>
inline void addCorner(const Vector<N, T>& offset, const Vector<N, T>& g, T r2,
                      NoiseResult<T, Vector<N, T>>& acc) {
    const T m = r2 - dot(offset, offset);
    if (m <= T(0)) return;

    const T m2 = m * m;
    const T m4 = m2 * m2;
    const T gd = dot(g, offset);

    acc.value += m4 * gd;
    acc.gradient += g * m4 - offset * (T(8) * m2 * m * gd);
}

template <std::size_t N, Scalar T>
inline NoiseResult<T, Vector<N, T>> scaled(NoiseResult<T, Vector<N, T>> r, T k) {
    r.value *= k;
    r.gradient *= k;
    return r;
}

// ============================================================================
// 2D
// ============================================================================

template <Scalar T>
NoiseResult<T, Vector<2, T>> simplex2(const Vector<2, T>& p) {
    using C = Simplex2Constants<T>;

    // Skew into lattice space and find the containing cell. Only the hash
    // sees the cell index, so it is kept modulo the ring.
    const T s = sum(p) * C::F;
    const Vector<2, T> cellF = floor(p + s);
    const IVec2 cell = floorMod(cellF, tables::SIMPLEX_RING);
    const Vector<2, T> x0 = p - cellF + sum(cellF) * C::G;

    // Lower (x >= y) or upper triangle; ties go to the x axis
    const IVec2 o1 = x0[0] >= x0[1] ? IVec2(1, 0) : IVec2(0, 1);

    const Vector<2, T> x1 = x0 - Vector<2, T>(o1) + C::G;
    const Vector<2, T> x2 = x0 - T(1) + T(2) * C::G;

    NoiseResult<T, Vector<2, T>> acc;
    addCorner(x0, gradient<T>(cell), C::R2, acc);
    addCorner(x1, gradient<T>(cell + o1), C::R2, acc);
    addCorner(x2, gradient<T>(cell + 1), C::R2, acc);
    return scaled(acc, C::K);
}

// ============================================================================
// 3D
// ============================================================================

template <Scalar T>
NoiseResult<T, Vector<3, T>> simplex3(const Vector<3, T>& p) {
    using C = Simplex3Constants<T>;

    const T s = sum(p) * C::F;
    const Vector<3, T> cellF = floor(p + s);
    const IVec3 cell = floorMod(cellF, tables::SIMPLEX_RING);
    const Vector<3, T> x0 = p - cellF + sum(cellF) * C::G;

    // Rank the components; the largest is stepped first. Ties favour the
    // lower axis.
    int32_t rx = 0, ry = 0, rz = 0;
    if (x0[0] >= x0[1]) ++rx; else ++ry;
    if (x0[0] >= x0[2]) ++rx; else ++rz;
    if (x0[1] >= x0[2]) ++ry; else ++rz;

    const IVec3 o1(rx >= 2 ? 1 : 0, ry >= 2 ? 1 : 0, rz >= 2 ? 1 : 0);
    const IVec3 o2(rx >= 1 ? 1 : 0, ry >= 1 ? 1 : 0, rz >= 1 ? 1 : 0);

    const Vector<3, T> x1 = x0 - Vector<3, T>(o1) + C::G;
    const Vector<3, T> x2 = x0 - Vector<3, T>(o2) + T(2) * C::G;
    const Vector<3, T> x3 = x0 - T(1) + T(3) * C::G;

    NoiseResult<T, Vector<3, T>> acc;
    addCorner(x0, gradient<T>(cell), C::R2, acc);
    addCorner(x1, gradient<T>(cell + o1), C::R2, acc);
    addCorner(x2, gradient<T>(cell + o2), C::R2, acc);
    addCorner(x3, gradient<T>(cell + 1), C::R2, acc);
    return scaled(acc, C::K);
}

// ============================================================================
// 4D
// ============================================================================

template <Scalar T>
NoiseResult<T, Vector<4, T>> simplex4(const Vector<4, T>& p) {
    using C = Simplex4Constants<T>;

    const T s = sum(p) * C::F;
    const Vector<4, T> cellF = floor(p + s);
    const IVec4 cell = floorMod(cellF, tables::SIMPLEX_RING);
    const Vector<4, T> x0 = p - cellF + sum(cellF) * C::G;

    // Pairwise ranking of the four components (six comparisons)
    IVec4 rank(0);
    for (std::size_t a = 0; a < 4; ++a) {
        for (std::size_t b = a + 1; b < 4; ++b) {
            if (x0[a] >= x0[b]) ++rank[a]; else ++rank[b];
        }
    }

    IVec4 o1, o2, o3;
    for (std::size_t c = 0; c < 4; ++c) {
        o1[c] = rank[c] >= 3 ? 1 : 0;
        o2[c] = rank[c] >= 2 ? 1 : 0;
        o3[c] = rank[c] >= 1 ? 1 : 0;
    }

    const Vector<4, T> x1 = x0 - Vector<4, T>(o1) + C::G;
    const Vector<4, T> x2 = x0 - Vector<4, T>(o2) + T(2) * C::G;
    const Vector<4, T> x3 = x0 - Vector<4, T>(o3) + T(3) * C::G;
    const Vector<4, T> x4 = x0 - T(1) + T(4) * C::G;

    NoiseResult<T, Vector<4, T>> acc;
    addCorner(x0, gradient<T>(cell), C::R2, acc);
    addCorner(x1, gradient<T>(cell + o1), C::R2, acc);
    addCorner(x2, gradient<T>(cell + o2), C::R2, acc);
    addCorner(x3, gradient<T>(cell + o3), C::R2, acc);
    addCorner(x4, gradient<T>(cell + 1), C::R2, acc);
    return scaled(acc, C::K);
}

// ============================================================================
// Periodic lattice
// ============================================================================
//
// Lattice coordinates u_c = sum(p) - p_c. The inverse map is
// p = sum(u) / (N - 1) - u_c, so integer steps of p along any single axis
// are lattice translations. A corner with integer u has x-space position
// V / (N - 1) where V_c = sum(u) - (N - 1) u_c; wrapping V_c modulo
// (N - 1) * period_c wraps the corner by whole periods along axis c.
//

/// Corner offsets of the lattice cell containing f, ordered by rank
template <std::size_t N, Scalar T>
std::array<Vector<N, int64_t>, N + 1> cellCorners(const Vector<N, T>& f) {
    Vector<N, int32_t> rank(0);
    for (std::size_t a = 0; a < N; ++a) {
        for (std::size_t b = a + 1; b < N; ++b) {
            if (f[a] >= f[b]) ++rank[a]; else ++rank[b];
        }
    }

    std::array<Vector<N, int64_t>, N + 1> corners{};
    for (std::size_t k = 1; k <= N; ++k) {
        for (std::size_t c = 0; c < N; ++c) {
            corners[k][c] = rank[c] >= static_cast<int32_t>(N - k) ? 1 : 0;
        }
    }
    return corners;
}

/// Lattice corner u moved by whole periods into the fundamental tile,
/// returned modulo the hash ring
template <std::size_t N>
Vector<N, int32_t> wrapCorner(const Vector<N, int64_t>& u, const Vector<N, int32_t>& period) {
    constexpr int64_t n1 = static_cast<int64_t>(N) - 1;
    const int64_t su = sum(u);

    Vector<N, int64_t> v;
    for (std::size_t c = 0; c < N; ++c) {
        v[c] = su - n1 * u[c];
        if (period[c] > 0) {
            v[c] = posMod(v[c], n1 * period[c]);
        }
    }

    // Exact: every v_c stays congruent to sum(u) - (N - 1) u_c mod (N - 1)
    const int64_t sv = sum(v);
    Vector<N, int32_t> wrapped;
    for (std::size_t c = 0; c < N; ++c) {
        wrapped[c] = static_cast<int32_t>(posMod((sv - v[c]) / n1, int64_t{tables::SIMPLEX_RING}));
    }
    return wrapped;
}

/// Shift p by whole periods (whole hash rings on untiled axes) so every
/// lattice coordinate fits comfortably in int64_t. Both shifts are exact
/// symmetries of the tiled field.
template <std::size_t N, Scalar T>
Vector<N, T> reduceSample(const Vector<N, T>& p, const Vector<N, int32_t>& period) {
    Vector<N, T> r;
    for (std::size_t c = 0; c < N; ++c) {
        const int32_t m = period[c] > 0 ? period[c] : tables::SIMPLEX_RING;
        r[c] = std::fmod(p[c], static_cast<T>(m));
    }
    return r;
}

template <std::size_t N, Scalar T>
T periodicSimplex(const Vector<N, T>& sample, const Vector<N, int32_t>& period, T r2, T k) {
    constexpr T n1 = static_cast<T>(N - 1);
    const Vector<N, T> p = reduceSample(sample, period);
    const Vector<N, T> u = sum(p) - p;
    const Vector<N, T> cellF = floor(u);
    const Vector<N, int64_t> cell(cellF);

    NoiseResult<T, Vector<N, T>> acc;
    for (const auto& offset : cellCorners(u - cellF)) {
        const Vector<N, int64_t> corner = cell + offset;
        const Vector<N, T> cu(corner);
        const Vector<N, T> position = sum(cu) / n1 - cu;

        addCorner(p - position, gradient<T>(wrapCorner(corner, period)), r2, acc);
    }
    return acc.value * k;
}

}  // namespace

// ============================================================================
// Public entry points
// ============================================================================

template <Scalar T>
T simplexNoise(T x) {
    return simplex2(Vector<2, T>(x, T(0))).value;
}

template <Scalar T>
T simplexNoise(const Vector<2, T>& p) {
    return simplex2(p).value;
}

template <Scalar T>
T simplexNoise(const Vector<3, T>& p) {
    return simplex3(p).value;
}

template <Scalar T>
T simplexNoise(const Vector<4, T>& p) {
    return simplex4(p).value;
}

template <Scalar T>
T simplexNoise(T x, int32_t period) {
    return periodicSimplex(Vector<2, T>(x, T(0)), IVec2(period, 0), kPeriodicR2_2<T>, kPeriodicK2<T>);
}

template <Scalar T>
T simplexNoise(const Vector<2, T>& p, const IVec2& period) {
    return periodicSimplex(p, period, kPeriodicR2_2<T>, kPeriodicK2<T>);
}

template <Scalar T>
T simplexNoise(const Vector<3, T>& p, const IVec3& period) {
    return periodicSimplex(p, period, kPeriodicR2_3<T>, kPeriodicK3<T>);
}

template <Scalar T>
T simplexNoise(const Vector<4, T>& p, const IVec4& period) {
    return periodicSimplex(p, period, kPeriodicR2_4<T>, kPeriodicK4<T>);
}

template <Scalar T>
NoiseResult<T, T> simplexNoiseDeriv(T x) {
    const auto r = simplex2(Vector<2, T>(x, T(0)));
    return {r.value, r.gradient[0]};
}

template <Scalar T>
NoiseResult<T, Vector<2, T>> simplexNoiseDeriv(const Vector<2, T>& p) {
    return simplex2(p);
}

template <Scalar T>
NoiseResult<T, Vector<3, T>> simplexNoiseDeriv(const Vector<3, T>& p) {
    return simplex3(p);
}

template <Scalar T>
NoiseResult<T, Vector<4, T>> simplexNoiseDeriv(const Vector<4, T>& p) {
    return simplex4(p);
}

// ============================================================================
// Explicit instantiations
// ============================================================================

#define SHADEKIT_INSTANTIATE_SIMPLEX(T)                                                 \
    template T simplexNoise<T>(T);                                                      \
    template T simplexNoise<T>(const Vector<2, T>&);                                    \
    template T simplexNoise<T>(const Vector<3, T>&);                                    \
    template T simplexNoise<T>(const Vector<4, T>&);                                    \
    template T simplexNoise<T>(T, int32_t);                                             \
    template T simplexNoise<T>(const Vector<2, T>&, const IVec2&);                      \
    template T simplexNoise<T>(const Vector<3, T>&, const IVec3&);                      \
    template T simplexNoise<T>(const Vector<4, T>&, const IVec4&);                      \
    template NoiseResult<T, T> simplexNoiseDeriv<T>(T);                                 \
    template NoiseResult<T, Vector<2, T>> simplexNoiseDeriv<T>(const Vector<2, T>&);    \
    template NoiseResult<T, Vector<3, T>> simplexNoiseDeriv<T>(const Vector<3, T>&);    \
    template NoiseResult<T, Vector<4, T>> simplexNoiseDeriv<T>(const Vector<4, T>&);

SHADEKIT_INSTANTIATE_SIMPLEX(float)
SHADEKIT_INSTANTIATE_SIMPLEX(double)

#undef SHADEKIT_INSTANTIATE_SIMPLEX

}  // namespace shadekit
