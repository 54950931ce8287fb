/**
 * @file noise_classic.cpp
 * @brief Classic Perlin gradient noise, 1D to 4D, plain and periodic
 *
 * Based on Ken Perlin's improved noise (2002): fixed permutation, quintic
 * fade, gradient dotted with the offset to each corner of the unit cell.
 * Each dimension has its own body so the corner bookkeeping stays readable.
 */

#include "shadekit/noise.hpp"

#include "shadekit/geometric.hpp"
#include "shadekit/noise_tables.hpp"

#include <cmath>
#include <numbers>

namespace shadekit {

// ============================================================================
// Helper functions
// ============================================================================

namespace {

using tables::classicHash;
using tables::foldIndex;

// Output scale per dimension, chosen so the extremes land inside [-1, 1]
template <Scalar T> constexpr T kScale1 = T(2);
template <Scalar T> constexpr T kScale2 = std::numbers::sqrt2_v<T>;
template <Scalar T> constexpr T kScale3 = std::numbers::sqrt2_v<T>;
template <Scalar T> constexpr T kScale4 = T(2) * std::numbers::inv_sqrt3_v<T>;

template <Scalar T>
inline T grad1(int32_t hash, T x) {
    return static_cast<T>(tables::kClassicGrad1[static_cast<std::size_t>(hash & 15)]) * x;
}

template <Scalar T>
inline T grad2(int32_t hash, T x, T y) {
    const DVec2& g = tables::kClassicGrad2[static_cast<std::size_t>(hash & 7)];
    return static_cast<T>(g[0]) * x + static_cast<T>(g[1]) * y;
}

template <Scalar T>
inline T grad3(int32_t hash, T x, T y, T z) {
    const DVec3& g = tables::kClassicGrad3[static_cast<std::size_t>(hash & 15)];
    return static_cast<T>(g[0]) * x + static_cast<T>(g[1]) * y + static_cast<T>(g[2]) * z;
}

template <Scalar T>
inline T grad4(int32_t hash, T x, T y, T z, T w) {
    const DVec4& g = tables::kClassicGrad4[static_cast<std::size_t>(hash & 31)];
    return static_cast<T>(g[0]) * x + static_cast<T>(g[1]) * y +
           static_cast<T>(g[2]) * z + static_cast<T>(g[3]) * w;
}

/// Lower and upper folded lattice index along one axis
struct AxisCell {
    int32_t lo;
    int32_t hi;
};

/// The cell is reduced by the period (or the table size) before it becomes
/// an integer, so coordinates past the int32_t range stay well defined.
template <Scalar T>
inline AxisCell foldAxis(T cell, int32_t period) {
    const int32_t i = floorMod(cell, period > 0 ? period : tables::PERLIN_SIZE);
    return {foldIndex(i, period), foldIndex(i + 1, period)};
}

// ============================================================================
// Per-dimension evaluators
// ============================================================================

template <Scalar T>
T classic1(T x, int32_t period) {
    const T fx = std::floor(x);
    const T f = x - fx;
    const AxisCell X = foldAxis(fx, period);

    const T n0 = grad1(tables::perm(X.lo), f);
    const T n1 = grad1(tables::perm(X.hi), f - T(1));

    return kScale1<T> * mix(n0, n1, fade(f));
}

template <Scalar T>
T classic2(const Vector<2, T>& p, const IVec2& period) {
    const Vector<2, T> cell = floor(p);
    const Vector<2, T> f = p - cell;
    const AxisCell X = foldAxis(cell[0], period[0]);
    const AxisCell Y = foldAxis(cell[1], period[1]);

    const T x0 = f[0], x1 = f[0] - T(1);
    const T y0 = f[1], y1 = f[1] - T(1);

    const T n00 = grad2(classicHash(IVec2(X.lo, Y.lo)), x0, y0);
    const T n10 = grad2(classicHash(IVec2(X.hi, Y.lo)), x1, y0);
    const T n01 = grad2(classicHash(IVec2(X.lo, Y.hi)), x0, y1);
    const T n11 = grad2(classicHash(IVec2(X.hi, Y.hi)), x1, y1);

    const T u = fade(f[0]);
    const T v = fade(f[1]);

    return kScale2<T> * mix(mix(n00, n10, u), mix(n01, n11, u), v);
}

template <Scalar T>
T classic3(const Vector<3, T>& p, const IVec3& period) {
    const Vector<3, T> cell = floor(p);
    const Vector<3, T> f = p - cell;
    const AxisCell X = foldAxis(cell[0], period[0]);
    const AxisCell Y = foldAxis(cell[1], period[1]);
    const AxisCell Z = foldAxis(cell[2], period[2]);

    const T x0 = f[0], x1 = f[0] - T(1);
    const T y0 = f[1], y1 = f[1] - T(1);
    const T z0 = f[2], z1 = f[2] - T(1);

    const T n000 = grad3(classicHash(IVec3(X.lo, Y.lo, Z.lo)), x0, y0, z0);
    const T n100 = grad3(classicHash(IVec3(X.hi, Y.lo, Z.lo)), x1, y0, z0);
    const T n010 = grad3(classicHash(IVec3(X.lo, Y.hi, Z.lo)), x0, y1, z0);
    const T n110 = grad3(classicHash(IVec3(X.hi, Y.hi, Z.lo)), x1, y1, z0);
    const T n001 = grad3(classicHash(IVec3(X.lo, Y.lo, Z.hi)), x0, y0, z1);
    const T n101 = grad3(classicHash(IVec3(X.hi, Y.lo, Z.hi)), x1, y0, z1);
    const T n011 = grad3(classicHash(IVec3(X.lo, Y.hi, Z.hi)), x0, y1, z1);
    const T n111 = grad3(classicHash(IVec3(X.hi, Y.hi, Z.hi)), x1, y1, z1);

    const T u = fade(f[0]);
    const T v = fade(f[1]);
    const T w = fade(f[2]);

    const T nx00 = mix(n000, n100, u);
    const T nx10 = mix(n010, n110, u);
    const T nx01 = mix(n001, n101, u);
    const T nx11 = mix(n011, n111, u);

    return kScale3<T> * mix(mix(nx00, nx10, v), mix(nx01, nx11, v), w);
}

template <Scalar T>
T classic4(const Vector<4, T>& p, const IVec4& period) {
    const Vector<4, T> cell = floor(p);
    const Vector<4, T> f = p - cell;
    const AxisCell X = foldAxis(cell[0], period[0]);
    const AxisCell Y = foldAxis(cell[1], period[1]);
    const AxisCell Z = foldAxis(cell[2], period[2]);
    const AxisCell W = foldAxis(cell[3], period[3]);

    const T x0 = f[0], x1 = f[0] - T(1);
    const T y0 = f[1], y1 = f[1] - T(1);
    const T z0 = f[2], z1 = f[2] - T(1);
    const T w0 = f[3], w1 = f[3] - T(1);

    const T u = fade(f[0]);
    const T v = fade(f[1]);
    const T s = fade(f[2]);
    const T t = fade(f[3]);

    // Trilinear blend of one w-layer of the hypercube
    auto layer = [&](int32_t wi, T wf) {
        const T n000 = grad4(classicHash(IVec4(X.lo, Y.lo, Z.lo, wi)), x0, y0, z0, wf);
        const T n100 = grad4(classicHash(IVec4(X.hi, Y.lo, Z.lo, wi)), x1, y0, z0, wf);
        const T n010 = grad4(classicHash(IVec4(X.lo, Y.hi, Z.lo, wi)), x0, y1, z0, wf);
        const T n110 = grad4(classicHash(IVec4(X.hi, Y.hi, Z.lo, wi)), x1, y1, z0, wf);
        const T n001 = grad4(classicHash(IVec4(X.lo, Y.lo, Z.hi, wi)), x0, y0, z1, wf);
        const T n101 = grad4(classicHash(IVec4(X.hi, Y.lo, Z.hi, wi)), x1, y0, z1, wf);
        const T n011 = grad4(classicHash(IVec4(X.lo, Y.hi, Z.hi, wi)), x0, y1, z1, wf);
        const T n111 = grad4(classicHash(IVec4(X.hi, Y.hi, Z.hi, wi)), x1, y1, z1, wf);

        const T nx00 = mix(n000, n100, u);
        const T nx10 = mix(n010, n110, u);
        const T nx01 = mix(n001, n101, u);
        const T nx11 = mix(n011, n111, u);
        return mix(mix(nx00, nx10, v), mix(nx01, nx11, v), s);
    };

    return kScale4<T> * mix(layer(W.lo, w0), layer(W.hi, w1), t);
}

}  // namespace

// ============================================================================
// Public entry points
// ============================================================================

template <Scalar T>
T classicNoise(T x) {
    return classic1(x, 0);
}

template <Scalar T>
T classicNoise(const Vector<2, T>& p) {
    return classic2(p, IVec2(0));
}

template <Scalar T>
T classicNoise(const Vector<3, T>& p) {
    return classic3(p, IVec3(0));
}

template <Scalar T>
T classicNoise(const Vector<4, T>& p) {
    return classic4(p, IVec4(0));
}

template <Scalar T>
T classicNoise(T x, int32_t period) {
    return classic1(x, period);
}

template <Scalar T>
T classicNoise(const Vector<2, T>& p, const IVec2& period) {
    return classic2(p, period);
}

template <Scalar T>
T classicNoise(const Vector<3, T>& p, const IVec3& period) {
    return classic3(p, period);
}

template <Scalar T>
T classicNoise(const Vector<4, T>& p, const IVec4& period) {
    return classic4(p, period);
}

// ============================================================================
// Explicit instantiations
// ============================================================================

#define SHADEKIT_INSTANTIATE_CLASSIC(T)                                         \
    template T classicNoise<T>(T);                                              \
    template T classicNoise<T>(const Vector<2, T>&);                            \
    template T classicNoise<T>(const Vector<3, T>&);                            \
    template T classicNoise<T>(const Vector<4, T>&);                            \
    template T classicNoise<T>(T, int32_t);                                     \
    template T classicNoise<T>(const Vector<2, T>&, const IVec2&);              \
    template T classicNoise<T>(const Vector<3, T>&, const IVec3&);              \
    template T classicNoise<T>(const Vector<4, T>&, const IVec4&);

SHADEKIT_INSTANTIATE_CLASSIC(float)
SHADEKIT_INSTANTIATE_CLASSIC(double)

#undef SHADEKIT_INSTANTIATE_CLASSIC

}  // namespace shadekit
