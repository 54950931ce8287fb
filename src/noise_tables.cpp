/**
 * @file noise_tables.cpp
 * @brief Constant-initialized permutation and gradient tables
 *
 * The simplex gradient sets follow the construction used by the GLSL
 * reference noise (Gustavson / McEwan): points on a regular grid folded onto
 * the surface of a cross-polytope, then normalized with the first-order
 * Taylor approximation of 1/sqrt(r).
 */

#include "shadekit/noise_tables.hpp"

#include <numbers>

namespace shadekit::tables {

namespace {

constexpr double floorConst(double x) {
    auto i = static_cast<long long>(x);
    return (static_cast<double>(i) > x) ? static_cast<double>(i - 1) : static_cast<double>(i);
}

constexpr double absConst(double x) {
    return x < 0.0 ? -x : x;
}

constexpr int32_t absConst(int32_t x) {
    return x < 0 ? -x : x;
}

/// 1.79284291400159 - 0.85373472095314 * r, approximately 1/sqrt(r) near r = 0.7
constexpr double taylorInvSqrt(double r) {
    return 1.79284291400159 - 0.85373472095314 * r;
}

constexpr std::array<uint8_t, PERLIN_SIZE> kPerlinBase = {
    151, 160, 137,  91,  90,  15, 131,  13, 201,  95,  96,  53, 194, 233,   7, 225,
    140,  36, 103,  30,  69, 142,   8,  99,  37, 240,  21,  10,  23, 190,   6, 148,
    247, 120, 234,  75,   0,  26, 197,  62,  94, 252, 219, 203, 117,  35,  11,  32,
     57, 177,  33,  88, 237, 149,  56,  87, 174,  20, 125, 136, 171, 168,  68, 175,
     74, 165,  71, 134, 139,  48,  27, 166,  77, 146, 158, 231,  83, 111, 229, 122,
     60, 211, 133, 230, 220, 105,  92,  41,  55,  46, 245,  40, 244, 102, 143,  54,
     65,  25,  63, 161,   1, 216,  80,  73, 209,  76, 132, 187, 208,  89,  18, 169,
    200, 196, 135, 130, 116, 188, 159,  86, 164, 100, 109, 198, 173, 186,   3,  64,
     52, 217, 226, 250, 124, 123,   5, 202,  38, 147, 118, 126, 255,  82,  85, 212,
    207, 206,  59, 227,  47,  16,  58,  17, 182, 189,  28,  42, 223, 183, 170, 213,
    119, 248, 152,   2,  44, 154, 163,  70, 221, 153, 101, 155, 167,  43, 172,   9,
    129,  22,  39, 253,  19,  98, 108, 110,  79, 113, 224, 232, 178, 185, 112, 104,
    218, 246,  97, 228, 251,  34, 242, 193, 238, 210, 144,  12, 191, 179, 162, 241,
     81,  51, 145, 235, 249,  14, 239, 107,  49, 192, 214,  31, 181, 199, 106, 157,
    184,  84, 204, 176, 115, 121,  50,  45, 127,   4, 150, 254, 138, 236, 205,  93,
    222, 114,  67,  29,  24,  72, 243, 141, 128, 195,  78,  66, 215,  61, 156, 180,
};

constexpr std::array<uint8_t, 2 * PERLIN_SIZE> buildPerlinPermutation() {
    std::array<uint8_t, 2 * PERLIN_SIZE> perm{};
    for (std::size_t i = 0; i < perm.size(); ++i) {
        perm[i] = kPerlinBase[i % PERLIN_SIZE];
    }
    return perm;
}

constexpr std::array<int16_t, SIMPLEX_RING> buildSimplexPermutation() {
    std::array<int16_t, SIMPLEX_RING> perm{};
    for (int32_t i = 0; i < SIMPLEX_RING; ++i) {
        perm[static_cast<std::size_t>(i)] = static_cast<int16_t>(((34 * i + 1) * i) % SIMPLEX_RING);
    }
    return perm;
}

// ============================================================================
// Classic gradient sets
// ============================================================================

constexpr double kInvSqrt2 = 1.0 / std::numbers::sqrt2;

constexpr std::array<double, CLASSIC_GRAD1_COUNT> buildClassicGrad1() {
    // 1, -1, 2, -2, ... 8, -8, scaled into [-1, 1]
    std::array<double, CLASSIC_GRAD1_COUNT> g{};
    for (std::size_t i = 0; i < g.size(); ++i) {
        double magnitude = static_cast<double>(i / 2 + 1) / 8.0;
        g[i] = (i & 1) ? -magnitude : magnitude;
    }
    return g;
}

constexpr std::array<DVec2, CLASSIC_GRAD2_COUNT> kClassicGrad2Data = {{
    { 1.0,  0.0}, {-1.0,  0.0}, { 0.0,  1.0}, { 0.0, -1.0},
    { kInvSqrt2,  kInvSqrt2}, {-kInvSqrt2,  kInvSqrt2},
    { kInvSqrt2, -kInvSqrt2}, {-kInvSqrt2, -kInvSqrt2},
}};

constexpr std::array<DVec3, CLASSIC_GRAD3_COUNT> buildClassicGrad3() {
    // The twelve cube edge midpoints, padded to 16 with a repeated tetrahedron
    constexpr std::array<std::array<double, 3>, CLASSIC_GRAD3_COUNT> edges = {{
        { 1,  1,  0}, {-1,  1,  0}, { 1, -1,  0}, {-1, -1,  0},
        { 1,  0,  1}, {-1,  0,  1}, { 1,  0, -1}, {-1,  0, -1},
        { 0,  1,  1}, { 0, -1,  1}, { 0,  1, -1}, { 0, -1, -1},
        { 1,  1,  0}, {-1,  1,  0}, { 0, -1,  1}, { 0, -1, -1},
    }};
    std::array<DVec3, CLASSIC_GRAD3_COUNT> g{};
    for (std::size_t i = 0; i < g.size(); ++i) {
        g[i] = DVec3(edges[i][0], edges[i][1], edges[i][2]) * kInvSqrt2;
    }
    return g;
}

constexpr std::array<DVec4, CLASSIC_GRAD4_COUNT> buildClassicGrad4() {
    // Edge midpoints of the tesseract: one zero component, three of +-1
    constexpr double scale = std::numbers::inv_sqrt3;
    std::array<DVec4, CLASSIC_GRAD4_COUNT> g{};
    std::size_t n = 0;
    for (std::size_t zero = 0; zero < 4; ++zero) {
        for (int sx = 0; sx < 2; ++sx) {
            for (int sy = 0; sy < 2; ++sy) {
                for (int sz = 0; sz < 2; ++sz) {
                    const std::array<double, 3> signs = {sx ? -1.0 : 1.0, sy ? -1.0 : 1.0,
                                                         sz ? -1.0 : 1.0};
                    DVec4 v;
                    std::size_t k = 0;
                    for (std::size_t c = 0; c < 4; ++c) {
                        v[c] = (c == zero) ? 0.0 : signs[k++] * scale;
                    }
                    g[n++] = v;
                }
            }
        }
    }
    return g;
}

// ============================================================================
// Simplex gradient sets
// ============================================================================

constexpr std::array<DVec2, SIMPLEX_GRAD2_COUNT> buildSimplexGrad2() {
    // 41 points on [-1, 1) folded onto a diamond
    std::array<DVec2, SIMPLEX_GRAD2_COUNT> g{};
    for (std::size_t i = 0; i < g.size(); ++i) {
        double x = 2.0 * static_cast<double>(i) / 41.0 - 1.0;
        double h = absConst(x) - 0.5;
        double a0 = x - floorConst(x + 0.5);
        g[i] = DVec2(a0, h) * taylorInvSqrt(a0 * a0 + h * h);
    }
    return g;
}

constexpr std::array<DVec3, SIMPLEX_GRAD3_COUNT> buildSimplexGrad3() {
    // 7x7 grid on a plane folded onto an octahedron. Grid points sit at
    // (4k - 13) / 14; the fold runs on those numerators so that points on
    // the diamond edge (h exactly 0) fold like every point outside it.
    std::array<DVec3, SIMPLEX_GRAD3_COUNT> g{};
    for (std::size_t j = 0; j < g.size(); ++j) {
        int32_t xn = 4 * static_cast<int32_t>(j / 7) - 13;
        int32_t yn = 4 * static_cast<int32_t>(j % 7) - 13;
        const int32_t hn = 14 - absConst(xn) - absConst(yn);
        if (hn <= 0) {
            xn -= (xn >= 0) ? 14 : -14;
            yn -= (yn >= 0) ? 14 : -14;
        }
        const double x = xn / 14.0;
        const double y = yn / 14.0;
        const double h = hn / 14.0;
        g[j] = DVec3(x, y, h) * taylorInvSqrt(x * x + y * y + h * h);
    }
    return g;
}

constexpr std::array<DVec4, SIMPLEX_GRAD4_COUNT> buildSimplexGrad4() {
    // 7x7x6 grid folded onto a 4D cross-polytope. xyz are sevenths and w is
    // in fourteenths, folded on the integer numerators like the 3D set.
    std::array<DVec4, SIMPLEX_GRAD4_COUNT> g{};
    for (std::size_t j = 0; j < g.size(); ++j) {
        int32_t xn = static_cast<int32_t>(j / 42) - 7;
        int32_t yn = static_cast<int32_t>((j % 49) / 7) - 7;
        int32_t zn = static_cast<int32_t>(j % 7) - 7;
        const int32_t wn = 21 - 2 * (absConst(xn) + absConst(yn) + absConst(zn));
        if (wn < 0) {
            xn += (xn < 0) ? 7 : -7;
            yn += (yn < 0) ? 7 : -7;
            zn += (zn < 0) ? 7 : -7;
        }
        const double px = xn / 7.0;
        const double py = yn / 7.0;
        const double pz = zn / 7.0;
        const double pw = wn / 14.0;
        g[j] = DVec4(px, py, pz, pw) * taylorInvSqrt(px * px + py * py + pz * pz + pw * pw);
    }
    return g;
}

}  // namespace

constinit const std::array<uint8_t, 2 * PERLIN_SIZE> kPerlinPermutation = buildPerlinPermutation();
constinit const std::array<int16_t, SIMPLEX_RING> kSimplexPermutation = buildSimplexPermutation();

constinit const std::array<double, CLASSIC_GRAD1_COUNT> kClassicGrad1 = buildClassicGrad1();
constinit const std::array<DVec2, CLASSIC_GRAD2_COUNT> kClassicGrad2 = kClassicGrad2Data;
constinit const std::array<DVec3, CLASSIC_GRAD3_COUNT> kClassicGrad3 = buildClassicGrad3();
constinit const std::array<DVec4, CLASSIC_GRAD4_COUNT> kClassicGrad4 = buildClassicGrad4();

constinit const std::array<DVec2, SIMPLEX_GRAD2_COUNT> kSimplexGrad2 = buildSimplexGrad2();
constinit const std::array<DVec3, SIMPLEX_GRAD3_COUNT> kSimplexGrad3 = buildSimplexGrad3();
constinit const std::array<DVec4, SIMPLEX_GRAD4_COUNT> kSimplexGrad4 = buildSimplexGrad4();

}  // namespace shadekit::tables
