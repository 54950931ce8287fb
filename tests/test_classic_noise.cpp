/**
 * @file test_classic_noise.cpp
 * @brief Tests for classic Perlin noise and its periodic variant
 */

#include "shadekit/noise.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace shadekit;

namespace {

// Sample offsets avoid the lattice so the range checks see interior values
std::vector<double> sampleAxis(int count, double step, double offset) {
    std::vector<double> values;
    values.reserve(static_cast<std::size_t>(count));
    for (int k = 0; k < count; ++k) {
        values.push_back(offset + k * step);
    }
    return values;
}

}  // namespace

// ============================================================================
// Lattice and range
// ============================================================================

TEST(ClassicNoiseTest, ZeroOnIntegerLattice) {
    for (int i = -4; i <= 4; ++i) {
        EXPECT_EQ(classicNoise(static_cast<double>(i)), 0.0);
        for (int j = -4; j <= 4; ++j) {
            EXPECT_EQ(classicNoise(DVec2(i, j)), 0.0);
            EXPECT_EQ(classicNoise(Vec3(float(i), float(j), float(i - j))), 0.0f);
            EXPECT_EQ(classicNoise(DVec4(i, j, -i, 2 * j)), 0.0);
        }
    }
}

TEST(ClassicNoiseTest, ZeroOnLatticeWithPeriod) {
    EXPECT_EQ(classicNoise(DVec2(3.0, -7.0), IVec2(4, 5)), 0.0);
    EXPECT_EQ(classicNoise(DVec3(1.0, 2.0, 300.0), IVec3(2, 0, 7)), 0.0);
}

TEST(ClassicNoiseTest, KnownValues) {
    EXPECT_NEAR(classicNoise(DVec2(0.5, 0.5)), -0.10355339059327379, 1e-12);
    EXPECT_NEAR(classicNoise(DVec2(0.5, 0.6)), -0.06227339059327381, 1e-12);
}

TEST(ClassicNoiseTest, Range1D) {
    double maxAbs = 0.0;
    for (double x : sampleAxis(20000, 0.0173, -150.3)) {
        maxAbs = std::max(maxAbs, std::abs(classicNoise(x)));
    }
    EXPECT_LE(maxAbs, 1.0 + 1e-5);
    EXPECT_GT(maxAbs, 0.9);
}

TEST(ClassicNoiseTest, Range2D) {
    double maxAbs = 0.0;
    for (double x : sampleAxis(150, 0.137, -10.1)) {
        for (double y : sampleAxis(150, 0.129, -9.7)) {
            maxAbs = std::max(maxAbs, std::abs(classicNoise(DVec2(x, y))));
        }
    }
    EXPECT_LE(maxAbs, 1.0 + 1e-5);
    EXPECT_GT(maxAbs, 0.8);
}

TEST(ClassicNoiseTest, Range3D) {
    double maxAbs = 0.0;
    for (double x : sampleAxis(36, 0.173, -3.1)) {
        for (double y : sampleAxis(36, 0.181, -2.9)) {
            for (double z : sampleAxis(36, 0.167, -3.3)) {
                maxAbs = std::max(maxAbs, std::abs(classicNoise(DVec3(x, y, z))));
            }
        }
    }
    EXPECT_LE(maxAbs, 1.0 + 1e-5);
    EXPECT_GT(maxAbs, 0.8);
}

TEST(ClassicNoiseTest, Range4D) {
    double maxAbs = 0.0;
    for (double x : sampleAxis(14, 0.31, -2.1)) {
        for (double y : sampleAxis(14, 0.29, -1.9)) {
            for (double z : sampleAxis(14, 0.33, -2.3)) {
                for (double w : sampleAxis(14, 0.27, -1.7)) {
                    maxAbs = std::max(maxAbs, std::abs(classicNoise(DVec4(x, y, z, w))));
                }
            }
        }
    }
    EXPECT_LE(maxAbs, 1.0 + 1e-5);
    EXPECT_GT(maxAbs, 0.5);
}

TEST(ClassicNoiseTest, HalfwayIn1DReachesOne) {
    // Gradients of opposite sign and unit magnitude meet at the cell center
    double best = 0.0;
    for (int i = -300; i < 300; ++i) {
        best = std::max(best, std::abs(classicNoise(i + 0.5)));
    }
    EXPECT_LE(best, 1.0 + 1e-12);
}

// ============================================================================
// Purity and smoothness
// ============================================================================

TEST(ClassicNoiseTest, Deterministic) {
    Vec3 p(12.34f, -5.67f, 0.89f);
    EXPECT_EQ(classicNoise(p), classicNoise(p));
    EXPECT_EQ(classicNoise(DVec4(0.1, 0.2, 0.3, 0.4)), classicNoise(DVec4(0.1, 0.2, 0.3, 0.4)));
}

TEST(ClassicNoiseTest, Continuous) {
    for (double x : sampleAxis(200, 0.0531, -5.0)) {
        DVec3 p(x, 0.37 * x, 1.3 - x);
        EXPECT_LT(std::abs(classicNoise(p) - classicNoise(p + 1e-4)), 1e-2);
    }
}

TEST(ClassicNoiseTest, FloatAndDoubleAgree) {
    for (double x : sampleAxis(100, 0.173, -7.9)) {
        DVec3 p(x, x * 0.5 + 0.3, -x);
        EXPECT_NEAR(classicNoise(Vec3(p)), classicNoise(p), 1e-4);
        DVec2 q(x, 2.1 - x);
        EXPECT_NEAR(classicNoise(Vec2(q)), classicNoise(q), 1e-4);
    }
}

TEST(ClassicNoiseTest, NegativeCoordinatesAreNotMirrored) {
    // Folding negative cells must not reflect the lattice around zero
    int differing = 0;
    for (double x : sampleAxis(50, 0.21, 0.05)) {
        if (std::abs(classicNoise(DVec2(x, 0.3)) - classicNoise(DVec2(-x, 0.3))) > 1e-6) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 40);
}

TEST(ClassicNoiseTest, CoordinatesPastInt32RangeRepeatEvery256) {
    // 3e9 = 256 * 11718750; the cell is reduced before it is converted
    EXPECT_EQ(classicNoise(DVec2(3.0e9 + 0.5, 0.25)), classicNoise(DVec2(0.5, 0.25)));
    EXPECT_EQ(classicNoise(DVec2(-3.0e9 + 0.5, 0.25)), classicNoise(DVec2(0.5, 0.25)));
    EXPECT_EQ(classicNoise(3.0e9 + 0.375), classicNoise(0.375));
    EXPECT_EQ(classicNoise(DVec4(0.5, 3.0e9 + 0.25, -3.0e9 + 0.75, 1.5)),
              classicNoise(DVec4(0.5, 0.25, 0.75, 1.5)));
}

// ============================================================================
// Periodic variant
// ============================================================================

TEST(ClassicNoiseTest, ZeroPeriodMatchesPlain) {
    DVec4 p(0.3, -1.7, 2.2, 5.9);
    EXPECT_EQ(classicNoise(p.x(), 0), classicNoise(p.x()));
    EXPECT_EQ(classicNoise(DVec2(p.x(), p.y()), IVec2(0)), classicNoise(DVec2(p.x(), p.y())));
    EXPECT_EQ(classicNoise(DVec3(p.x(), p.y(), p.z()), IVec3(0)),
              classicNoise(DVec3(p.x(), p.y(), p.z())));
    EXPECT_EQ(classicNoise(p, IVec4(0)), classicNoise(p));
}

TEST(ClassicNoiseTest, Periodic1D) {
    for (double x : sampleAxis(100, 0.097, -4.0)) {
        EXPECT_NEAR(classicNoise(x + 7.0, 7), classicNoise(x, 7), 1e-12);
        EXPECT_NEAR(classicNoise(x - 14.0, 7), classicNoise(x, 7), 1e-12);
    }
}

TEST(ClassicNoiseTest, Periodic2D) {
    const IVec2 period(3, 5);
    for (double x : sampleAxis(20, 0.173, -1.3)) {
        for (double y : sampleAxis(20, 0.211, -2.0)) {
            DVec2 p(x, y);
            double base = classicNoise(p, period);
            EXPECT_NEAR(classicNoise(p + DVec2(3.0, 0.0), period), base, 1e-9);
            EXPECT_NEAR(classicNoise(p + DVec2(0.0, -5.0), period), base, 1e-9);
            EXPECT_NEAR(classicNoise(p + DVec2(-6.0, 10.0), period), base, 1e-9);
        }
    }
}

TEST(ClassicNoiseTest, Periodic3D) {
    const IVec3 period(2, 3, 5);
    for (double t : sampleAxis(300, 0.0419, -6.0)) {
        DVec3 p(t, 0.7 * t + 0.11, 1.9 - 0.3 * t);
        double base = classicNoise(p, period);
        EXPECT_NEAR(classicNoise(p + DVec3(2.0, 3.0, 5.0), period), base, 1e-9);
        EXPECT_NEAR(classicNoise(p + DVec3(-4.0, 0.0, 10.0), period), base, 1e-9);
    }
}

TEST(ClassicNoiseTest, Periodic4DInFloat) {
    const IVec4 period(2, 3, 4, 5);
    for (double t : sampleAxis(200, 0.0613, -5.0)) {
        Vec4 p(float(t), float(0.5 * t + 0.2), float(-t), float(0.25 * t - 1.1));
        float base = classicNoise(p, period);
        EXPECT_NEAR(classicNoise(p + Vec4(2.0f, 3.0f, 4.0f, 5.0f), period), base, 1e-4f);
    }
}

TEST(ClassicNoiseTest, PartialPeriodLeavesOtherAxesFree) {
    const IVec2 period(4, 0);
    DVec2 p(0.37, 0.61);
    EXPECT_NEAR(classicNoise(p + DVec2(4.0, 0.0), period), classicNoise(p, period), 1e-12);

    int differing = 0;
    for (int k = 1; k <= 8; ++k) {
        double shifted = classicNoise(p + DVec2(0.0, 4.0 * k), period);
        if (std::abs(shifted - classicNoise(p, period)) > 1e-6) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 0);
}

TEST(ClassicNoiseTest, PeriodicPastInt32Range) {
    // 3e9 mod 7 = 4 and -3e9 mod 7 = 3
    EXPECT_EQ(classicNoise(DVec2(3.0e9 + 0.5, 0.25), IVec2(7, 0)),
              classicNoise(DVec2(4.5, 0.25), IVec2(7, 0)));
    EXPECT_EQ(classicNoise(-3.0e9 + 0.5, 7), classicNoise(3.5, 7));
}

TEST(ClassicNoiseTest, UnitPeriodIsStillBounded) {
    for (double x : sampleAxis(40, 0.113, -2.0)) {
        double n = classicNoise(DVec2(x, 0.5 * x), IVec2(1, 1));
        EXPECT_LE(std::abs(n), 1.0 + 1e-5);
        EXPECT_NEAR(classicNoise(DVec2(x + 1.0, 0.5 * x - 3.0), IVec2(1, 1)), n, 1e-12);
    }
}
