/**
 * @file test_matrix.cpp
 * @brief Unit tests for matrices and the matrix built-ins
 */

#include "shadekit/matrix.hpp"
#include "shadekit/matrix_functions.hpp"
#include "shadekit/transform.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

using namespace shadekit;

namespace {

const DMat4 kSample4(1.0, 0.0, 4.0, 0.0,
                     2.0, 1.0, 2.0, 1.0,
                     3.0, 2.0, 3.0, 1.0,
                     4.0, 3.0, 0.0, 0.0);

}  // namespace

// ============================================================================
// Construction and access
// ============================================================================

TEST(MatrixTest, ScalarConstructorIsColumnMajor) {
    Mat2 m(1.0f, 2.0f, 3.0f, 4.0f);
    EXPECT_EQ(m[0], Vec2(1.0f, 2.0f));
    EXPECT_EQ(m[1], Vec2(3.0f, 4.0f));
    EXPECT_EQ(m.row(0), Vec2(1.0f, 3.0f));
}

TEST(MatrixTest, ColumnConstructor) {
    Mat3x2 m(Vec2(1.0f, 2.0f), Vec2(3.0f, 4.0f), Vec2(5.0f, 6.0f));
    EXPECT_EQ(Mat3x2::columns(), 3u);
    EXPECT_EQ(Mat3x2::rows(), 2u);
    EXPECT_EQ(m.row(1), Vec3(2.0f, 4.0f, 6.0f));
}

TEST(MatrixTest, IdentityAndZero) {
    Mat3 id = Mat3::identity();
    for (std::size_t c = 0; c < 3; ++c) {
        for (std::size_t r = 0; r < 3; ++r) {
            EXPECT_FLOAT_EQ(id[c][r], c == r ? 1.0f : 0.0f);
        }
    }
    EXPECT_EQ(Mat2x4::zero()[1], Vec4(0.0f));

    // Non-square identity has ones on the leading diagonal only
    Mat2x3 rect = Mat2x3::identity();
    EXPECT_EQ(rect[0], Vec3(1.0f, 0.0f, 0.0f));
    EXPECT_EQ(rect[1], Vec3(0.0f, 1.0f, 0.0f));
}

TEST(MatrixTest, CheckedColumnAccessThrows) {
    Mat4x3 m;
    EXPECT_NO_THROW((void)m.at(3));
    EXPECT_THROW((void)m.at(4), std::out_of_range);
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(MatrixTest, MatrixVectorProduct) {
    // Columns are the images of the basis vectors
    Mat3x2 m(Vec2(1.0f, 0.0f), Vec2(0.0f, 1.0f), Vec2(2.0f, 3.0f));
    EXPECT_EQ(m * Vec3(1.0f, 1.0f, 1.0f), Vec2(3.0f, 4.0f));
}

TEST(MatrixTest, RowVectorProduct) {
    Mat2 m(1.0f, 2.0f, 3.0f, 4.0f);
    // v^T M: dot with each column
    EXPECT_EQ(Vec2(1.0f, 1.0f) * m, Vec2(3.0f, 7.0f));
}

TEST(MatrixTest, ProductShapes) {
    Mat2x3 a(1.0f, 2.0f, 3.0f,
             4.0f, 5.0f, 6.0f);
    Mat3x2 b(1.0f, 0.0f,
             0.0f, 1.0f,
             1.0f, 1.0f);

    Mat3 ab = a * b;
    EXPECT_EQ(ab[0], Vec3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(ab[1], Vec3(4.0f, 5.0f, 6.0f));
    EXPECT_EQ(ab[2], Vec3(5.0f, 7.0f, 9.0f));

    Mat2 ba = b * a;
    EXPECT_EQ(ba[0], Vec2(4.0f, 5.0f));
    EXPECT_EQ(ba[1], Vec2(10.0f, 11.0f));
}

TEST(MatrixTest, ProductComposesMaps) {
    DMat3 a(2.0, 0.0, 1.0, -1.0, 3.0, 0.5, 0.0, 4.0, 1.0);
    DMat3 b(1.0, 1.0, 0.0, 0.0, 2.0, -3.0, 5.0, 0.0, 1.0);
    DVec3 v(0.5, -1.5, 2.0);
    EXPECT_TRUE(isCloseTo((a * b) * v, a * (b * v), 1e-12));
}

TEST(MatrixTest, AddSubtractScale) {
    Mat2 a(1.0f, 2.0f, 3.0f, 4.0f);
    Mat2 b = Mat2::identity();
    EXPECT_EQ(a + b, Mat2(2.0f, 2.0f, 3.0f, 5.0f));
    EXPECT_EQ(a - a, Mat2::zero());
    EXPECT_EQ(2.0f * a, a + a);
    EXPECT_EQ(-a, a * -1.0f);
}

// ============================================================================
// Built-ins
// ============================================================================

TEST(MatrixFunctionTest, Transpose) {
    Mat3x2 m(1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f);
    Mat2x3 t = transpose(m);
    EXPECT_EQ(t[0], Vec3(1.0f, 3.0f, 5.0f));
    EXPECT_EQ(t[1], Vec3(2.0f, 4.0f, 6.0f));
    EXPECT_EQ(transpose(t), m);
}

TEST(MatrixFunctionTest, MatrixCompMult) {
    Mat2 a(1.0f, 2.0f, 3.0f, 4.0f);
    Mat2 b(2.0f, 0.5f, -1.0f, 0.0f);
    EXPECT_EQ(matrixCompMult(a, b), Mat2(2.0f, 1.0f, -3.0f, 0.0f));
}

TEST(MatrixFunctionTest, OuterProduct) {
    Mat2x3 m = outerProduct(Vec3(1.0f, 2.0f, 3.0f), Vec2(10.0f, 20.0f));
    EXPECT_EQ(m[0], Vec3(10.0f, 20.0f, 30.0f));
    EXPECT_EQ(m[1], Vec3(20.0f, 40.0f, 60.0f));
}

TEST(MatrixFunctionTest, Trace) {
    EXPECT_DOUBLE_EQ(trace(kSample4), 1.0 + 1.0 + 3.0 + 0.0);
}

TEST(MatrixFunctionTest, Determinant) {
    EXPECT_FLOAT_EQ(determinant(Mat2(4.0f, 5.0f, 6.0f, 7.0f)), -2.0f);
    EXPECT_FLOAT_EQ(determinant(Mat3::identity()), 1.0f);
    EXPECT_DOUBLE_EQ(determinant(kSample4), -7.0);
    EXPECT_DOUBLE_EQ(determinant(kSample4 * kSample4), 49.0);
    EXPECT_DOUBLE_EQ(determinant(DMat4::identity()), 1.0);
}

TEST(MatrixFunctionTest, DeterminantOfTransposeMatches) {
    DMat3 m(5.0, 7.0, 11.0, -6.0, 9.0, 2.0, 1.0, 13.0, 0.0);
    EXPECT_NEAR(determinant(transpose(m)), determinant(m), 1e-9);
    EXPECT_NEAR(determinant(transpose(kSample4)), determinant(kSample4), 1e-12);
}

TEST(MatrixFunctionTest, Inverse2) {
    Mat2 m(1.0f, 3.0f, 2.0f, 4.0f);
    Mat2 inv = inverse(m);
    EXPECT_TRUE(isCloseTo(m * inv, Mat2::identity(), 1e-6f));
    EXPECT_TRUE(isCloseTo(inv * m, Mat2::identity(), 1e-6f));
}

TEST(MatrixFunctionTest, Inverse3) {
    DMat3 m(5.0, 7.0, 11.0, -6.0, 9.0, 2.0, 1.0, 13.0, 0.0);
    DMat3 inv = inverse(m);
    EXPECT_TRUE(isCloseTo(m * inv, DMat3::identity(), 1e-12));
    EXPECT_TRUE(isCloseTo(inv * m, DMat3::identity(), 1e-12));
    EXPECT_EQ(inverse(DMat3::identity()), DMat3::identity());
}

TEST(MatrixFunctionTest, Inverse4KnownValues) {
    const DMat4 expected(3.0 / 7.0, 12.0 / 7.0, -12.0 / 7.0, 4.0 / 7.0,
                         -4.0 / 7.0, -16.0 / 7.0, 16.0 / 7.0, -3.0 / 7.0,
                         1.0 / 7.0, -3.0 / 7.0, 3.0 / 7.0, -1.0 / 7.0,
                         -4.0 / 7.0, 5.0 / 7.0, 2.0 / 7.0, -3.0 / 7.0);
    DMat4 inv = inverse(kSample4);
    EXPECT_TRUE(isCloseTo(inv, expected, 1e-12));
    EXPECT_TRUE(isCloseTo(inverse(inv), kSample4, 1e-12));
}

TEST(MatrixFunctionTest, InverseTimesMatrixIsIdentity) {
    Mat4 m(2.0f, 0.5f, 0.0f, 1.0f,
           -1.0f, 3.0f, 0.25f, 0.0f,
           0.0f, 1.0f, 4.0f, -2.0f,
           1.5f, 0.0f, 1.0f, 1.0f);
    EXPECT_TRUE(isCloseTo(m * inverse(m), Mat4::identity(), 1e-5f));
}

TEST(MatrixFunctionTest, SingularInversePropagatesNonFinite) {
    Mat2 singular(1.0f, 2.0f, 2.0f, 4.0f);
    Mat2 inv = inverse(singular);
    EXPECT_FALSE(std::isfinite(inv[0][0]));
}

TEST(MatrixFunctionTest, IsInvertible) {
    EXPECT_TRUE(isInvertible(kSample4));
    EXPECT_TRUE(isInvertible(Mat2::identity()));
    EXPECT_FALSE(isInvertible(Mat2(1.0f, 2.0f, 2.0f, 4.0f)));
    EXPECT_FALSE(isInvertible(DMat3::zero()));
}

TEST(MatrixFunctionTest, TryInverseRejectsSingular) {
    EXPECT_FALSE(tryInverse(Mat2(1.0f, 2.0f, 2.0f, 4.0f)).has_value());
    EXPECT_FALSE(tryInverse(DMat3::zero()).has_value());

    auto inv = tryInverse(kSample4);
    ASSERT_TRUE(inv.has_value());
    EXPECT_TRUE(isCloseTo(*inv * kSample4, DMat4::identity(), 1e-12));
}

// ============================================================================
// Transforms
// ============================================================================

namespace {

const double kPi = std::acos(-1.0);

DVec3 transformPoint(const DMat4& m, const DVec3& p) {
    DVec4 r = m * DVec4(p[0], p[1], p[2], 1.0);
    return DVec3(r[0], r[1], r[2]) / r[3];
}

}  // namespace

TEST(TransformTest, TranslateSetsLastColumn) {
    DMat4 m = translate(DMat4::identity(), DVec3(1.0, 3.0, 2.0));
    EXPECT_EQ(m[3], DVec4(1.0, 3.0, 2.0, 1.0));
    EXPECT_EQ(m[0], DVec4(1.0, 0.0, 0.0, 0.0));
    EXPECT_EQ(transformPoint(m, DVec3(1.0, 1.0, 1.0)), DVec3(2.0, 4.0, 3.0));
}

TEST(TransformTest, TranslateComposesWithExistingMatrix) {
    DMat4 scale(2.0);
    scale[3][3] = 1.0;
    DMat4 m = translate(scale, DVec3(1.0, -1.0, 0.5));
    // Translation is applied before the existing scale
    EXPECT_EQ(m[3], DVec4(2.0, -2.0, 1.0, 1.0));
    EXPECT_TRUE(isApproxEqual(m, scale * translate(DMat4::identity(), DVec3(1.0, -1.0, 0.5))));
}

TEST(TransformTest, RotateQuarterTurnAboutZ) {
    DMat4 m = rotate(DMat4::identity(), kPi / 2.0, DVec3(0.0, 0.0, 1.0));
    EXPECT_TRUE(isCloseTo(transformPoint(m, DVec3(1.0, 0.0, 0.0)), DVec3(0.0, 1.0, 0.0), 1e-15));
    EXPECT_TRUE(isCloseTo(transformPoint(m, DVec3(0.0, 1.0, 0.0)), DVec3(-1.0, 0.0, 0.0), 1e-15));
    EXPECT_EQ(m[3], DVec4(0.0, 0.0, 0.0, 1.0));
}

TEST(TransformTest, RotateNormalizesAxis) {
    DMat4 a = rotate(DMat4::identity(), 0.7, DVec3(1.0, 2.0, 2.0));
    DMat4 b = rotate(DMat4::identity(), 0.7, DVec3(1.0, 2.0, 2.0) / 3.0);
    EXPECT_TRUE(isCloseTo(a, b, 1e-15));
    // Rotations preserve length and have unit determinant
    EXPECT_NEAR(length(transformPoint(a, DVec3(3.0, -1.0, 2.0))), length(DVec3(3.0, -1.0, 2.0)), 1e-12);
    EXPECT_NEAR(determinant(a), 1.0, 1e-12);
}

TEST(TransformTest, RotateKeepsTranslation) {
    DMat4 t = translate(DMat4::identity(), DVec3(5.0, 0.0, 0.0));
    DMat4 m = rotate(t, kPi, DVec3(0.0, 1.0, 0.0));
    EXPECT_EQ(m[3], t[3]);
    EXPECT_TRUE(isCloseTo(transformPoint(m, DVec3(1.0, 0.0, 0.0)), DVec3(4.0, 0.0, 0.0), 1e-15));
}

TEST(TransformTest, PerspectiveEntries) {
    DMat4 p = perspective(kPi / 2.0, 2.0, 1.0, 10.0);
    EXPECT_NEAR(p[0][0], 0.5, 1e-15);
    EXPECT_NEAR(p[1][1], 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(p[2][2], -11.0 / 9.0);
    EXPECT_DOUBLE_EQ(p[2][3], -1.0);
    EXPECT_DOUBLE_EQ(p[3][2], -20.0 / 9.0);
    EXPECT_EQ(p[3][3], 0.0);
}

TEST(TransformTest, PerspectiveMapsClipPlanesToUnitDepth) {
    DMat4 p = perspective(1.0, 1.5, 0.5, 100.0);
    EXPECT_NEAR(transformPoint(p, DVec3(0.0, 0.0, -0.5))[2], -1.0, 1e-12);
    EXPECT_NEAR(transformPoint(p, DVec3(0.0, 0.0, -100.0))[2], 1.0, 1e-12);
}

TEST(TransformTest, LookAtPlacesTargetOnNegativeZ) {
    DVec3 eye(3.0, 2.0, 4.0);
    DVec3 center(0.0, 1.0, 0.0);
    DMat4 v = lookAt(eye, center, DVec3(0.0, 1.0, 0.0));

    EXPECT_TRUE(isCloseTo(transformPoint(v, eye), DVec3::zero(), 1e-12));
    EXPECT_TRUE(isCloseTo(transformPoint(v, center), DVec3(0.0, 0.0, -distance(eye, center)), 1e-12));
    EXPECT_NEAR(determinant(v), 1.0, 1e-12);
}

TEST(TransformTest, LookAtAlongNegativeZIsTranslation) {
    DMat4 v = lookAt(DVec3(0.0, 0.0, 5.0), DVec3::zero(), DVec3(0.0, 1.0, 0.0));
    EXPECT_TRUE(isCloseTo(v, translate(DMat4::identity(), DVec3(0.0, 0.0, -5.0)), 1e-15));
}
