/**
 * @file matrix_functions.hpp
 * @brief Matrix built-ins: transpose, matrixCompMult, outerProduct,
 *        determinant, inverse, isInvertible
 *
 * inverse() follows the numeric style of the rest of the kernel: a singular
 * input divides by a zero determinant and propagates inf/NaN. tryInverse()
 * is the checked form and reports a (near) singular input as nullopt.
 */

#pragma once

#include "shadekit/matrix.hpp"

#include <optional>

namespace shadekit {

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<R, C, T> transpose(const Matrix<C, R, T>& m) {
    Matrix<R, C, T> result;
    for (std::size_t c = 0; c < C; ++c) {
        for (std::size_t r = 0; r < R; ++r) {
            result[r][c] = m[c][r];
        }
    }
    return result;
}

/// Componentwise product of two matrices of the same shape
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> matrixCompMult(const Matrix<C, R, T>& a, const Matrix<C, R, T>& b) {
    Matrix<C, R, T> result;
    for (std::size_t c = 0; c < C; ++c) result[c] = a[c] * b[c];
    return result;
}

/// col * row^T: an R-row, C-column matrix
template <std::size_t R, std::size_t C, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> outerProduct(const Vector<R, T>& col, const Vector<C, T>& row) {
    Matrix<C, R, T> result;
    for (std::size_t c = 0; c < C; ++c) result[c] = col * row[c];
    return result;
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr T trace(const Matrix<N, N, T>& m) {
    T s = T(0);
    for (std::size_t i = 0; i < N; ++i) s += m[i][i];
    return s;
}

// ============================================================================
// Determinant (cofactor expansion along the first row)
// ============================================================================

template <Scalar T>
[[nodiscard]] constexpr T determinant(const Matrix<2, 2, T>& m) {
    return m[0][0] * m[1][1] - m[1][0] * m[0][1];
}

template <Scalar T>
[[nodiscard]] constexpr T determinant(const Matrix<3, 3, T>& m) {
    return m[0][0] * (m[1][1] * m[2][2] - m[2][1] * m[1][2])
         - m[1][0] * (m[0][1] * m[2][2] - m[2][1] * m[0][2])
         + m[2][0] * (m[0][1] * m[1][2] - m[1][1] * m[0][2]);
}

template <Scalar T>
[[nodiscard]] constexpr T determinant(const Matrix<4, 4, T>& m) {
    // 2x2 minors of the lower two rows
    const T s0 = m[2][2] * m[3][3] - m[3][2] * m[2][3];
    const T s1 = m[1][2] * m[3][3] - m[3][2] * m[1][3];
    const T s2 = m[1][2] * m[2][3] - m[2][2] * m[1][3];
    const T s3 = m[0][2] * m[3][3] - m[3][2] * m[0][3];
    const T s4 = m[0][2] * m[2][3] - m[2][2] * m[0][3];
    const T s5 = m[0][2] * m[1][3] - m[1][2] * m[0][3];

    const T c0 = m[1][1] * s0 - m[2][1] * s1 + m[3][1] * s2;
    const T c1 = m[0][1] * s0 - m[2][1] * s3 + m[3][1] * s4;
    const T c2 = m[0][1] * s1 - m[1][1] * s3 + m[3][1] * s5;
    const T c3 = m[0][1] * s2 - m[1][1] * s4 + m[2][1] * s5;

    return m[0][0] * c0 - m[1][0] * c1 + m[2][0] * c2 - m[3][0] * c3;
}

// ============================================================================
// Inverse (adjugate / determinant)
// ============================================================================

template <Scalar T>
[[nodiscard]] constexpr Matrix<2, 2, T> inverse(const Matrix<2, 2, T>& m) {
    const T invDet = T(1) / determinant(m);
    return Matrix<2, 2, T>( m[1][1] * invDet, -m[0][1] * invDet,
                           -m[1][0] * invDet,  m[0][0] * invDet);
}

template <Scalar T>
[[nodiscard]] constexpr Matrix<3, 3, T> inverse(const Matrix<3, 3, T>& m) {
    const T invDet = T(1) / determinant(m);
    Matrix<3, 3, T> r;
    r[0][0] =  (m[1][1] * m[2][2] - m[2][1] * m[1][2]) * invDet;
    r[1][0] = -(m[1][0] * m[2][2] - m[2][0] * m[1][2]) * invDet;
    r[2][0] =  (m[1][0] * m[2][1] - m[2][0] * m[1][1]) * invDet;
    r[0][1] = -(m[0][1] * m[2][2] - m[2][1] * m[0][2]) * invDet;
    r[1][1] =  (m[0][0] * m[2][2] - m[2][0] * m[0][2]) * invDet;
    r[2][1] = -(m[0][0] * m[2][1] - m[2][0] * m[0][1]) * invDet;
    r[0][2] =  (m[0][1] * m[1][2] - m[1][1] * m[0][2]) * invDet;
    r[1][2] = -(m[0][0] * m[1][2] - m[1][0] * m[0][2]) * invDet;
    r[2][2] =  (m[0][0] * m[1][1] - m[1][0] * m[0][1]) * invDet;
    return r;
}

namespace detail {

/// 3x3 minor of m with column skipCol and row skipRow removed
template <Scalar T>
[[nodiscard]] constexpr T minor4(const Matrix<4, 4, T>& m, std::size_t skipCol, std::size_t skipRow) {
    Matrix<3, 3, T> sub;
    std::size_t dc = 0;
    for (std::size_t c = 0; c < 4; ++c) {
        if (c == skipCol) continue;
        std::size_t dr = 0;
        for (std::size_t r = 0; r < 4; ++r) {
            if (r == skipRow) continue;
            sub[dc][dr] = m[c][r];
            ++dr;
        }
        ++dc;
    }
    return determinant(sub);
}

}  // namespace detail

template <Scalar T>
[[nodiscard]] constexpr Matrix<4, 4, T> inverse(const Matrix<4, 4, T>& m) {
    const T invDet = T(1) / determinant(m);
    Matrix<4, 4, T> r;
    // inverse[c][r] = cofactor(row c, column r) / det, i.e. adjugate is the
    // transposed cofactor matrix
    for (std::size_t c = 0; c < 4; ++c) {
        for (std::size_t row = 0; row < 4; ++row) {
            T cof = detail::minor4(m, row, c);
            if ((c + row) & 1) cof = -cof;
            r[c][row] = cof * invDet;
        }
    }
    return r;
}

/// False when the determinant is within epsilon of zero
template <std::size_t N, Scalar T>
[[nodiscard]] inline bool isInvertible(const Matrix<N, N, T>& m) {
    return !isApproxEqual(determinant(m), T(0));
}

/// Checked inverse: nullopt when the matrix is not invertible
template <std::size_t N, Scalar T>
[[nodiscard]] inline std::optional<Matrix<N, N, T>> tryInverse(const Matrix<N, N, T>& m) {
    if (!isInvertible(m)) {
        return std::nullopt;
    }
    return inverse(m);
}

}  // namespace shadekit
