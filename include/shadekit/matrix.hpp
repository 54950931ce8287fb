/**
 * @file matrix.hpp
 * @brief Column-major C x R matrices (2..4 columns, 2..4 rows)
 *
 * Matrix<C, R, T> stores C column vectors of length R and maps R^C to R^R.
 * Naming follows GLSL: Mat3x2 has 3 columns and 2 rows. Shape mismatches in
 * multiplication are compile errors.
 */

#pragma once

#include "shadekit/geometric.hpp"
#include "shadekit/vector.hpp"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace shadekit {

template <std::size_t C, std::size_t R, Scalar T>
    requires (C >= 2 && C <= 4 && R >= 2 && R <= 4)
class Matrix {
public:
    using value_type = T;
    using Column = Vector<R, T>;
    using Row = Vector<C, T>;

    constexpr Matrix() = default;

    /// Diagonal matrix with s on the main diagonal (identity for s = 1)
    constexpr explicit Matrix(T s) {
        for (std::size_t i = 0; i < C && i < R; ++i) cols_[i][i] = s;
    }

    /// One vector per column
    template <typename... Cols>
        requires (sizeof...(Cols) == C && (std::same_as<Cols, Column> && ...))
    constexpr Matrix(const Cols&... cols) : cols_{cols...} {}

    /// C * R scalars in column-major order, like GLSL mat constructors
    template <typename... Args>
        requires (sizeof...(Args) == C * R && (std::convertible_to<Args, T> && ...))
    constexpr Matrix(Args... args) {
        const std::array<T, C * R> flat{static_cast<T>(args)...};
        for (std::size_t c = 0; c < C; ++c) {
            for (std::size_t r = 0; r < R; ++r) {
                cols_[c][r] = flat[c * R + r];
            }
        }
    }

    [[nodiscard]] static constexpr Matrix identity() { return Matrix(T(1)); }
    [[nodiscard]] static constexpr Matrix zero() { return Matrix(); }

    [[nodiscard]] static constexpr std::size_t columns() { return C; }
    [[nodiscard]] static constexpr std::size_t rows() { return R; }

    // Column access
    [[nodiscard]] constexpr Column& operator[](std::size_t c) { return cols_[c]; }
    [[nodiscard]] constexpr const Column& operator[](std::size_t c) const { return cols_[c]; }

    [[nodiscard]] Column& at(std::size_t c) {
        checkColumn(c);
        return cols_[c];
    }
    [[nodiscard]] const Column& at(std::size_t c) const {
        checkColumn(c);
        return cols_[c];
    }

    [[nodiscard]] constexpr Row row(std::size_t r) const {
        Row result;
        for (std::size_t c = 0; c < C; ++c) result[c] = cols_[c][r];
        return result;
    }

    constexpr Matrix& operator+=(const Matrix& o) {
        for (std::size_t c = 0; c < C; ++c) cols_[c] += o.cols_[c];
        return *this;
    }
    constexpr Matrix& operator-=(const Matrix& o) {
        for (std::size_t c = 0; c < C; ++c) cols_[c] -= o.cols_[c];
        return *this;
    }
    constexpr Matrix& operator*=(T s) {
        for (std::size_t c = 0; c < C; ++c) cols_[c] *= s;
        return *this;
    }
    constexpr Matrix& operator/=(T s) {
        for (std::size_t c = 0; c < C; ++c) cols_[c] /= s;
        return *this;
    }

    constexpr bool operator==(const Matrix& other) const = default;

private:
    void checkColumn(std::size_t c) const {
        if (c >= C) {
            throw std::out_of_range("Matrix column " + std::to_string(c) +
                                    " out of range for " + std::to_string(C) + " columns");
        }
    }

    std::array<Column, C> cols_{};
};

// ============================================================================
// Aliases (columns x rows)
// ============================================================================

using Mat2 = Matrix<2, 2, float>;
using Mat3 = Matrix<3, 3, float>;
using Mat4 = Matrix<4, 4, float>;
using Mat2x3 = Matrix<2, 3, float>;
using Mat2x4 = Matrix<2, 4, float>;
using Mat3x2 = Matrix<3, 2, float>;
using Mat3x4 = Matrix<3, 4, float>;
using Mat4x2 = Matrix<4, 2, float>;
using Mat4x3 = Matrix<4, 3, float>;

using DMat2 = Matrix<2, 2, double>;
using DMat3 = Matrix<3, 3, double>;
using DMat4 = Matrix<4, 4, double>;
using DMat2x3 = Matrix<2, 3, double>;
using DMat2x4 = Matrix<2, 4, double>;
using DMat3x2 = Matrix<3, 2, double>;
using DMat3x4 = Matrix<3, 4, double>;
using DMat4x2 = Matrix<4, 2, double>;
using DMat4x3 = Matrix<4, 3, double>;

// ============================================================================
// Arithmetic operators
// ============================================================================

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator+(Matrix<C, R, T> a, const Matrix<C, R, T>& b) { return a += b; }
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator-(Matrix<C, R, T> a, const Matrix<C, R, T>& b) { return a -= b; }
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator*(Matrix<C, R, T> m, T s) { return m *= s; }
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator*(T s, Matrix<C, R, T> m) { return m *= s; }
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator/(Matrix<C, R, T> m, T s) { return m /= s; }

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Matrix<C, R, T> operator-(Matrix<C, R, T> m) {
    for (std::size_t c = 0; c < C; ++c) m[c] = -m[c];
    return m;
}

/// Linear map: sum of columns weighted by v
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Vector<R, T> operator*(const Matrix<C, R, T>& m, const Vector<C, T>& v) {
    Vector<R, T> result = Vector<R, T>::zero();
    for (std::size_t c = 0; c < C; ++c) result += m[c] * v[c];
    return result;
}

/// Row vector times matrix
template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] constexpr Vector<C, T> operator*(const Vector<R, T>& v, const Matrix<C, R, T>& m) {
    Vector<C, T> result;
    for (std::size_t c = 0; c < C; ++c) result[c] = dot(v, m[c]);
    return result;
}

/// Composition: (a * b) * v == a * (b * v)
template <std::size_t C, std::size_t R, std::size_t K, Scalar T>
[[nodiscard]] constexpr Matrix<K, R, T> operator*(const Matrix<C, R, T>& a, const Matrix<K, C, T>& b) {
    Matrix<K, R, T> result;
    for (std::size_t k = 0; k < K; ++k) result[k] = a * b[k];
    return result;
}

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] inline bool isCloseTo(const Matrix<C, R, T>& a, const Matrix<C, R, T>& b, T maxDiff) {
    for (std::size_t c = 0; c < C; ++c) {
        if (!isCloseTo(a[c], b[c], maxDiff)) return false;
    }
    return true;
}

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] inline bool isApproxEqual(const Matrix<C, R, T>& a, const Matrix<C, R, T>& b) {
    return isCloseTo(a, b, std::numeric_limits<T>::epsilon());
}

}  // namespace shadekit
