/**
 * @file geometric.hpp
 * @brief Geometric built-ins: dot, cross, length, normalize, reflect, refract
 *
 * normalize() and recipLength() of a zero-length vector yield NaN or inf;
 * callers guard degenerate input. projection() and angle() treat a
 * (near) zero-length operand as a special case and return zero.
 */

#pragma once

#include "shadekit/vector.hpp"

#include <cmath>

namespace shadekit {

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr T dot(const Vector<N, T>& a, const Vector<N, T>& b) {
    T s = T(0);
    for (std::size_t i = 0; i < N; ++i) s += a[i] * b[i];
    return s;
}

/// Right-handed cross product
template <Scalar T>
[[nodiscard]] constexpr Vector<3, T> cross(const Vector<3, T>& a, const Vector<3, T>& b) {
    return {a[1] * b[2] - b[1] * a[2],
            a[2] * b[0] - b[2] * a[0],
            a[0] * b[1] - b[0] * a[1]};
}

/// Squared length, dot(v, v)
template <std::size_t N, Scalar T>
[[nodiscard]] constexpr T sqLength(const Vector<N, T>& v) {
    return dot(v, v);
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline T length(const Vector<N, T>& v) {
    return std::sqrt(dot(v, v));
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline T distance(const Vector<N, T>& p0, const Vector<N, T>& p1) {
    return length(p0 - p1);
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> normalize(const Vector<N, T>& v) {
    return v / length(v);
}

/// 1 / length(v)
template <std::size_t N, Scalar T>
[[nodiscard]] inline T recipLength(const Vector<N, T>& v) {
    return T(1) / std::sqrt(dot(v, v));
}

/// v rescaled to the given length, keeping its direction
template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> normalizeTo(const Vector<N, T>& v, T len) {
    return normalize(v) * len;
}

/// Component of x along y; zero when y has (near) zero length
template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> projection(const Vector<N, T>& x, const Vector<N, T>& y) {
    const T yy = sqLength(y);
    if (isApproxEqual(yy, T(0))) {
        return Vector<N, T>::zero();
    }
    return y * (dot(x, y) / yy);
}

/// True if dot(a, b) is within epsilon of zero
template <std::size_t N, Scalar T>
[[nodiscard]] inline bool isPerpendicular(const Vector<N, T>& a, const Vector<N, T>& b) {
    return isApproxEqual(dot(a, b), T(0));
}

/**
 * @brief Unsigned angle between a and b in radians, in [0, pi]
 *
 * Zero when either vector has (near) zero length. The cosine is clamped to
 * [-1, 1] before acos so rounding on parallel inputs cannot produce NaN.
 */
template <std::size_t N, Scalar T>
[[nodiscard]] inline T angle(const Vector<N, T>& a, const Vector<N, T>& b) {
    const T lenProduct = dot(a, a) * dot(b, b);
    if (isApproxEqual(lenProduct, T(0))) {
        return T(0);
    }
    return std::acos(clamp(dot(a, b) / std::sqrt(lenProduct), T(-1), T(1)));
}

/// n if dot(nref, i) < 0, otherwise -n
template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> faceforward(const Vector<N, T>& n, const Vector<N, T>& i,
                                                 const Vector<N, T>& nref) {
    return dot(nref, i) < T(0) ? n : -n;
}

/// Reflect incident direction i about surface normal n (n should be unit length)
template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> reflect(const Vector<N, T>& i, const Vector<N, T>& n) {
    return i - n * (T(2) * dot(n, i));
}

/**
 * @brief Refraction direction for incident i, normal n, index ratio eta
 *
 * i and n should be unit length. Returns the zero vector on total internal
 * reflection.
 */
template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> refract(const Vector<N, T>& i, const Vector<N, T>& n, T eta) {
    T d = dot(n, i);
    T k = T(1) - eta * eta * (T(1) - d * d);
    if (k < T(0)) {
        return Vector<N, T>::zero();
    }
    return i * eta - n * (eta * d + std::sqrt(k));
}

}  // namespace shadekit
