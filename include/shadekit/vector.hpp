/**
 * @file vector.hpp
 * @brief Fixed-size 2/3/4 component vectors and their elementwise built-ins
 *
 * Vector<N, T> is a plain value type. Arithmetic is componentwise; a scalar
 * operand is broadcast to every component. Mismatched sizes do not compile.
 *
 * Usage:
 * ```cpp
 * Vec3 p(0.5f, 1.25f, -3.0f);
 * Vec3 cell = floor(p);
 * Vec3 local = fract(p);
 * float d = dot(local, Vec3(1.0f));
 * ```
 */

#pragma once

#include "shadekit/scalar.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace shadekit {

template <std::size_t N, Component T>
    requires (N >= 2 && N <= 4)
class Vector {
public:
    using value_type = T;

    constexpr Vector() = default;

    /// Broadcast one value to every component
    constexpr explicit Vector(T s) {
        for (std::size_t i = 0; i < N; ++i) c_[i] = s;
    }

    /// One value per component
    template <typename... Args>
        requires (sizeof...(Args) == N && N > 1 && (std::convertible_to<Args, T> && ...))
    constexpr Vector(Args... args) : c_{static_cast<T>(args)...} {}

    /// Convert from another component type (e.g. DVec3 -> Vec3, IVec2 -> Vec2)
    template <Component U>
    constexpr explicit Vector(const Vector<N, U>& other) {
        for (std::size_t i = 0; i < N; ++i) c_[i] = static_cast<T>(other[i]);
    }

    [[nodiscard]] static constexpr Vector zero() { return Vector(T(0)); }
    [[nodiscard]] static constexpr std::size_t size() { return N; }

    // Unchecked access
    [[nodiscard]] constexpr T& operator[](std::size_t i) { return c_[i]; }
    [[nodiscard]] constexpr const T& operator[](std::size_t i) const { return c_[i]; }

    // Checked access
    [[nodiscard]] T& at(std::size_t i) {
        checkIndex(i);
        return c_[i];
    }
    [[nodiscard]] const T& at(std::size_t i) const {
        checkIndex(i);
        return c_[i];
    }

    [[nodiscard]] constexpr T x() const { return c_[0]; }
    [[nodiscard]] constexpr T y() const { return c_[1]; }
    [[nodiscard]] constexpr T z() const requires (N >= 3) { return c_[2]; }
    [[nodiscard]] constexpr T w() const requires (N >= 4) { return c_[3]; }

    [[nodiscard]] constexpr auto begin() { return c_.begin(); }
    [[nodiscard]] constexpr auto end() { return c_.end(); }
    [[nodiscard]] constexpr auto begin() const { return c_.begin(); }
    [[nodiscard]] constexpr auto end() const { return c_.end(); }

    // ========================================================================
    // Compound assignment
    // ========================================================================

    constexpr Vector& operator+=(const Vector& o) {
        for (std::size_t i = 0; i < N; ++i) c_[i] += o.c_[i];
        return *this;
    }
    constexpr Vector& operator-=(const Vector& o) {
        for (std::size_t i = 0; i < N; ++i) c_[i] -= o.c_[i];
        return *this;
    }
    constexpr Vector& operator*=(const Vector& o) {
        for (std::size_t i = 0; i < N; ++i) c_[i] *= o.c_[i];
        return *this;
    }
    constexpr Vector& operator/=(const Vector& o) {
        for (std::size_t i = 0; i < N; ++i) c_[i] /= o.c_[i];
        return *this;
    }
    constexpr Vector& operator+=(T s) { return *this += Vector(s); }
    constexpr Vector& operator-=(T s) { return *this -= Vector(s); }
    constexpr Vector& operator*=(T s) {
        for (std::size_t i = 0; i < N; ++i) c_[i] *= s;
        return *this;
    }
    constexpr Vector& operator/=(T s) {
        for (std::size_t i = 0; i < N; ++i) c_[i] /= s;
        return *this;
    }

    constexpr bool operator==(const Vector& other) const = default;

private:
    void checkIndex(std::size_t i) const {
        if (i >= N) {
            throw std::out_of_range("Vector index " + std::to_string(i) +
                                    " out of range for size " + std::to_string(N));
        }
    }

    std::array<T, N> c_{};
};

// ============================================================================
// Aliases
// ============================================================================

using Vec2 = Vector<2, float>;
using Vec3 = Vector<3, float>;
using Vec4 = Vector<4, float>;
using DVec2 = Vector<2, double>;
using DVec3 = Vector<3, double>;
using DVec4 = Vector<4, double>;
using IVec2 = Vector<2, int32_t>;
using IVec3 = Vector<3, int32_t>;
using IVec4 = Vector<4, int32_t>;

// ============================================================================
// Arithmetic operators
// ============================================================================

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator-(Vector<N, T> v) {
    for (std::size_t i = 0; i < N; ++i) v[i] = -v[i];
    return v;
}

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator+(Vector<N, T> a, const Vector<N, T>& b) { return a += b; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator-(Vector<N, T> a, const Vector<N, T>& b) { return a -= b; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator*(Vector<N, T> a, const Vector<N, T>& b) { return a *= b; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator/(Vector<N, T> a, const Vector<N, T>& b) { return a /= b; }

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator+(Vector<N, T> a, T s) { return a += s; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator-(Vector<N, T> a, T s) { return a -= s; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator*(Vector<N, T> a, T s) { return a *= s; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator/(Vector<N, T> a, T s) { return a /= s; }

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator+(T s, const Vector<N, T>& a) { return Vector<N, T>(s) + a; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator-(T s, const Vector<N, T>& a) { return Vector<N, T>(s) - a; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator*(T s, Vector<N, T> a) { return a *= s; }
template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> operator/(T s, const Vector<N, T>& a) { return Vector<N, T>(s) / a; }

// ============================================================================
// Elementwise built-ins
// ============================================================================

/// Apply a unary function to every component
template <std::size_t N, Component T, typename F>
[[nodiscard]] constexpr Vector<N, T> map(const Vector<N, T>& v, F&& f) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = f(v[i]);
    return r;
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> floor(const Vector<N, T>& v) {
    return map(v, [](T x) { return std::floor(x); });
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> fract(const Vector<N, T>& v) {
    return map(v, [](T x) { return fract(x); });
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> sqrt(const Vector<N, T>& v) {
    return map(v, [](T x) { return std::sqrt(x); });
}

template <std::size_t N, Component T>
[[nodiscard]] inline Vector<N, T> abs(const Vector<N, T>& v) {
    return map(v, [](T x) { return x < T(0) ? -x : x; });
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> mod(const Vector<N, T>& x, T y) {
    return map(x, [y](T c) { return mod(c, y); });
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, T> mod(const Vector<N, T>& x, const Vector<N, T>& y) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = mod(x[i], y[i]);
    return r;
}

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> min(const Vector<N, T>& a, const Vector<N, T>& b) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = b[i] < a[i] ? b[i] : a[i];
    return r;
}

template <std::size_t N, Component T>
[[nodiscard]] constexpr Vector<N, T> max(const Vector<N, T>& a, const Vector<N, T>& b) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = a[i] < b[i] ? b[i] : a[i];
    return r;
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> clamp(const Vector<N, T>& v, T lo, T hi) {
    return min(max(v, Vector<N, T>(lo)), Vector<N, T>(hi));
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> step(T edge, const Vector<N, T>& x) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = step(edge, x[i]);
    return r;
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> step(const Vector<N, T>& edge, const Vector<N, T>& x) {
    Vector<N, T> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = step(edge[i], x[i]);
    return r;
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> mix(const Vector<N, T>& a, const Vector<N, T>& b, T t) {
    return a + (b - a) * t;
}

template <std::size_t N, Scalar T>
[[nodiscard]] constexpr Vector<N, T> mix(const Vector<N, T>& a, const Vector<N, T>& b,
                                         const Vector<N, T>& t) {
    return a + (b - a) * t;
}

/// Sum of all components
template <std::size_t N, Component T>
[[nodiscard]] constexpr T sum(const Vector<N, T>& v) {
    T s = T(0);
    for (std::size_t i = 0; i < N; ++i) s += v[i];
    return s;
}

/// Lattice cell of each component reduced into [0, n)
template <std::size_t N, Scalar T>
[[nodiscard]] inline Vector<N, int32_t> floorMod(const Vector<N, T>& v, int32_t n) {
    Vector<N, int32_t> r;
    for (std::size_t i = 0; i < N; ++i) r[i] = floorMod(v[i], n);
    return r;
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline bool isCloseTo(const Vector<N, T>& a, const Vector<N, T>& b, T maxDiff) {
    for (std::size_t i = 0; i < N; ++i) {
        if (!isCloseTo(a[i], b[i], maxDiff)) return false;
    }
    return true;
}

template <std::size_t N, Scalar T>
[[nodiscard]] inline bool isApproxEqual(const Vector<N, T>& a, const Vector<N, T>& b) {
    return isCloseTo(a, b, std::numeric_limits<T>::epsilon());
}

}  // namespace shadekit
