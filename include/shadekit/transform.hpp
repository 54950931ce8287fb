/**
 * @file transform.hpp
 * @brief 4x4 model/view/projection builders: translate, rotate, perspective, lookAt
 *
 * All matrices are column-major and right-handed, for column vectors
 * (p' = M * p). translate() and rotate() post-multiply the given matrix, so
 * rotate(translate(I, t), a, axis) rotates first and then translates.
 * perspective() maps view-space depth [-near, -far] to clip depth [-1, 1].
 */

#pragma once

#include "shadekit/geometric.hpp"
#include "shadekit/matrix.hpp"

#include <cmath>

namespace shadekit {

/// m * T(v): the last column becomes m * (v, 1)
template <Scalar T>
[[nodiscard]] constexpr Matrix<4, 4, T> translate(const Matrix<4, 4, T>& m, const Vector<3, T>& v) {
    Matrix<4, 4, T> result = m;
    result[3] = m[0] * v[0] + m[1] * v[1] + m[2] * v[2] + m[3];
    return result;
}

/**
 * @brief m * R(angle, axis): counter-clockwise rotation by angle radians
 *        about axis (looking down the axis toward the origin)
 *
 * The axis is normalized first; a zero axis gives NaN.
 */
template <Scalar T>
[[nodiscard]] inline Matrix<4, 4, T> rotate(const Matrix<4, 4, T>& m, T angle, const Vector<3, T>& axis) {
    const T c = std::cos(angle);
    const T s = std::sin(angle);
    const Vector<3, T> a = normalize(axis);
    const Vector<3, T> t = a * (T(1) - c);

    // Rodrigues' rotation, one column per basis vector
    const Matrix<3, 3, T> rot(
        c + t[0] * a[0],        t[0] * a[1] + s * a[2], t[0] * a[2] - s * a[1],
        t[1] * a[0] - s * a[2], c + t[1] * a[1],        t[1] * a[2] + s * a[0],
        t[2] * a[0] + s * a[1], t[2] * a[1] - s * a[0], c + t[2] * a[2]);

    Matrix<4, 4, T> result;
    for (std::size_t col = 0; col < 3; ++col) {
        result[col] = m[0] * rot[col][0] + m[1] * rot[col][1] + m[2] * rot[col][2];
    }
    result[3] = m[3];
    return result;
}

/**
 * @brief Right-handed perspective projection
 *
 * @param fovY   Vertical field of view in radians
 * @param aspect Width over height
 * @param zNear  Distance to the near plane
 * @param zFar   Distance to the far plane
 */
template <Scalar T>
[[nodiscard]] inline Matrix<4, 4, T> perspective(T fovY, T aspect, T zNear, T zFar) {
    const T q = T(1) / std::tan(fovY / T(2));
    Matrix<4, 4, T> result;
    result[0][0] = q / aspect;
    result[1][1] = q;
    result[2][2] = (zNear + zFar) / (zNear - zFar);
    result[2][3] = T(-1);
    result[3][2] = T(2) * zNear * zFar / (zNear - zFar);
    return result;
}

/// View matrix for a camera at eye looking toward center, with up roughly up
template <Scalar T>
[[nodiscard]] inline Matrix<4, 4, T> lookAt(const Vector<3, T>& eye, const Vector<3, T>& center,
                                            const Vector<3, T>& up) {
    const Vector<3, T> f = normalize(center - eye);
    const Vector<3, T> s = normalize(cross(f, up));
    const Vector<3, T> u = cross(s, f);

    return Matrix<4, 4, T>(
        s[0], u[0], -f[0], T(0),
        s[1], u[1], -f[1], T(0),
        s[2], u[2], -f[2], T(0),
        -dot(s, eye), -dot(u, eye), dot(f, eye), T(1));
}

}  // namespace shadekit
