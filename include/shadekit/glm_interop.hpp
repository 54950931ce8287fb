/**
 * @file glm_interop.hpp
 * @brief Conversions between shadekit and glm vector / matrix types
 *
 * Both libraries store matrices column-major with GLSL shape naming, so a
 * conversion is a straight element copy. Requires glm 0.9.9 or newer.
 */

#pragma once

#include "shadekit/matrix.hpp"
#include "shadekit/vector.hpp"

#include <glm/glm.hpp>

namespace shadekit {

template <std::size_t N, Scalar T>
[[nodiscard]] inline glm::vec<static_cast<glm::length_t>(N), T> toGlm(const Vector<N, T>& v) {
    glm::vec<static_cast<glm::length_t>(N), T> out;
    for (std::size_t i = 0; i < N; ++i) {
        out[static_cast<glm::length_t>(i)] = v[i];
    }
    return out;
}

template <glm::length_t N, typename T>
    requires Scalar<T>
[[nodiscard]] inline Vector<static_cast<std::size_t>(N), T> fromGlm(const glm::vec<N, T>& v) {
    Vector<static_cast<std::size_t>(N), T> out;
    for (glm::length_t i = 0; i < N; ++i) {
        out[static_cast<std::size_t>(i)] = v[i];
    }
    return out;
}

template <std::size_t C, std::size_t R, Scalar T>
[[nodiscard]] inline glm::mat<static_cast<glm::length_t>(C), static_cast<glm::length_t>(R), T>
toGlm(const Matrix<C, R, T>& m) {
    glm::mat<static_cast<glm::length_t>(C), static_cast<glm::length_t>(R), T> out;
    for (std::size_t c = 0; c < C; ++c) {
        out[static_cast<glm::length_t>(c)] = toGlm(m[c]);
    }
    return out;
}

template <glm::length_t C, glm::length_t R, typename T>
    requires Scalar<T>
[[nodiscard]] inline Matrix<static_cast<std::size_t>(C), static_cast<std::size_t>(R), T>
fromGlm(const glm::mat<C, R, T>& m) {
    Matrix<static_cast<std::size_t>(C), static_cast<std::size_t>(R), T> out;
    for (glm::length_t c = 0; c < C; ++c) {
        out[static_cast<std::size_t>(c)] = fromGlm(m[c]);
    }
    return out;
}

}  // namespace shadekit
