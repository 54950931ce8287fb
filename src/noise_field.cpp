/**
 * @file noise_field.cpp
 * @brief Basis, fractal and scaled noise fields
 */

#include "shadekit/noise_field.hpp"

#include "shadekit/noise.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace shadekit {

namespace {

template <std::size_t N>
bool isTiled(const Vector<N, int32_t>& period) {
    for (std::size_t i = 0; i < N; ++i) {
        if (period[i] > 0) return true;
    }
    return false;
}

/// Running maximum of the ridged accumulator, assuming signal = 1 every octave
float ridgedMaxValue(int octaves, float gain) {
    float w = 1.0f;
    float maxValue = 0.0f;
    for (int i = 0; i < octaves; ++i) {
        maxValue += w;
        w = std::clamp(w * gain, 0.0f, 1.0f);
    }
    return maxValue;
}

}  // namespace

// ============================================================================
// Basis fields
// ============================================================================

float ClassicField2D::evaluate(const Vec2& p) const {
    return classicNoise(p, period_);
}

float ClassicField3D::evaluate(const Vec3& p) const {
    return classicNoise(p, period_);
}

float ClassicField4D::evaluate(const Vec4& p) const {
    return classicNoise(p, period_);
}

float SimplexField2D::evaluate(const Vec2& p) const {
    return isTiled(period_) ? simplexNoise(p, period_) : simplexNoise(p);
}

float SimplexField3D::evaluate(const Vec3& p) const {
    return isTiled(period_) ? simplexNoise(p, period_) : simplexNoise(p);
}

float SimplexField4D::evaluate(const Vec4& p) const {
    return isTiled(period_) ? simplexNoise(p, period_) : simplexNoise(p);
}

// ============================================================================
// Octave parameters
// ============================================================================

OctaveParams::OctaveParams(int octaves_, float lacunarity_, float persistence_)
    : octaves(octaves_), lacunarity(lacunarity_), persistence(persistence_) {
    if (octaves < 1 || octaves > MAX_OCTAVES) {
        throw std::invalid_argument("octaves must be in [1, " + std::to_string(MAX_OCTAVES) +
                                    "], got " + std::to_string(octaves));
    }
    if (!(lacunarity > 0.0f)) {
        throw std::invalid_argument("lacunarity must be positive, got " + std::to_string(lacunarity));
    }
    if (!(persistence > 0.0f)) {
        throw std::invalid_argument("persistence must be positive, got " + std::to_string(persistence));
    }
}

// ============================================================================
// FBM (Fractal Brownian Motion)
// ============================================================================

FBMField2D::FBMField2D(std::unique_ptr<NoiseField2D> base, int octaves,
                       float lacunarity, float persistence)
    : base_(std::move(base)), params_(octaves, lacunarity, persistence) {
}

float FBMField2D::evaluate(const Vec2& p) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        value += base_->evaluate(p * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= params_.persistence;
        frequency *= params_.lacunarity;
    }

    return value / maxAmplitude;
}

FBMField3D::FBMField3D(std::unique_ptr<NoiseField3D> base, int octaves,
                       float lacunarity, float persistence)
    : base_(std::move(base)), params_(octaves, lacunarity, persistence) {
}

float FBMField3D::evaluate(const Vec3& p) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        value += base_->evaluate(p * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= params_.persistence;
        frequency *= params_.lacunarity;
    }

    return value / maxAmplitude;
}

// ============================================================================
// Ridged multi-fractal
// ============================================================================

RidgedField2D::RidgedField2D(std::unique_ptr<NoiseField2D> base, int octaves,
                             float lacunarity, float gain)
    : base_(std::move(base)), params_(octaves, lacunarity, gain),
      maxValue_(ridgedMaxValue(octaves, gain)) {
}

float RidgedField2D::evaluate(const Vec2& p) const {
    float value = 0.0f;
    float weight = 1.0f;
    float frequency = 1.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        float signal = 1.0f - std::abs(base_->evaluate(p * frequency));
        signal *= signal;
        signal *= weight;

        weight = std::clamp(signal * params_.persistence, 0.0f, 1.0f);
        value += signal;
        frequency *= params_.lacunarity;
    }

    // [0, maxValue_] to [-1, 1]
    return value * 2.0f / maxValue_ - 1.0f;
}

RidgedField3D::RidgedField3D(std::unique_ptr<NoiseField3D> base, int octaves,
                             float lacunarity, float gain)
    : base_(std::move(base)), params_(octaves, lacunarity, gain),
      maxValue_(ridgedMaxValue(octaves, gain)) {
}

float RidgedField3D::evaluate(const Vec3& p) const {
    float value = 0.0f;
    float weight = 1.0f;
    float frequency = 1.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        float signal = 1.0f - std::abs(base_->evaluate(p * frequency));
        signal *= signal;
        signal *= weight;

        weight = std::clamp(signal * params_.persistence, 0.0f, 1.0f);
        value += signal;
        frequency *= params_.lacunarity;
    }

    return value * 2.0f / maxValue_ - 1.0f;
}

// ============================================================================
// Billow
// ============================================================================

BillowField2D::BillowField2D(std::unique_ptr<NoiseField2D> base, int octaves,
                             float lacunarity, float persistence)
    : base_(std::move(base)), params_(octaves, lacunarity, persistence) {
}

float BillowField2D::evaluate(const Vec2& p) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        value += std::abs(base_->evaluate(p * frequency)) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= params_.persistence;
        frequency *= params_.lacunarity;
    }

    return (value / maxAmplitude) * 2.0f - 1.0f;
}

BillowField3D::BillowField3D(std::unique_ptr<NoiseField3D> base, int octaves,
                             float lacunarity, float persistence)
    : base_(std::move(base)), params_(octaves, lacunarity, persistence) {
}

float BillowField3D::evaluate(const Vec3& p) const {
    float value = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    float maxAmplitude = 0.0f;

    for (int i = 0; i < params_.octaves; ++i) {
        value += std::abs(base_->evaluate(p * frequency)) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= params_.persistence;
        frequency *= params_.lacunarity;
    }

    return (value / maxAmplitude) * 2.0f - 1.0f;
}

// ============================================================================
// Scaling
// ============================================================================

ScaledField2D::ScaledField2D(std::unique_ptr<NoiseField2D> source, Vec2 frequency,
                             float amplitude, float offset)
    : source_(std::move(source)), frequency_(frequency),
      amplitude_(amplitude), offset_(offset) {
}

float ScaledField2D::evaluate(const Vec2& p) const {
    return source_->evaluate(p * frequency_) * amplitude_ + offset_;
}

ScaledField3D::ScaledField3D(std::unique_ptr<NoiseField3D> source, Vec3 frequency,
                             float amplitude, float offset)
    : source_(std::move(source)), frequency_(frequency),
      amplitude_(amplitude), offset_(offset) {
}

float ScaledField3D::evaluate(const Vec3& p) const {
    return source_->evaluate(p * frequency_) * amplitude_ + offset_;
}

}  // namespace shadekit
