/**
 * @file noise_field.hpp
 * @brief Composable noise fields: basis noise, fractal stacking, scaling
 *
 * Fields wrap the free noise functions behind a virtual evaluate() so they
 * can be composed at runtime. Composition owns its inputs through
 * unique_ptr. Example:
 *
 *   auto terrain = std::make_unique<FBMField2D>(
 *       std::make_unique<SimplexField2D>(), 6);
 */

#pragma once

#include "shadekit/vector.hpp"

#include <memory>

namespace shadekit {

// ============================================================================
// Base interfaces
// ============================================================================

/// Abstract 2D noise field
class NoiseField2D {
public:
    virtual ~NoiseField2D() = default;

    /// Evaluate at p. Returns approximately [-1, 1] unless rescaled.
    [[nodiscard]] virtual float evaluate(const Vec2& p) const = 0;
};

/// Abstract 3D noise field
class NoiseField3D {
public:
    virtual ~NoiseField3D() = default;

    [[nodiscard]] virtual float evaluate(const Vec3& p) const = 0;
};

/// Abstract 4D noise field (e.g. 3D space plus looping time)
class NoiseField4D {
public:
    virtual ~NoiseField4D() = default;

    [[nodiscard]] virtual float evaluate(const Vec4& p) const = 0;
};

// ============================================================================
// Basis fields
// ============================================================================
//
// A period component <= 0 leaves that axis untiled. An all-zero period
// selects the plain (non-tiling) evaluator.
//

class ClassicField2D : public NoiseField2D {
public:
    explicit ClassicField2D(IVec2 period = IVec2(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    IVec2 period_;
};

class ClassicField3D : public NoiseField3D {
public:
    explicit ClassicField3D(IVec3 period = IVec3(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    IVec3 period_;
};

class ClassicField4D : public NoiseField4D {
public:
    explicit ClassicField4D(IVec4 period = IVec4(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec4& p) const override;

private:
    IVec4 period_;
};

class SimplexField2D : public NoiseField2D {
public:
    explicit SimplexField2D(IVec2 period = IVec2(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    IVec2 period_;
};

class SimplexField3D : public NoiseField3D {
public:
    explicit SimplexField3D(IVec3 period = IVec3(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    IVec3 period_;
};

class SimplexField4D : public NoiseField4D {
public:
    explicit SimplexField4D(IVec4 period = IVec4(0)) : period_(period) {}
    [[nodiscard]] float evaluate(const Vec4& p) const override;

private:
    IVec4 period_;
};

// ============================================================================
// Fractal fields (octave stacking)
// ============================================================================

/// Shared octave parameters; the constructor validates them
struct OctaveParams {
    static constexpr int MAX_OCTAVES = 16;

    int octaves = 6;
    float lacunarity = 2.0f;    ///< Frequency multiplier per octave
    float persistence = 0.5f;   ///< Amplitude multiplier per octave (gain for ridged)

    /// @throws std::invalid_argument if octaves is outside [1, 16] or a factor is <= 0
    explicit OctaveParams(int octaves_ = 6, float lacunarity_ = 2.0f, float persistence_ = 0.5f);
};

/// Fractal Brownian motion: amplitude-weighted octave sum, normalized
class FBMField2D : public NoiseField2D {
public:
    FBMField2D(std::unique_ptr<NoiseField2D> base, int octaves = 6,
               float lacunarity = 2.0f, float persistence = 0.5f);
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    std::unique_ptr<NoiseField2D> base_;
    OctaveParams params_;
};

class FBMField3D : public NoiseField3D {
public:
    FBMField3D(std::unique_ptr<NoiseField3D> base, int octaves = 6,
               float lacunarity = 2.0f, float persistence = 0.5f);
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    std::unique_ptr<NoiseField3D> base_;
    OctaveParams params_;
};

/// Ridged multi-fractal: (1 - |n|)^2 weighted by the previous octave
class RidgedField2D : public NoiseField2D {
public:
    RidgedField2D(std::unique_ptr<NoiseField2D> base, int octaves = 6,
                  float lacunarity = 2.0f, float gain = 0.5f);
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    std::unique_ptr<NoiseField2D> base_;
    OctaveParams params_;
    float maxValue_;  ///< Precomputed max for normalization
};

class RidgedField3D : public NoiseField3D {
public:
    RidgedField3D(std::unique_ptr<NoiseField3D> base, int octaves = 6,
                  float lacunarity = 2.0f, float gain = 0.5f);
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    std::unique_ptr<NoiseField3D> base_;
    OctaveParams params_;
    float maxValue_;
};

/// Billow: |n| per octave, remapped to [-1, 1]
class BillowField2D : public NoiseField2D {
public:
    BillowField2D(std::unique_ptr<NoiseField2D> base, int octaves = 6,
                  float lacunarity = 2.0f, float persistence = 0.5f);
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    std::unique_ptr<NoiseField2D> base_;
    OctaveParams params_;
};

class BillowField3D : public NoiseField3D {
public:
    BillowField3D(std::unique_ptr<NoiseField3D> base, int octaves = 6,
                  float lacunarity = 2.0f, float persistence = 0.5f);
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    std::unique_ptr<NoiseField3D> base_;
    OctaveParams params_;
};

// ============================================================================
// Scaling
// ============================================================================

/// source(p * frequency) * amplitude + offset
class ScaledField2D : public NoiseField2D {
public:
    ScaledField2D(std::unique_ptr<NoiseField2D> source, Vec2 frequency,
                  float amplitude = 1.0f, float offset = 0.0f);
    [[nodiscard]] float evaluate(const Vec2& p) const override;

private:
    std::unique_ptr<NoiseField2D> source_;
    Vec2 frequency_;
    float amplitude_;
    float offset_;
};

class ScaledField3D : public NoiseField3D {
public:
    ScaledField3D(std::unique_ptr<NoiseField3D> source, Vec3 frequency,
                  float amplitude = 1.0f, float offset = 0.0f);
    [[nodiscard]] float evaluate(const Vec3& p) const override;

private:
    std::unique_ptr<NoiseField3D> source_;
    Vec3 frequency_;
    float amplitude_;
    float offset_;
};

}  // namespace shadekit
