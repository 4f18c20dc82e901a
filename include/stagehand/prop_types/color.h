#pragma once

#include <stagehand/stagehand_export.h>
#include <stagehand/value/value.h>

namespace stagehand {

struct Oklab {
    double l{0.0};
    double a{0.0};
    double b{0.0};
    double alpha{1.0};
};

/**
 * sRGB (gamma encoded, channels nominally in [0, 1]) to Oklab. The transfer functions are applied
 * sign-symmetrically so out-of-gamut channels produced by extrapolation round-trip without NaNs.
 */
[[nodiscard]] STAGEHAND_EXPORT Oklab srgb_to_oklab(const Rgba& color);

[[nodiscard]] STAGEHAND_EXPORT Rgba oklab_to_srgb(const Oklab& lab);

/**
 * Perceptual blend: interpolate L, a and b in Oklab and alpha linearly. No clamping.
 */
[[nodiscard]] STAGEHAND_EXPORT Rgba interpolate_rgba(const Rgba& left, const Rgba& right, double progression);

/**
 * Clamp every channel into [0, 1].
 */
[[nodiscard]] STAGEHAND_EXPORT Rgba clamp_rgba(const Rgba& color);

}  // namespace stagehand
