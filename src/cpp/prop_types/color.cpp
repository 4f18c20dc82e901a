#include <stagehand/prop_types/color.h>

#include <algorithm>
#include <cmath>

namespace stagehand {

namespace {

double srgb_to_linear(double c) {
    const double magnitude = std::abs(c);
    const double linear = magnitude <= 0.04045 ? magnitude / 12.92 : std::pow((magnitude + 0.055) / 1.055, 2.4);
    return std::copysign(linear, c);
}

double linear_to_srgb(double c) {
    const double magnitude = std::abs(c);
    const double encoded = magnitude <= 0.0031308 ? magnitude * 12.92 : 1.055 * std::pow(magnitude, 1.0 / 2.4) - 0.055;
    return std::copysign(encoded, c);
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

}  // namespace

Oklab srgb_to_oklab(const Rgba& color) {
    const double r = srgb_to_linear(color.r);
    const double g = srgb_to_linear(color.g);
    const double b = srgb_to_linear(color.b);

    const double l_ = std::cbrt(0.4122214708 * r + 0.5363325363 * g + 0.0514459929 * b);
    const double m_ = std::cbrt(0.2119034982 * r + 0.6806995451 * g + 0.1073969566 * b);
    const double s_ = std::cbrt(0.0883024619 * r + 0.2817188376 * g + 0.6299787005 * b);

    return Oklab{
        0.2104542553 * l_ + 0.7936177850 * m_ - 0.0040720468 * s_,
        1.9779984951 * l_ - 2.4285922050 * m_ + 0.4505937099 * s_,
        0.0259040371 * l_ + 0.7827717662 * m_ - 0.8086757660 * s_,
        color.a,
    };
}

Rgba oklab_to_srgb(const Oklab& lab) {
    const double l_ = lab.l + 0.3963377774 * lab.a + 0.2158037573 * lab.b;
    const double m_ = lab.l - 0.1055613458 * lab.a - 0.0638541728 * lab.b;
    const double s_ = lab.l - 0.0894841775 * lab.a - 1.2914855480 * lab.b;

    const double l3 = l_ * l_ * l_;
    const double m3 = m_ * m_ * m_;
    const double s3 = s_ * s_ * s_;

    return Rgba{
        linear_to_srgb(+4.0767416621 * l3 - 3.3077115913 * m3 + 0.2309699292 * s3),
        linear_to_srgb(-1.2684380046 * l3 + 2.6097574011 * m3 - 0.3413193965 * s3),
        linear_to_srgb(-0.0041960863 * l3 - 0.7034186147 * m3 + 1.7076147010 * s3),
        lab.alpha,
    };
}

Rgba interpolate_rgba(const Rgba& left, const Rgba& right, double progression) {
    const auto l = srgb_to_oklab(left);
    const auto r = srgb_to_oklab(right);
    return oklab_to_srgb(Oklab{
        lerp(l.l, r.l, progression),
        lerp(l.a, r.a, progression),
        lerp(l.b, r.b, progression),
        lerp(l.alpha, r.alpha, progression),
    });
}

Rgba clamp_rgba(const Rgba& color) {
    return Rgba{
        std::clamp(color.r, 0.0, 1.0),
        std::clamp(color.g, 0.0, 1.0),
        std::clamp(color.b, 0.0, 1.0),
        std::clamp(color.a, 0.0, 1.0),
    };
}

}  // namespace stagehand
