#pragma once

#include <stagehand/stagehand_export.h>

namespace stagehand {

/**
 * @brief A unit cubic bezier from (0, 0) to (1, 1) with inner control points (x1, y1) and (x2, y2).
 *
 * The x control points are clamped to [0, 1], which keeps x(t) monotonic so every x has exactly one t. The y
 * control points are free, allowing overshoot.
 */
class STAGEHAND_EXPORT UnitBezier {
public:
    static constexpr double DEFAULT_EPSILON = 1e-7;

    UnitBezier(double x1, double y1, double x2, double y2);

    [[nodiscard]] double sample_x(double t) const { return ((_ax * t + _bx) * t + _cx) * t; }

    [[nodiscard]] double sample_y(double t) const { return ((_ay * t + _by) * t + _cy) * t; }

    [[nodiscard]] double sample_derivative_x(double t) const { return (3.0 * _ax * t + 2.0 * _bx) * t + _cx; }

    /**
     * @brief The curve parameter t with x(t) == x, found by Newton iterations with a bisection fallback.
     * `x` is clamped to [0, 1].
     */
    [[nodiscard]] double solve_curve_x(double x, double epsilon = DEFAULT_EPSILON) const;

    /**
     * @brief y for a given x; the eased progression.
     */
    [[nodiscard]] double solve(double x, double epsilon = DEFAULT_EPSILON) const {
        return sample_y(solve_curve_x(x, epsilon));
    }

private:
    double _ax, _bx, _cx;
    double _ay, _by, _cy;
};

}  // namespace stagehand
