#include <stagehand/sequence/bezier.h>

#include <algorithm>
#include <cmath>

namespace stagehand {

UnitBezier::UnitBezier(double x1, double y1, double x2, double y2) {
    x1 = std::clamp(x1, 0.0, 1.0);
    x2 = std::clamp(x2, 0.0, 1.0);

    // Polynomial coefficients; the end points are fixed at (0, 0) and (1, 1)
    _cx = 3.0 * x1;
    _bx = 3.0 * (x2 - x1) - _cx;
    _ax = 1.0 - _cx - _bx;

    _cy = 3.0 * y1;
    _by = 3.0 * (y2 - y1) - _cy;
    _ay = 1.0 - _cy - _by;
}

double UnitBezier::solve_curve_x(double x, double epsilon) const {
    x = std::clamp(x, 0.0, 1.0);

    double t = x;
    for (int i = 0; i < 8; ++i) {
        const double error = sample_x(t) - x;
        if (std::abs(error) < epsilon) {
            return t;
        }
        const double dx = sample_derivative_x(t);
        if (std::abs(dx) < 1e-6) {
            break;
        }
        t -= error / dx;
    }

    double lo = 0.0;
    double hi = 1.0;
    t = x;
    while (lo < hi) {
        const double value = sample_x(t);
        if (std::abs(value - x) < epsilon) {
            return t;
        }
        if (x > value) {
            lo = t;
        } else {
            hi = t;
        }
        const double next = (hi - lo) * 0.5 + lo;
        if (next == t) {
            break;
        }
        t = next;
    }
    return t;
}

}  // namespace stagehand
