/// @file RootFinder.cpp
/// @brief Implementation of the Brent and bisection root finders

#include "adiabat/solver/RootFinder.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Adiabat {

namespace {

constexpr double kMachineEpsilon = std::numeric_limits<double>::epsilon();

bool sameSign(double x, double y) {
    return (x > 0.0 && y > 0.0) || (x < 0.0 && y < 0.0);
}

} // anonymous namespace

int BrentRootFinder::findRoot(const ResidualFunction& f,
                              double a, double fa,
                              double b, double fb,
                              const RootFinderOptions& options,
                              double& dRoot,
                              int& iterations) {
    iterations = 0;

    if (sameSign(fa, fb)) {
        return ErrorCode::kNoSignChange;
    }
    if (fa == 0.0) {
        dRoot = a;
        return ErrorCode::kSuccess;
    }
    if (fb == 0.0) {
        dRoot = b;
        return ErrorCode::kSuccess;
    }

    double c = a;
    double fc = fa;
    double d = b - a;
    double e = d;

    for (int iter = 0; iter < options.iMaxIterations; ++iter) {
        iterations = iter + 1;

        // Keep the root between b and c
        if (sameSign(fb, fc)) {
            c = a;
            fc = fa;
            d = b - a;
            e = d;
        }
        // b is the best estimate
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        const double tol1 = 2.0 * kMachineEpsilon * std::abs(b) + 0.5 * options.dTolRelative * std::abs(b);
        const double xm = 0.5 * (c - b);

        if (std::abs(xm) <= tol1 || std::abs(fb) <= options.dTolFunction || fb == 0.0) {
            dRoot = b;
            return ErrorCode::kSuccess;
        }

        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            double p, q;
            const double s = fb / fa;
            if (a == c) {
                // Secant
                p = 2.0 * xm * s;
                q = 1.0 - s;
            } else {
                // Inverse quadratic interpolation
                const double qa = fa / fc;
                const double r = fb / fc;
                p = s * (2.0 * xm * qa * (qa - r) - (b - a) * (r - 1.0));
                q = (qa - 1.0) * (r - 1.0) * (s - 1.0);
            }
            if (p > 0.0) {
                q = -q;
            } else {
                p = -p;
            }
            const double min1 = 3.0 * xm * q - std::abs(tol1 * q);
            const double min2 = std::abs(e * q);
            if (2.0 * p < std::min(min1, min2)) {
                e = d;
                d = p / q;
            } else {
                d = xm;
                e = d;
            }
        } else {
            d = xm;
            e = d;
        }

        a = b;
        fa = fb;
        const double dMidpoint = b + xm;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, xm);

        int info = f(b, fb);
        if (info != ErrorCode::kSuccess) {
            // Fall back to the bracket midpoint
            b = dMidpoint;
            d = xm;
            e = d;
            info = f(b, fb);
            if (info != ErrorCode::kSuccess) {
                return info;
            }
        }
    }

    return ErrorCode::kOuterConvergenceFailure;
}

int BisectionRootFinder::findRoot(const ResidualFunction& f,
                                  double a, double fa,
                                  double b, double fb,
                                  const RootFinderOptions& options,
                                  double& dRoot,
                                  int& iterations) {
    iterations = 0;

    if (sameSign(fa, fb)) {
        return ErrorCode::kNoSignChange;
    }
    if (fa == 0.0) {
        dRoot = a;
        return ErrorCode::kSuccess;
    }
    if (fb == 0.0) {
        dRoot = b;
        return ErrorCode::kSuccess;
    }

    for (int iter = 0; iter < options.iMaxIterations; ++iter) {
        iterations = iter + 1;

        const double dMid = 0.5 * (a + b);
        double fm = 0.0;
        int info = f(dMid, fm);
        if (info != ErrorCode::kSuccess) {
            return info;
        }

        if (std::abs(fm) <= options.dTolFunction || fm == 0.0) {
            dRoot = dMid;
            return ErrorCode::kSuccess;
        }

        if (sameSign(fa, fm)) {
            a = dMid;
            fa = fm;
        } else {
            b = dMid;
            fb = fm;
        }

        const double dWidth = std::abs(b - a);
        if (dWidth <= options.dTolRelative * std::abs(dMid) + 4.0 * kMachineEpsilon * std::abs(dMid)) {
            dRoot = (std::abs(fa) < std::abs(fb)) ? a : b;
            return ErrorCode::kSuccess;
        }
    }

    return ErrorCode::kOuterConvergenceFailure;
}

std::unique_ptr<IRootFinder> createRootFinder(RootFinderType type) {
    switch (type) {
        case RootFinderType::Bisection:
            return std::make_unique<BisectionRootFinder>();
        case RootFinderType::Brent:
        default:
            return std::make_unique<BrentRootFinder>();
    }
}

} // namespace Adiabat
