/// @file IRootFinder.hpp
/// @brief Interface for bracketing 1-D root finders
/// @details Used by the temperature solver to locate the zero of the energy
/// residual. Implementations keep a sign-changing bracket at all times.

#pragma once

#include <functional>

namespace Adiabat {

/// @brief Residual callback
/// @details Evaluates f(x) into the second argument and returns an error code
/// (0 = success). A failing evaluation is not a root-finder failure by itself.
using ResidualFunction = std::function<int(double, double&)>;

/// @brief Termination settings for a root search
struct RootFinderOptions {
    double dTolFunction = 0.0;      ///< Stop when |f(x)| <= dTolFunction
    double dTolRelative = 0.0;      ///< Stop when the bracket width <= dTolRelative * |x|
    int iMaxIterations = 100;       ///< Iteration budget
};

/// @brief Abstract interface for bracketing root finders
/// @details Implementations:
/// - BrentRootFinder: Brent-Dekker (inverse quadratic, secant, bisection)
/// - BisectionRootFinder: plain bisection
class IRootFinder {
public:
    virtual ~IRootFinder() = default;

    /// @brief Find a root of f inside [a, b]
    /// @param f Residual callback
    /// @param a Left end of the bracket
    /// @param fa f(a)
    /// @param b Right end of the bracket
    /// @param fb f(b), opposite sign to fa (or zero)
    /// @param options Termination settings
    /// @param dRoot Output: root estimate
    /// @param iterations Output: iterations used
    /// @return Error code (0 = success, kNoSignChange if fa and fb share a sign,
    ///         kOuterConvergenceFailure when the budget is exhausted, or the
    ///         code of an evaluation that failed at both the trial point and
    ///         the bracket midpoint)
    virtual int findRoot(const ResidualFunction& f,
                         double a, double fa,
                         double b, double fb,
                         const RootFinderOptions& options,
                         double& dRoot,
                         int& iterations) = 0;

    /// @brief Get root finder name for logging
    /// @return Root finder name string
    virtual const char* getRootFinderName() const = 0;
};

} // namespace Adiabat
