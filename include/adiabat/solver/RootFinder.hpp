/// @file RootFinder.hpp
/// @brief Bracketing root finders for the temperature search
/// @details When an evaluation fails at a trial point, the midpoint of the
/// current bracket is evaluated instead; a second failure ends the search
/// with that evaluation's error code.

#pragma once

#include <memory>
#include "adiabat/interfaces/IRootFinder.hpp"
#include "adiabat/context/Species.hpp"

namespace Adiabat {

/// @brief Brent-Dekker root finder
/// @details Combines inverse quadratic interpolation, the secant rule and
/// bisection; the bracket is kept throughout.
class BrentRootFinder : public IRootFinder {
public:
    int findRoot(const ResidualFunction& f,
                 double a, double fa,
                 double b, double fb,
                 const RootFinderOptions& options,
                 double& dRoot,
                 int& iterations) override;

    const char* getRootFinderName() const override {
        return "Brent";
    }
};

/// @brief Plain bisection root finder
class BisectionRootFinder : public IRootFinder {
public:
    int findRoot(const ResidualFunction& f,
                 double a, double fa,
                 double b, double fb,
                 const RootFinderOptions& options,
                 double& dRoot,
                 int& iterations) override;

    const char* getRootFinderName() const override {
        return "Bisection";
    }
};

/// @brief Create a root finder by type
std::unique_ptr<IRootFinder> createRootFinder(RootFinderType type);

} // namespace Adiabat
