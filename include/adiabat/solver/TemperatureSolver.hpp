/// @file TemperatureSolver.hpp
/// @brief Outer search for the adiabatic equilibrium temperature
/// @details Finds T* with r(T) = H_sys(T, n*(T)) - H_propellant = 0, where
/// n*(T) comes from the Gibbs minimizer. The full range is tried first; if
/// it does not bracket a root, interior samples are scanned and the first
/// adjacent pair of successful evaluations with a sign change is used.

#pragma once

#include <Eigen/Dense>
#include "adiabat/util/Constants.hpp"
#include "adiabat/util/Tolerances.hpp"

namespace Adiabat {

// Forward declarations
struct SpeciesState;
struct MinimizerState;
class GibbsMinimizer;
class IRootFinder;

/// @brief Outer temperature solver
class TemperatureSolver {
public:
    /// @brief Constructor
    /// @param minimizer Inner solver
    /// @param rootFinder Bracketing root finder
    /// @param tolerances Tolerances (kTolEnthalpy, kTolTemperature)
    TemperatureSolver(GibbsMinimizer& minimizer,
                      IRootFinder& rootFinder,
                      const Tolerances& tolerances);

    /// @brief Solve for the equilibrium temperature and composition
    /// @param system Chemical system
    /// @param dPressure Pressure (Pa)
    /// @param dTargetEnthalpy Propellant enthalpy (J per reference mass)
    /// @param dTemperatureLow Lower end of the search range (K)
    /// @param dTemperatureHigh Upper end of the search range (K)
    /// @param minState Iteration bookkeeping (histories, warm start)
    /// @param dTemperature Output: equilibrium temperature (K)
    /// @param dMoles Output: equilibrium composition
    /// @return Error code (0 = success, kInvalidInput, kInnerConvergenceFailure
    ///         or kOuterConvergenceFailure)
    int solve(const SpeciesState& system,
              double dPressure,
              double dTargetEnthalpy,
              double dTemperatureLow,
              double dTemperatureHigh,
              MinimizerState& minState,
              double& dTemperature,
              Eigen::VectorXd& dMoles);

    /// @brief Energy residual at one temperature
    /// @param system Chemical system
    /// @param dPressure Pressure (Pa)
    /// @param dTargetEnthalpy Propellant enthalpy (J)
    /// @param dTemperature Trial temperature (K)
    /// @param minState Iteration bookkeeping; its last composition seeds the solve
    /// @param dResidual Output: H_sys - H_propellant (J)
    /// @param dMoles Output: composition at the trial temperature
    /// @return Error code of the inner solve
    int residual(const SpeciesState& system,
                 double dPressure,
                 double dTargetEnthalpy,
                 double dTemperature,
                 MinimizerState& minState,
                 double& dResidual,
                 Eigen::VectorXd& dMoles);

    /// @brief Set the root-finder iteration budget
    void setMaxIterations(int iMaxIterations) { iMaxIterations_ = iMaxIterations; }

    /// @brief Set the number of interior samples of the bracket scan
    void setBracketSamples(int nSamples) { nBracketSamples_ = nSamples; }

private:
    GibbsMinimizer& minimizer_;
    IRootFinder& rootFinder_;
    Tolerances tolerances_;
    int iMaxIterations_ = Constants::kMaxOuterIterations;
    int nBracketSamples_ = Constants::kDefaultBracketSamples;
};

} // namespace Adiabat
