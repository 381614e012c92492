#pragma once

#include <Eigen/Dense>
#include <vector>

namespace Adiabat {

/// Solver state for the inner Gibbs minimization and the outer temperature search
/// Stores iteration bookkeeping and histories of one calculation
struct MinimizerState {
    // Inner iteration tracking
    int iterGlobal = 0;                 ///< Newton iterations of the last inner solve
    int iterTotal = 0;                  ///< Newton iterations summed over all inner solves
    int nAssemblageChanges = 0;         ///< Condensed species added/removed in the last inner solve
    int nInnerSolves = 0;               ///< Inner solves performed
    int nInnerFailures = 0;             ///< Inner solves that did not converge

    // Outer iteration tracking
    int iterOuter = 0;                  ///< Root-finder iterations

    // Convergence metrics of the last inner solve
    double dMassBalanceResidual = 0.0;  ///< max |A n - b|
    double dMaxSpeciesChange = 0.0;     ///< Scaled max Newton update
    double dMaxDrivingForce = 0.0;      ///< Largest driving force of an inactive condensed species
    double dGibbsEnergy = 0.0;          ///< Final G of the last inner solve (J)

    // Histories
    std::vector<double> dGibbsHistory;          ///< G per accepted iterate of the last inner solve (J)
    std::vector<bool> lFeasibleHistory;         ///< Mass balance satisfied at the iterate
    std::vector<double> dTemperatureHistory;    ///< Trial temperatures of the outer search (K)
    std::vector<double> dResidualHistory;       ///< Energy residual at each trial (J)

    // Warm start
    Eigen::VectorXd dMolesLast;         ///< Last converged composition
    bool lWarmStartAvailable = false;   ///< dMolesLast holds a usable composition

    // Status flags
    bool lDebugMode = false;            ///< Debug output enabled
    bool lConverged = false;            ///< Last inner solve converged

    // Constructor
    MinimizerState() = default;

    /// Reset per-solve counters and the G history before an inner solve
    void initIteration();

    /// Reset everything for a new calculation
    void reset();
};

} // namespace Adiabat
