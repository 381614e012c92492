/// @file GibbsMinimizer.hpp
/// @brief Gibbs energy minimization at fixed temperature and pressure
/// @details Minimizes G(T, n) / RT subject to A n = b and n >= 0 with the
/// element-potential (RAND) Newton iteration. Each iteration solves the
/// symmetric system
///
///   [ R     b_g   A_c ] [ pi ]   [ r + A_g (y mu) ]
///   [ b_g^T  0     0  ] [ u  ] = [ sum y mu       ]
///   [ A_c^T  0     0  ] [ dc ]   [ g_c            ]
///
/// with R_jk = sum_gas a_ji a_ki y_i, b_g = A_g y and r = b - A n, and
/// reconstructs the gas update dn_i = y_i (sum_j a_ji pi_j - mu_i + u).
/// Gas moles stay positive through a fraction-to-boundary rule; condensed
/// moles that reach zero leave the active set. Once A n = b holds, an
/// Armijo backtracking search keeps G non-increasing. Condensed species
/// enter the active set when their driving force sum_j pi_j a_jc - g_c
/// is positive.

#pragma once

#include <Eigen/Dense>
#include <vector>
#include "adiabat/util/Constants.hpp"
#include "adiabat/util/Tolerances.hpp"

namespace Adiabat {

// Forward declarations
struct SpeciesState;
struct MinimizerState;

/// @brief Inner equilibrium solver
class GibbsMinimizer {
public:
    /// @brief Constructor
    /// @param tolerances Convergence tolerances
    /// @param iMaxIterations Newton iteration cap
    explicit GibbsMinimizer(const Tolerances& tolerances,
                            int iMaxIterations = Constants::kMaxInnerIterations);

    /// @brief Minimize G at fixed temperature and pressure
    /// @param system Chemical system (A, b, candidates)
    /// @param dTemperature Temperature (K)
    /// @param dPressure Pressure (Pa)
    /// @param minState Iteration bookkeeping (G history, counters)
    /// @param dMoles Output: moles of every candidate (zero for excluded species)
    /// @param seed Optional starting composition aligned with the candidates
    /// @return Error code (0 = success, kInvalidInput, kNoValidSpecies,
    ///         kSingularMatrix or kInnerConvergenceFailure)
    int minimize(const SpeciesState& system,
                 double dTemperature,
                 double dPressure,
                 MinimizerState& minState,
                 Eigen::VectorXd& dMoles,
                 const Eigen::VectorXd* seed = nullptr);

    /// @brief Element potentials of the last successful solve (dimensionless, per element row)
    const Eigen::VectorXd& getElementPotentials() const { return dElementPotential_; }

    /// @brief Set the Newton iteration cap
    void setMaxIterations(int iMaxIterations) { iMaxIterations_ = iMaxIterations; }

    /// @brief Get minimizer name for logging
    const char* getMinimizerName() const { return "RANDGibbsMinimizer"; }

private:
    /// @brief Select elements, species in play and their standard potentials
    int prepare(const SpeciesState& system, double dTemperature);

    /// @brief Starting composition (even split by atom count, or seed)
    void initialize(const SpeciesState& system, const Eigen::VectorXd* seed);

    /// @brief Activate a condensed carrier for every element no gas species carries
    /// @details Picks the carrier with the lowest G0 per atom of the element and
    /// seeds it so that the element row balances on its own.
    void activateCondensedCarriers();

    /// @brief True if play index k is the only active carrier of an element
    /// that no gas species carries
    bool isSoleCondensedCarrier(int k) const;

    /// @brief Chemical potentials mu_i / RT of the gas species in play
    void computeChemicalPotentials(double dLogPressure);

    /// @brief G / RT of a composition of the species in play
    double gibbsEnergy(const Eigen::VectorXd& dMolesPlay, double dLogPressure) const;

    /// @brief Solve the Newton system for (pi, u, dc) and build the update
    /// @return Error code (0 = success, kSingularMatrix)
    int computeDirection();

    /// @brief Handle a singular Newton matrix by a diagonal shift
    void handleSingular(Eigen::MatrixXd& matrix) const;

    /// @brief Largest driving force among inactive condensed species
    /// @return Play index of that species, or -1 if none is inactive
    int maxDrivingForce(double& dDrivingForce) const;

    /// @brief Scaled max of the Newton update
    double maxSpeciesChange() const;

    Tolerances tolerances_;
    int iMaxIterations_;

    // Working set (indices into the candidate list)
    std::vector<int> iElements_;        ///< Element rows with b > 0
    std::vector<int> iPlay_;            ///< Species in play
    std::vector<bool> lGas_;            ///< Gas flag per play index
    std::vector<bool> lActive_;         ///< Condensed species in the active set
    std::vector<bool> lGasCarried_;     ///< Element row has a gas carrier in play
    Eigen::VectorXd dStdGibbs_;         ///< G0 / RT per play index
    Eigen::MatrixXd dStoich_;           ///< A restricted to (iElements_, iPlay_)
    Eigen::VectorXd dMolesElement_;     ///< b restricted to iElements_

    // Iterate
    Eigen::VectorXd dMolesPlay_;        ///< n per play index
    Eigen::VectorXd dChemPotential_;    ///< mu / RT per play index
    Eigen::VectorXd dUpdate_;           ///< Newton update per play index
    Eigen::VectorXd dPi_;               ///< Element potentials per active element
    double dMolesScale_ = 1.0;          ///< max(1, max b)

    Eigen::VectorXd dElementPotential_; ///< Element potentials per element row
};

} // namespace Adiabat
