#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "Species.hpp"
#include "../util/Constants.hpp"
#include "../util/Tolerances.hpp"

namespace Adiabat {

/// Chemical system state: candidate species, element basis and mass balance
/// Filled by the setup routines, read by the minimizer and post-processing
struct SpeciesState {
    // System dimensions
    int nElements = 0;                  ///< Rows of the stoichiometry matrix
    int nSpecies = 0;                   ///< Columns of the stoichiometry matrix
    int nPropellantElements = 0;        ///< Leading rows that belong to the propellant
    int nGasSpecies = 0;                ///< Gas candidates
    int nCondensedSpecies = 0;          ///< Condensed candidates

    // Scalar values
    double dIdealConstant = Constants::kIdealGasConstant;  ///< Ideal gas constant
    double dTotalMass = 0.0;            ///< Propellant mass from element table (kg)
    double dTemperatureLow = 0.0;       ///< Lower end of the candidates' union range (K)
    double dTemperatureHigh = 0.0;      ///< Upper end of the candidates' union range (K)

    // Tolerances
    Tolerances tolerances;

    // Candidates in input order
    std::vector<CandidateSpecies> species;

    // Element basis
    std::vector<std::string> cElementName;  ///< Element symbols (propellant elements first)

    // 1D real arrays
    Eigen::VectorXd dMolesElement;      ///< b: element moles per reference mass
    Eigen::VectorXd dSpeciesMolarMass;  ///< Species molar mass (kg/mol, 0 if unknown element)
    Eigen::VectorXd dSpeciesTotalAtoms; ///< Atoms per formula unit
    Eigen::VectorXd dMolesSpecies;      ///< Latest composition (moles)
    Eigen::VectorXd dElementPotential;  ///< Latest element potentials (dimensionless)

    // 2D real matrices
    Eigen::MatrixXd dStoichSpecies;     ///< A: stoichiometry matrix (nElements x nSpecies)

    // Flags
    std::vector<bool> lSpeciesAllowed;  ///< All elements of the species are supplied by the propellant

    // Constructor
    SpeciesState() = default;

    /// Allocate arrays based on system dimensions
    void allocate(int numElements, int numSpecies);

    /// Reset to initial state
    void reset();

    /// Get element index by symbol (returns -1 if not found)
    int getElementIndex(const std::string& cSymbol) const;

    /// Get species index by formula (returns -1 if not found)
    int getSpeciesIndex(const std::string& cFormula) const;

    /// Max-norm of A * n - b (infinite if the vector size does not match)
    double massBalanceResidual(const Eigen::VectorXd& dMoles) const;
};

} // namespace Adiabat
