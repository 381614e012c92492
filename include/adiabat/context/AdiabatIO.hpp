#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "Species.hpp"
#include "../util/Constants.hpp"

namespace Adiabat {

/// Input/Output state
/// Bridge between external callers and internal state
struct AdiabatIO {
    // Input variables
    int iPrintResultsMode = 0;          ///< Print results mode (0=none, 1=summary, 2=detailed)
    double dPressure = 0.0;             ///< Chamber pressure (Pa)

    Propellant propellant;                      ///< Propellant record
    std::vector<CandidateSpecies> candidates;   ///< Candidate products in input order

    // Solver configuration
    RootFinderType iRootFinder = RootFinderType::Brent;                 ///< Outer root finder
    int iMaxInnerIterations = Constants::kMaxInnerIterations;          ///< Inner iteration cap
    int iMaxOuterIterations = Constants::kMaxOuterIterations;          ///< Outer iteration cap
    int nBracketSamples = Constants::kDefaultBracketSamples;           ///< Interior bracket samples
    double dTemperatureMargin = Constants::kDefaultTemperatureMargin;  ///< Distance kept from range edges (K)

    // Optional explicit search bounds
    bool lTemperatureBounds = false;    ///< Explicit bounds set
    double dTemperatureLowInput = 0.0;  ///< Requested lower bound (K)
    double dTemperatureHighInput = 0.0; ///< Requested upper bound (K)

    // Control flags
    bool lDebugMode = false;            ///< Trace iterations on stderr

    // Output variables
    int INFOAdiabat = 0;                ///< Status/error code
    double dTemperature = 0.0;          ///< Equilibrium temperature (K)
    double dTemperatureLow = 0.0;       ///< Search range used, lower end (K)
    double dTemperatureHigh = 0.0;      ///< Search range used, upper end (K)
    double dGibbsEnergySys = 0.0;       ///< System Gibbs energy (J)
    double dEnthalpySys = 0.0;          ///< System enthalpy (J)
    double dEntropySys = 0.0;           ///< System entropy (J/K)
    double dHeatCapacitySys = 0.0;      ///< System heat capacity (J/K)
    double dHeatCapacityFD = 0.0;       ///< Heat capacity from enthalpy difference (J/K)
    double dMolesTotal = 0.0;           ///< Total product moles
    double dMolesGas = 0.0;             ///< Gas product moles
    double dMolesCondensed = 0.0;       ///< Condensed product moles
    double dCondensedMassFraction = 0.0;    ///< Condensed mass / propellant mass
    double dGasMolarMass = 0.0;         ///< Average gas molar mass (kg/mol)
    double dSpecificGasConstant = 0.0;  ///< R n_gas / m (J/(kg K))
    double dSpecificHeatCapacity = 0.0; ///< cp (J/(kg K))
    double dSpecificHeatVolumetric = 0.0;   ///< cv = (Cp - R n_gas) / m (J/(kg K))
    double dHeatCapacityRatio = 0.0;    ///< gamma
    double dTotalMass = 0.0;            ///< Propellant mass (kg)

    Eigen::VectorXd dMolesSpeciesOut;       ///< Moles per candidate
    std::vector<std::string> cSpeciesNameOut;   ///< Candidate formulas
    std::vector<std::string> cSpeciesPhaseOut;  ///< Candidate phase names

    // Constructor
    AdiabatIO() = default;

    /// Reset output variables (inputs are kept)
    void resetOutput();

    /// Reset everything
    void reset();
};

} // namespace Adiabat
