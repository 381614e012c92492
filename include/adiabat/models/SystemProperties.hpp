/// @file SystemProperties.hpp
/// @brief Extensive properties of a product mixture at (T, P, n)
/// @details Gas species are an ideal mixture: each contributes
/// S_i - R ln(x_i P / P0) with x_i = n_i / n_gas, where x ln x -> 0 at x = 0.
/// Condensed species contribute their pure standard-state entropy.
/// Species with zero moles are skipped and need not be valid at T.

#pragma once

#include <Eigen/Dense>
#include <vector>
#include "adiabat/context/Species.hpp"

namespace Adiabat {

/// Extensive mixture properties
struct SystemThermo {
    double dHeatCapacity = 0.0;     ///< Cp_sys = sum n_i Cp_i (J/K)
    double dEnthalpy = 0.0;         ///< H_sys (J)
    double dEntropy = 0.0;          ///< S_sys including mixing (J/K)
    double dGibbsEnergy = 0.0;      ///< G_sys = H_sys - T S_sys (J)
    double dMolesTotal = 0.0;       ///< sum n_i
    double dMolesGas = 0.0;         ///< sum over gas species
    double dMolesCondensed = 0.0;   ///< sum over condensed species
};

/// Reporting quantities derived from SystemThermo and species masses
struct DerivedProperties {
    double dMassGas = 0.0;                  ///< Gas mass (kg)
    double dMassCondensed = 0.0;            ///< Condensed mass (kg)
    double dCondensedMassFraction = 0.0;    ///< Condensed mass / total mass
    double dGasMolarMass = 0.0;             ///< Gas mass / n_gas (kg/mol)
    double dSpecificGasConstant = 0.0;      ///< R n_gas / m_total (J/(kg K))
    double dSpecificHeatCapacity = 0.0;     ///< Cp_sys / m_total (J/(kg K))
    double dSpecificHeatVolumetric = 0.0;   ///< (Cp_sys - R n_gas) / m_total (J/(kg K))
    double dHeatCapacityRatio = 0.0;        ///< Cp_sys / (Cp_sys - R n_gas)
    double dHeatCapacityFD = 0.0;           ///< (H(T + dT) - H(T)) / dT at fixed n (J/K)
};

namespace SystemProperties {

/// @brief Aggregate mixture properties
/// @param species Candidate species aligned with dMoles
/// @param dTemperature Temperature (K)
/// @param dPressure Pressure (Pa)
/// @param dMoles Moles of each species (>= 0)
/// @param thermo Output: mixture properties
/// @return Error code (0 = success, kInvalidInput for bad T, P or a size
///         mismatch, kTemperatureOutOfRange if a species with moles > 0 is
///         not valid at T)
int evaluate(const std::vector<CandidateSpecies>& species,
             double dTemperature,
             double dPressure,
             const Eigen::VectorXd& dMoles,
             SystemThermo& thermo);

/// @brief Derive the reporting quantities
/// @param species Candidate species aligned with dMoles
/// @param dSpeciesMolarMass Species molar masses (kg/mol)
/// @param dTotalMass Propellant mass (kg)
/// @param dTemperature Temperature (K)
/// @param dPressure Pressure (Pa)
/// @param dMoles Moles of each species
/// @param thermo Mixture properties at (T, n)
/// @param derived Output: derived quantities
/// @return Error code (0 = success, kInvalidInput for zero mass or zero gas moles)
int derive(const std::vector<CandidateSpecies>& species,
           const Eigen::VectorXd& dSpeciesMolarMass,
           double dTotalMass,
           double dTemperature,
           double dPressure,
           const Eigen::VectorXd& dMoles,
           const SystemThermo& thermo,
           DerivedProperties& derived);

} // namespace SystemProperties
} // namespace Adiabat
