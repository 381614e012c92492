/// @file GlushkoPolynomial.hpp
/// @brief Standard-state properties from 9-coefficient Glushko polynomials
/// @details Coefficients are calorie based with reduced temperature t = T/1000:
///
///   H(T)  = 4.184 (c1 + c2 t + c3 t^2 + ... + c8 t^7)                       [J/mol]
///   Cp(T) = 4.184e-3 (c2 + 2 c3 t + 3 c4 t^2 + ... + 7 c8 t^6)              [J/(mol K)]
///   S(T)  = 4.184 (c0 + 1e-3 (c2 ln t + 2 c3 t + 3/2 c4 t^2 + 4/3 c5 t^3
///                 + 5/4 c6 t^4 + 6/5 c7 t^5 + 7/6 c8 t^6))                  [J/(mol K)]
///   G(T)  = H - T S
///
/// c1 is the enthalpy integration constant and c0 the entropy integration
/// constant. All functions are pure.

#pragma once

#include "adiabat/context/Species.hpp"

namespace Adiabat {

/// Standard-state properties of one species at one temperature
struct StandardProperties {
    double dHeatCapacity = 0.0;     ///< Cp (J/(mol K))
    double dEnthalpy = 0.0;         ///< H (J/mol)
    double dEntropy = 0.0;          ///< S at standard pressure (J/(mol K))
    double dGibbsEnergy = 0.0;      ///< G = H - T S (J/mol)
};

namespace GlushkoPolynomial {

/// @brief Molar heat capacity, no range check
double heatCapacity(const GlushkoCoefficients& c, double dTemperature);

/// @brief Molar enthalpy, no range check
double enthalpy(const GlushkoCoefficients& c, double dTemperature);

/// @brief Standard molar entropy, no range check
double entropy(const GlushkoCoefficients& c, double dTemperature);

/// @brief Standard molar Gibbs energy, no range check
double gibbsEnergy(const GlushkoCoefficients& c, double dTemperature);

/// @brief Evaluate all standard-state properties of a species
/// @param species Candidate species (coefficients and validity range)
/// @param dTemperature Temperature (K)
/// @param props Output: properties (left untouched on error)
/// @return Error code (0 = success, kTemperatureOutOfRange outside
///         [dTemperatureMin, dTemperatureMax], kInvalidInput for T <= 0 or NaN)
int evaluate(const CandidateSpecies& species,
             double dTemperature,
             StandardProperties& props);

/// @brief Validate a species record
/// @return Error code (0 = success, kInvalidCoefficients for non-finite
///         coefficients, kInvalidInput for an empty or inverted range)
int validate(const CandidateSpecies& species);

} // namespace GlushkoPolynomial
} // namespace Adiabat
