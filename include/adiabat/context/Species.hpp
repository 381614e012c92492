/// @file Species.hpp
/// @brief Input records: candidate combustion products and the propellant
/// @details Plain data; validation is done by the setup routines and the
/// property evaluator, not by these types.

#pragma once

#include <array>
#include <string>
#include <utility>
#include <vector>
#include "adiabat/util/Constants.hpp"

namespace Adiabat {

/// Phase tag of a candidate species
enum class SpeciesPhase {
    Gas,            ///< Ideal gas, takes part in mixing
    Condensed       ///< Pure condensed phase, no mixing term
};

/// Interpretation of the propellant composition amounts
enum class CompositionBasis {
    Moles,          ///< Moles of element contained in the reference mass
    MoleFraction,   ///< Element mole fractions, scaled to the reference mass
    MassFraction    ///< Element mass fractions, scaled to the reference mass
};

/// Outer temperature root-finding method
enum class RootFinderType {
    Brent,          ///< Brent-Dekker (inverse quadratic / secant / bisection)
    Bisection       ///< Plain bisection
};

/// Ordered element symbol -> atom count, in order of first appearance
using ElementCounts = std::vector<std::pair<std::string, int>>;

/// Ordered element symbol -> amount
using ElementAmounts = std::vector<std::pair<std::string, double>>;

/// Glushko coefficient array (c0..c8)
using GlushkoCoefficients = std::array<double, Constants::kNumGlushkoCoeff>;

/// A possible combustion product
struct CandidateSpecies {
    std::string cFormula;                       ///< Chemical formula (e.g. "H2O")
    GlushkoCoefficients dCoefficients{};        ///< Glushko coefficients c0..c8
    SpeciesPhase iPhase = SpeciesPhase::Gas;    ///< Phase tag
    double dTemperatureMin = 0.0;               ///< Lower bound of validity range (K)
    double dTemperatureMax = 0.0;               ///< Upper bound of validity range (K)
    ElementCounts elementCounts;                ///< Parsed formula (filled by setup)

    CandidateSpecies() = default;

    CandidateSpecies(std::string formula,
                     const GlushkoCoefficients& coefficients,
                     SpeciesPhase phase,
                     double temperatureMin,
                     double temperatureMax)
        : cFormula(std::move(formula)),
          dCoefficients(coefficients),
          iPhase(phase),
          dTemperatureMin(temperatureMin),
          dTemperatureMax(temperatureMax) {}

    bool isGas() const { return iPhase == SpeciesPhase::Gas; }

    /// Validity check used by the mass balance filter: min <= T < max
    bool isValidAt(double dTemperature) const {
        return dTemperature >= dTemperatureMin && dTemperature < dTemperatureMax;
    }
};

/// Propellant record
struct Propellant {
    double dEnthalpy = 0.0;                                 ///< Enthalpy of the reference mass (J)
    ElementAmounts composition;                             ///< Element symbol -> amount
    CompositionBasis iBasis = CompositionBasis::Moles;      ///< How amounts are interpreted
    double dReferenceMass = 1.0;                            ///< Reference mass (kg)
};

/// Phase name used by the JSON formats
inline const char* phaseName(SpeciesPhase iPhase) {
    return iPhase == SpeciesPhase::Gas ? "gas" : "condensed";
}

} // namespace Adiabat
