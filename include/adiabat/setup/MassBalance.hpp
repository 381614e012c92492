/// @file MassBalance.hpp
/// @brief Elemental mass-balance system A n = b
/// @details Builds the stoichiometry matrix (elements x species) and the
/// element-moles vector of one reference mass of propellant. Element rows
/// hold the propellant elements first, in their given order, followed by
/// elements that only the candidates contain, in order of first appearance.

#pragma once

#include <vector>
#include "adiabat/context/Species.hpp"
#include "adiabat/context/SpeciesState.hpp"

namespace Adiabat {
namespace MassBalance {

/// @brief Convert a propellant composition to element moles per reference mass
/// @param propellant Propellant record
/// @param elementMoles Output: element symbol -> moles, in composition order
/// @param dTotalMass Output: propellant mass (kg)
/// @return Error code (0 = success, kInvalidInput for an empty, negative or
///         all-zero composition, a duplicated or malformed symbol or a
///         non-positive reference mass, kUnknownElement for a symbol with no
///         tabulated molar mass)
int computeElementMoles(const Propellant& propellant,
                        ElementAmounts& elementMoles,
                        double& dTotalMass);

/// @brief Build A, b and the species bookkeeping in a SpeciesState
/// @param propellant Propellant record
/// @param candidates Candidate species (copied into state.species with parsed formulas)
/// @param state Output: allocated and filled system state
/// @return Error code (0 = success, kNoCandidateSpecies, kInvalidFormula,
///         kInvalidCoefficients, kInvalidInput, kUnknownElement or
///         kInfeasibleMassBalance when a propellant element has no supplying species)
int build(const Propellant& propellant,
          const std::vector<CandidateSpecies>& candidates,
          SpeciesState& state);

} // namespace MassBalance
} // namespace Adiabat
