/// @file FormulaParser.hpp
/// @brief Chemical formula parser
/// @details Parses flat formulas such as "H2O", "Fe3O4" or "CH3OH" into
/// element symbol -> atom count. Symbols are an uppercase letter followed by
/// lowercase letters; a missing count means 1; repeated symbols are summed.
/// Parentheses, charges and fractional counts are rejected.

#pragma once

#include <string>
#include "adiabat/context/Species.hpp"

namespace Adiabat {
namespace FormulaParser {

/// @brief Parse a chemical formula
/// @param cFormula Formula string
/// @param counts Output: element counts in order of first appearance
/// @return Error code (0 = success, kInvalidFormula on malformed input)
int parse(const std::string& cFormula, ElementCounts& counts);

/// @brief Atom count of an element in parsed counts
/// @return Count, or 0 if the element does not occur
int countOf(const ElementCounts& counts, const std::string& cElement);

/// @brief Total number of atoms in parsed counts
int totalAtoms(const ElementCounts& counts);

/// @brief Molar mass of a parsed formula from the element table
/// @param counts Parsed element counts
/// @param dMolarMass Output: molar mass (kg/mol)
/// @return Error code (0 = success, kUnknownElement if a symbol is not tabulated)
int molarMass(const ElementCounts& counts, double& dMolarMass);

} // namespace FormulaParser
} // namespace Adiabat
