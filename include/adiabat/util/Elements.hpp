#pragma once

#include <string>

namespace Adiabat {
namespace Elements {

/// Number of elements in the periodic table lookup (H through Pu)
constexpr int kNumElements = 94;

/// Get atomic number of an element symbol
/// @param cSymbol Element symbol (case sensitive, e.g. "He")
/// @return Atomic number, or 0 if the symbol is unknown
int atomicNumber(const std::string& cSymbol);

/// Check if an element symbol is known
bool isKnown(const std::string& cSymbol);

/// Get the standard molar mass of an element
/// @param cSymbol Element symbol
/// @return Molar mass in kg/mol, or 0 if the symbol is unknown
double molarMass(const std::string& cSymbol);

/// Get element symbol by atomic number (1-based)
const char* symbol(int iAtomicNumber);

} // namespace Elements
} // namespace Adiabat
