/// @file JsonReader.hpp
/// @brief Readers for the propellant and combustion-product documents
/// @details
/// Propellant:
/// @code
/// {"enthalpy": -8.23e+6, "composition": {"C": 45.67, "H": 67.98},
///  "basis": "moles", "reference_mass": 1.0}
/// @endcode
/// "basis" ("moles", "mole_fraction", "mass_fraction") and "reference_mass"
/// are optional. Combustion products are an array of
/// @code
/// {"formula": "O", "coefficients": [9 numbers], "phase": "gas",
///  "temperature_range": {"min": 1000, "max": 5000}}
/// @endcode

#pragma once

#include <string>
#include <vector>
#include "adiabat/context/Species.hpp"
#include "adiabat/io/JsonValue.hpp"

namespace Adiabat {
namespace JsonReader {

/// @brief Read a propellant document from disk
/// @return Error code (0 = success, kInputFileError, kJSONParseError for bad
///         syntax or missing/mistyped keys, kInvalidInput for an unknown basis)
int readPropellant(const std::string& cFileName, Propellant& propellant, std::string& cError);

/// @brief Read a combustion-product list from disk
/// @return Error code (0 = success, kInputFileError, kJSONParseError, or
///         kInvalidInput for a wrong coefficient count or an unknown phase)
int readCandidateSpecies(const std::string& cFileName,
                         std::vector<CandidateSpecies>& candidates,
                         std::string& cError);

/// @brief Convert a parsed propellant document
int toPropellant(const JsonValue& root, Propellant& propellant, std::string& cError);

/// @brief Convert a parsed combustion-product list
int toCandidateSpecies(const JsonValue& root,
                       std::vector<CandidateSpecies>& candidates,
                       std::string& cError);

/// @brief Read a whole file into a string
/// @return Error code (0 = success, kInputFileError)
int readFile(const std::string& cFileName, std::string& text);

} // namespace JsonReader
} // namespace Adiabat
