/// @file JsonWriter.hpp
/// @brief Result document writer
/// @details Writes pressure, temperature, specific_heat_capacity_volumetric,
/// gas_average_molar_mass, the propellant record (with total_mass_kg) and
/// the combustion_products array, indented by four spaces.

#pragma once

#include <string>

namespace Adiabat {

class AdiabatContext;

namespace JsonWriter {

/// @brief Format the result document of a successful calculation
/// @param ctx Calculation context
/// @param text Output: document text
/// @return Error code (0 = success, kJSONWriteError if a value is not finite
///         or the context holds no result)
int formatResults(const AdiabatContext& ctx, std::string& text);

/// @brief Write the result document to a file
/// @return Error code (0 = success, kJSONWriteError)
int writeResults(const std::string& cFileName, const AdiabatContext& ctx);

} // namespace JsonWriter
} // namespace Adiabat
