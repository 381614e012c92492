#include "adiabat/io/JsonWriter.hpp"
#include "adiabat/io/JsonValue.hpp"
#include "adiabat/AdiabatContext.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Adiabat {
namespace JsonWriter {

namespace {

bool writeNumber(std::ostream& out, double value) {
    if (!std::isfinite(value)) return false;
    out << value;
    return true;
}

} // anonymous namespace

int formatResults(const AdiabatContext& ctx, std::string& text) {
    const auto& io = *ctx.io;

    if (io.INFOAdiabat != 0 ||
        io.dMolesSpeciesOut.size() != static_cast<Eigen::Index>(io.cSpeciesNameOut.size())) {
        return ErrorCode::kJSONWriteError;
    }

    const std::string indent1(4, ' ');
    const std::string indent2(8, ' ');
    const std::string indent3(12, ' ');

    std::ostringstream out;
    out << std::setprecision(16);
    bool lFinite = true;

    out << "{\n";
    out << indent1 << "\"pressure\": ";
    lFinite &= writeNumber(out, io.dPressure);
    out << ",\n";
    out << indent1 << "\"temperature\": ";
    lFinite &= writeNumber(out, io.dTemperature);
    out << ",\n";
    out << indent1 << "\"specific_heat_capacity_volumetric\": ";
    lFinite &= writeNumber(out, io.dSpecificHeatVolumetric);
    out << ",\n";
    out << indent1 << "\"gas_average_molar_mass\": ";
    lFinite &= writeNumber(out, io.dGasMolarMass);
    out << ",\n";

    // Propellant record
    out << indent1 << "\"propellant\": {\n";
    out << indent2 << "\"enthalpy\": ";
    lFinite &= writeNumber(out, io.propellant.dEnthalpy);
    out << ",\n";
    out << indent2 << "\"composition\": {";
    const auto& composition = io.propellant.composition;
    if (!composition.empty()) {
        out << "\n";
        for (size_t i = 0; i < composition.size(); ++i) {
            out << indent3 << Json::quote(composition[i].first) << ": ";
            lFinite &= writeNumber(out, composition[i].second);
            if (i + 1 < composition.size()) out << ",";
            out << "\n";
        }
        out << indent2;
    }
    out << "},\n";
    out << indent2 << "\"total_mass_kg\": ";
    lFinite &= writeNumber(out, io.dTotalMass);
    out << "\n";
    out << indent1 << "},\n";

    // Products in input order
    out << indent1 << "\"combustion_products\": [";
    const size_t nSpecies = io.cSpeciesNameOut.size();
    if (nSpecies > 0) {
        out << "\n";
        for (size_t i = 0; i < nSpecies; ++i) {
            out << indent2 << "{\n";
            out << indent3 << "\"formula\": " << Json::quote(io.cSpeciesNameOut[i]) << ",\n";
            out << indent3 << "\"phase\": " << Json::quote(io.cSpeciesPhaseOut[i]) << ",\n";
            out << indent3 << "\"moles\": ";
            lFinite &= writeNumber(out, io.dMolesSpeciesOut(static_cast<Eigen::Index>(i)));
            out << "\n";
            out << indent2 << "}";
            if (i + 1 < nSpecies) out << ",";
            out << "\n";
        }
        out << indent1;
    }
    out << "]\n";
    out << "}\n";

    if (!lFinite) {
        return ErrorCode::kJSONWriteError;
    }

    text = out.str();
    return ErrorCode::kSuccess;
}

int writeResults(const std::string& cFileName, const AdiabatContext& ctx) {
    std::string text;
    int info = formatResults(ctx, text);
    if (info != ErrorCode::kSuccess) return info;

    std::ofstream file(cFileName);
    if (!file.is_open()) {
        return ErrorCode::kJSONWriteError;
    }
    file << text;
    file.close();
    if (file.fail()) {
        return ErrorCode::kJSONWriteError;
    }
    return ErrorCode::kSuccess;
}

} // namespace JsonWriter
} // namespace Adiabat
