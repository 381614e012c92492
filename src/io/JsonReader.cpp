#include "adiabat/io/JsonReader.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <fstream>
#include <sstream>

namespace Adiabat {
namespace JsonReader {

namespace {

int requireNumber(const JsonValue& parent, const std::string& key, double& value,
                  const std::string& context, std::string& cError) {
    const JsonValue* member = parent.find(key);
    if (member == nullptr || !member->isNumber()) {
        cError = context + ": missing or non-numeric \"" + key + "\"";
        return ErrorCode::kJSONParseError;
    }
    value = member->numberValue;
    return ErrorCode::kSuccess;
}

} // anonymous namespace

int readFile(const std::string& cFileName, std::string& text) {
    std::ifstream file(cFileName);
    if (!file.is_open()) {
        return ErrorCode::kInputFileError;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ErrorCode::kInputFileError;
    }
    text = buffer.str();
    return ErrorCode::kSuccess;
}

int toPropellant(const JsonValue& root, Propellant& propellant, std::string& cError) {
    if (!root.isObject()) {
        cError = "propellant: expected an object";
        return ErrorCode::kJSONParseError;
    }

    Propellant result;
    int info = requireNumber(root, "enthalpy", result.dEnthalpy, "propellant", cError);
    if (info != ErrorCode::kSuccess) return info;

    const JsonValue* composition = root.find("composition");
    if (composition == nullptr || !composition->isObject()) {
        cError = "propellant: missing or non-object \"composition\"";
        return ErrorCode::kJSONParseError;
    }
    for (const auto& cSymbol : composition->objectKeys) {
        double dAmount = 0.0;
        info = requireNumber(*composition, cSymbol, dAmount, "propellant composition", cError);
        if (info != ErrorCode::kSuccess) return info;
        result.composition.emplace_back(cSymbol, dAmount);
    }

    if (const JsonValue* basis = root.find("basis")) {
        if (!basis->isString()) {
            cError = "propellant: \"basis\" must be a string";
            return ErrorCode::kJSONParseError;
        }
        if (basis->stringValue == "moles") {
            result.iBasis = CompositionBasis::Moles;
        } else if (basis->stringValue == "mole_fraction") {
            result.iBasis = CompositionBasis::MoleFraction;
        } else if (basis->stringValue == "mass_fraction") {
            result.iBasis = CompositionBasis::MassFraction;
        } else {
            cError = "propellant: unknown basis \"" + basis->stringValue + "\"";
            return ErrorCode::kInvalidInput;
        }
    }

    if (root.find("reference_mass") != nullptr) {
        info = requireNumber(root, "reference_mass", result.dReferenceMass, "propellant", cError);
        if (info != ErrorCode::kSuccess) return info;
    }

    propellant = std::move(result);
    return ErrorCode::kSuccess;
}

int toCandidateSpecies(const JsonValue& root,
                       std::vector<CandidateSpecies>& candidates,
                       std::string& cError) {
    if (!root.isArray()) {
        cError = "combustion products: expected an array";
        return ErrorCode::kJSONParseError;
    }

    std::vector<CandidateSpecies> result;
    result.reserve(root.arrayValue.size());

    for (size_t k = 0; k < root.arrayValue.size(); ++k) {
        const JsonValue& item = root.arrayValue[k];
        const std::string context = "combustion product " + std::to_string(k);
        if (!item.isObject()) {
            cError = context + ": expected an object";
            return ErrorCode::kJSONParseError;
        }

        CandidateSpecies species;

        const JsonValue* formula = item.find("formula");
        if (formula == nullptr || !formula->isString()) {
            cError = context + ": missing or non-string \"formula\"";
            return ErrorCode::kJSONParseError;
        }
        species.cFormula = formula->stringValue;

        const JsonValue* coefficients = item.find("coefficients");
        if (coefficients == nullptr || !coefficients->isArray()) {
            cError = context + " (" + species.cFormula + "): missing or non-array \"coefficients\"";
            return ErrorCode::kJSONParseError;
        }
        if (coefficients->arrayValue.size() != species.dCoefficients.size()) {
            cError = context + " (" + species.cFormula + "): expected " +
                     std::to_string(species.dCoefficients.size()) + " coefficients, got " +
                     std::to_string(coefficients->arrayValue.size());
            return ErrorCode::kInvalidInput;
        }
        for (size_t c = 0; c < species.dCoefficients.size(); ++c) {
            if (!coefficients->arrayValue[c].isNumber()) {
                cError = context + " (" + species.cFormula + "): non-numeric coefficient";
                return ErrorCode::kJSONParseError;
            }
            species.dCoefficients[c] = coefficients->arrayValue[c].numberValue;
        }

        const JsonValue* phase = item.find("phase");
        if (phase == nullptr || !phase->isString()) {
            cError = context + " (" + species.cFormula + "): missing or non-string \"phase\"";
            return ErrorCode::kJSONParseError;
        }
        if (phase->stringValue == "gas") {
            species.iPhase = SpeciesPhase::Gas;
        } else if (phase->stringValue == "condensed") {
            species.iPhase = SpeciesPhase::Condensed;
        } else {
            cError = context + " (" + species.cFormula + "): unknown phase \"" + phase->stringValue + "\"";
            return ErrorCode::kInvalidInput;
        }

        const JsonValue* range = item.find("temperature_range");
        if (range == nullptr || !range->isObject()) {
            cError = context + " (" + species.cFormula + "): missing \"temperature_range\"";
            return ErrorCode::kJSONParseError;
        }
        int info = requireNumber(*range, "min", species.dTemperatureMin, context, cError);
        if (info != ErrorCode::kSuccess) return info;
        info = requireNumber(*range, "max", species.dTemperatureMax, context, cError);
        if (info != ErrorCode::kSuccess) return info;

        result.push_back(std::move(species));
    }

    candidates = std::move(result);
    return ErrorCode::kSuccess;
}

int readPropellant(const std::string& cFileName, Propellant& propellant, std::string& cError) {
    std::string text;
    int info = readFile(cFileName, text);
    if (info != ErrorCode::kSuccess) {
        cError = "could not open " + cFileName;
        return info;
    }

    JsonValue root;
    info = Json::parse(text, root, cError);
    if (info != ErrorCode::kSuccess) {
        cError = cFileName + ": " + cError;
        return info;
    }

    return toPropellant(root, propellant, cError);
}

int readCandidateSpecies(const std::string& cFileName,
                         std::vector<CandidateSpecies>& candidates,
                         std::string& cError) {
    std::string text;
    int info = readFile(cFileName, text);
    if (info != ErrorCode::kSuccess) {
        cError = "could not open " + cFileName;
        return info;
    }

    JsonValue root;
    info = Json::parse(text, root, cError);
    if (info != ErrorCode::kSuccess) {
        cError = cFileName + ": " + cError;
        return info;
    }

    return toCandidateSpecies(root, candidates, cError);
}

} // namespace JsonReader
} // namespace Adiabat
