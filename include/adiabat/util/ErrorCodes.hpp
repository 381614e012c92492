#pragma once

namespace Adiabat {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;

// Input validation errors (1-9)
constexpr int kInvalidInput = 1;
constexpr int kTemperatureOutOfRange = 2;
constexpr int kNoCandidateSpecies = 3;
constexpr int kInvalidFormula = 4;
constexpr int kUnknownElement = 5;
constexpr int kInvalidCoefficients = 6;

// System check errors (10-19)
constexpr int kInfeasibleMassBalance = 10;

// Inner (composition) solver errors (20-29)
constexpr int kInnerConvergenceFailure = 20;
constexpr int kSingularMatrix = 21;
constexpr int kNoValidSpecies = 22;

// Outer (temperature) solver errors (30-39)
constexpr int kOuterConvergenceFailure = 30;
constexpr int kNoSignChange = 31;

// Input/output errors (40-49)
constexpr int kInputFileError = 40;
constexpr int kJSONParseError = 41;
constexpr int kJSONWriteError = 42;

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kInvalidInput: return "Invalid input";
        case kTemperatureOutOfRange: return "Temperature out of range";
        case kNoCandidateSpecies: return "No candidate species";
        case kInvalidFormula: return "Invalid chemical formula";
        case kUnknownElement: return "Unknown element";
        case kInvalidCoefficients: return "Invalid polynomial coefficients";
        case kInfeasibleMassBalance: return "Infeasible mass balance";
        case kInnerConvergenceFailure: return "Composition solver did not converge";
        case kSingularMatrix: return "Singular matrix encountered";
        case kNoValidSpecies: return "No valid species at temperature";
        case kOuterConvergenceFailure: return "Temperature solver did not converge";
        case kNoSignChange: return "No enthalpy balance root in temperature range";
        case kInputFileError: return "Input file error";
        case kJSONParseError: return "JSON parse error";
        case kJSONWriteError: return "JSON write error";
        default: return "Unknown error";
    }
}

/// Inner solver details collapse to the InnerConvergenceFailure kind
inline bool isInnerFailure(int code) {
    return code >= 20 && code < 30;
}

/// Outer solver details collapse to the OuterConvergenceFailure kind
inline bool isOuterFailure(int code) {
    return code >= 30 && code < 40;
}

/// Input validation details collapse to the InvalidInput kind
inline bool isInputFailure(int code) {
    return code == kInvalidInput || code == kNoCandidateSpecies ||
           code == kInvalidFormula || code == kUnknownElement ||
           code == kInvalidCoefficients;
}

} // namespace ErrorCode
} // namespace Adiabat
