#include "adiabat/models/GlushkoPolynomial.hpp"
#include "adiabat/util/Constants.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cmath>

namespace Adiabat {
namespace GlushkoPolynomial {

double heatCapacity(const GlushkoCoefficients& c, double dTemperature) {
    const double t = dTemperature * Constants::kReducedTemperatureScale;

    // Horner on d/dt of the enthalpy polynomial
    double dSum = 7.0 * c[8];
    dSum = dSum * t + 6.0 * c[7];
    dSum = dSum * t + 5.0 * c[6];
    dSum = dSum * t + 4.0 * c[5];
    dSum = dSum * t + 3.0 * c[4];
    dSum = dSum * t + 2.0 * c[3];
    dSum = dSum * t + c[2];

    return Constants::kCalorieToJoule * Constants::kReducedTemperatureScale * dSum;
}

double enthalpy(const GlushkoCoefficients& c, double dTemperature) {
    const double t = dTemperature * Constants::kReducedTemperatureScale;

    double dSum = c[8];
    for (int i = 7; i >= 1; --i) {
        dSum = dSum * t + c[i];
    }

    return Constants::kCalorieToJoule * dSum;
}

double entropy(const GlushkoCoefficients& c, double dTemperature) {
    const double t = dTemperature * Constants::kReducedTemperatureScale;

    double dPoly = (7.0 / 6.0) * c[8];
    dPoly = dPoly * t + (6.0 / 5.0) * c[7];
    dPoly = dPoly * t + (5.0 / 4.0) * c[6];
    dPoly = dPoly * t + (4.0 / 3.0) * c[5];
    dPoly = dPoly * t + 1.5 * c[4];
    dPoly = dPoly * t + 2.0 * c[3];
    dPoly = dPoly * t;

    double dIntegral = c[2] * std::log(t) + dPoly;

    return Constants::kCalorieToJoule *
           (c[0] + Constants::kReducedTemperatureScale * dIntegral);
}

double gibbsEnergy(const GlushkoCoefficients& c, double dTemperature) {
    return enthalpy(c, dTemperature) - dTemperature * entropy(c, dTemperature);
}

int evaluate(const CandidateSpecies& species,
             double dTemperature,
             StandardProperties& props) {
    if (!(dTemperature > 0.0) || !std::isfinite(dTemperature)) {
        return ErrorCode::kInvalidInput;
    }
    if (dTemperature < species.dTemperatureMin ||
        dTemperature > species.dTemperatureMax) {
        return ErrorCode::kTemperatureOutOfRange;
    }

    const auto& c = species.dCoefficients;
    props.dHeatCapacity = heatCapacity(c, dTemperature);
    props.dEnthalpy = enthalpy(c, dTemperature);
    props.dEntropy = entropy(c, dTemperature);
    props.dGibbsEnergy = props.dEnthalpy - dTemperature * props.dEntropy;

    return ErrorCode::kSuccess;
}

int validate(const CandidateSpecies& species) {
    for (double dCoeff : species.dCoefficients) {
        if (!std::isfinite(dCoeff)) {
            return ErrorCode::kInvalidCoefficients;
        }
    }
    if (!std::isfinite(species.dTemperatureMin) ||
        !std::isfinite(species.dTemperatureMax) ||
        species.dTemperatureMin <= 0.0 ||
        species.dTemperatureMin >= species.dTemperatureMax) {
        return ErrorCode::kInvalidInput;
    }
    return ErrorCode::kSuccess;
}

} // namespace GlushkoPolynomial
} // namespace Adiabat
