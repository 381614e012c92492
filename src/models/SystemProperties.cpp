#include "adiabat/models/SystemProperties.hpp"
#include "adiabat/models/GlushkoPolynomial.hpp"
#include "adiabat/util/Constants.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cmath>

namespace Adiabat {
namespace SystemProperties {

int evaluate(const std::vector<CandidateSpecies>& species,
             double dTemperature,
             double dPressure,
             const Eigen::VectorXd& dMoles,
             SystemThermo& thermo) {
    if (!(dPressure > 0.0) || !std::isfinite(dPressure)) {
        return ErrorCode::kInvalidInput;
    }
    if (!(dTemperature > 0.0) || !std::isfinite(dTemperature)) {
        return ErrorCode::kInvalidInput;
    }
    if (dMoles.size() != static_cast<Eigen::Index>(species.size())) {
        return ErrorCode::kInvalidInput;
    }

    const double R = Constants::kIdealGasConstant;
    const double dLogPressure = std::log(dPressure / Constants::kStandardPressure);

    SystemThermo result;
    for (size_t i = 0; i < species.size(); ++i) {
        if (dMoles(i) < 0.0 || !std::isfinite(dMoles(i))) {
            return ErrorCode::kInvalidInput;
        }
        result.dMolesTotal += dMoles(i);
        if (species[i].isGas()) {
            result.dMolesGas += dMoles(i);
        } else {
            result.dMolesCondensed += dMoles(i);
        }
    }

    for (size_t i = 0; i < species.size(); ++i) {
        const double n = dMoles(i);
        if (n <= 0.0) continue;

        StandardProperties props;
        int info = GlushkoPolynomial::evaluate(species[i], dTemperature, props);
        if (info != ErrorCode::kSuccess) return info;

        result.dHeatCapacity += n * props.dHeatCapacity;
        result.dEnthalpy += n * props.dEnthalpy;

        double dEntropy = props.dEntropy;
        if (species[i].isGas()) {
            // Partial-pressure correction -R ln(p_i / P0)
            double dMoleFraction = n / result.dMolesGas;
            dEntropy -= R * (std::log(dMoleFraction) + dLogPressure);
        }
        result.dEntropy += n * dEntropy;
    }

    result.dGibbsEnergy = result.dEnthalpy - dTemperature * result.dEntropy;
    thermo = result;

    return ErrorCode::kSuccess;
}

int derive(const std::vector<CandidateSpecies>& species,
           const Eigen::VectorXd& dSpeciesMolarMass,
           double dTotalMass,
           double dTemperature,
           double dPressure,
           const Eigen::VectorXd& dMoles,
           const SystemThermo& thermo,
           DerivedProperties& derived) {
    if (!(dTotalMass > 0.0) || !(thermo.dMolesGas > 0.0)) {
        return ErrorCode::kInvalidInput;
    }
    if (dSpeciesMolarMass.size() != dMoles.size()) {
        return ErrorCode::kInvalidInput;
    }

    const double R = Constants::kIdealGasConstant;
    DerivedProperties result;

    for (size_t i = 0; i < species.size(); ++i) {
        double dMass = dMoles(i) * dSpeciesMolarMass(i);
        if (species[i].isGas()) {
            result.dMassGas += dMass;
        } else {
            result.dMassCondensed += dMass;
        }
    }

    const double dGasCp = thermo.dHeatCapacity - R * thermo.dMolesGas;

    result.dCondensedMassFraction = result.dMassCondensed / dTotalMass;
    result.dGasMolarMass = result.dMassGas / thermo.dMolesGas;
    result.dSpecificGasConstant = R * thermo.dMolesGas / dTotalMass;
    result.dSpecificHeatCapacity = thermo.dHeatCapacity / dTotalMass;
    result.dSpecificHeatVolumetric = dGasCp / dTotalMass;
    result.dHeatCapacityRatio = thermo.dHeatCapacity / dGasCp;

    // Forward difference of H at fixed composition
    SystemThermo shifted;
    const double dDelta = Constants::kFiniteDifferenceStep;
    int info = evaluate(species, dTemperature + dDelta, dPressure, dMoles, shifted);
    if (info == ErrorCode::kSuccess) {
        result.dHeatCapacityFD = (shifted.dEnthalpy - thermo.dEnthalpy) / dDelta;
    } else {
        // Upper range edge: use the backward difference
        info = evaluate(species, dTemperature - dDelta, dPressure, dMoles, shifted);
        if (info != ErrorCode::kSuccess) return info;
        result.dHeatCapacityFD = (thermo.dEnthalpy - shifted.dEnthalpy) / dDelta;
    }

    derived = result;
    return ErrorCode::kSuccess;
}

} // namespace SystemProperties
} // namespace Adiabat
