#include "adiabat/Adiabat.hpp"
#include "adiabat/models/SystemProperties.hpp"
#include <cmath>

namespace Adiabat {

void postProcess(AdiabatContext& ctx) {
    auto& system = *ctx.species;
    auto& io = *ctx.io;

    const Eigen::VectorXd& dMoles = system.dMolesSpecies;

    SystemThermo thermo;
    int info = SystemProperties::evaluate(system.species, io.dTemperature, io.dPressure,
                                          dMoles, thermo);
    if (info != ErrorCode::kSuccess) {
        io.INFOAdiabat = info;
        return;
    }

    io.dGibbsEnergySys = thermo.dGibbsEnergy;
    io.dEnthalpySys = thermo.dEnthalpy;
    io.dEntropySys = thermo.dEntropy;
    io.dHeatCapacitySys = thermo.dHeatCapacity;
    io.dMolesTotal = thermo.dMolesTotal;
    io.dMolesGas = thermo.dMolesGas;
    io.dMolesCondensed = thermo.dMolesCondensed;

    // Gas-based quantities need gas moles; an all-condensed result keeps them at zero
    if (thermo.dMolesGas > 0.0) {
        DerivedProperties derived;
        info = SystemProperties::derive(system.species, system.dSpeciesMolarMass, system.dTotalMass,
                                        io.dTemperature, io.dPressure, dMoles, thermo, derived);
        if (info != ErrorCode::kSuccess) {
            io.INFOAdiabat = info;
            return;
        }

        io.dCondensedMassFraction = derived.dCondensedMassFraction;
        io.dGasMolarMass = derived.dGasMolarMass;
        io.dSpecificGasConstant = derived.dSpecificGasConstant;
        io.dSpecificHeatCapacity = derived.dSpecificHeatCapacity;
        io.dSpecificHeatVolumetric = derived.dSpecificHeatVolumetric;
        io.dHeatCapacityRatio = derived.dHeatCapacityRatio;
        io.dHeatCapacityFD = derived.dHeatCapacityFD;
    } else if (system.dTotalMass > 0.0) {
        io.dCondensedMassFraction = 1.0;
        io.dSpecificHeatCapacity = thermo.dHeatCapacity / system.dTotalMass;
        io.dSpecificHeatVolumetric = io.dSpecificHeatCapacity;
    }

    // Per-candidate output in input order
    io.dMolesSpeciesOut = dMoles;
    io.cSpeciesNameOut.clear();
    io.cSpeciesPhaseOut.clear();
    for (const auto& candidate : system.species) {
        io.cSpeciesNameOut.push_back(candidate.cFormula);
        io.cSpeciesPhaseOut.push_back(phaseName(candidate.iPhase));
    }
}

} // namespace Adiabat
