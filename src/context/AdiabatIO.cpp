#include "adiabat/context/AdiabatIO.hpp"

namespace Adiabat {

void AdiabatIO::resetOutput() {
    INFOAdiabat = 0;
    dTemperature = 0.0;
    dTemperatureLow = 0.0;
    dTemperatureHigh = 0.0;
    dGibbsEnergySys = 0.0;
    dEnthalpySys = 0.0;
    dEntropySys = 0.0;
    dHeatCapacitySys = 0.0;
    dHeatCapacityFD = 0.0;
    dMolesTotal = 0.0;
    dMolesGas = 0.0;
    dMolesCondensed = 0.0;
    dCondensedMassFraction = 0.0;
    dGasMolarMass = 0.0;
    dSpecificGasConstant = 0.0;
    dSpecificHeatCapacity = 0.0;
    dSpecificHeatVolumetric = 0.0;
    dHeatCapacityRatio = 0.0;
    dTotalMass = 0.0;

    dMolesSpeciesOut.resize(0);
    cSpeciesNameOut.clear();
    cSpeciesPhaseOut.clear();
}

void AdiabatIO::reset() {
    resetOutput();

    iPrintResultsMode = 0;
    dPressure = 0.0;
    propellant = Propellant();
    candidates.clear();

    iRootFinder = RootFinderType::Brent;
    iMaxInnerIterations = Constants::kMaxInnerIterations;
    iMaxOuterIterations = Constants::kMaxOuterIterations;
    nBracketSamples = Constants::kDefaultBracketSamples;
    dTemperatureMargin = Constants::kDefaultTemperatureMargin;

    lTemperatureBounds = false;
    dTemperatureLowInput = 0.0;
    dTemperatureHighInput = 0.0;
    lDebugMode = false;
}

} // namespace Adiabat
