#include "adiabat/Adiabat.hpp"
#include <iomanip>
#include <iostream>

namespace Adiabat {

void printResults(AdiabatContext& ctx) {
    switch (ctx.io->iPrintResultsMode) {
        case 1:
            printResultsSummary(ctx);
            break;
        case 2:
            printResultsDetailed(ctx);
            break;
        default:
            break;
    }
}

void printResultsSummary(AdiabatContext& ctx) {
    auto& io = *ctx.io;

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "           ADIABAT RESULTS\n";
    std::cout << "========================================\n";

    std::cout << "\nConditions:\n";
    std::cout << "  Pressure:    " << std::scientific << std::setprecision(6)
              << io.dPressure << " Pa\n";
    std::cout << "  Enthalpy:    " << io.propellant.dEnthalpy << " J\n";
    std::cout << "  Mass:        " << io.dTotalMass << " kg\n";

    std::cout << "\nEquilibrium:\n";
    std::cout << "  Temperature: " << std::fixed << std::setprecision(4)
              << io.dTemperature << " K\n";
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "  Cv:          " << io.dSpecificHeatVolumetric << " J/(kg K)\n";
    std::cout << "  Gas M:       " << io.dGasMolarMass << " kg/mol\n";

    std::cout << "\nCombustion Products:\n";
    for (int i = 0; i < static_cast<int>(io.cSpeciesNameOut.size()); ++i) {
        if (io.dMolesSpeciesOut(i) <= 0.0) continue;
        std::cout << "  " << std::setw(12) << std::left << io.cSpeciesNameOut[i]
                  << std::setw(10) << io.cSpeciesPhaseOut[i]
                  << ": " << std::scientific << std::setprecision(6)
                  << io.dMolesSpeciesOut(i) << " mol\n";
    }
    std::cout << std::right;

    std::cout << "\n========================================\n\n";
}

void printResultsDetailed(AdiabatContext& ctx) {
    auto& io = *ctx.io;
    auto& system = *ctx.species;
    auto& minState = *ctx.solver;

    printResultsSummary(ctx);

    std::cout << "System Properties:\n";
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "  Enthalpy:        " << io.dEnthalpySys << " J\n";
    std::cout << "  Entropy:         " << io.dEntropySys << " J/K\n";
    std::cout << "  Gibbs energy:    " << io.dGibbsEnergySys << " J\n";
    std::cout << "  Heat capacity:   " << io.dHeatCapacitySys << " J/K"
              << " (finite difference " << io.dHeatCapacityFD << ")\n";
    std::cout << "  cp:              " << io.dSpecificHeatCapacity << " J/(kg K)\n";
    std::cout << "  R_gas:           " << io.dSpecificGasConstant << " J/(kg K)\n";
    std::cout << "  gamma:           " << io.dHeatCapacityRatio << "\n";
    std::cout << "  Condensed mass:  " << io.dCondensedMassFraction << "\n";
    std::cout << "  Moles (gas/condensed): " << io.dMolesGas << " / " << io.dMolesCondensed << "\n";

    std::cout << "\nAll Candidates:\n";
    for (int i = 0; i < static_cast<int>(io.cSpeciesNameOut.size()); ++i) {
        std::cout << "  " << std::setw(12) << std::left << io.cSpeciesNameOut[i]
                  << std::setw(10) << io.cSpeciesPhaseOut[i] << std::right
                  << ": " << io.dMolesSpeciesOut(i) << " mol";
        if (io.dMolesTotal > 0.0) {
            std::cout << "  x = " << io.dMolesSpeciesOut(i) / io.dMolesTotal;
        }
        std::cout << "\n";
    }

    std::cout << "\nElement Potentials (mu / RT):\n";
    for (int j = 0; j < system.nElements && j < system.dElementPotential.size(); ++j) {
        std::cout << "  " << std::setw(4) << std::left << system.cElementName[j] << std::right
                  << ": " << system.dElementPotential(j) << "\n";
    }

    std::cout << "\nSolver:\n";
    std::cout << "  Outer iterations:   " << minState.iterOuter << "\n";
    std::cout << "  Inner solves:       " << minState.nInnerSolves
              << " (" << minState.nInnerFailures << " failed)\n";
    std::cout << "  Newton iterations:  " << minState.iterTotal << "\n";
    std::cout << "  Mass balance error: " << minState.dMassBalanceResidual << "\n";

    std::cout << "\n========================================\n\n";
}

} // namespace Adiabat
