#include "adiabat/context/MinimizerState.hpp"

namespace Adiabat {

void MinimizerState::initIteration() {
    iterGlobal = 0;
    nAssemblageChanges = 0;
    dMassBalanceResidual = 0.0;
    dMaxSpeciesChange = 0.0;
    dMaxDrivingForce = 0.0;
    dGibbsEnergy = 0.0;
    lConverged = false;
    dGibbsHistory.clear();
    lFeasibleHistory.clear();
}

void MinimizerState::reset() {
    initIteration();
    iterTotal = 0;
    nInnerSolves = 0;
    nInnerFailures = 0;
    iterOuter = 0;
    dTemperatureHistory.clear();
    dResidualHistory.clear();
    dMolesLast.resize(0);
    lWarmStartAvailable = false;
}

} // namespace Adiabat
