#include "adiabat/context/SpeciesState.hpp"
#include <limits>

namespace Adiabat {

void SpeciesState::allocate(int numElements, int numSpecies) {
    nElements = numElements;
    nSpecies = numSpecies;

    dMolesElement = Eigen::VectorXd::Zero(numElements);
    dSpeciesMolarMass = Eigen::VectorXd::Zero(numSpecies);
    dSpeciesTotalAtoms = Eigen::VectorXd::Zero(numSpecies);
    dMolesSpecies = Eigen::VectorXd::Zero(numSpecies);
    dElementPotential = Eigen::VectorXd::Zero(numElements);
    dStoichSpecies = Eigen::MatrixXd::Zero(numElements, numSpecies);

    cElementName.assign(numElements, std::string());
    lSpeciesAllowed.assign(numSpecies, false);
}

void SpeciesState::reset() {
    nElements = 0;
    nSpecies = 0;
    nPropellantElements = 0;
    nGasSpecies = 0;
    nCondensedSpecies = 0;
    dTotalMass = 0.0;
    dTemperatureLow = 0.0;
    dTemperatureHigh = 0.0;

    species.clear();
    cElementName.clear();
    dMolesElement.resize(0);
    dSpeciesMolarMass.resize(0);
    dSpeciesTotalAtoms.resize(0);
    dMolesSpecies.resize(0);
    dElementPotential.resize(0);
    dStoichSpecies.resize(0, 0);
    lSpeciesAllowed.clear();
}

int SpeciesState::getElementIndex(const std::string& cSymbol) const {
    for (int i = 0; i < nElements; ++i) {
        if (cElementName[i] == cSymbol) return i;
    }
    return -1;
}

int SpeciesState::getSpeciesIndex(const std::string& cFormula) const {
    for (int i = 0; i < static_cast<int>(species.size()); ++i) {
        if (species[i].cFormula == cFormula) return i;
    }
    return -1;
}

double SpeciesState::massBalanceResidual(const Eigen::VectorXd& dMoles) const {
    if (dMoles.size() != nSpecies) return std::numeric_limits<double>::infinity();
    if (nElements == 0) return 0.0;
    return (dStoichSpecies * dMoles - dMolesElement).cwiseAbs().maxCoeff();
}

} // namespace Adiabat
