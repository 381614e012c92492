#include "adiabat/setup/MassBalance.hpp"
#include "adiabat/models/GlushkoPolynomial.hpp"
#include "adiabat/parser/FormulaParser.hpp"
#include "adiabat/util/Elements.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <algorithm>
#include <cmath>

namespace Adiabat {
namespace MassBalance {

namespace {

/// A composition key must be a single element symbol with no count
bool isElementSymbol(const std::string& cSymbol) {
    ElementCounts counts;
    if (FormulaParser::parse(cSymbol, counts) != ErrorCode::kSuccess) return false;
    return counts.size() == 1 && counts[0].first == cSymbol;
}

} // anonymous namespace

int computeElementMoles(const Propellant& propellant,
                        ElementAmounts& elementMoles,
                        double& dTotalMass) {
    elementMoles.clear();
    dTotalMass = 0.0;

    if (propellant.composition.empty()) {
        return ErrorCode::kInvalidInput;
    }
    if (!std::isfinite(propellant.dEnthalpy)) {
        return ErrorCode::kInvalidInput;
    }

    // Validate symbols and amounts
    double dSum = 0.0;
    std::vector<double> dMolarMass;
    dMolarMass.reserve(propellant.composition.size());

    for (size_t i = 0; i < propellant.composition.size(); ++i) {
        const auto& [cSymbol, dAmount] = propellant.composition[i];

        if (!isElementSymbol(cSymbol)) {
            return ErrorCode::kInvalidInput;
        }
        for (size_t k = 0; k < i; ++k) {
            if (propellant.composition[k].first == cSymbol) {
                return ErrorCode::kInvalidInput;
            }
        }
        if (!std::isfinite(dAmount) || dAmount < 0.0) {
            return ErrorCode::kInvalidInput;
        }

        double dMass = Elements::molarMass(cSymbol);
        if (dMass <= 0.0) {
            return ErrorCode::kUnknownElement;
        }
        dMolarMass.push_back(dMass);
        dSum += dAmount;
    }

    if (!(dSum > 0.0)) {
        return ErrorCode::kInvalidInput;
    }

    switch (propellant.iBasis) {
        case CompositionBasis::Moles: {
            // Amounts are already moles in the reference mass
            for (size_t i = 0; i < propellant.composition.size(); ++i) {
                const auto& [cSymbol, dAmount] = propellant.composition[i];
                elementMoles.emplace_back(cSymbol, dAmount);
                dTotalMass += dAmount * dMolarMass[i];
            }
            break;
        }
        case CompositionBasis::MoleFraction: {
            if (!(propellant.dReferenceMass > 0.0) || !std::isfinite(propellant.dReferenceMass)) {
                return ErrorCode::kInvalidInput;
            }
            double dMeanMass = 0.0;
            for (size_t i = 0; i < propellant.composition.size(); ++i) {
                dMeanMass += (propellant.composition[i].second / dSum) * dMolarMass[i];
            }
            double dMolesAtoms = propellant.dReferenceMass / dMeanMass;
            for (const auto& [cSymbol, dAmount] : propellant.composition) {
                elementMoles.emplace_back(cSymbol, (dAmount / dSum) * dMolesAtoms);
            }
            dTotalMass = propellant.dReferenceMass;
            break;
        }
        case CompositionBasis::MassFraction: {
            if (!(propellant.dReferenceMass > 0.0) || !std::isfinite(propellant.dReferenceMass)) {
                return ErrorCode::kInvalidInput;
            }
            for (size_t i = 0; i < propellant.composition.size(); ++i) {
                const auto& [cSymbol, dAmount] = propellant.composition[i];
                double dMass = (dAmount / dSum) * propellant.dReferenceMass;
                elementMoles.emplace_back(cSymbol, dMass / dMolarMass[i]);
            }
            dTotalMass = propellant.dReferenceMass;
            break;
        }
    }

    return ErrorCode::kSuccess;
}

int build(const Propellant& propellant,
          const std::vector<CandidateSpecies>& candidates,
          SpeciesState& state) {
    state.reset();

    if (candidates.empty()) {
        return ErrorCode::kNoCandidateSpecies;
    }

    ElementAmounts elementMoles;
    double dTotalMass = 0.0;
    int info = computeElementMoles(propellant, elementMoles, dTotalMass);
    if (info != ErrorCode::kSuccess) return info;

    // Validate and parse candidates
    std::vector<CandidateSpecies> species = candidates;
    for (auto& candidate : species) {
        info = GlushkoPolynomial::validate(candidate);
        if (info != ErrorCode::kSuccess) return info;

        info = FormulaParser::parse(candidate.cFormula, candidate.elementCounts);
        if (info != ErrorCode::kSuccess) return info;
    }

    // Element basis: propellant elements first, then new species elements
    std::vector<std::string> cElementName;
    for (const auto& entry : elementMoles) {
        cElementName.push_back(entry.first);
    }
    const int nPropellantElements = static_cast<int>(cElementName.size());

    for (const auto& candidate : species) {
        for (const auto& [cSymbol, iAtoms] : candidate.elementCounts) {
            if (std::find(cElementName.begin(), cElementName.end(), cSymbol) == cElementName.end()) {
                cElementName.push_back(cSymbol);
            }
        }
    }

    const int nElements = static_cast<int>(cElementName.size());
    const int nSpecies = static_cast<int>(species.size());

    state.allocate(nElements, nSpecies);
    state.nPropellantElements = nPropellantElements;
    state.cElementName = cElementName;
    state.dTotalMass = dTotalMass;

    for (int j = 0; j < nPropellantElements; ++j) {
        state.dMolesElement(j) = elementMoles[j].second;
    }

    state.dTemperatureLow = species[0].dTemperatureMin;
    state.dTemperatureHigh = species[0].dTemperatureMax;

    for (int i = 0; i < nSpecies; ++i) {
        const auto& candidate = species[i];

        bool lAllowed = true;
        for (const auto& [cSymbol, iAtoms] : candidate.elementCounts) {
            int j = state.getElementIndex(cSymbol);
            state.dStoichSpecies(j, i) = static_cast<double>(iAtoms);
            // Elements outside the propellant, or present with zero amount,
            // cannot appear in any product with n >= 0
            if (j >= nPropellantElements || state.dMolesElement(j) <= 0.0) {
                lAllowed = false;
            }
        }
        state.lSpeciesAllowed[i] = lAllowed;

        state.dSpeciesTotalAtoms(i) = FormulaParser::totalAtoms(candidate.elementCounts);

        double dMolarMass = 0.0;
        if (FormulaParser::molarMass(candidate.elementCounts, dMolarMass) == ErrorCode::kSuccess) {
            state.dSpeciesMolarMass(i) = dMolarMass;
        }

        if (candidate.isGas()) {
            state.nGasSpecies++;
        } else {
            state.nCondensedSpecies++;
        }

        state.dTemperatureLow = std::min(state.dTemperatureLow, candidate.dTemperatureMin);
        state.dTemperatureHigh = std::max(state.dTemperatureHigh, candidate.dTemperatureMax);
    }

    state.species = std::move(species);

    // Every supplied element needs at least one admissible carrier
    for (int j = 0; j < nPropellantElements; ++j) {
        if (state.dMolesElement(j) <= 0.0) continue;

        bool lSupplied = false;
        for (int i = 0; i < nSpecies; ++i) {
            if (state.lSpeciesAllowed[i] && state.dStoichSpecies(j, i) > 0.0) {
                lSupplied = true;
                break;
            }
        }
        if (!lSupplied) {
            return ErrorCode::kInfeasibleMassBalance;
        }
    }

    return ErrorCode::kSuccess;
}

} // namespace MassBalance
} // namespace Adiabat
