/// @file GibbsMinimizer.cpp
/// @brief Implementation of the element-potential Gibbs minimizer

#include "adiabat/solver/GibbsMinimizer.hpp"
#include "adiabat/context/SpeciesState.hpp"
#include "adiabat/context/MinimizerState.hpp"
#include "adiabat/models/GlushkoPolynomial.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <Eigen/LU>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace Adiabat {

GibbsMinimizer::GibbsMinimizer(const Tolerances& tolerances, int iMaxIterations)
    : tolerances_(tolerances), iMaxIterations_(iMaxIterations) {
}

int GibbsMinimizer::minimize(const SpeciesState& system,
                             double dTemperature,
                             double dPressure,
                             MinimizerState& minState,
                             Eigen::VectorXd& dMoles,
                             const Eigen::VectorXd* seed) {
    minState.initIteration();
    minState.nInnerSolves++;

    if (!(dTemperature > 0.0) || !std::isfinite(dTemperature) ||
        !(dPressure > 0.0) || !std::isfinite(dPressure)) {
        minState.nInnerFailures++;
        return ErrorCode::kInvalidInput;
    }
    if (system.nSpecies == 0) {
        minState.nInnerFailures++;
        return ErrorCode::kNoCandidateSpecies;
    }

    int info = prepare(system, dTemperature);
    if (info != ErrorCode::kSuccess) {
        minState.nInnerFailures++;
        return info;
    }

    initialize(system, seed);

    const int nPlay = static_cast<int>(iPlay_.size());
    const double dRT = Constants::kIdealGasConstant * dTemperature;
    const double dLogPressure = std::log(dPressure / Constants::kStandardPressure);
    const double dTolMass = tolerances_[kTolMassBalance] * dMolesScale_;
    const double dTolMinMoles = tolerances_[kTolMinMoles];

    // Trial composition along the current update
    auto takeStep = [&](double dStep, int iBlocking) {
        Eigen::VectorXd dTrial = dMolesPlay_;
        for (int k = 0; k < nPlay; ++k) {
            if (lGas_[k]) {
                dTrial(k) = std::max(dMolesPlay_(k) + dStep * dUpdate_(k), dTolMinMoles);
            } else if (lActive_[k]) {
                dTrial(k) = std::max(dMolesPlay_(k) + dStep * dUpdate_(k), 0.0);
            }
        }
        if (iBlocking >= 0) {
            dTrial(iBlocking) = 0.0;
        }
        return dTrial;
    };

    bool lConverged = false;

    for (int iter = 0; iter < iMaxIterations_; ++iter) {
        minState.iterGlobal = iter + 1;

        computeChemicalPotentials(dLogPressure);

        double dResidual = (dMolesElement_ - dStoich_ * dMolesPlay_).cwiseAbs().maxCoeff();
        bool lFeasible = dResidual <= dTolMass;
        double dGibbs = gibbsEnergy(dMolesPlay_, dLogPressure);

        minState.dMassBalanceResidual = dResidual;
        minState.dGibbsHistory.push_back(dGibbs * dRT);
        minState.lFeasibleHistory.push_back(lFeasible);

        info = computeDirection();
        if (info != ErrorCode::kSuccess) {
            if (minState.lDebugMode) {
                std::cerr << "[GibbsMinimizer] " << getMinimizerName()
                          << ": singular Newton system at iteration " << minState.iterGlobal << "\n";
            }
            minState.nInnerFailures++;
            return info;
        }

        // An active condensed species at zero that wants to decrease leaves the set
        int iDrop = -1;
        for (int k = 0; k < nPlay; ++k) {
            if (!lGas_[k] && lActive_[k] && dMolesPlay_(k) <= 0.0 && dUpdate_(k) < 0.0 &&
                !isSoleCondensedCarrier(k)) {
                iDrop = k;
                break;
            }
        }
        if (iDrop >= 0) {
            lActive_[iDrop] = false;
            dMolesPlay_(iDrop) = 0.0;
            if (++minState.nAssemblageChanges > Constants::kMaxAssemblageChanges) break;
            continue;
        }

        double dChange = maxSpeciesChange();
        minState.dMaxSpeciesChange = dChange;

        if (lFeasible && dChange <= tolerances_[kTolComposition]) {
            double dForce = 0.0;
            int iAdd = maxDrivingForce(dForce);
            minState.dMaxDrivingForce = (iAdd >= 0) ? dForce : 0.0;

            if (iAdd >= 0 && dForce > tolerances_[kTolDrivingForce]) {
                lActive_[iAdd] = true;
                if (++minState.nAssemblageChanges > Constants::kMaxAssemblageChanges) break;
                continue;
            }
            lConverged = true;
            break;
        }

        // Step length: gas moles stay positive, condensed moles non-negative
        double dStep = 1.0;
        for (int k = 0; k < nPlay; ++k) {
            if (lGas_[k] && dUpdate_(k) < 0.0) {
                dStep = std::min(dStep, Constants::kFractionToBoundary * dMolesPlay_(k) / -dUpdate_(k));
            }
        }
        int iBlocking = -1;
        for (int k = 0; k < nPlay; ++k) {
            if (!lGas_[k] && lActive_[k] && dUpdate_(k) < 0.0) {
                double dLimit = dMolesPlay_(k) / -dUpdate_(k);
                if (dLimit <= dStep) {
                    dStep = dLimit;
                    iBlocking = k;
                }
            }
        }

        Eigen::VectorXd dTrial;

        if (lFeasible) {
            // Armijo backtracking on G along a feasible direction
            double dSlope = std::min(dChemPotential_.dot(dUpdate_), 0.0);
            double dSlack = 1.0e-14 * std::max(1.0, std::abs(dGibbs));
            bool lAccepted = false;

            for (int ls = 0; ls < Constants::kMaxLineSearchSteps; ++ls) {
                dTrial = takeStep(dStep, iBlocking);
                double dGibbsTrial = gibbsEnergy(dTrial, dLogPressure);
                if (dGibbsTrial <= dGibbs + tolerances_[kTolArmijo] * dStep * dSlope + dSlack) {
                    lAccepted = true;
                    break;
                }
                dStep *= 0.5;
                iBlocking = -1;
            }

            if (!lAccepted) {
                // No further decrease at working precision
                double dForce = 0.0;
                int iAdd = maxDrivingForce(dForce);
                if (iAdd >= 0 && dForce > tolerances_[kTolDrivingForce]) {
                    lActive_[iAdd] = true;
                    if (++minState.nAssemblageChanges > Constants::kMaxAssemblageChanges) break;
                    continue;
                }
                lConverged = true;
                break;
            }
        } else {
            dTrial = takeStep(dStep, iBlocking);
        }

        dMolesPlay_ = dTrial;

        // The last carrier of a gas-free element stays active at zero
        if (iBlocking >= 0 && !isSoleCondensedCarrier(iBlocking)) {
            lActive_[iBlocking] = false;
            if (++minState.nAssemblageChanges > Constants::kMaxAssemblageChanges) break;
        }
    }

    minState.iterTotal += minState.iterGlobal;

    if (!lConverged) {
        if (minState.lDebugMode) {
            std::cerr << "[GibbsMinimizer] " << getMinimizerName() << ": no convergence at T=" << dTemperature
                      << " K after " << minState.iterGlobal << " iterations, residual="
                      << minState.dMassBalanceResidual << ", change="
                      << minState.dMaxSpeciesChange << "\n";
        }
        minState.nInnerFailures++;
        return ErrorCode::kInnerConvergenceFailure;
    }

    // Map back to the full candidate list
    dMoles = Eigen::VectorXd::Zero(system.nSpecies);
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k] || lActive_[k]) {
            dMoles(iPlay_[k]) = dMolesPlay_(k);
        }
    }

    dElementPotential_ = Eigen::VectorXd::Zero(system.nElements);
    for (size_t a = 0; a < iElements_.size(); ++a) {
        dElementPotential_(iElements_[a]) = dPi_(a);
    }

    minState.dGibbsEnergy = gibbsEnergy(dMolesPlay_, dLogPressure) * dRT;
    minState.lConverged = true;
    minState.dMolesLast = dMoles;
    minState.lWarmStartAvailable = true;

    if (minState.lDebugMode) {
        std::cerr << "[GibbsMinimizer] " << getMinimizerName() << ": T=" << dTemperature << " K converged in "
                  << minState.iterGlobal << " iterations, G=" << minState.dGibbsEnergy
                  << " J, species in play=" << nPlay << "\n";
    }

    return ErrorCode::kSuccess;
}

int GibbsMinimizer::prepare(const SpeciesState& system, double dTemperature) {
    iElements_.clear();
    iPlay_.clear();
    lGas_.clear();
    lActive_.clear();
    lGasCarried_.clear();

    for (int j = 0; j < system.nPropellantElements; ++j) {
        if (system.dMolesElement(j) > 0.0) {
            iElements_.push_back(j);
        }
    }
    if (iElements_.empty()) {
        return ErrorCode::kInvalidInput;
    }

    const double dRT = Constants::kIdealGasConstant * dTemperature;
    std::vector<double> dStdGibbs;

    for (int i = 0; i < system.nSpecies; ++i) {
        if (!system.lSpeciesAllowed[i]) continue;

        const auto& species = system.species[i];
        if (!species.isValidAt(dTemperature)) continue;

        StandardProperties props;
        if (GlushkoPolynomial::evaluate(species, dTemperature, props) != ErrorCode::kSuccess) continue;

        iPlay_.push_back(i);
        lGas_.push_back(species.isGas());
        dStdGibbs.push_back(props.dGibbsEnergy / dRT);
    }

    if (iPlay_.empty()) {
        return ErrorCode::kNoValidSpecies;
    }

    const int m = static_cast<int>(iElements_.size());
    const int nPlay = static_cast<int>(iPlay_.size());

    dStdGibbs_ = Eigen::Map<Eigen::VectorXd>(dStdGibbs.data(), nPlay);
    dStoich_.resize(m, nPlay);
    dMolesElement_.resize(m);

    for (int a = 0; a < m; ++a) {
        dMolesElement_(a) = system.dMolesElement(iElements_[a]);
        for (int k = 0; k < nPlay; ++k) {
            dStoich_(a, k) = system.dStoichSpecies(iElements_[a], iPlay_[k]);
        }
    }

    // Every element needs a carrier among the species valid at this temperature
    for (int a = 0; a < m; ++a) {
        if (dStoich_.row(a).maxCoeff() <= 0.0) {
            return ErrorCode::kNoValidSpecies;
        }
    }

    lGasCarried_.assign(m, false);
    for (int a = 0; a < m; ++a) {
        for (int k = 0; k < nPlay; ++k) {
            if (lGas_[k] && dStoich_(a, k) > 0.0) {
                lGasCarried_[a] = true;
                break;
            }
        }
    }

    lActive_.assign(nPlay, false);
    dMolesScale_ = std::max(1.0, dMolesElement_.maxCoeff());

    return ErrorCode::kSuccess;
}

void GibbsMinimizer::initialize(const SpeciesState& system, const Eigen::VectorXd* seed) {
    const int nPlay = static_cast<int>(iPlay_.size());
    const int nGas = static_cast<int>(std::count(lGas_.begin(), lGas_.end(), true));
    const double dAtoms = dMolesElement_.sum();

    dMolesPlay_ = Eigen::VectorXd::Zero(nPlay);

    if (seed != nullptr && seed->size() == system.nSpecies) {
        // Species absent from the seed restart slightly above zero
        double dFloor = 1.0e-10 * dAtoms / std::max(nGas, 1);
        for (int k = 0; k < nPlay; ++k) {
            double dValue = (*seed)(iPlay_[k]);
            if (!std::isfinite(dValue) || dValue < 0.0) dValue = 0.0;

            if (lGas_[k]) {
                dMolesPlay_(k) = std::max(dValue, dFloor);
            } else {
                dMolesPlay_(k) = dValue;
                lActive_[k] = dValue > 0.0;
            }
        }
    } else {
        // Even split of the atoms over the gas species
        int nShare = (nGas > 0) ? nGas : nPlay;
        for (int k = 0; k < nPlay; ++k) {
            if (nGas > 0 && !lGas_[k]) continue;
            double dAtomsSpecies = system.dSpeciesTotalAtoms(iPlay_[k]);
            dMolesPlay_(k) = dAtoms / (nShare * dAtomsSpecies);
            if (!lGas_[k]) lActive_[k] = true;
        }
    }

    // Without a gas phase the condensed species carry everything
    if (nGas == 0) {
        for (int k = 0; k < nPlay; ++k) {
            lActive_[k] = true;
        }
        return;
    }

    activateCondensedCarriers();
}

void GibbsMinimizer::activateCondensedCarriers() {
    const int m = static_cast<int>(iElements_.size());
    const int nPlay = static_cast<int>(iPlay_.size());

    for (int a = 0; a < m; ++a) {
        if (lGasCarried_[a]) continue;

        // Already carried by an active species with moles
        bool lCarried = false;
        for (int k = 0; k < nPlay; ++k) {
            if (lActive_[k] && dStoich_(a, k) > 0.0 && dMolesPlay_(k) > 0.0) {
                lCarried = true;
                break;
            }
        }
        if (lCarried) continue;

        int iBest = -1;
        double dBest = 0.0;
        for (int k = 0; k < nPlay; ++k) {
            if (lGas_[k] || dStoich_(a, k) <= 0.0) continue;
            double dPerAtom = dStdGibbs_(k) / dStoich_(a, k);
            if (iBest < 0 || dPerAtom < dBest) {
                iBest = k;
                dBest = dPerAtom;
            }
        }
        // prepare() guarantees a carrier for every element row
        if (iBest < 0) continue;

        lActive_[iBest] = true;
        dMolesPlay_(iBest) = std::max(dMolesPlay_(iBest), dMolesElement_(a) / dStoich_(a, iBest));
    }
}

bool GibbsMinimizer::isSoleCondensedCarrier(int k) const {
    if (lGas_[k]) return false;

    const int m = static_cast<int>(iElements_.size());
    const int nPlay = static_cast<int>(iPlay_.size());

    for (int a = 0; a < m; ++a) {
        if (lGasCarried_[a] || dStoich_(a, k) <= 0.0) continue;

        bool lOther = false;
        for (int k2 = 0; k2 < nPlay; ++k2) {
            if (k2 != k && lActive_[k2] && dStoich_(a, k2) > 0.0) {
                lOther = true;
                break;
            }
        }
        if (!lOther) return true;
    }
    return false;
}

void GibbsMinimizer::computeChemicalPotentials(double dLogPressure) {
    const int nPlay = static_cast<int>(iPlay_.size());

    double dMolesGas = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k]) dMolesGas += dMolesPlay_(k);
    }

    dChemPotential_ = dStdGibbs_;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k]) {
            dChemPotential_(k) += dLogPressure + std::log(dMolesPlay_(k) / dMolesGas);
        }
    }
}

double GibbsMinimizer::gibbsEnergy(const Eigen::VectorXd& dMolesPlay, double dLogPressure) const {
    const int nPlay = static_cast<int>(iPlay_.size());

    double dMolesGas = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k]) dMolesGas += dMolesPlay(k);
    }

    double dGibbs = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        double n = dMolesPlay(k);
        if (n <= 0.0) continue;
        if (lGas_[k]) {
            dGibbs += n * (dStdGibbs_(k) + dLogPressure + std::log(n / dMolesGas));
        } else {
            dGibbs += n * dStdGibbs_(k);
        }
    }
    return dGibbs;
}

int GibbsMinimizer::computeDirection() {
    const int m = static_cast<int>(iElements_.size());
    const int nPlay = static_cast<int>(iPlay_.size());

    std::vector<int> iGas;
    std::vector<int> iCond;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k]) {
            iGas.push_back(k);
        } else if (lActive_[k]) {
            iCond.push_back(k);
        }
    }

    const bool lHasGas = !iGas.empty();
    const int iOffsetU = m;
    const int iOffsetCond = m + (lHasGas ? 1 : 0);
    const int nVar = iOffsetCond + static_cast<int>(iCond.size());

    Eigen::MatrixXd matrix = Eigen::MatrixXd::Zero(nVar, nVar);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(nVar);

    // Mass balance residual r = b - A n
    rhs.head(m) = dMolesElement_ - dStoich_ * dMolesPlay_;

    double dSumYMu = 0.0;
    for (int k : iGas) {
        const double y = dMolesPlay_(k);
        const double mu = dChemPotential_(k);
        for (int j = 0; j < m; ++j) {
            const double ajk = dStoich_(j, k);
            if (ajk == 0.0) continue;
            for (int l = 0; l < m; ++l) {
                matrix(j, l) += ajk * dStoich_(l, k) * y;
            }
            matrix(j, iOffsetU) += ajk * y;
            rhs(j) += ajk * y * mu;
        }
        dSumYMu += y * mu;
    }

    if (lHasGas) {
        for (int j = 0; j < m; ++j) {
            matrix(iOffsetU, j) = matrix(j, iOffsetU);
        }
        rhs(iOffsetU) = dSumYMu;
    }

    for (size_t c = 0; c < iCond.size(); ++c) {
        const int k = iCond[c];
        const int col = iOffsetCond + static_cast<int>(c);
        for (int j = 0; j < m; ++j) {
            matrix(j, col) = dStoich_(j, k);
            matrix(col, j) = dStoich_(j, k);
        }
        rhs(col) = dChemPotential_(k);
    }

    // Solve using Eigen's PartialPivLU
    Eigen::PartialPivLU<Eigen::MatrixXd> lu(matrix);
    Eigen::VectorXd solution;

    if (lu.rcond() > 1.0e-13) {
        solution = lu.solve(rhs);
    } else {
        // Rank-deficient stoichiometry (e.g. one species carrying two elements):
        // solve the shifted system and refine against the original
        Eigen::MatrixXd shifted = matrix;
        handleSingular(shifted);
        lu.compute(shifted);
        solution = lu.solve(rhs);
        for (int iRefine = 0; iRefine < 3; ++iRefine) {
            solution += lu.solve(rhs - matrix * solution);
        }

        double dScale = std::max(1.0, rhs.cwiseAbs().maxCoeff());
        if ((matrix * solution - rhs).cwiseAbs().maxCoeff() > 1.0e-8 * dScale) {
            return ErrorCode::kSingularMatrix;
        }
    }

    if (!solution.allFinite()) {
        return ErrorCode::kSingularMatrix;
    }

    dPi_ = solution.head(m);
    const double u = lHasGas ? solution(iOffsetU) : 0.0;

    dUpdate_ = Eigen::VectorXd::Zero(nPlay);
    for (int k : iGas) {
        double dPotential = 0.0;
        for (int j = 0; j < m; ++j) {
            dPotential += dPi_(j) * dStoich_(j, k);
        }
        dUpdate_(k) = dMolesPlay_(k) * (dPotential - dChemPotential_(k) + u);
    }
    for (size_t c = 0; c < iCond.size(); ++c) {
        dUpdate_(iCond[c]) = solution(iOffsetCond + static_cast<int>(c));
    }

    return ErrorCode::kSuccess;
}

void GibbsMinimizer::handleSingular(Eigen::MatrixXd& matrix) const {
    // Quasi-definite shift: +eps on the potential block, -eps on the constraint block
    const int m = static_cast<int>(iElements_.size());
    const int n = static_cast<int>(matrix.rows());
    const double dShift = 1.0e-12 * std::max(1.0, matrix.cwiseAbs().maxCoeff());
    for (int i = 0; i < n; ++i) {
        matrix(i, i) += (i < m) ? dShift : -dShift;
    }
}

int GibbsMinimizer::maxDrivingForce(double& dDrivingForce) const {
    const int m = static_cast<int>(iElements_.size());
    const int nPlay = static_cast<int>(iPlay_.size());

    int iBest = -1;
    dDrivingForce = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k] || lActive_[k]) continue;

        double dForce = -dStdGibbs_(k);
        for (int j = 0; j < m; ++j) {
            dForce += dPi_(j) * dStoich_(j, k);
        }
        if (iBest < 0 || dForce > dDrivingForce) {
            iBest = k;
            dDrivingForce = dForce;
        }
    }
    return iBest;
}

double GibbsMinimizer::maxSpeciesChange() const {
    const int nPlay = static_cast<int>(iPlay_.size());

    double dTotal = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        if (lGas_[k] || lActive_[k]) dTotal += dMolesPlay_(k);
    }
    const double dFloor = tolerances_[kTolComposition] * std::max(dTotal, tolerances_[kTolMinMoles]);

    double dChange = 0.0;
    for (int k = 0; k < nPlay; ++k) {
        if (!lGas_[k] && !lActive_[k]) continue;
        double dDenominator = std::max(dMolesPlay_(k), dFloor);
        dChange = std::max(dChange, std::abs(dUpdate_(k)) / dDenominator);
    }
    return dChange;
}

} // namespace Adiabat
