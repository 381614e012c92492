/// @file TemperatureSolver.cpp
/// @brief Implementation of the outer temperature search

#include "adiabat/solver/TemperatureSolver.hpp"
#include "adiabat/solver/GibbsMinimizer.hpp"
#include "adiabat/interfaces/IRootFinder.hpp"
#include "adiabat/context/SpeciesState.hpp"
#include "adiabat/context/MinimizerState.hpp"
#include "adiabat/models/SystemProperties.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

namespace Adiabat {

TemperatureSolver::TemperatureSolver(GibbsMinimizer& minimizer,
                                     IRootFinder& rootFinder,
                                     const Tolerances& tolerances)
    : minimizer_(minimizer), rootFinder_(rootFinder), tolerances_(tolerances) {
}

int TemperatureSolver::residual(const SpeciesState& system,
                                double dPressure,
                                double dTargetEnthalpy,
                                double dTemperature,
                                MinimizerState& minState,
                                double& dResidual,
                                Eigen::VectorXd& dMoles) {
    const Eigen::VectorXd* seed = nullptr;
    Eigen::VectorXd dSeed;
    if (minState.lWarmStartAvailable) {
        dSeed = minState.dMolesLast;
        seed = &dSeed;
    }

    int info = minimizer_.minimize(system, dTemperature, dPressure, minState, dMoles, seed);
    if (info != ErrorCode::kSuccess) {
        if (minState.lDebugMode) {
            std::cerr << "[TemperatureSolver] T=" << std::setprecision(10) << dTemperature
                      << " K inner solve failed: " << ErrorCode::getMessage(info) << "\n";
        }
        return info;
    }

    SystemThermo thermo;
    info = SystemProperties::evaluate(system.species, dTemperature, dPressure, dMoles, thermo);
    if (info != ErrorCode::kSuccess) return info;

    dResidual = thermo.dEnthalpy - dTargetEnthalpy;

    minState.dTemperatureHistory.push_back(dTemperature);
    minState.dResidualHistory.push_back(dResidual);

    if (minState.lDebugMode) {
        std::cerr << "[TemperatureSolver] T=" << std::setprecision(10) << dTemperature
                  << " K residual=" << dResidual << " J inner iterations="
                  << minState.iterGlobal << "\n";
    }

    return ErrorCode::kSuccess;
}

int TemperatureSolver::solve(const SpeciesState& system,
                             double dPressure,
                             double dTargetEnthalpy,
                             double dTemperatureLow,
                             double dTemperatureHigh,
                             MinimizerState& minState,
                             double& dTemperature,
                             Eigen::VectorXd& dMoles) {
    if (!(dTemperatureLow > 0.0) || !(dTemperatureHigh > dTemperatureLow) ||
        !std::isfinite(dTemperatureHigh) || !std::isfinite(dTargetEnthalpy)) {
        return ErrorCode::kInvalidInput;
    }

    Eigen::VectorXd dMolesTrial;
    ResidualFunction f = [&](double T, double& r) {
        return residual(system, dPressure, dTargetEnthalpy, T, minState, r, dMolesTrial);
    };

    // Full range first
    double fLow = 0.0;
    double fHigh = 0.0;
    int infoLow = f(dTemperatureLow, fLow);
    int infoHigh = f(dTemperatureHigh, fHigh);

    double a = 0.0, fa = 0.0, b = 0.0, fb = 0.0;
    bool lBracketed = false;
    bool lAnySuccess = (infoLow == ErrorCode::kSuccess) || (infoHigh == ErrorCode::kSuccess);

    if (infoLow == ErrorCode::kSuccess && infoHigh == ErrorCode::kSuccess &&
        fLow * fHigh <= 0.0) {
        a = dTemperatureLow;
        fa = fLow;
        b = dTemperatureHigh;
        fb = fHigh;
        lBracketed = true;
    }

    // Scan interior samples for the first adjacent sign change
    if (!lBracketed && nBracketSamples_ > 0) {
        const double dSpacing = (dTemperatureHigh - dTemperatureLow) / (nBracketSamples_ + 1);

        bool lHavePrevious = (infoLow == ErrorCode::kSuccess);
        double dPrevious = dTemperatureLow;
        double fPrevious = fLow;

        for (int k = 1; k <= nBracketSamples_ + 1 && !lBracketed; ++k) {
            double T = (k <= nBracketSamples_) ? dTemperatureLow + k * dSpacing : dTemperatureHigh;
            double fT = fHigh;
            int info = (k <= nBracketSamples_) ? f(T, fT) : infoHigh;
            if (info != ErrorCode::kSuccess) continue;

            lAnySuccess = true;
            if (lHavePrevious && fPrevious * fT <= 0.0) {
                a = dPrevious;
                fa = fPrevious;
                b = T;
                fb = fT;
                lBracketed = true;
            }
            lHavePrevious = true;
            dPrevious = T;
            fPrevious = fT;
        }
    }

    if (!lBracketed) {
        if (minState.lDebugMode) {
            std::cerr << "[TemperatureSolver] No bracket in [" << dTemperatureLow << ", "
                      << dTemperatureHigh << "] K\n";
        }
        return lAnySuccess ? ErrorCode::kOuterConvergenceFailure
                           : ErrorCode::kInnerConvergenceFailure;
    }

    RootFinderOptions options;
    options.dTolFunction = tolerances_[kTolEnthalpy];
    options.dTolRelative = tolerances_[kTolTemperature];
    options.iMaxIterations = iMaxIterations_;

    double dRoot = 0.0;
    int info = rootFinder_.findRoot(f, a, fa, b, fb, options, dRoot, minState.iterOuter);

    if (minState.lDebugMode) {
        std::cerr << "[TemperatureSolver] " << rootFinder_.getRootFinderName() << " finished after "
                  << minState.iterOuter << " iterations: " << ErrorCode::getMessage(info) << "\n";
    }

    if (info != ErrorCode::kSuccess) {
        if (ErrorCode::isInnerFailure(info)) return ErrorCode::kInnerConvergenceFailure;
        return ErrorCode::kOuterConvergenceFailure;
    }

    // Composition at the root
    double dResidual = 0.0;
    info = residual(system, dPressure, dTargetEnthalpy, dRoot, minState, dResidual, dMolesTrial);
    if (info != ErrorCode::kSuccess) {
        return ErrorCode::kInnerConvergenceFailure;
    }

    dTemperature = dRoot;
    dMoles = dMolesTrial;

    return ErrorCode::kSuccess;
}

} // namespace Adiabat
