#include "adiabat/Adiabat.hpp"
#include "adiabat/setup/MassBalance.hpp"
#include "adiabat/solver/GibbsMinimizer.hpp"
#include "adiabat/solver/RootFinder.hpp"
#include "adiabat/solver/TemperatureSolver.hpp"
#include <cmath>
#include <iostream>
#include <memory>

namespace Adiabat {

void adiabat(AdiabatContext& ctx) {
    // Initialize
    init(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    // Check inputs
    checkSystem(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    // Mass balance and search range
    setup(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    // Outer temperature search
    solve(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    // Derived quantities
    postProcess(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    printResults(ctx);
}

void solveComposition(AdiabatContext& ctx, double temperature) {
    init(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    checkSystem(ctx);
    if (ctx.io->INFOAdiabat != 0) return;

    auto& io = *ctx.io;
    auto& system = *ctx.species;

    if (!std::isfinite(temperature) || temperature <= 0.0) {
        io.INFOAdiabat = ErrorCode::kInvalidInput;
        return;
    }

    int info = MassBalance::build(io.propellant, io.candidates, system);
    if (info != ErrorCode::kSuccess) {
        io.INFOAdiabat = info;
        return;
    }
    io.dTotalMass = system.dTotalMass;

    // Species ranges are half-open, so the union maximum admits no species
    if (temperature < system.dTemperatureLow || temperature >= system.dTemperatureHigh) {
        io.INFOAdiabat = ErrorCode::kTemperatureOutOfRange;
        return;
    }

    GibbsMinimizer minimizer(system.tolerances, io.iMaxInnerIterations);
    Eigen::VectorXd dMoles;
    info = minimizer.minimize(system, temperature, io.dPressure, *ctx.solver, dMoles);
    if (info != ErrorCode::kSuccess) {
        io.INFOAdiabat = ErrorCode::isInnerFailure(info) ? ErrorCode::kInnerConvergenceFailure : info;
        return;
    }

    system.dMolesSpecies = dMoles;
    system.dElementPotential = minimizer.getElementPotentials();
    io.dTemperature = temperature;

    postProcess(ctx);
    if (io.INFOAdiabat != 0) return;

    printResults(ctx);
}

void init(AdiabatContext& ctx) {
    ctx.resetAdiabat();

    // Initialize tolerances
    ctx.species->tolerances.initDefaults();
    ctx.solver->lDebugMode = ctx.io->lDebugMode;
}

void checkSystem(AdiabatContext& ctx) {
    auto& io = *ctx.io;

    // Pressure must be positive and finite
    if (!std::isfinite(io.dPressure) || io.dPressure <= 0.0) {
        io.INFOAdiabat = ErrorCode::kInvalidInput;
        return;
    }

    if (io.candidates.empty()) {
        io.INFOAdiabat = ErrorCode::kNoCandidateSpecies;
        return;
    }

    if (!std::isfinite(io.propellant.dEnthalpy) || io.propellant.composition.empty()) {
        io.INFOAdiabat = ErrorCode::kInvalidInput;
        return;
    }

    if (io.iMaxInnerIterations <= 0 || io.iMaxOuterIterations <= 0 ||
        io.nBracketSamples < 0 || !(io.dTemperatureMargin >= 0.0)) {
        io.INFOAdiabat = ErrorCode::kInvalidInput;
        return;
    }

    if (io.lTemperatureBounds) {
        if (!std::isfinite(io.dTemperatureLowInput) || !std::isfinite(io.dTemperatureHighInput) ||
            io.dTemperatureLowInput <= 0.0 || io.dTemperatureHighInput <= io.dTemperatureLowInput) {
            io.INFOAdiabat = ErrorCode::kInvalidInput;
            return;
        }
    }
}

void setup(AdiabatContext& ctx) {
    auto& io = *ctx.io;
    auto& system = *ctx.species;

    // A, b and species bookkeeping; fails before any optimization when infeasible
    int info = MassBalance::build(io.propellant, io.candidates, system);
    if (info != ErrorCode::kSuccess) {
        io.INFOAdiabat = info;
        return;
    }
    io.dTotalMass = system.dTotalMass;

    if (io.lTemperatureBounds) {
        if (io.dTemperatureLowInput < system.dTemperatureLow ||
            io.dTemperatureHighInput > system.dTemperatureHigh) {
            io.INFOAdiabat = ErrorCode::kTemperatureOutOfRange;
            return;
        }
        io.dTemperatureLow = io.dTemperatureLowInput;
        io.dTemperatureHigh = io.dTemperatureHighInput;
    } else {
        // Stay clear of the open upper end of the validity ranges
        io.dTemperatureLow = system.dTemperatureLow + io.dTemperatureMargin;
        io.dTemperatureHigh = system.dTemperatureHigh - io.dTemperatureMargin;
        if (io.dTemperatureHigh <= io.dTemperatureLow) {
            io.INFOAdiabat = ErrorCode::kTemperatureOutOfRange;
            return;
        }
    }
}

void solve(AdiabatContext& ctx) {
    auto& io = *ctx.io;
    auto& system = *ctx.species;
    auto& minState = *ctx.solver;

    GibbsMinimizer minimizer(system.tolerances, io.iMaxInnerIterations);
    std::unique_ptr<IRootFinder> rootFinder = createRootFinder(io.iRootFinder);

    TemperatureSolver temperatureSolver(minimizer, *rootFinder, system.tolerances);
    temperatureSolver.setMaxIterations(io.iMaxOuterIterations);
    temperatureSolver.setBracketSamples(io.nBracketSamples);

    if (minState.lDebugMode) {
        std::cerr << "[Adiabat] " << system.nElements << " elements, " << system.nSpecies
                  << " species, search range [" << io.dTemperatureLow << ", "
                  << io.dTemperatureHigh << "] K, " << rootFinder->getRootFinderName() << "\n";
    }

    double dTemperature = 0.0;
    Eigen::VectorXd dMoles;
    int info = temperatureSolver.solve(system, io.dPressure, io.propellant.dEnthalpy,
                                       io.dTemperatureLow, io.dTemperatureHigh,
                                       minState, dTemperature, dMoles);
    if (info != ErrorCode::kSuccess) {
        io.INFOAdiabat = info;
        return;
    }

    io.dTemperature = dTemperature;
    system.dMolesSpecies = dMoles;
    system.dElementPotential = minimizer.getElementPotentials();
}

void setPressure(AdiabatContext& ctx, double pressure) {
    ctx.io->dPressure = pressure;
}

void setPropellant(AdiabatContext& ctx, const Propellant& propellant) {
    ctx.io->propellant = propellant;
}

void setPropellant(AdiabatContext& ctx, double enthalpy, const ElementAmounts& composition) {
    ctx.io->propellant.dEnthalpy = enthalpy;
    ctx.io->propellant.composition = composition;
}

void setCompositionBasis(AdiabatContext& ctx, CompositionBasis basis) {
    ctx.io->propellant.iBasis = basis;
}

void setReferenceMass(AdiabatContext& ctx, double mass) {
    ctx.io->propellant.dReferenceMass = mass;
}

void addCandidateSpecies(AdiabatContext& ctx, const CandidateSpecies& species) {
    ctx.io->candidates.push_back(species);
}

void addCandidateSpecies(AdiabatContext& ctx,
                         const std::string& formula,
                         const GlushkoCoefficients& coefficients,
                         SpeciesPhase phase,
                         double temperatureMin,
                         double temperatureMax) {
    ctx.io->candidates.emplace_back(formula, coefficients, phase, temperatureMin, temperatureMax);
}

void setCandidateSpecies(AdiabatContext& ctx, const std::vector<CandidateSpecies>& candidates) {
    ctx.io->candidates = candidates;
}

void setTemperatureBounds(AdiabatContext& ctx, double low, double high) {
    ctx.io->lTemperatureBounds = true;
    ctx.io->dTemperatureLowInput = low;
    ctx.io->dTemperatureHighInput = high;
}

void setRootFinder(AdiabatContext& ctx, RootFinderType type) {
    ctx.io->iRootFinder = type;
}

void setMaxIterations(AdiabatContext& ctx, int innerIterations, int outerIterations) {
    ctx.io->iMaxInnerIterations = innerIterations;
    ctx.io->iMaxOuterIterations = outerIterations;
}

void setPrintResultsMode(AdiabatContext& ctx, int mode) {
    ctx.io->iPrintResultsMode = mode;
}

void setDebugMode(AdiabatContext& ctx, bool enable) {
    ctx.io->lDebugMode = enable;
}

double getTemperature(const AdiabatContext& ctx) {
    return ctx.io->dTemperature;
}

const Eigen::VectorXd& getMolesSpecies(const AdiabatContext& ctx) {
    return ctx.io->dMolesSpeciesOut;
}

std::pair<double, int> getMolesSpecies(const AdiabatContext& ctx, const std::string& formula) {
    const auto& io = *ctx.io;
    for (int i = 0; i < static_cast<int>(io.cSpeciesNameOut.size()); ++i) {
        if (io.cSpeciesNameOut[i] == formula && i < io.dMolesSpeciesOut.size()) {
            return {io.dMolesSpeciesOut(i), 0};
        }
    }
    return {0.0, ErrorCode::kInvalidInput};
}

std::pair<double, int> getElementPotential(const AdiabatContext& ctx, const std::string& element) {
    const auto& system = *ctx.species;
    int j = system.getElementIndex(element);
    if (j < 0 || j >= system.dElementPotential.size()) {
        return {0.0, ErrorCode::kUnknownElement};
    }
    return {system.dElementPotential(j), 0};
}

int getInfoCode(const AdiabatContext& ctx) {
    return ctx.io->INFOAdiabat;
}

std::string getErrorMessage(const AdiabatContext& ctx) {
    return ErrorCode::getMessage(ctx.io->INFOAdiabat);
}

} // namespace Adiabat
