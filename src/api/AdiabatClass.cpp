/// @file AdiabatClass.cpp
/// @brief Implementation of the object-oriented API

#include "adiabat/AdiabatClass.hpp"
#include "adiabat/Adiabat.hpp"

#include "adiabat/interfaces/IRootFinder.hpp"
#include "adiabat/solver/GibbsMinimizer.hpp"
#include "adiabat/solver/RootFinder.hpp"
#include "adiabat/solver/TemperatureSolver.hpp"

namespace Adiabat {

AdiabatClass::AdiabatClass()
    : io_(context_.io.get()) {
}

AdiabatClass::~AdiabatClass() = default;

AdiabatClass::AdiabatClass(AdiabatClass&& other) noexcept
    : context_(std::move(other.context_)),
      io_(context_.io.get()),
      rootFinder_(std::move(other.rootFinder_)) {
}

AdiabatClass& AdiabatClass::operator=(AdiabatClass&& other) noexcept {
    if (this != &other) {
        context_ = std::move(other.context_);
        rootFinder_ = std::move(other.rootFinder_);

        // Rebind raw pointer to new context
        io_ = context_.io.get();
    }
    return *this;
}

// =========================================================================
// Input Configuration
// =========================================================================

void AdiabatClass::setPressure(double pressure) {
    Adiabat::setPressure(context_, pressure);
}

void AdiabatClass::setPropellant(const Propellant& propellant) {
    Adiabat::setPropellant(context_, propellant);
}

void AdiabatClass::setPropellant(double enthalpy, const ElementAmounts& composition) {
    Adiabat::setPropellant(context_, enthalpy, composition);
}

void AdiabatClass::setCompositionBasis(CompositionBasis basis) {
    Adiabat::setCompositionBasis(context_, basis);
}

void AdiabatClass::setReferenceMass(double mass) {
    Adiabat::setReferenceMass(context_, mass);
}

void AdiabatClass::addCandidateSpecies(const CandidateSpecies& species) {
    Adiabat::addCandidateSpecies(context_, species);
}

void AdiabatClass::setCandidateSpecies(const std::vector<CandidateSpecies>& candidates) {
    Adiabat::setCandidateSpecies(context_, candidates);
}

void AdiabatClass::setTemperatureBounds(double low, double high) {
    Adiabat::setTemperatureBounds(context_, low, high);
}

void AdiabatClass::setPrintResultsMode(int mode) {
    Adiabat::setPrintResultsMode(context_, mode);
}

void AdiabatClass::setDebugMode(bool enable) {
    Adiabat::setDebugMode(context_, enable);
}

// =========================================================================
// Solver Configuration
// =========================================================================

void AdiabatClass::setRootFinder(RootFinderType type) {
    Adiabat::setRootFinder(context_, type);
    rootFinder_.reset();
}

void AdiabatClass::setRootFinder(std::unique_ptr<IRootFinder> rootFinder) {
    rootFinder_ = std::move(rootFinder);
}

void AdiabatClass::setMaxIterations(int innerIterations, int outerIterations) {
    Adiabat::setMaxIterations(context_, innerIterations, outerIterations);
}

// =========================================================================
// Main Computation
// =========================================================================

int AdiabatClass::calculate() {
    init(context_);
    if (context_.infoAdiabat() != 0) {
        return context_.infoAdiabat();
    }

    checkSystem(context_);
    if (context_.infoAdiabat() != 0) {
        return context_.infoAdiabat();
    }

    setup(context_);
    if (context_.infoAdiabat() != 0) {
        return context_.infoAdiabat();
    }

    solve();
    if (context_.infoAdiabat() != 0) {
        return context_.infoAdiabat();
    }

    postProcess(context_);
    if (context_.infoAdiabat() != 0) {
        return context_.infoAdiabat();
    }

    Adiabat::printResults(context_);
    return context_.infoAdiabat();
}

int AdiabatClass::calculateComposition(double temperature) {
    solveComposition(context_, temperature);
    return context_.infoAdiabat();
}

void AdiabatClass::solve() {
    if (!rootFinder_) {
        Adiabat::solve(context_);
        return;
    }

    auto& system = *context_.species;
    auto& minState = *context_.solver;

    GibbsMinimizer minimizer(system.tolerances, io_->iMaxInnerIterations);
    TemperatureSolver temperatureSolver(minimizer, *rootFinder_, system.tolerances);
    temperatureSolver.setMaxIterations(io_->iMaxOuterIterations);
    temperatureSolver.setBracketSamples(io_->nBracketSamples);

    double dTemperature = 0.0;
    Eigen::VectorXd dMoles;
    int info = temperatureSolver.solve(system, io_->dPressure, io_->propellant.dEnthalpy,
                                       io_->dTemperatureLow, io_->dTemperatureHigh,
                                       minState, dTemperature, dMoles);
    if (info != ErrorCode::kSuccess) {
        io_->INFOAdiabat = info;
        return;
    }

    io_->dTemperature = dTemperature;
    system.dMolesSpecies = dMoles;
    system.dElementPotential = minimizer.getElementPotentials();
}

// =========================================================================
// Output Retrieval
// =========================================================================

double AdiabatClass::getTemperature() const {
    return Adiabat::getTemperature(context_);
}

const Eigen::VectorXd& AdiabatClass::getMolesSpecies() const {
    return Adiabat::getMolesSpecies(context_);
}

std::pair<double, int> AdiabatClass::getMolesSpecies(const std::string& formula) const {
    return Adiabat::getMolesSpecies(context_, formula);
}

std::pair<double, int> AdiabatClass::getElementPotential(const std::string& element) const {
    return Adiabat::getElementPotential(context_, element);
}

double AdiabatClass::getEnthalpy() const {
    return io_->dEnthalpySys;
}

double AdiabatClass::getGibbsEnergy() const {
    return io_->dGibbsEnergySys;
}

double AdiabatClass::getGasMolarMass() const {
    return io_->dGasMolarMass;
}

double AdiabatClass::getSpecificHeatVolumetric() const {
    return io_->dSpecificHeatVolumetric;
}

double AdiabatClass::getHeatCapacityRatio() const {
    return io_->dHeatCapacityRatio;
}

double AdiabatClass::getCondensedMassFraction() const {
    return io_->dCondensedMassFraction;
}

void AdiabatClass::printResults() {
    Adiabat::printResults(context_);
}

// =========================================================================
// Status
// =========================================================================

int AdiabatClass::getInfoCode() const {
    return context_.infoAdiabat();
}

bool AdiabatClass::isSuccess() const {
    return context_.isSuccess();
}

std::string AdiabatClass::getErrorMessage() const {
    return Adiabat::getErrorMessage(context_);
}

// =========================================================================
// Reset
// =========================================================================

void AdiabatClass::reset() {
    context_.resetAdiabat();
}

void AdiabatClass::resetAll() {
    context_.resetAll();
    rootFinder_.reset();
}

} // namespace Adiabat
