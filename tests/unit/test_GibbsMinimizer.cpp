#include <gtest/gtest.h>
#include <adiabat/context/MinimizerState.hpp>
#include <adiabat/context/SpeciesState.hpp>
#include <adiabat/models/GlushkoPolynomial.hpp>
#include <adiabat/setup/MassBalance.hpp>
#include <adiabat/solver/GibbsMinimizer.hpp>
#include <adiabat/util/ErrorCodes.hpp>
#include "../TestSystems.hpp"
#include <cmath>

using namespace Adiabat;

namespace {

/// Dimensionless standard Gibbs energy G0 / RT
double reducedGibbs(const CandidateSpecies& species, double dTemperature) {
    StandardProperties props;
    GlushkoPolynomial::evaluate(species, dTemperature, props);
    return props.dGibbsEnergy / (Constants::kIdealGasConstant * dTemperature);
}

/// Gas chemical potential mu / RT in a mixture with dMolesGas total gas moles
double reducedPotential(const CandidateSpecies& species, double dTemperature, double dPressure,
                        double dMoles, double dMolesGas) {
    return reducedGibbs(species, dTemperature) +
           std::log(dPressure / Constants::kStandardPressure) + std::log(dMoles / dMolesGas);
}

class GibbsMinimizerTest : public ::testing::Test {
protected:
    SpeciesState system;
    MinimizerState minState;
    Tolerances tolerances;

    void build(const std::vector<CandidateSpecies>& candidates, const ElementAmounts& composition) {
        ASSERT_EQ(MassBalance::build(TestSystems::makePropellant(0.0, composition), candidates, system),
                  ErrorCode::kSuccess);
    }

    std::vector<CandidateSpecies> condensedSet(double dShift) {
        return {TestSystems::hydrogen(), TestSystems::oxygenAtom(), TestSystems::water(),
                TestSystems::condensedWater(dShift)};
    }
};

} // anonymous namespace

TEST_F(GibbsMinimizerTest, HydrogenDissociation) {
    build({TestSystems::hydrogenAtom(), TestSystems::hydrogen()}, {{"H", 2.0}});

    const double T = 2500.0;
    const double P = 1.0e5;
    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, T, P, minState, n), ErrorCode::kSuccess);

    ASSERT_EQ(n.size(), 2);
    EXPECT_NEAR(n(0), 0.047047, 1e-5);
    EXPECT_NEAR(n(1), 0.976477, 1e-5);
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);

    // mu_H2 = 2 mu_H
    const double nGas = n.sum();
    double muH = reducedPotential(system.species[0], T, P, n(0), nGas);
    double muH2 = reducedPotential(system.species[1], T, P, n(1), nGas);
    EXPECT_NEAR(muH2, 2.0 * muH, 1e-8);

    // Element potential of H equals mu_H / RT
    EXPECT_NEAR(minimizer.getElementPotentials()(0), muH, 1e-6);

    EXPECT_TRUE(minState.lConverged);
    EXPECT_TRUE(minState.lWarmStartAvailable);
    EXPECT_EQ(minState.nInnerSolves, 1);
    EXPECT_EQ(minState.nInnerFailures, 0);
}

TEST_F(GibbsMinimizerTest, SingleSpeciesCarriesBothElements) {
    build({TestSystems::water()}, {{"H", 2.0}, {"O", 1.0}});

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 3000.0, 1.0e5, minState, n), ErrorCode::kSuccess);
    ASSERT_EQ(n.size(), 1);
    EXPECT_NEAR(n(0), 1.0, 1e-10);
}

TEST_F(GibbsMinimizerTest, CompositionFixedByMassBalance) {
    build({TestSystems::oxygenAtom(), TestSystems::water()}, {{"H", 2.0}, {"O", 2.0}});

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 3000.0, 1.0e5, minState, n), ErrorCode::kSuccess);
    EXPECT_NEAR(n(0), 1.0, 1e-10);
    EXPECT_NEAR(n(1), 1.0, 1e-10);
}

TEST_F(GibbsMinimizerTest, CondensedPhaseCoexistence) {
    build(condensedSet(-5000.0), {{"H", 2.0}, {"O", 1.5}});

    const double T = 3000.0;
    const double P = 1.0e5;
    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, T, P, minState, n), ErrorCode::kSuccess);

    EXPECT_NEAR(n(0), 0.003662, 1e-5);
    EXPECT_NEAR(n(1), 0.503662, 1e-5);
    EXPECT_NEAR(n(2), 0.395388, 1e-5);
    EXPECT_NEAR(n(3), 0.600950, 1e-5);
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);

    // Gas and condensed water share one chemical potential
    const double nGas = n(0) + n(1) + n(2);
    double muGas = reducedPotential(system.species[2], T, P, n(2), nGas);
    EXPECT_NEAR(muGas, reducedGibbs(system.species[3], T), 1e-8);
    EXPECT_GE(minState.nAssemblageChanges, 1);
}

TEST_F(GibbsMinimizerTest, UnstableCondensedPhaseStaysOut) {
    build(condensedSet(5000.0), {{"H", 2.0}, {"O", 1.5}});

    const double T = 3000.0;
    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, T, 1.0e5, minState, n), ErrorCode::kSuccess);

    EXPECT_EQ(n(3), 0.0);
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);

    // Negative driving force: pi . a_c < g_c
    const Eigen::VectorXd& pi = minimizer.getElementPotentials();
    double dForce = 2.0 * pi(0) + pi(1) - reducedGibbs(system.species[3], T);
    EXPECT_LT(dForce, 0.0);
}

TEST_F(GibbsMinimizerTest, StableCondensedPhaseDominates) {
    build(condensedSet(-30000.0), {{"H", 2.0}, {"O", 1.5}});

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 3000.0, 1.0e5, minState, n), ErrorCode::kSuccess);

    EXPECT_NEAR(n(3), 0.99666, 1e-3);
    EXPECT_GT(n(3), n(2));
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);
}

TEST_F(GibbsMinimizerTest, GibbsEnergyNonIncreasingFromFeasibleSeed) {
    build({TestSystems::hydrogenAtom(), TestSystems::hydrogen()}, {{"H", 2.0}});

    Eigen::VectorXd seed(2);
    seed << 1.0, 0.5;

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 2500.0, 1.0e5, minState, n, &seed), ErrorCode::kSuccess);

    const auto& history = minState.dGibbsHistory;
    ASSERT_GE(history.size(), 2u);
    ASSERT_EQ(history.size(), minState.lFeasibleHistory.size());
    for (size_t k = 0; k < history.size(); ++k) {
        EXPECT_TRUE(minState.lFeasibleHistory[k]);
        if (k > 0) {
            EXPECT_LE(history[k], history[k - 1] + 1e-9 * std::abs(history[k - 1]));
        }
    }
    EXPECT_NEAR(n(0), 0.047047, 1e-5);
}

TEST_F(GibbsMinimizerTest, GibbsEnergyNonIncreasingWithCondensedSeed) {
    build(condensedSet(-5000.0), {{"H", 2.0}, {"O", 1.5}});

    Eigen::VectorXd seed(4);
    seed << 0.2, 0.7, 0.6, 0.2;

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 3000.0, 1.0e5, minState, n, &seed), ErrorCode::kSuccess);

    const auto& history = minState.dGibbsHistory;
    for (size_t k = 1; k < history.size(); ++k) {
        EXPECT_LE(history[k], history[k - 1] + 1e-9 * std::abs(history[k - 1]));
    }
    EXPECT_NEAR(n(3), 0.600950, 1e-5);
}

TEST_F(GibbsMinimizerTest, ElementCarriedOnlyByCondensedSpecies) {
    std::vector<CandidateSpecies> candidates = TestSystems::hydrogenOxygenSet();
    candidates.push_back(TestSystems::alumina());
    build(candidates, {{"Al", 0.2}, {"H", 2.0}, {"O", 1.3}});

    const double T = 3000.0;
    const double P = 1.0e6;
    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, T, P, minState, n), ErrorCode::kSuccess);

    // All aluminium sits in the alumina
    ASSERT_EQ(n.size(), 5);
    EXPECT_NEAR(n(4), 0.1, 1e-10);
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);

    // Alumina is in equilibrium with the element potentials
    const Eigen::VectorXd pi = minimizer.getElementPotentials();
    const int iAl = system.getElementIndex("Al");
    const int iO = system.getElementIndex("O");
    EXPECT_NEAR(2.0 * pi(iAl) + 3.0 * pi(iO), reducedGibbs(system.species[4], T), 1e-8);

    // The gas is the H2/O equilibrium of the leftover atoms
    SpeciesState gasSystem;
    ASSERT_EQ(MassBalance::build(TestSystems::makePropellant(0.0, {{"H", 2.0}, {"O", 1.0}}),
                                 TestSystems::hydrogenOxygenSet(), gasSystem),
              ErrorCode::kSuccess);
    MinimizerState gasState;
    GibbsMinimizer gasMinimizer(tolerances);
    Eigen::VectorXd nGas;
    ASSERT_EQ(gasMinimizer.minimize(gasSystem, T, P, gasState, nGas), ErrorCode::kSuccess);
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(n(i), nGas(i), 1e-7);
    }
    EXPECT_NEAR(pi(iO), gasMinimizer.getElementPotentials()(gasSystem.getElementIndex("O")), 1e-6);
}

TEST_F(GibbsMinimizerTest, CondensedCarrierRestartsFromWarmStart) {
    std::vector<CandidateSpecies> candidates = TestSystems::hydrogenOxygenSet();
    candidates.push_back(TestSystems::alumina());
    build(candidates, {{"Al", 0.2}, {"H", 2.0}, {"O", 1.3}});

    // Seed without alumina
    Eigen::VectorXd seed(5);
    seed << 0.8, 0.2, 0.1, 0.1, 0.0;

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 3000.0, 1.0e6, minState, n, &seed), ErrorCode::kSuccess);
    EXPECT_NEAR(n(4), 0.1, 1e-10);
    EXPECT_LE(system.massBalanceResidual(n), 1e-10);
}

TEST_F(GibbsMinimizerTest, SpeciesOutsideRangeHeldAtZero) {
    std::vector<CandidateSpecies> candidates = {TestSystems::hydrogenAtom(), TestSystems::hydrogen()};
    candidates[0].dTemperatureMax = 2000.0;
    build(candidates, {{"H", 2.0}});

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    ASSERT_EQ(minimizer.minimize(system, 2500.0, 1.0e5, minState, n), ErrorCode::kSuccess);
    EXPECT_EQ(n(0), 0.0);
    EXPECT_NEAR(n(1), 1.0, 1e-10);
}

TEST_F(GibbsMinimizerTest, Failures) {
    build({TestSystems::hydrogenAtom(), TestSystems::hydrogen()}, {{"H", 2.0}});

    GibbsMinimizer minimizer(tolerances);
    Eigen::VectorXd n;
    EXPECT_EQ(minimizer.minimize(system, -1.0, 1.0e5, minState, n), ErrorCode::kInvalidInput);
    EXPECT_EQ(minimizer.minimize(system, 2500.0, 0.0, minState, n), ErrorCode::kInvalidInput);

    // No candidate is valid at 6000 K
    EXPECT_EQ(minimizer.minimize(system, 6000.0, 1.0e5, minState, n), ErrorCode::kNoValidSpecies);
    EXPECT_EQ(minState.nInnerFailures, 3);

    // Upper end of the validity range is open
    EXPECT_EQ(minimizer.minimize(system, 5000.0, 1.0e5, minState, n), ErrorCode::kNoValidSpecies);

    EXPECT_STREQ(minimizer.getMinimizerName(), "RANDGibbsMinimizer");

    minimizer.setMaxIterations(1);
    EXPECT_EQ(minimizer.minimize(system, 2500.0, 1.0e5, minState, n), ErrorCode::kInnerConvergenceFailure);
}
