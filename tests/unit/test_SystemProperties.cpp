#include <gtest/gtest.h>
#include <adiabat/models/GlushkoPolynomial.hpp>
#include <adiabat/models/SystemProperties.hpp>
#include <adiabat/util/Constants.hpp>
#include <adiabat/util/ErrorCodes.hpp>
#include "../TestSystems.hpp"
#include <cmath>

using namespace Adiabat;

namespace {

StandardProperties standard(const CandidateSpecies& species, double dTemperature) {
    StandardProperties props;
    GlushkoPolynomial::evaluate(species, dTemperature, props);
    return props;
}

} // anonymous namespace

TEST(SystemPropertiesTest, SinglePureGasAtStandardPressure) {
    std::vector<CandidateSpecies> species = {TestSystems::water()};
    Eigen::VectorXd n(1);
    n << 2.0;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, 3000.0, Constants::kStandardPressure, n, thermo),
              ErrorCode::kSuccess);

    EXPECT_NEAR(thermo.dEnthalpy, 2.0 * TestSystems::kWaterEnthalpy3000, 1e-6);
    EXPECT_NEAR(thermo.dHeatCapacity, 2.0 * TestSystems::kWaterHeatCapacity3000, 1e-9);
    EXPECT_NEAR(thermo.dEntropy, 2.0 * TestSystems::kWaterEntropy3000, 1e-9);
    EXPECT_NEAR(thermo.dGibbsEnergy, thermo.dEnthalpy - 3000.0 * thermo.dEntropy, 1e-6);
    EXPECT_DOUBLE_EQ(thermo.dMolesTotal, 2.0);
    EXPECT_DOUBLE_EQ(thermo.dMolesGas, 2.0);
    EXPECT_DOUBLE_EQ(thermo.dMolesCondensed, 0.0);
}

TEST(SystemPropertiesTest, MixingAndPressureEntropy) {
    std::vector<CandidateSpecies> species = {TestSystems::hydrogen(), TestSystems::hydrogenAtom()};
    Eigen::VectorXd n(2);
    n << 0.75, 0.25;
    const double T = 2500.0;
    const double P = 1.0e5;
    const double R = Constants::kIdealGasConstant;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, T, P, n, thermo), ErrorCode::kSuccess);

    const auto h2 = standard(species[0], T);
    const auto h = standard(species[1], T);
    const double dLogP = std::log(P / Constants::kStandardPressure);

    double expected = 0.75 * (h2.dEntropy - R * (std::log(0.75) + dLogP)) +
                      0.25 * (h.dEntropy - R * (std::log(0.25) + dLogP));
    EXPECT_NEAR(thermo.dEntropy, expected, 1e-9);
    EXPECT_NEAR(thermo.dEnthalpy, 0.75 * h2.dEnthalpy + 0.25 * h.dEnthalpy, 1e-6);
}

TEST(SystemPropertiesTest, CondensedSpeciesHaveNoMixingTerm) {
    std::vector<CandidateSpecies> species = {TestSystems::hydrogen(), TestSystems::condensedWater(-5000.0)};
    Eigen::VectorXd n(2);
    n << 1.0, 1.0;
    const double T = 3000.0;
    const double P = 2.0e5;
    const double R = Constants::kIdealGasConstant;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, T, P, n, thermo), ErrorCode::kSuccess);

    // The only gas has x = 1
    double expected = standard(species[0], T).dEntropy - R * std::log(P / Constants::kStandardPressure) +
                      standard(species[1], T).dEntropy;
    EXPECT_NEAR(thermo.dEntropy, expected, 1e-9);
    EXPECT_DOUBLE_EQ(thermo.dMolesGas, 1.0);
    EXPECT_DOUBLE_EQ(thermo.dMolesCondensed, 1.0);
}

TEST(SystemPropertiesTest, ZeroMolesSpeciesAreSkipped) {
    CandidateSpecies narrow = TestSystems::oxygenAtom();
    narrow.dTemperatureMax = 2000.0;

    std::vector<CandidateSpecies> species = {TestSystems::water(), narrow};
    Eigen::VectorXd n(2);
    n << 1.0, 0.0;

    // O is outside its range at 3000 K but holds no moles
    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, 3000.0, Constants::kStandardPressure, n, thermo),
              ErrorCode::kSuccess);
    EXPECT_NEAR(thermo.dEnthalpy, TestSystems::kWaterEnthalpy3000, 1e-6);
    EXPECT_NEAR(thermo.dEntropy, TestSystems::kWaterEntropy3000, 1e-9);

    n(1) = 0.1;
    EXPECT_EQ(SystemProperties::evaluate(species, 3000.0, Constants::kStandardPressure, n, thermo),
              ErrorCode::kTemperatureOutOfRange);
}

TEST(SystemPropertiesTest, InvalidArguments) {
    std::vector<CandidateSpecies> species = {TestSystems::water()};
    Eigen::VectorXd n(1);
    n << 1.0;
    SystemThermo thermo;

    EXPECT_EQ(SystemProperties::evaluate(species, 3000.0, 0.0, n, thermo), ErrorCode::kInvalidInput);
    EXPECT_EQ(SystemProperties::evaluate(species, -1.0, 1.0e5, n, thermo), ErrorCode::kInvalidInput);

    Eigen::VectorXd wrongSize(2);
    wrongSize << 1.0, 1.0;
    EXPECT_EQ(SystemProperties::evaluate(species, 3000.0, 1.0e5, wrongSize, thermo), ErrorCode::kInvalidInput);

    n << -0.5;
    EXPECT_EQ(SystemProperties::evaluate(species, 3000.0, 1.0e5, n, thermo), ErrorCode::kInvalidInput);
}

TEST(SystemPropertiesTest, DerivedQuantities) {
    std::vector<CandidateSpecies> species = {TestSystems::water(), TestSystems::hydrogen(),
                                             TestSystems::condensedWater(-5000.0)};
    Eigen::VectorXd dMolarMass(3);
    const double dWater = 2.0 * 1.008e-3 + 15.999e-3;
    const double dHydrogen = 2.0 * 1.008e-3;
    dMolarMass << dWater, dHydrogen, dWater;

    Eigen::VectorXd n(3);
    n << 0.5, 0.5, 0.25;
    const double dTotalMass = 0.5 * dWater + 0.5 * dHydrogen + 0.25 * dWater;
    const double T = 3000.0;
    const double P = 1.0e5;
    const double R = Constants::kIdealGasConstant;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, T, P, n, thermo), ErrorCode::kSuccess);

    DerivedProperties derived;
    ASSERT_EQ(SystemProperties::derive(species, dMolarMass, dTotalMass, T, P, n, thermo, derived),
              ErrorCode::kSuccess);

    EXPECT_NEAR(derived.dMassCondensed, 0.25 * dWater, 1e-15);
    EXPECT_NEAR(derived.dCondensedMassFraction, 0.25 * dWater / dTotalMass, 1e-12);
    EXPECT_NEAR(derived.dGasMolarMass, (0.5 * dWater + 0.5 * dHydrogen) / 1.0, 1e-15);
    EXPECT_NEAR(derived.dSpecificGasConstant, R / dTotalMass, 1e-9);
    EXPECT_NEAR(derived.dSpecificHeatVolumetric, (thermo.dHeatCapacity - R) / dTotalMass, 1e-9);
    EXPECT_NEAR(derived.dHeatCapacityRatio, thermo.dHeatCapacity / (thermo.dHeatCapacity - R), 1e-12);
    EXPECT_GT(derived.dHeatCapacityRatio, 1.0);

    // Finite-difference Cp agrees with the analytic sum at fixed n
    EXPECT_NEAR(derived.dHeatCapacityFD, thermo.dHeatCapacity, 1e-3 * thermo.dHeatCapacity);
}

TEST(SystemPropertiesTest, FiniteDifferenceAtUpperRangeEdge) {
    std::vector<CandidateSpecies> species = {TestSystems::water()};
    Eigen::VectorXd dMolarMass(1);
    dMolarMass << 2.0 * 1.008e-3 + 15.999e-3;
    Eigen::VectorXd n(1);
    n << 1.0;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, 5000.0, 1.0e5, n, thermo), ErrorCode::kSuccess);

    DerivedProperties derived;
    ASSERT_EQ(SystemProperties::derive(species, dMolarMass, dMolarMass(0), 5000.0, 1.0e5, n, thermo, derived),
              ErrorCode::kSuccess);
    EXPECT_NEAR(derived.dHeatCapacityFD, thermo.dHeatCapacity, 1e-3 * thermo.dHeatCapacity);
}

TEST(SystemPropertiesTest, DeriveNeedsGas) {
    std::vector<CandidateSpecies> species = {TestSystems::condensedWater(-5000.0)};
    Eigen::VectorXd dMolarMass(1);
    dMolarMass << 18.015e-3;
    Eigen::VectorXd n(1);
    n << 1.0;

    SystemThermo thermo;
    ASSERT_EQ(SystemProperties::evaluate(species, 3000.0, 1.0e5, n, thermo), ErrorCode::kSuccess);

    DerivedProperties derived;
    EXPECT_EQ(SystemProperties::derive(species, dMolarMass, 18.015e-3, 3000.0, 1.0e5, n, thermo, derived),
              ErrorCode::kInvalidInput);
}
