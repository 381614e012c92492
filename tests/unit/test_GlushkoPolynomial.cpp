#include <gtest/gtest.h>
#include <adiabat/models/GlushkoPolynomial.hpp>
#include <adiabat/util/ErrorCodes.hpp>
#include "../TestSystems.hpp"
#include <cmath>
#include <limits>

using namespace Adiabat;

TEST(GlushkoPolynomialTest, WaterReferenceValues) {
    const CandidateSpecies water = TestSystems::water();

    StandardProperties props;
    ASSERT_EQ(GlushkoPolynomial::evaluate(water, 3000.0, props), ErrorCode::kSuccess);

    EXPECT_NEAR(props.dEnthalpy, TestSystems::kWaterEnthalpy3000, 1e-6);
    EXPECT_NEAR(props.dHeatCapacity, TestSystems::kWaterHeatCapacity3000, 1e-9);
    EXPECT_NEAR(props.dEntropy, TestSystems::kWaterEntropy3000, 1e-9);
    EXPECT_NEAR(props.dGibbsEnergy, props.dEnthalpy - 3000.0 * props.dEntropy, 1e-6);

    const GlushkoCoefficients c = TestSystems::waterCoefficients();
    EXPECT_NEAR(GlushkoPolynomial::enthalpy(c, 1000.0), TestSystems::kWaterEnthalpy1000, 1e-6);
    EXPECT_NEAR(GlushkoPolynomial::enthalpy(c, 2000.0), TestSystems::kWaterEnthalpy2000, 1e-6);
    EXPECT_NEAR(GlushkoPolynomial::enthalpy(c, 4000.0), TestSystems::kWaterEnthalpy4000, 1e-6);
}

TEST(GlushkoPolynomialTest, FullCoefficientSet) {
    // The oxygen set uses all nine coefficients
    const GlushkoCoefficients c = TestSystems::oxygenAtomCoefficients();
    EXPECT_NEAR(GlushkoPolynomial::enthalpy(c, 3000.0), TestSystems::kOxygenEnthalpy3000, 1e-6);
}

TEST(GlushkoPolynomialTest, Purity) {
    const CandidateSpecies oxygen = TestSystems::oxygenAtom();

    StandardProperties first;
    StandardProperties second;
    ASSERT_EQ(GlushkoPolynomial::evaluate(oxygen, 2345.6, first), ErrorCode::kSuccess);
    ASSERT_EQ(GlushkoPolynomial::evaluate(oxygen, 2345.6, second), ErrorCode::kSuccess);

    EXPECT_EQ(first.dHeatCapacity, second.dHeatCapacity);
    EXPECT_EQ(first.dEnthalpy, second.dEnthalpy);
    EXPECT_EQ(first.dEntropy, second.dEntropy);
    EXPECT_EQ(first.dGibbsEnergy, second.dGibbsEnergy);
}

TEST(GlushkoPolynomialTest, HeatCapacityIsEnthalpyDerivative) {
    const double h = 1.0e-2;
    for (const auto& species : TestSystems::hydrogenOxygenSet()) {
        const auto& c = species.dCoefficients;
        for (double T : {1200.0, 2500.0, 4300.0}) {
            double dHdT = (GlushkoPolynomial::enthalpy(c, T + h) -
                           GlushkoPolynomial::enthalpy(c, T - h)) / (2.0 * h);
            EXPECT_NEAR(GlushkoPolynomial::heatCapacity(c, T), dHdT, 1e-5)
                << species.cFormula << " at " << T << " K";
        }
    }
}

TEST(GlushkoPolynomialTest, EntropyDerivativeIsCpOverT) {
    const double h = 1.0e-2;
    for (const auto& species : TestSystems::hydrogenOxygenSet()) {
        const auto& c = species.dCoefficients;
        for (double T : {1500.0, 3500.0}) {
            double dSdT = (GlushkoPolynomial::entropy(c, T + h) -
                           GlushkoPolynomial::entropy(c, T - h)) / (2.0 * h);
            EXPECT_NEAR(GlushkoPolynomial::heatCapacity(c, T) / T, dSdT, 1e-8)
                << species.cFormula << " at " << T << " K";
        }
    }
}

TEST(GlushkoPolynomialTest, GibbsEnergyConsistency) {
    const GlushkoCoefficients c = TestSystems::hydrogenCoefficients();
    const double T = 2750.0;
    EXPECT_NEAR(GlushkoPolynomial::gibbsEnergy(c, T),
                GlushkoPolynomial::enthalpy(c, T) - T * GlushkoPolynomial::entropy(c, T), 1e-8);
}

TEST(GlushkoPolynomialTest, RangeChecks) {
    const CandidateSpecies water = TestSystems::water();
    StandardProperties props;

    EXPECT_EQ(GlushkoPolynomial::evaluate(water, 999.0, props), ErrorCode::kTemperatureOutOfRange);
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, 5000.5, props), ErrorCode::kTemperatureOutOfRange);
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, 0.0, props), ErrorCode::kInvalidInput);
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, -10.0, props), ErrorCode::kInvalidInput);
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, std::numeric_limits<double>::quiet_NaN(), props),
              ErrorCode::kInvalidInput);

    // Range ends are inclusive
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, 1000.0, props), ErrorCode::kSuccess);
    EXPECT_EQ(GlushkoPolynomial::evaluate(water, 5000.0, props), ErrorCode::kSuccess);
}

TEST(GlushkoPolynomialTest, Validate) {
    CandidateSpecies species = TestSystems::water();
    EXPECT_EQ(GlushkoPolynomial::validate(species), ErrorCode::kSuccess);

    species.dCoefficients[4] = std::numeric_limits<double>::infinity();
    EXPECT_EQ(GlushkoPolynomial::validate(species), ErrorCode::kInvalidCoefficients);

    species = TestSystems::water();
    species.dTemperatureMin = 5000.0;
    EXPECT_EQ(GlushkoPolynomial::validate(species), ErrorCode::kInvalidInput);

    species.dTemperatureMin = 0.0;
    EXPECT_EQ(GlushkoPolynomial::validate(species), ErrorCode::kInvalidInput);
}
