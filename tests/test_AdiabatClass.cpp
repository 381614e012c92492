/// @file test_AdiabatClass.cpp
/// @brief Tests for the class-based AdiabatClass API
/// @details Verifies that AdiabatClass produces identical results to the free-function API

#include <gtest/gtest.h>
#include "adiabat/AdiabatClass.hpp"
#include "adiabat/Adiabat.hpp"
#include "adiabat/solver/RootFinder.hpp"
#include "adiabat/util/ErrorCodes.hpp"
#include "TestSystems.hpp"
#include <cmath>
#include <memory>

using namespace Adiabat;

namespace {

/// Brent search that counts how often it is used
class CountingRootFinder : public IRootFinder {
public:
    explicit CountingRootFinder(int* nCalls) : nCalls_(nCalls) {}

    int findRoot(const ResidualFunction& f,
                 double a, double fa,
                 double b, double fb,
                 const RootFinderOptions& options,
                 double& dRoot,
                 int& iterations) override {
        ++(*nCalls_);
        return brent_.findRoot(f, a, fa, b, fb, options, dRoot, iterations);
    }

    const char* getRootFinderName() const override {
        return "CountingBrent";
    }

private:
    BrentRootFinder brent_;
    int* nCalls_;
};

} // anonymous namespace

/// @brief Test fixture for AdiabatClass tests
class AdiabatClassTest : public ::testing::Test {
protected:
    const double dTarget = -150000.0;

    void configure(AdiabatClass& calc) {
        calc.setPressure(1.0e5);
        calc.setPropellant(dTarget, {{"H", 2.0}, {"O", 1.0}});
        calc.setCandidateSpecies(TestSystems::hydrogenOxygenSet());
    }

    /// @brief Compare two doubles with tolerance
    bool approxEqual(double a, double b, double tol = 1e-10) {
        return std::abs(a - b) < tol;
    }
};

/// @brief Test basic construction and destruction
TEST_F(AdiabatClassTest, ConstructorDestructor) {
    AdiabatClass calc;
    EXPECT_EQ(calc.getInfoCode(), 0);
    EXPECT_TRUE(calc.isSuccess());
    EXPECT_EQ(calc.getMolesSpecies().size(), 0);
}

/// @brief Test move semantics
TEST_F(AdiabatClassTest, MoveSemantics) {
    AdiabatClass calc1;
    configure(calc1);

    // Move constructor
    AdiabatClass calc2(std::move(calc1));
    EXPECT_EQ(calc2.getInfoCode(), 0);
    EXPECT_DOUBLE_EQ(calc2.getContext().io->dPressure, 1.0e5);

    // Move assignment
    AdiabatClass calc3;
    calc3 = std::move(calc2);
    ASSERT_EQ(calc3.calculate(), 0) << calc3.getErrorMessage();
    EXPECT_GT(calc3.getTemperature(), 1000.0);
}

/// @brief Compare class-based API with free-function API
TEST_F(AdiabatClassTest, CompareWithFreeFunctionAPI) {
    // ===== Class-based API =====
    AdiabatClass calc;
    configure(calc);
    int result1 = calc.calculate();
    EXPECT_EQ(result1, 0) << "Class-based calculation failed: " << calc.getErrorMessage();

    double temperature1 = calc.getTemperature();
    auto [molesWater1, info1] = calc.getMolesSpecies("H2O");
    auto [potentialO1, info2] = calc.getElementPotential("O");

    // ===== Free-function API =====
    AdiabatContext ctx;
    setPressure(ctx, 1.0e5);
    setPropellant(ctx, dTarget, {{"H", 2.0}, {"O", 1.0}});
    setCandidateSpecies(ctx, TestSystems::hydrogenOxygenSet());

    adiabat(ctx);
    int result2 = getInfoCode(ctx);
    EXPECT_EQ(result2, 0) << "Free-function calculation failed";

    double temperature2 = getTemperature(ctx);
    auto [molesWater2, info3] = getMolesSpecies(ctx, "H2O");
    auto [potentialO2, info4] = getElementPotential(ctx, "O");

    // ===== Compare results =====
    EXPECT_TRUE(approxEqual(temperature1, temperature2))
        << "Temperature mismatch: " << temperature1 << " vs " << temperature2;
    EXPECT_TRUE(approxEqual(molesWater1, molesWater2))
        << "H2O moles mismatch: " << molesWater1 << " vs " << molesWater2;
    EXPECT_TRUE(approxEqual(potentialO1, potentialO2))
        << "O potential mismatch: " << potentialO1 << " vs " << potentialO2;
    EXPECT_EQ(info1 + info2 + info3 + info4, 0);
}

/// @brief Test a user-supplied root finder
TEST_F(AdiabatClassTest, CustomRootFinder) {
    AdiabatClass reference;
    configure(reference);
    ASSERT_EQ(reference.calculate(), 0);

    int nCalls = 0;
    AdiabatClass calc;
    configure(calc);
    calc.setRootFinder(std::make_unique<CountingRootFinder>(&nCalls));
    ASSERT_EQ(calc.calculate(), 0) << calc.getErrorMessage();

    EXPECT_EQ(nCalls, 1);
    EXPECT_TRUE(approxEqual(calc.getTemperature(), reference.getTemperature()));

    // Selecting a built-in type drops the custom strategy
    calc.setRootFinder(RootFinderType::Brent);
    ASSERT_EQ(calc.calculate(), 0);
    EXPECT_EQ(nCalls, 1);
}

/// @brief Test derived outputs
TEST_F(AdiabatClassTest, DerivedOutputs) {
    AdiabatClass calc;
    configure(calc);
    ASSERT_EQ(calc.calculate(), 0);

    const auto& io = *calc.getContext().io;
    EXPECT_DOUBLE_EQ(calc.getGasMolarMass(), io.dGasMolarMass);
    EXPECT_NEAR(io.dSpecificHeatCapacity - io.dSpecificHeatVolumetric, io.dSpecificGasConstant, 1e-9);
    EXPECT_NEAR(io.dHeatCapacityFD, io.dHeatCapacitySys, 1e-3 * io.dHeatCapacitySys);
    EXPECT_NEAR(calc.getGibbsEnergy(), io.dEnthalpySys - calc.getTemperature() * io.dEntropySys, 1e-6);
    ASSERT_EQ(io.cSpeciesNameOut.size(), 4u);
    EXPECT_EQ(io.cSpeciesNameOut[0], "H2O");
    EXPECT_EQ(io.cSpeciesPhaseOut[0], "gas");
    EXPECT_NEAR(io.dTotalMass, 2.0 * 1.008e-3 + 15.999e-3, 1e-12);
}

/// @brief Test reset functionality
TEST_F(AdiabatClassTest, Reset) {
    AdiabatClass calc;
    configure(calc);
    ASSERT_EQ(calc.calculate(), 0);

    // Reset for new calculation (keeps inputs)
    calc.reset();
    EXPECT_DOUBLE_EQ(calc.getTemperature(), 0.0);
    calc.setPropellant(-120000.0, {{"H", 2.0}, {"O", 1.0}});
    int result = calc.calculate();
    EXPECT_EQ(result, 0);

    // Full reset (clears inputs)
    calc.resetAll();
    EXPECT_TRUE(calc.isSuccess());
    EXPECT_EQ(calc.calculate(), ErrorCode::kInvalidInput);
}

/// @brief Test multiple independent instances
TEST_F(AdiabatClassTest, MultipleInstances) {
    AdiabatClass calc1;
    AdiabatClass calc2;
    configure(calc1);
    configure(calc2);
    calc2.setPropellant(-100000.0, {{"H", 2.0}, {"O", 1.0}});

    ASSERT_EQ(calc1.calculate(), 0);
    ASSERT_EQ(calc2.calculate(), 0);
    EXPECT_LT(calc1.getTemperature(), calc2.getTemperature());
}

/// @brief Test error reporting
TEST_F(AdiabatClassTest, ErrorMessage) {
    AdiabatClass calc;
    configure(calc);
    calc.setPressure(-1.0);
    EXPECT_EQ(calc.calculate(), ErrorCode::kInvalidInput);
    EXPECT_FALSE(calc.isSuccess());
    EXPECT_EQ(calc.getErrorMessage(), "Invalid input");
}
