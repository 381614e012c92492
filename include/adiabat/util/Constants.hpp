#pragma once

namespace Adiabat {
namespace Constants {

// Physical constants
constexpr double kIdealGasConstant = 8.31446261815324;  // J/(mol·K)
constexpr double kStandardPressure = 101325.0;          // Pa
constexpr double kStandardTemperature = 298.15;         // K
constexpr double kCalorieToJoule = 4.184;               // J/cal

// Glushko polynomial layout
constexpr int kNumGlushkoCoeff = 9;                     // c0 (entropy const), c1 (enthalpy const), c2..c8
constexpr double kReducedTemperatureScale = 1.0e-3;     // t = T / 1000

// Solver limits
constexpr int kMaxInnerIterations = 500;                // Gibbs minimizer iterations
constexpr int kMaxOuterIterations = 200;                // Temperature root-finder iterations
constexpr int kMaxLineSearchSteps = 40;                 // Armijo backtracking halvings
constexpr int kMaxAssemblageChanges = 50;               // Condensed species add/remove events
constexpr int kDefaultBracketSamples = 16;              // Interior samples for bracket scan

// Numerical constants
constexpr double kFractionToBoundary = 0.99;            // Max fraction of a gas amount removed per step
constexpr double kDefaultTemperatureMargin = 1.0e-3;    // K, kept away from range edges
constexpr double kFiniteDifferenceStep = 1.0e-3;        // K, for Cp from enthalpy

// Tolerance array size
constexpr int kNumTolerances = 7;

} // namespace Constants
} // namespace Adiabat
