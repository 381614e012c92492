#pragma once

#include "AdiabatContext.hpp"
#include "util/Constants.hpp"
#include "util/ErrorCodes.hpp"
#include "util/Tolerances.hpp"

#include <string>
#include <utility>
#include <vector>

namespace Adiabat {

// ============================================================================
// Main Solver Functions
// ============================================================================

/// Main entry point - computes the adiabatic equilibrium temperature and composition
void adiabat(AdiabatContext& ctx);

/// Equilibrium composition at a fixed temperature (inner solve only)
void solveComposition(AdiabatContext& ctx, double temperature);

/// Initialize the solver
void init(AdiabatContext& ctx);

/// Check inputs
void checkSystem(AdiabatContext& ctx);

/// Build the mass-balance system and the temperature search range
void setup(AdiabatContext& ctx);

/// Run the outer temperature search
void solve(AdiabatContext& ctx);

/// Compute system and derived properties of the result
void postProcess(AdiabatContext& ctx);

// ============================================================================
// Input Setting Functions
// ============================================================================

/// Set chamber pressure [Pa]
void setPressure(AdiabatContext& ctx, double pressure);

/// Set the propellant record
void setPropellant(AdiabatContext& ctx, const Propellant& propellant);

/// Set propellant enthalpy [J per reference mass] and elemental composition
void setPropellant(AdiabatContext& ctx, double enthalpy, const ElementAmounts& composition);

/// Set how the composition amounts are interpreted
void setCompositionBasis(AdiabatContext& ctx, CompositionBasis basis);

/// Set the reference mass of the propellant [kg]
void setReferenceMass(AdiabatContext& ctx, double mass);

/// Append one candidate product
void addCandidateSpecies(AdiabatContext& ctx, const CandidateSpecies& species);

/// Append one candidate product from its parts
void addCandidateSpecies(AdiabatContext& ctx,
                         const std::string& formula,
                         const GlushkoCoefficients& coefficients,
                         SpeciesPhase phase,
                         double temperatureMin,
                         double temperatureMax);

/// Replace the candidate list
void setCandidateSpecies(AdiabatContext& ctx, const std::vector<CandidateSpecies>& candidates);

/// Restrict the temperature search to [low, high] K
void setTemperatureBounds(AdiabatContext& ctx, double low, double high);

/// Select the outer root finder
void setRootFinder(AdiabatContext& ctx, RootFinderType type);

/// Set iteration caps of the inner and outer solves
void setMaxIterations(AdiabatContext& ctx, int innerIterations, int outerIterations);

/// Set print results mode (0=none, 1=summary, 2=detailed)
void setPrintResultsMode(AdiabatContext& ctx, int mode);

/// Enable/disable iteration tracing on stderr
void setDebugMode(AdiabatContext& ctx, bool enable);

// ============================================================================
// Output Retrieval Functions
// ============================================================================

/// Get equilibrium temperature [K]
double getTemperature(const AdiabatContext& ctx);

/// Get moles of every candidate, in input order
const Eigen::VectorXd& getMolesSpecies(const AdiabatContext& ctx);

/// Get moles of one candidate by formula
/// Returns (moles, info) where info=0 on success
std::pair<double, int> getMolesSpecies(const AdiabatContext& ctx, const std::string& formula);

/// Get element potentials (dimensionless, divided by RT) by element symbol
/// Returns (potential, info) where info=0 on success
std::pair<double, int> getElementPotential(const AdiabatContext& ctx, const std::string& element);

/// Get the error/info code of the last calculation
int getInfoCode(const AdiabatContext& ctx);

/// Get the message for the error/info code of the last calculation
std::string getErrorMessage(const AdiabatContext& ctx);

// ============================================================================
// Output Functions
// ============================================================================

/// Print results according to iPrintResultsMode
void printResults(AdiabatContext& ctx);

/// Print a one-block summary
void printResultsSummary(AdiabatContext& ctx);

/// Print the summary followed by per-species detail
void printResultsDetailed(AdiabatContext& ctx);

} // namespace Adiabat
