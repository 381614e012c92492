/// @file AdiabatClass.hpp
/// @brief Object-oriented API for adiabatic equilibrium calculations
/// @details Owns the calculation context and the outer root-finding strategy.

#pragma once

#include "adiabat/AdiabatContext.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Adiabat {

// Forward declarations
class IRootFinder;

/// @brief Adiabatic flame temperature and equilibrium composition calculator
/// @details Wraps the free-function API around an owned AdiabatContext.
/// The root finder is a replaceable strategy; by default it follows
/// the RootFinderType selected with setRootFinder().
///
/// Example usage:
/// @code
/// AdiabatClass calc;
/// calc.setPressure(1.0e5);
/// calc.setPropellant(-241826.0, {{"H", 2.0}, {"O", 1.0}});
/// calc.addCandidateSpecies(h2o);
/// calc.calculate();
/// double T = calc.getTemperature();
/// @endcode
class AdiabatClass {
public:
    /// @brief Constructor - Brent root finder by default
    AdiabatClass();

    /// @brief Destructor
    ~AdiabatClass();

    /// @brief Move constructor
    AdiabatClass(AdiabatClass&&) noexcept;

    /// @brief Move assignment
    AdiabatClass& operator=(AdiabatClass&&) noexcept;

    // Delete copy operations (AdiabatContext is not copyable)
    AdiabatClass(const AdiabatClass&) = delete;
    AdiabatClass& operator=(const AdiabatClass&) = delete;

    // =========================================================================
    // Input Configuration
    // =========================================================================

    /// @brief Set chamber pressure
    /// @param pressure Pressure [Pa]
    void setPressure(double pressure);

    /// @brief Set the propellant record
    void setPropellant(const Propellant& propellant);

    /// @brief Set propellant enthalpy and elemental composition
    /// @param enthalpy Enthalpy of the reference mass [J]
    /// @param composition Element symbol -> amount
    void setPropellant(double enthalpy, const ElementAmounts& composition);

    /// @brief Set how composition amounts are interpreted
    void setCompositionBasis(CompositionBasis basis);

    /// @brief Set the reference mass of the propellant
    /// @param mass Reference mass [kg]
    void setReferenceMass(double mass);

    /// @brief Append one candidate product
    void addCandidateSpecies(const CandidateSpecies& species);

    /// @brief Replace the candidate list
    void setCandidateSpecies(const std::vector<CandidateSpecies>& candidates);

    /// @brief Restrict the temperature search
    /// @param low Lower bound [K]
    /// @param high Upper bound [K]
    void setTemperatureBounds(double low, double high);

    /// @brief Set print results mode
    /// @param mode Print mode (0 = none, 1 = summary, 2 = detailed)
    void setPrintResultsMode(int mode);

    /// @brief Enable/disable iteration tracing on stderr
    void setDebugMode(bool enable);

    // =========================================================================
    // Solver Configuration (Advanced)
    // =========================================================================

    /// @brief Select a built-in root finder
    void setRootFinder(RootFinderType type);

    /// @brief Set custom root finder strategy
    /// @param rootFinder Root finder implementation
    void setRootFinder(std::unique_ptr<IRootFinder> rootFinder);

    /// @brief Set iteration caps
    /// @param innerIterations Newton iterations per composition solve
    /// @param outerIterations Root-finder iterations
    void setMaxIterations(int innerIterations, int outerIterations);

    // =========================================================================
    // Main Computation
    // =========================================================================

    /// @brief Run the adiabatic equilibrium calculation
    /// @return Error code (0 = success)
    int calculate();

    /// @brief Equilibrium composition at a fixed temperature
    /// @param temperature Temperature [K]
    /// @return Error code (0 = success)
    int calculateComposition(double temperature);

    // =========================================================================
    // Output Retrieval
    // =========================================================================

    /// @brief Get equilibrium temperature [K]
    double getTemperature() const;

    /// @brief Get moles of every candidate, in input order
    const Eigen::VectorXd& getMolesSpecies() const;

    /// @brief Get moles of one candidate
    /// @param formula Candidate formula
    /// @return Pair of (moles, error code)
    std::pair<double, int> getMolesSpecies(const std::string& formula) const;

    /// @brief Get element potential (divided by RT)
    /// @param element Element symbol
    /// @return Pair of (potential, error code)
    std::pair<double, int> getElementPotential(const std::string& element) const;

    /// @brief Get system enthalpy [J]
    double getEnthalpy() const;

    /// @brief Get system Gibbs energy [J]
    double getGibbsEnergy() const;

    /// @brief Get average gas molar mass [kg/mol]
    double getGasMolarMass() const;

    /// @brief Get specific heat at constant volume [J/(kg K)]
    double getSpecificHeatVolumetric() const;

    /// @brief Get ratio of specific heats
    double getHeatCapacityRatio() const;

    /// @brief Get condensed mass fraction
    double getCondensedMassFraction() const;

    /// @brief Print results to stdout
    void printResults();

    // =========================================================================
    // Status
    // =========================================================================

    /// @brief Get error/info code
    int getInfoCode() const;

    /// @brief Check if calculation succeeded
    bool isSuccess() const;

    /// @brief Get error message
    std::string getErrorMessage() const;

    // =========================================================================
    // Reset
    // =========================================================================

    /// @brief Reset results (keeps inputs)
    void reset();

    /// @brief Reset everything including inputs
    void resetAll();

    /// @brief Get underlying context
    AdiabatContext& getContext() { return context_; }

    /// @brief Get underlying context (const)
    const AdiabatContext& getContext() const { return context_; }

private:
    // Core state (owns all data)
    AdiabatContext context_;

    // Convenience pointer (non-owning)
    AdiabatIO* io_;

    // Strategy component (owned); null means "follow io_->iRootFinder"
    std::unique_ptr<IRootFinder> rootFinder_;

    /// @brief Outer search using the configured strategy
    void solve();
};

} // namespace Adiabat
