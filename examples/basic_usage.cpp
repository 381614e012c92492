/// Basic usage example for Adiabat
/// Demonstrates the AdiabatClass object-oriented API on a hydrogen/oxygen system

#include <adiabat/AdiabatClass.hpp>
#include <iostream>

int main() {
    using namespace Adiabat;

    // Create an AdiabatClass instance (RAII - automatic cleanup)
    AdiabatClass calc;

    // Chamber pressure [Pa]
    calc.setPressure(1.0e5);

    // One reference mass of propellant: 2 mol H and 1 mol O, enthalpy in J
    calc.setPropellant(-150000.0, {{"H", 2.0}, {"O", 1.0}});

    // Candidate products, Glushko coefficients c0..c8, valid 1000-5000 K
    calc.addCandidateSpecies(CandidateSpecies(
        "H2O", {51.65, -59727.5, 6218.0, 2142.5, -213.0, 0.0, 0.0, 0.0, 0.0},
        SpeciesPhase::Gas, 1000.0, 5000.0));
    calc.addCandidateSpecies(CandidateSpecies(
        "H2", {38.35, -1655.4, 5927.0, 723.25, -51.83, 0.0, 0.0, 0.0, 0.0},
        SpeciesPhase::Gas, 1000.0, 5000.0));
    calc.addCandidateSpecies(CandidateSpecies(
        "H", {34.66, 50624.0, 4969.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
        SpeciesPhase::Gas, 1000.0, 5000.0));
    calc.addCandidateSpecies(CandidateSpecies(
        "O", {45.168916, 58008.607, 5353.7423, -412.44632, 246.19247,
              -86.140481, 17.415382, -1.8288189, 0.077299666},
        SpeciesPhase::Gas, 1000.0, 5000.0));

    // Run the calculation
    int result = calc.calculate();

    if (!calc.isSuccess()) {
        std::cerr << "Calculation failed (code " << result << "): "
                  << calc.getErrorMessage() << std::endl;
        return 1;
    }

    std::cout << "Adiabatic temperature: " << calc.getTemperature() << " K\n";
    std::cout << "Gas molar mass:        " << calc.getGasMolarMass() << " kg/mol\n";
    std::cout << "Heat capacity ratio:   " << calc.getHeatCapacityRatio() << "\n";

    auto [water, info] = calc.getMolesSpecies("H2O");
    if (info == 0) {
        std::cout << "H2O:                   " << water << " mol\n";
    }

    // Detailed report
    calc.setPrintResultsMode(2);
    calc.printResults();

    return 0;
}
