#pragma once

#include <array>
#include "Constants.hpp"

namespace Adiabat {

// Tolerance indices
enum ToleranceIndex {
    kTolMassBalance = 0,       // Mass balance residual (scaled by max(1, max b))
    kTolComposition = 1,       // Relative composition change between iterations
    kTolDrivingForce = 2,      // Condensed species driving force
    kTolMinMoles = 3,          // Minimum moles threshold
    kTolEnthalpy = 4,          // Energy residual (J)
    kTolTemperature = 5,       // Relative temperature bracket width
    kTolArmijo = 6             // Sufficient decrease parameter
};

struct Tolerances {
    std::array<double, Constants::kNumTolerances> values;

    Tolerances() {
        initDefaults();
    }

    void initDefaults() {
        values[kTolMassBalance] = 1.0e-10;
        values[kTolComposition] = 1.0e-10;
        values[kTolDrivingForce] = 1.0e-8;
        values[kTolMinMoles] = 1.0e-100;
        values[kTolEnthalpy] = 1.0e-3;
        values[kTolTemperature] = 1.0e-12;
        values[kTolArmijo] = 1.0e-4;
    }

    double& operator[](int index) { return values[index]; }
    const double& operator[](int index) const { return values[index]; }
};

} // namespace Adiabat
