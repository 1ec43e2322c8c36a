#pragma once

#include <array>
#include "porephase/util/Constants.hpp"

namespace PorePhase {

// Tolerance indices
enum ToleranceIndex {
    kTolUnity = 0,             // Allowed deviation of the aggregate mole fraction from 1
    kTolMoleFractionRange = 1  // Slack on the [0, 1] mole fraction range before warning
};

struct Tolerances {
    std::array<double, Constants::kNumTolerances> values;

    Tolerances() {
        initDefaults();
    }

    void initDefaults() {
        values[kTolUnity] = 1.0e-10;
        values[kTolMoleFractionRange] = 0.0;
    }

    double& operator[](int index) { return values[index]; }
    const double& operator[](int index) const { return values[index]; }
};

} // namespace PorePhase
