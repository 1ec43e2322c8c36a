#pragma once

#include <string>
#include "porephase/util/Constants.hpp"
#include "porephase/util/Tolerances.hpp"

namespace PorePhase {

/// Settings specific to Mixture objects
struct MixtureSettings {
    std::string cPrefix = Constants::kMixturePrefix;  ///< Prefix of generated mixture names
    bool lEchoDiagnostics = false;                    ///< Echo findings to std::cerr
    Tolerances tolerances;                            ///< Unity and range tolerances

    MixtureSettings() = default;

    void reset() {
        cPrefix = Constants::kMixturePrefix;
        lEchoDiagnostics = false;
        tolerances.initDefaults();
    }
};

} // namespace PorePhase
