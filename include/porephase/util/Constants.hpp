#pragma once

#include <limits>

namespace PorePhase {
namespace Constants {

// Reserved property and qualifier names
constexpr const char* kMoleFraction = "mole_fraction";  // per-component mole fraction
constexpr const char* kConcentration = "concentration"; // per-component molar density
constexpr const char* kAggregate = "all";               // qualifier of the summed mole fraction

// Default name prefix for generated mixture names
constexpr const char* kMixturePrefix = "mix";

// Number of tolerance values
constexpr int kNumTolerances = 2;

// Sentinel stored for a mole fraction that has not been specified
constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

// Network element kinds carrying per-instance arrays
enum class ElementKind {
    Pore = 0,
    Throat
};

// Element names as they appear in property keys
constexpr const char* kElementNames[] = {
    "pore",
    "throat"
};

constexpr int kNumElementKinds = 2;

} // namespace Constants
} // namespace PorePhase
