#pragma once

namespace PorePhase {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;

// Membership errors (1-9)
constexpr int kNotInProject = 1;
constexpr int kNotInMixture = 2;
constexpr int kDuplicatePhaseName = 3;

// Key protocol errors (10-19)
constexpr int kKeyNotFound = 10;
constexpr int kInvalidKey = 11;
constexpr int kArrayLengthMismatch = 12;
constexpr int kAlreadyOwnedByComponent = 13;

// Composition errors (20-29)
constexpr int kCompositionNotNormalized = 20;
constexpr int kMissingComponentProperty = 21;
constexpr int kInsufficientConcentrationData = 22;

// Advisory findings (50-59), never thrown
constexpr int kMoleFractionOutOfRange = 50;
constexpr int kConcentrationFallback = 51;

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kNotInProject: return "Phase does not belong to this project";
        case kNotInMixture: return "Phase does not belong to this mixture";
        case kDuplicatePhaseName: return "Phase name already used in this project";
        case kKeyNotFound: return "Property key not found";
        case kInvalidKey: return "Malformed property key";
        case kArrayLengthMismatch: return "Array length does not match element count";
        case kAlreadyOwnedByComponent: return "Key already assigned to a component object";
        case kCompositionNotNormalized: return "Mole fraction does not add to unity";
        case kMissingComponentProperty: return "Component lacks the requested property";
        case kInsufficientConcentrationData: return "Concentration missing for a component";
        case kMoleFractionOutOfRange: return "Mole fraction outside the range 0 -> 1";
        case kConcentrationFallback: return "No single free component, composition taken from concentrations";
        default: return "Unknown error";
    }
}

} // namespace ErrorCode
} // namespace PorePhase
