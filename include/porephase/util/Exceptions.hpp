/// @file Exceptions.hpp
/// @brief Exception types raised by the mixture composition model
/// @details Every exception carries the ErrorCode value describing it, so
/// callers may dispatch either on type or on code.

#pragma once

#include "porephase/util/ErrorCodes.hpp"
#include <stdexcept>
#include <string>

namespace PorePhase {

/// @brief Base class of all errors raised by porephase
class MixtureException : public std::runtime_error {
public:
    MixtureException(int code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    /// @brief Error code (see ErrorCode namespace)
    int code() const noexcept { return code_; }

private:
    int code_;
};

/// Referenced phase is not registered in the enclosing project
class NotInProjectError : public MixtureException {
public:
    explicit NotInProjectError(const std::string& name)
        : MixtureException(ErrorCode::kNotInProject,
                           name + " doesn't belong to this project") {}
};

/// Referenced phase is not a component of the mixture
class NotInMixtureError : public MixtureException {
public:
    explicit NotInMixtureError(const std::string& name)
        : MixtureException(ErrorCode::kNotInMixture,
                           name + " doesn't belong to this mixture") {}
};

class DuplicatePhaseNameError : public MixtureException {
public:
    explicit DuplicatePhaseNameError(const std::string& name)
        : MixtureException(ErrorCode::kDuplicatePhaseName,
                           "Another phase is already named " + name) {}
};

class KeyNotFoundError : public MixtureException {
public:
    explicit KeyNotFoundError(const std::string& key)
        : MixtureException(ErrorCode::kKeyNotFound, key) {}
};

class InvalidKeyError : public MixtureException {
public:
    explicit InvalidKeyError(const std::string& key)
        : MixtureException(ErrorCode::kInvalidKey, "Malformed property key: " + key) {}
};

class ArrayLengthMismatchError : public MixtureException {
public:
    ArrayLengthMismatchError(const std::string& key, long expected, long received)
        : MixtureException(ErrorCode::kArrayLengthMismatch,
                           key + " expects " + std::to_string(expected) +
                           " values, received " + std::to_string(received)) {}
};

/// Write to a key the mixture would otherwise delegate to a component
class AlreadyOwnedByComponentError : public MixtureException {
public:
    explicit AlreadyOwnedByComponentError(const std::string& key)
        : MixtureException(ErrorCode::kAlreadyOwnedByComponent,
                           key + " already assigned to a component object") {}
};

/// Aggregate mole fraction differs from unity in at least one instance
class CompositionNotNormalizedError : public MixtureException {
public:
    explicit CompositionNotNormalizedError(const std::string& element)
        : MixtureException(ErrorCode::kCompositionNotNormalized,
                           "Mole fraction does not add to unity in all " + element + "s") {}
};

class MissingComponentPropertyError : public MixtureException {
public:
    MissingComponentPropertyError(const std::string& component, const std::string& key)
        : MixtureException(ErrorCode::kMissingComponentProperty,
                           component + " has no property " + key) {}
};

class InsufficientConcentrationDataError : public MixtureException {
public:
    explicit InsufficientConcentrationDataError(const std::string& component)
        : MixtureException(ErrorCode::kInsufficientConcentrationData,
                           "No concentration specified for component " + component) {}
};

} // namespace PorePhase
