/// @file IPhaseRegistry.hpp
/// @brief Interface for looking up sibling phases by name
/// @details A mixture keeps only the names of its components and
/// re-resolves them through this interface on every access, so components
/// may be shared between mixtures and replaced in the registry.

#pragma once

#include <memory>
#include <string>

namespace PorePhase {

// Forward declarations
class Phase;

/// @brief Abstract namespace of phases
class IPhaseRegistry {
public:
    virtual ~IPhaseRegistry() = default;

    /// @brief Look up a phase by name
    /// @param name Phase name
    /// @return Shared handle to the live phase object
    /// @throws NotInProjectError if no phase has this name
    virtual std::shared_ptr<Phase> resolve(const std::string& name) const = 0;

    /// @brief Check whether a phase of this name is registered
    virtual bool contains(const std::string& name) const = 0;

    /// @brief Check whether this exact object is registered
    /// @details Identity test: a different object carrying a registered
    /// name is not contained
    virtual bool contains(const Phase& phase) const = 0;
};

} // namespace PorePhase
