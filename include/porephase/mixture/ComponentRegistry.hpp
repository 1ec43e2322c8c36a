/// @file ComponentRegistry.hpp
/// @brief Names of the phases constituting a mixture
/// @details Holds names only. Component objects are resolved through the
/// project on every access, so a stale object is never handed out.

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace PorePhase {

// Forward declarations
class Phase;
class IPhaseRegistry;

class ComponentRegistry {
public:
    /// @param project Namespace the component names are resolved in
    explicit ComponentRegistry(const IPhaseRegistry& project);

    /// @brief Register a component by name
    /// @return false if it was already registered
    /// @throws NotInProjectError if the project has no phase of this name
    bool add(const std::string& name);

    /// @brief Register a component object
    /// @throws NotInProjectError if this exact object is not in the project
    bool add(const Phase& phase);

    /// @brief Deregister a component
    /// @throws NotInMixtureError if the name is not registered
    void remove(const std::string& name);

    bool contains(const std::string& name) const;

    /// @brief Registered names, in registration order
    const std::vector<std::string>& names() const { return names_; }

    std::size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    /// @brief Resolve a registered component
    /// @throws NotInMixtureError if not registered
    /// @throws NotInProjectError if the project no longer holds it
    std::shared_ptr<Phase> resolve(const std::string& name) const;

    /// @brief Map of name to live component object
    std::map<std::string, std::shared_ptr<Phase>> list() const;

    /// @brief Check membership of a component object
    /// @throws NotInProjectError if the object is not in the project
    /// @throws NotInMixtureError if it is not a component
    void validate(const Phase& phase) const;

    /// @brief Check membership of a component name
    void validate(const std::string& name) const;

private:
    const IPhaseRegistry& project_;
    std::vector<std::string> names_;
};

} // namespace PorePhase
