/// @file Project.hpp
/// @brief Container of the phases defined on one network
/// @details Owns every phase of a simulation and serves as the namespace
/// through which mixtures find their components.

#pragma once

#include "porephase/interfaces/IPhaseRegistry.hpp"
#include "porephase/context/PropertyStore.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace PorePhase {

// Forward declarations
class Phase;
class Mixture;
struct MixtureSettings;

class Project : public IPhaseRegistry {
public:
    /// @param counts Pore and throat counts of the network
    explicit Project(const ElementCounts& counts);

    ~Project() override;

    // Mixtures keep a reference to their project
    Project(const Project&) = delete;
    Project& operator=(const Project&) = delete;

    const ElementCounts& counts() const { return counts_; }

    // =========================================================================
    // Phase management
    // =========================================================================

    /// @brief Create and register a pure phase
    /// @param name Phase name (generated from "phase" if empty)
    /// @throws DuplicatePhaseNameError if the name is taken
    std::shared_ptr<Phase> createPhase(const std::string& name = "");

    /// @brief Create and register a mixture of registered phases
    /// @param name Mixture name (generated from settings.cPrefix if empty)
    /// @param components Initial components, each must belong to this project
    std::shared_ptr<Mixture> createMixture(const std::string& name,
                                           const std::vector<std::shared_ptr<Phase>>& components);

    std::shared_ptr<Mixture> createMixture(const std::string& name,
                                           const std::vector<std::shared_ptr<Phase>>& components,
                                           const MixtureSettings& settings);

    /// @brief Register an existing phase
    /// @throws DuplicatePhaseNameError if the name is taken
    /// @throws ArrayLengthMismatchError if its element counts differ from the network
    void addPhase(std::shared_ptr<Phase> phase);

    /// @brief Deregister a phase
    /// @return true if a phase was removed
    bool removePhase(const std::string& name);

    /// @brief Names of all registered phases, sorted
    std::vector<std::string> phaseNames() const;

    /// @brief First unused name of the form <prefix>_01, <prefix>_02, ...
    std::string uniqueName(const std::string& prefix) const;

    // =========================================================================
    // IPhaseRegistry
    // =========================================================================

    std::shared_ptr<Phase> resolve(const std::string& name) const override;
    bool contains(const std::string& name) const override;
    bool contains(const Phase& phase) const override;

private:
    ElementCounts counts_;
    std::map<std::string, std::shared_ptr<Phase>> phases_;
};

} // namespace PorePhase
