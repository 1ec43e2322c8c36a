/// @file Mixture.hpp
/// @brief Phase composed of independently modelled pure-component phases
/// @details A Mixture stores its own properties like any Phase and resolves
/// every other key in three stages:
/// 1. direct lookup in its own storage
/// 2. delegation: "<element>.<prop>.<component>" reads "<element>.<prop>"
///    from that component
/// 3. interleaving: any key not naming a component is blended from all
///    components, weighted by their mole fractions
///
/// Example usage:
/// @code
/// Project project({100, 250});
/// auto water = project.createPhase("water");
/// auto air = project.createPhase("air");
/// water->set("pore.viscosity", 1.0e-3);
/// air->set("pore.viscosity", 1.8e-5);
/// auto mix = project.createMixture("humid_air", {water, air});
/// mix->setMoleFraction("water", 0.02);
/// mix->recomputeFromFreeComponent();
/// Eigen::VectorXd mu = mix->get("pore.viscosity");
/// @endcode
///
/// Components are shared, not owned: they are looked up in the project by
/// name on every access. Concurrent mutation of a component shared by two
/// mixtures is the caller's responsibility.

#pragma once

#include "porephase/context/Diagnostics.hpp"
#include "porephase/context/MixtureSettings.hpp"
#include "porephase/context/Phase.hpp"
#include "porephase/mixture/ComponentRegistry.hpp"
#include "porephase/mixture/HealthChecker.hpp"
#include <Eigen/Dense>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace PorePhase {

// Forward declarations
class IPhaseRegistry;
class CompositionReconciler;

class Mixture : public Phase {
public:
    /// Mode of setComponent()
    enum class Mode {
        Add,
        Remove
    };

    /// @brief Constructor
    /// @param name Name of the mixture, unique within the project
    /// @param counts Pore and throat counts of the network
    /// @param project Namespace the components are resolved in; must outlive the mixture
    /// @param components Initial components; their pore mole fractions are seeded unset
    /// @param settings Mixture settings
    Mixture(const std::string& name,
            const ElementCounts& counts,
            const IPhaseRegistry& project,
            const std::vector<std::shared_ptr<Phase>>& components = {},
            const MixtureSettings& settings = MixtureSettings());

    ~Mixture() override;

    // The reconciler and health checker hold references to this object
    Mixture(const Mixture&) = delete;
    Mixture& operator=(const Mixture&) = delete;
    Mixture(Mixture&&) = delete;
    Mixture& operator=(Mixture&&) = delete;

    const char* typeName() const override { return "Mixture"; }

    // =========================================================================
    // Components
    // =========================================================================

    /// @brief Add a component
    /// @details Its pore mole fraction is seeded unset if not already present
    /// and the pore aggregate is reset to unset.
    /// @throws NotInProjectError if the phase is not in the project
    void addComponent(const Phase& component);
    void addComponent(const std::string& name);
    void addComponents(const std::vector<std::shared_ptr<Phase>>& components);

    /// @brief Remove a component and every key qualified by its name
    /// @throws NotInMixtureError if it is not a component
    void removeComponent(const Phase& component);
    void removeComponent(const std::string& name);
    void removeComponents(const std::vector<std::shared_ptr<Phase>>& components);

    /// @brief Add or remove a component
    void setComponent(const Phase& component, Mode mode = Mode::Add);

    /// @brief Name to live component object, resolved through the project
    std::map<std::string, std::shared_ptr<Phase>> listComponents() const;

    /// @brief Add each given phase; already registered ones are ignored
    void setComponents(const std::vector<std::shared_ptr<Phase>>& components);

    /// @brief Registered component names, in registration order
    const std::vector<std::string>& componentNames() const;

    bool hasComponent(const std::string& name) const;

    // =========================================================================
    // Key protocol
    // =========================================================================

    using PropertyStore::get;
    using PropertyStore::has;
    using PropertyStore::set;

    /// @brief Read a key: direct, delegated or interleaved
    /// @throws KeyNotFoundError if no stage can serve the key
    /// @throws CompositionNotNormalizedError if interleaving is needed and the
    /// composition does not sum to unity
    Eigen::VectorXd get(const PropertyKey& key) const override;

    /// @brief Store a key on the mixture
    /// @throws AlreadyOwnedByComponentError if the key is served by delegation
    void set(const PropertyKey& key, const Eigen::VectorXd& values) override;

    /// @brief True if the key is stored or can be delegated to a component
    bool has(const PropertyKey& key) const override;

    /// @brief Keys stored on the mixture, sorted
    std::vector<std::string> props() const override;

    /// @brief Keys stored on the mixture plus, if deep, every component
    /// property suffixed with ".<component>"
    std::vector<std::string> props(bool deep) const;

    /// @brief Mole-fraction weighted blend of a property over all components
    /// @details Falls back to a plain lookup (KeyNotFoundError) if any
    /// component lacks the property.
    Eigen::VectorXd interleaveData(const PropertyKey& key) const;
    Eigen::VectorXd interleaveData(const std::string& key) const {
        return interleaveData(PropertyKey::parse(key));
    }

    // =========================================================================
    // Composition
    // =========================================================================

    /// @brief Store a component's concentration and unset all mole fractions
    /// @throws NotInProjectError / NotInMixtureError on membership violation
    void setConcentration(const std::string& component, const Eigen::VectorXd& values,
                          Constants::ElementKind element = Constants::ElementKind::Pore);
    void setConcentration(const std::string& component, double value,
                          Constants::ElementKind element = Constants::ElementKind::Pore);
    void setConcentration(const Phase& component, const Eigen::VectorXd& values,
                          Constants::ElementKind element = Constants::ElementKind::Pore);
    void setConcentration(const Phase& component, double value,
                          Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief Store a component's mole fraction and recompute the aggregate
    /// @details Other components and concentrations are left untouched.
    /// Values outside [0, 1] are accepted and reported as a warning.
    /// @return Findings recorded by this call
    std::vector<Finding> setMoleFraction(const std::string& component, const Eigen::VectorXd& values,
                                         Constants::ElementKind element = Constants::ElementKind::Pore);
    std::vector<Finding> setMoleFraction(const std::string& component, double value,
                                         Constants::ElementKind element = Constants::ElementKind::Pore);
    std::vector<Finding> setMoleFraction(const Phase& component, const Eigen::VectorXd& values,
                                         Constants::ElementKind element = Constants::ElementKind::Pore);
    std::vector<Finding> setMoleFraction(const Phase& component, double value,
                                         Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief Back-solve the single unset component, else normalize concentrations
    void recomputeFromFreeComponent(Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief Release a component (unset its mole fraction), then back-solve
    void recomputeFromFreeComponent(const std::string& released,
                                    Constants::ElementKind element = Constants::ElementKind::Pore);
    void recomputeFromFreeComponent(const Phase& released,
                                    Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief Mole fractions from concentrations only
    /// @throws InsufficientConcentrationDataError if any component lacks a concentration
    void recomputeFromConcentrations(Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief <element>.mole_fraction.all := sum of component mole fractions
    void recomputeAggregate(Constants::ElementKind element = Constants::ElementKind::Pore);

    /// @brief Locations where the composition does not sum to unity
    HealthReport checkHealth(Constants::ElementKind element = Constants::ElementKind::Pore);

    // =========================================================================
    // Settings & diagnostics
    // =========================================================================

    const MixtureSettings& settings() const { return settings_; }

    Diagnostics& diagnostics() { return diagnostics_; }
    const Diagnostics& diagnostics() const { return diagnostics_; }

    /// @brief Print the mixture and its component phases
    void printSummary(std::ostream& os) const;

private:
    const IPhaseRegistry& project_;
    MixtureSettings settings_;
    Diagnostics diagnostics_;
    ComponentRegistry components_;

    // The aggregate mole fraction is a cache refreshed during const reads
    std::unique_ptr<CompositionReconciler> reconciler_;
    std::unique_ptr<HealthChecker> health_;

    /// Seed the mole fraction of a newly registered component
    void onComponentAdded(const std::string& name);

    /// True if the key is not stored here and a component lists the unqualified key
    bool isOwnedByComponent(const PropertyKey& key) const;
};

} // namespace PorePhase
