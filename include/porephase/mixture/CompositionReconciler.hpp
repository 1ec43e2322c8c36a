/// @file CompositionReconciler.hpp
/// @brief Keeps mole fractions, concentrations and their aggregate consistent
/// @details Two update policies are provided and are not interchangeable:
/// - recomputeFromFreeComponent(): back-solves the single unset component,
///   otherwise falls back to concentration normalization
/// - recomputeFromConcentrations(): normalization only, every component
///   must carry a concentration
///
/// All reads and writes go through the owning Mixture's key protocol.

#pragma once

#include "porephase/context/Diagnostics.hpp"
#include "porephase/util/Constants.hpp"
#include "porephase/util/PropertyKey.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace PorePhase {

// Forward declarations
class Mixture;
class ComponentRegistry;
struct Tolerances;

class CompositionReconciler {
public:
    CompositionReconciler(Mixture& mixture,
                          const ComponentRegistry& components,
                          const Tolerances& tolerances,
                          Diagnostics& diagnostics);

    // =========================================================================
    // Key helpers
    // =========================================================================

    static PropertyKey moleFractionKey(Constants::ElementKind element, const std::string& component);
    static PropertyKey concentrationKey(Constants::ElementKind element, const std::string& component);
    static PropertyKey aggregateKey(Constants::ElementKind element);

    // =========================================================================
    // Aggregate
    // =========================================================================

    /// @brief <element>.mole_fraction.all := sum of component mole fractions
    /// @details Components without a mole fraction contribute NaN
    void recomputeAggregate(Constants::ElementKind element);

    /// @brief Mark the aggregate unset
    /// @param force Store NaN even if no aggregate was stored before
    void invalidateAggregate(Constants::ElementKind element, bool force);

    /// @brief True if the stored aggregate is within tolerance of 1 everywhere
    bool isNormalized(Constants::ElementKind element) const;

    // =========================================================================
    // Update policies
    // =========================================================================

    /// @brief Back-solve the free component, else normalize concentrations
    /// @param released Component whose mole fraction is unset first (may be empty)
    /// @throws InsufficientConcentrationDataError if the fallback lacks data
    void recomputeFromFreeComponent(Constants::ElementKind element, const std::string& released);

    /// @brief Mole fraction := concentration / total concentration
    /// @throws InsufficientConcentrationDataError if any component lacks a concentration
    void recomputeFromConcentrations(Constants::ElementKind element);

    // =========================================================================
    // Setters (membership already validated by the caller)
    // =========================================================================

    /// @brief Store a concentration and unset every mole fraction
    void setConcentration(const std::string& component,
                          const Eigen::VectorXd& values,
                          Constants::ElementKind element);

    /// @brief Store a mole fraction and recompute the aggregate
    /// @return Findings recorded by this call
    std::vector<Finding> setMoleFraction(const std::string& component,
                                         const Eigen::VectorXd& values,
                                         Constants::ElementKind element);

    /// @brief Set every component's mole fraction to NaN
    void resetMoleFractions(Constants::ElementKind element);

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief Mole fraction of a component (all NaN if not specified)
    Eigen::VectorXd moleFraction(const std::string& component, Constants::ElementKind element) const;

    /// @brief True if a component's mole fraction is missing or contains NaN
    bool isUnset(const std::string& component, Constants::ElementKind element) const;

private:
    Mixture& mixture_;
    const ComponentRegistry& components_;
    const Tolerances& tolerances_;
    Diagnostics& diagnostics_;
};

} // namespace PorePhase
