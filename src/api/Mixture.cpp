/// @file Mixture.cpp
/// @brief Implementation of the mixture phase

#include "porephase/Mixture.hpp"

#include "porephase/interfaces/IPhaseRegistry.hpp"
#include "porephase/mixture/CompositionReconciler.hpp"
#include "porephase/util/Exceptions.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace PorePhase {

namespace {

const char* const kHorizontalRule =
    "------------------------------------------------------------------------------";

} // namespace

Mixture::Mixture(const std::string& name,
                 const ElementCounts& counts,
                 const IPhaseRegistry& project,
                 const std::vector<std::shared_ptr<Phase>>& components,
                 const MixtureSettings& settings)
    : Phase(name, counts),
      project_(project),
      settings_(settings),
      components_(project) {

    diagnostics_.setEcho(settings_.lEchoDiagnostics);
    reconciler_ = std::make_unique<CompositionReconciler>(*this, components_,
                                                          settings_.tolerances, diagnostics_);
    health_ = std::make_unique<HealthChecker>(*this, *reconciler_, settings_.tolerances);

    addComponents(components);
    reconciler_->invalidateAggregate(Constants::ElementKind::Pore, true);
}

Mixture::~Mixture() = default;

// =========================================================================
// Components
// =========================================================================

void Mixture::addComponent(const Phase& component) {
    if (&component == this) {
        throw std::invalid_argument("A mixture cannot be a component of itself");
    }
    if (component.name() == Constants::kAggregate) {
        throw InvalidKeyError(component.name());
    }
    if (component.counts() != counts()) {
        const bool pores = component.counts().nPores != counts().nPores;
        throw ArrayLengthMismatchError(
            component.name() + (pores ? ".pore" : ".throat"),
            static_cast<long>(pores ? counts().nPores : counts().nThroats),
            static_cast<long>(pores ? component.counts().nPores : component.counts().nThroats));
    }
    if (components_.add(component)) {
        onComponentAdded(component.name());
    }
}

void Mixture::addComponent(const std::string& name) {
    addComponent(*project_.resolve(name));
}

void Mixture::addComponents(const std::vector<std::shared_ptr<Phase>>& components) {
    for (const auto& component : components) {
        if (component) {
            addComponent(*component);
        }
    }
}

void Mixture::removeComponent(const Phase& component) {
    removeComponent(component.name());
}

void Mixture::removeComponent(const std::string& name) {
    components_.remove(name);

    // Remove data qualified by the component
    for (const auto& key : keys()) {
        const PropertyKey parsed = PropertyKey::parse(key);
        if (parsed.qualifier == name) {
            erase(parsed);
        }
    }

    reconciler_->invalidateAggregate(Constants::ElementKind::Pore, true);
    reconciler_->invalidateAggregate(Constants::ElementKind::Throat, false);
}

void Mixture::removeComponents(const std::vector<std::shared_ptr<Phase>>& components) {
    for (const auto& component : components) {
        if (component) {
            removeComponent(*component);
        }
    }
}

void Mixture::setComponent(const Phase& component, Mode mode) {
    if (mode == Mode::Add) {
        addComponent(component);
    } else {
        removeComponent(component);
    }
}

std::map<std::string, std::shared_ptr<Phase>> Mixture::listComponents() const {
    return components_.list();
}

void Mixture::setComponents(const std::vector<std::shared_ptr<Phase>>& components) {
    addComponents(components);
}

const std::vector<std::string>& Mixture::componentNames() const {
    return components_.names();
}

bool Mixture::hasComponent(const std::string& name) const {
    return components_.contains(name);
}

void Mixture::onComponentAdded(const std::string& name) {
    const PropertyKey key = CompositionReconciler::moleFractionKey(Constants::ElementKind::Pore, name);
    if (!has(key)) {
        set(key, Constants::kUnset);
    }
    reconciler_->invalidateAggregate(Constants::ElementKind::Pore, true);
    reconciler_->invalidateAggregate(Constants::ElementKind::Throat, false);
}

// =========================================================================
// Key protocol
// =========================================================================

Eigen::VectorXd Mixture::get(const PropertyKey& key) const {
    if (hasStored(key)) {
        return stored(key);
    }

    // Key ends in a component name: fetch it from the component
    if (key.hasQualifier() && components_.contains(key.qualifier)) {
        auto component = components_.resolve(key.qualifier);
        const PropertyKey stripped = key.withoutQualifier();
        if (component->has(stripped)) {
            return component->get(stripped);
        }
        throw KeyNotFoundError(key.str());
    }

    return interleaveData(key);
}

void Mixture::set(const PropertyKey& key, const Eigen::VectorXd& values) {
    // Prevent writing 'element.property.component' on the mixture
    if (isOwnedByComponent(key)) {
        throw AlreadyOwnedByComponentError(key.str());
    }
    store(key, values);

    // A component mole fraction changed behind the reconciler's back
    if (key.property == Constants::kMoleFraction && components_.contains(key.qualifier)) {
        const PropertyKey aggregate = CompositionReconciler::aggregateKey(key.element);
        if (hasStored(aggregate)) {
            store(aggregate, Eigen::VectorXd::Constant(count(key.element), Constants::kUnset));
        }
    }
}

bool Mixture::has(const PropertyKey& key) const {
    if (hasStored(key)) {
        return true;
    }
    if (key.hasQualifier() && components_.contains(key.qualifier) &&
        project_.contains(key.qualifier)) {
        return components_.resolve(key.qualifier)->has(key.withoutQualifier());
    }
    return false;
}

std::vector<std::string> Mixture::props() const {
    return keys();
}

std::vector<std::string> Mixture::props(bool deep) const {
    std::set<std::string> result;
    if (deep) {
        for (const auto& pair : components_.list()) {
            for (const auto& prop : pair.second->props()) {
                result.insert(prop + "." + pair.first);
            }
        }
    }
    for (const auto& key : keys()) {
        result.insert(key);
    }
    return std::vector<std::string>(result.begin(), result.end());
}

bool Mixture::isOwnedByComponent(const PropertyKey& key) const {
    if (!key.hasQualifier() || hasStored(key) || !components_.contains(key.qualifier)) {
        return false;
    }
    const std::vector<std::string> componentProps =
        components_.resolve(key.qualifier)->props();
    return std::find(componentProps.begin(), componentProps.end(),
                     key.withoutQualifier().str()) != componentProps.end();
}

Eigen::VectorXd Mixture::interleaveData(const PropertyKey& key) const {
    const Constants::ElementKind element = key.element;
    if (!reconciler_->isNormalized(element)) {
        reconciler_->recomputeAggregate(element);
        if (!reconciler_->isNormalized(element)) {
            throw CompositionNotNormalizedError(toString(element));
        }
    }

    Eigen::VectorXd vals = Eigen::VectorXd::Zero(count(element));
    try {
        for (const auto& name : components_.names()) {
            auto component = components_.resolve(name);
            if (!component->has(key)) {
                throw MissingComponentPropertyError(name, key.str());
            }
            vals += component->get(key).cwiseProduct(reconciler_->moleFraction(name, element));
        }
    }
    catch (const MissingComponentPropertyError&) {
        // Degrade to a plain lookup, which reports the key as not found
        return PropertyStore::get(key);
    }
    return vals;
}

// =========================================================================
// Composition
// =========================================================================

void Mixture::setConcentration(const std::string& component, const Eigen::VectorXd& values,
                               Constants::ElementKind element) {
    components_.validate(component);
    reconciler_->setConcentration(component, values, element);
}

void Mixture::setConcentration(const std::string& component, double value,
                               Constants::ElementKind element) {
    setConcentration(component, Eigen::VectorXd::Constant(count(element), value), element);
}

void Mixture::setConcentration(const Phase& component, const Eigen::VectorXd& values,
                               Constants::ElementKind element) {
    components_.validate(component);
    reconciler_->setConcentration(component.name(), values, element);
}

void Mixture::setConcentration(const Phase& component, double value,
                               Constants::ElementKind element) {
    setConcentration(component, Eigen::VectorXd::Constant(count(element), value), element);
}

std::vector<Finding> Mixture::setMoleFraction(const std::string& component,
                                              const Eigen::VectorXd& values,
                                              Constants::ElementKind element) {
    components_.validate(component);
    return reconciler_->setMoleFraction(component, values, element);
}

std::vector<Finding> Mixture::setMoleFraction(const std::string& component, double value,
                                              Constants::ElementKind element) {
    return setMoleFraction(component, Eigen::VectorXd::Constant(count(element), value), element);
}

std::vector<Finding> Mixture::setMoleFraction(const Phase& component,
                                              const Eigen::VectorXd& values,
                                              Constants::ElementKind element) {
    components_.validate(component);
    return reconciler_->setMoleFraction(component.name(), values, element);
}

std::vector<Finding> Mixture::setMoleFraction(const Phase& component, double value,
                                              Constants::ElementKind element) {
    return setMoleFraction(component, Eigen::VectorXd::Constant(count(element), value), element);
}

void Mixture::recomputeFromFreeComponent(Constants::ElementKind element) {
    reconciler_->recomputeFromFreeComponent(element, "");
}

void Mixture::recomputeFromFreeComponent(const std::string& released,
                                         Constants::ElementKind element) {
    components_.validate(released);
    reconciler_->recomputeFromFreeComponent(element, released);
}

void Mixture::recomputeFromFreeComponent(const Phase& released,
                                         Constants::ElementKind element) {
    components_.validate(released);
    reconciler_->recomputeFromFreeComponent(element, released.name());
}

void Mixture::recomputeFromConcentrations(Constants::ElementKind element) {
    reconciler_->recomputeFromConcentrations(element);
}

void Mixture::recomputeAggregate(Constants::ElementKind element) {
    reconciler_->recomputeAggregate(element);
}

HealthReport Mixture::checkHealth(Constants::ElementKind element) {
    return health_->check(element);
}

// =========================================================================
// Summary
// =========================================================================

void Mixture::printSummary(std::ostream& os) const {
    os << kHorizontalRule << "\n";
    os << typeName() << " : " << name() << "\n";
    os << kHorizontalRule << "\n";
    for (const auto& key : keys()) {
        os << "  " << key << "\n";
    }
    os << "Component Phases\n";
    os << kHorizontalRule << "\n";
    for (const auto& pair : components_.list()) {
        os << pair.second->typeName() << " : " << pair.first << "\n";
    }
    os << kHorizontalRule << "\n";
}

} // namespace PorePhase
