/// @file CompositionReconciler.cpp
/// @brief Mole fraction / concentration reconciliation

#include "porephase/mixture/CompositionReconciler.hpp"
#include "porephase/mixture/ComponentRegistry.hpp"
#include "porephase/Mixture.hpp"
#include "porephase/util/ErrorCodes.hpp"
#include "porephase/util/Exceptions.hpp"
#include "porephase/util/Tolerances.hpp"

#include <string>

namespace PorePhase {

CompositionReconciler::CompositionReconciler(Mixture& mixture,
                                             const ComponentRegistry& components,
                                             const Tolerances& tolerances,
                                             Diagnostics& diagnostics)
    : mixture_(mixture),
      components_(components),
      tolerances_(tolerances),
      diagnostics_(diagnostics) {
}

PropertyKey CompositionReconciler::moleFractionKey(Constants::ElementKind element,
                                                   const std::string& component) {
    return PropertyKey(element, Constants::kMoleFraction, component);
}

PropertyKey CompositionReconciler::concentrationKey(Constants::ElementKind element,
                                                    const std::string& component) {
    return PropertyKey(element, Constants::kConcentration, component);
}

PropertyKey CompositionReconciler::aggregateKey(Constants::ElementKind element) {
    return PropertyKey(element, Constants::kMoleFraction, Constants::kAggregate);
}

void CompositionReconciler::recomputeAggregate(Constants::ElementKind element) {
    Eigen::VectorXd total = Eigen::VectorXd::Zero(mixture_.count(element));
    for (const auto& name : components_.names()) {
        total += moleFraction(name, element);
    }
    mixture_.set(aggregateKey(element), total);
}

void CompositionReconciler::invalidateAggregate(Constants::ElementKind element, bool force) {
    const PropertyKey key = aggregateKey(element);
    if (force || mixture_.has(key)) {
        mixture_.set(key, Constants::kUnset);
    }
}

bool CompositionReconciler::isNormalized(Constants::ElementKind element) const {
    const PropertyKey key = aggregateKey(element);
    if (!mixture_.has(key)) {
        return false;
    }
    const Eigen::VectorXd total = mixture_.get(key);
    // NaN entries compare false and therefore fail the test
    return ((total.array() - 1.0).abs() <= tolerances_[kTolUnity]).all();
}

void CompositionReconciler::recomputeFromFreeComponent(Constants::ElementKind element,
                                                       const std::string& released) {
    if (!released.empty()) {
        mixture_.set(moleFractionKey(element, released), Constants::kUnset);
    }

    // Search for components with NaN in their mole fraction array
    std::vector<std::string> unset;
    for (const auto& name : components_.names()) {
        if (isUnset(name, element)) {
            unset.push_back(name);
        }
    }

    if (unset.size() == 1) {
        const std::string& free = unset.front();
        Eigen::VectorXd remainder = Eigen::VectorXd::Ones(mixture_.count(element));
        for (const auto& name : components_.names()) {
            if (name != free) {
                remainder -= moleFraction(name, element);
            }
        }
        mixture_.set(moleFractionKey(element, free), remainder);
    } else {
        // None or several unknowns: composition has to come from concentrations
        diagnostics_.record(Severity::Info, ErrorCode::kConcentrationFallback, "",
                            std::to_string(unset.size()) +
                            " components with unset mole fraction, normalizing concentrations");
        recomputeFromConcentrations(element);
    }
    recomputeAggregate(element);
}

void CompositionReconciler::recomputeFromConcentrations(Constants::ElementKind element) {
    const auto& names = components_.names();
    for (const auto& name : names) {
        if (!mixture_.has(concentrationKey(element, name))) {
            throw InsufficientConcentrationDataError(name);
        }
    }

    Eigen::VectorXd density = Eigen::VectorXd::Zero(mixture_.count(element));
    std::vector<Eigen::VectorXd> concentrations;
    concentrations.reserve(names.size());
    for (const auto& name : names) {
        concentrations.push_back(mixture_.get(concentrationKey(element, name)));
        density += concentrations.back();
    }

    for (std::size_t i = 0; i < names.size(); ++i) {
        Eigen::VectorXd x = concentrations[i].cwiseQuotient(density);
        mixture_.set(moleFractionKey(element, names[i]), x);
    }
    recomputeAggregate(element);
}

void CompositionReconciler::setConcentration(const std::string& component,
                                             const Eigen::VectorXd& values,
                                             Constants::ElementKind element) {
    if (values.size() == 0) {
        return;
    }
    mixture_.set(concentrationKey(element, component), values);
    resetMoleFractions(element);
}

std::vector<Finding> CompositionReconciler::setMoleFraction(const std::string& component,
                                                            const Eigen::VectorXd& values,
                                                            Constants::ElementKind element) {
    const std::size_t mark = diagnostics_.size();
    const PropertyKey key = moleFractionKey(element, component);

    const double slack = tolerances_[kTolMoleFractionRange];
    bool outOfRange = false;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (values(i) > 1.0 + slack || values(i) < -slack) {
            outOfRange = true;
            break;
        }
    }
    if (outOfRange) {
        diagnostics_.record(Severity::Warning, ErrorCode::kMoleFractionOutOfRange, key.str(),
                            "Received values contain mole fractions outside the range of 0 -> 1");
    }

    if (values.size() > 0) {
        mixture_.set(key, values);
    }
    recomputeAggregate(element);
    return diagnostics_.since(mark);
}

void CompositionReconciler::resetMoleFractions(Constants::ElementKind element) {
    for (const auto& name : components_.names()) {
        mixture_.set(moleFractionKey(element, name), Constants::kUnset);
    }
    recomputeAggregate(element);
}

Eigen::VectorXd CompositionReconciler::moleFraction(const std::string& component,
                                                    Constants::ElementKind element) const {
    const PropertyKey key = moleFractionKey(element, component);
    if (!mixture_.has(key)) {
        return Eigen::VectorXd::Constant(mixture_.count(element), Constants::kUnset);
    }
    return mixture_.get(key);
}

bool CompositionReconciler::isUnset(const std::string& component,
                                    Constants::ElementKind element) const {
    return moleFraction(component, element).hasNaN();
}

} // namespace PorePhase
