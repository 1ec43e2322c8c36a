#include "porephase/mixture/ComponentRegistry.hpp"
#include "porephase/interfaces/IPhaseRegistry.hpp"
#include "porephase/context/Phase.hpp"
#include "porephase/util/Exceptions.hpp"

#include <algorithm>

namespace PorePhase {

ComponentRegistry::ComponentRegistry(const IPhaseRegistry& project)
    : project_(project) {
}

bool ComponentRegistry::add(const std::string& name) {
    if (!project_.contains(name)) {
        throw NotInProjectError(name);
    }
    if (contains(name)) {
        return false;
    }
    names_.push_back(name);
    return true;
}

bool ComponentRegistry::add(const Phase& phase) {
    if (!project_.contains(phase)) {
        throw NotInProjectError(phase.name());
    }
    return add(phase.name());
}

void ComponentRegistry::remove(const std::string& name) {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        throw NotInMixtureError(name);
    }
    names_.erase(it);
}

bool ComponentRegistry::contains(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

std::shared_ptr<Phase> ComponentRegistry::resolve(const std::string& name) const {
    if (!contains(name)) {
        throw NotInMixtureError(name);
    }
    return project_.resolve(name);
}

std::map<std::string, std::shared_ptr<Phase>> ComponentRegistry::list() const {
    std::map<std::string, std::shared_ptr<Phase>> result;
    for (const auto& name : names_) {
        result.emplace(name, project_.resolve(name));
    }
    return result;
}

void ComponentRegistry::validate(const Phase& phase) const {
    if (!project_.contains(phase)) {
        throw NotInProjectError(phase.name());
    }
    if (!contains(phase.name())) {
        throw NotInMixtureError(phase.name());
    }
}

void ComponentRegistry::validate(const std::string& name) const {
    if (!project_.contains(name)) {
        throw NotInProjectError(name);
    }
    if (!contains(name)) {
        throw NotInMixtureError(name);
    }
}

} // namespace PorePhase
