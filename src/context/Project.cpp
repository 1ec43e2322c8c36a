/// @file Project.cpp
/// @brief Implementation of the phase container

#include "porephase/context/Project.hpp"
#include "porephase/context/Phase.hpp"
#include "porephase/context/MixtureSettings.hpp"
#include "porephase/Mixture.hpp"
#include "porephase/util/Exceptions.hpp"

#include <cstdio>

namespace PorePhase {

Project::Project(const ElementCounts& counts)
    : counts_(counts) {
}

Project::~Project() = default;

std::shared_ptr<Phase> Project::createPhase(const std::string& name) {
    auto phase = std::make_shared<Phase>(name.empty() ? uniqueName("phase") : name, counts_);
    addPhase(phase);
    return phase;
}

std::shared_ptr<Mixture> Project::createMixture(const std::string& name,
                                                const std::vector<std::shared_ptr<Phase>>& components) {
    return createMixture(name, components, MixtureSettings());
}

std::shared_ptr<Mixture> Project::createMixture(const std::string& name,
                                                const std::vector<std::shared_ptr<Phase>>& components,
                                                const MixtureSettings& settings) {
    const std::string mixName = name.empty() ? uniqueName(settings.cPrefix) : name;
    if (contains(mixName)) {
        throw DuplicatePhaseNameError(mixName);
    }
    auto mixture = std::make_shared<Mixture>(mixName, counts_, *this, components, settings);
    addPhase(mixture);
    return mixture;
}

void Project::addPhase(std::shared_ptr<Phase> phase) {
    if (!phase) {
        return;
    }
    if (phase->counts().nPores != counts_.nPores) {
        throw ArrayLengthMismatchError(phase->name() + ".pore", static_cast<long>(counts_.nPores),
                                       static_cast<long>(phase->counts().nPores));
    }
    if (phase->counts().nThroats != counts_.nThroats) {
        throw ArrayLengthMismatchError(phase->name() + ".throat", static_cast<long>(counts_.nThroats),
                                       static_cast<long>(phase->counts().nThroats));
    }
    auto it = phases_.find(phase->name());
    if (it != phases_.end()) {
        if (it->second == phase) {
            return;
        }
        throw DuplicatePhaseNameError(phase->name());
    }
    phases_.emplace(phase->name(), std::move(phase));
}

bool Project::removePhase(const std::string& name) {
    return phases_.erase(name) > 0;
}

std::vector<std::string> Project::phaseNames() const {
    std::vector<std::string> names;
    names.reserve(phases_.size());
    for (const auto& pair : phases_) {
        names.push_back(pair.first);
    }
    return names;
}

std::string Project::uniqueName(const std::string& prefix) const {
    for (int i = 1;; ++i) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "_%02d", i);
        std::string candidate = prefix + suffix;
        if (!contains(candidate)) {
            return candidate;
        }
    }
}

std::shared_ptr<Phase> Project::resolve(const std::string& name) const {
    auto it = phases_.find(name);
    if (it == phases_.end()) {
        throw NotInProjectError(name);
    }
    return it->second;
}

bool Project::contains(const std::string& name) const {
    return phases_.find(name) != phases_.end();
}

bool Project::contains(const Phase& phase) const {
    auto it = phases_.find(phase.name());
    return it != phases_.end() && it->second.get() == &phase;
}

} // namespace PorePhase
