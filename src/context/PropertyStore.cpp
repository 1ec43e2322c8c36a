#include "porephase/context/PropertyStore.hpp"
#include "porephase/util/Exceptions.hpp"

namespace PorePhase {

PropertyStore::PropertyStore(const ElementCounts& counts)
    : counts_(counts) {
}

Eigen::Index PropertyStore::count(Constants::ElementKind element) const {
    switch (element) {
        case Constants::ElementKind::Pore: return counts_.nPores;
        case Constants::ElementKind::Throat: return counts_.nThroats;
    }
    return 0;
}

bool PropertyStore::has(const PropertyKey& key) const {
    return hasStored(key);
}

Eigen::VectorXd PropertyStore::get(const PropertyKey& key) const {
    return stored(key);
}

void PropertyStore::set(const PropertyKey& key, const Eigen::VectorXd& values) {
    store(key, values);
}

void PropertyStore::set(const PropertyKey& key, double value) {
    set(key, Eigen::VectorXd::Constant(count(key.element), value));
}

bool PropertyStore::erase(const PropertyKey& key) {
    return data_.erase(key.str()) > 0;
}

std::vector<std::string> PropertyStore::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& pair : data_) {
        result.push_back(pair.first);
    }
    return result;
}

std::vector<std::string> PropertyStore::props() const {
    return keys();
}

bool PropertyStore::hasStored(const PropertyKey& key) const {
    return data_.find(key.str()) != data_.end();
}

const Eigen::VectorXd& PropertyStore::stored(const PropertyKey& key) const {
    auto it = data_.find(key.str());
    if (it == data_.end()) {
        throw KeyNotFoundError(key.str());
    }
    return it->second;
}

void PropertyStore::store(const PropertyKey& key, const Eigen::VectorXd& values) {
    const Eigen::Index expected = count(key.element);
    if (values.size() != expected) {
        throw ArrayLengthMismatchError(key.str(), static_cast<long>(expected),
                                       static_cast<long>(values.size()));
    }
    data_[key.str()] = values;
}

} // namespace PorePhase
