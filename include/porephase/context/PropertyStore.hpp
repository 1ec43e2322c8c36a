/// @file PropertyStore.hpp
/// @brief Keyed storage of per-element property arrays
/// @details Maps a dotted PropertyKey to an Eigen vector holding one value
/// per pore or throat. Length is checked against the element counts on
/// every write.

#pragma once

#include "porephase/util/Constants.hpp"
#include "porephase/util/PropertyKey.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace PorePhase {

/// Number of instances of each element kind
struct ElementCounts {
    Eigen::Index nPores = 0;
    Eigen::Index nThroats = 0;

    bool operator==(const ElementCounts& other) const {
        return nPores == other.nPores && nThroats == other.nThroats;
    }
    bool operator!=(const ElementCounts& other) const { return !(*this == other); }
};

class PropertyStore {
public:
    explicit PropertyStore(const ElementCounts& counts);

    virtual ~PropertyStore() = default;

    /// @brief Number of instances of an element kind
    Eigen::Index count(Constants::ElementKind element) const;

    const ElementCounts& counts() const { return counts_; }

    /// @brief Check whether a key can be read without computation
    virtual bool has(const PropertyKey& key) const;
    bool has(const std::string& key) const { return has(PropertyKey::parse(key)); }

    /// @brief Read a property array
    /// @throws KeyNotFoundError if the key is not stored
    virtual Eigen::VectorXd get(const PropertyKey& key) const;
    Eigen::VectorXd get(const std::string& key) const { return get(PropertyKey::parse(key)); }

    /// @brief Store a property array
    /// @throws ArrayLengthMismatchError if values.size() != count(key.element)
    virtual void set(const PropertyKey& key, const Eigen::VectorXd& values);
    void set(const std::string& key, const Eigen::VectorXd& values) {
        set(PropertyKey::parse(key), values);
    }

    /// @brief Store a scalar broadcast to every element instance
    void set(const PropertyKey& key, double value);
    void set(const std::string& key, double value) { set(PropertyKey::parse(key), value); }

    /// @brief Remove a stored key
    /// @return true if the key was present
    bool erase(const PropertyKey& key);

    /// @brief All stored keys, sorted
    std::vector<std::string> keys() const;

    /// @brief Property names visible on this object, sorted
    virtual std::vector<std::string> props() const;

protected:
    /// Direct storage access, bypassing any protocol of derived classes
    bool hasStored(const PropertyKey& key) const;
    const Eigen::VectorXd& stored(const PropertyKey& key) const;
    void store(const PropertyKey& key, const Eigen::VectorXd& values);

private:
    ElementCounts counts_;
    std::map<std::string, Eigen::VectorXd> data_;
};

} // namespace PorePhase
