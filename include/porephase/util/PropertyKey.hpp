/// @file PropertyKey.hpp
/// @brief Tagged property key <element>.<property>[.<qualifier>]
/// @details Replaces ad hoc splitting of dotted strings. The qualifier is
/// either empty (mixture-level value), "all" (aggregate) or the name of a
/// component whose value is materialized on the mixture.

#pragma once

#include "porephase/util/Constants.hpp"
#include <string>

namespace PorePhase {

/// @brief Render an element kind as it appears in keys ("pore", "throat")
const char* toString(Constants::ElementKind element);

/// @brief Parse an element name
/// @throws InvalidKeyError if the name is not a known element kind
Constants::ElementKind parseElementKind(const std::string& name);

struct PropertyKey {
    Constants::ElementKind element = Constants::ElementKind::Pore;
    std::string property;
    std::string qualifier;  ///< Empty when absent

    PropertyKey() = default;

    PropertyKey(Constants::ElementKind element,
                const std::string& property,
                const std::string& qualifier = "")
        : element(element), property(property), qualifier(qualifier) {}

    /// @brief Parse a dotted key
    /// @details The first segment names the element. With three or more
    /// segments the last one is the qualifier and everything between is the
    /// property name.
    /// @throws InvalidKeyError on empty segments, fewer than two segments
    /// or an unknown element
    static PropertyKey parse(const std::string& key);

    /// @brief Dotted representation
    std::string str() const;

    bool hasQualifier() const { return !qualifier.empty(); }

    /// @brief True for the "<element>.<property>.all" aggregate key
    bool isAggregate() const { return qualifier == Constants::kAggregate; }

    PropertyKey withQualifier(const std::string& q) const {
        return PropertyKey(element, property, q);
    }

    PropertyKey withoutQualifier() const {
        return PropertyKey(element, property);
    }

    bool operator==(const PropertyKey& other) const {
        return element == other.element && property == other.property &&
               qualifier == other.qualifier;
    }
    bool operator!=(const PropertyKey& other) const { return !(*this == other); }
};

} // namespace PorePhase
