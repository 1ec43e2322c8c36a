/// @file Phase.hpp
/// @brief Named pure-component phase

#pragma once

#include "porephase/context/PropertyStore.hpp"
#include <string>

namespace PorePhase {

/// @brief A phase owning its own property arrays
/// @details Pure phases are the components of a Mixture. A mixture reads
/// them through get()/props() only and never writes into them.
class Phase : public PropertyStore {
public:
    /// @param name Unique name within the project; must be non-empty and
    /// contain no '.' since it is used as a key qualifier
    Phase(const std::string& name, const ElementCounts& counts);

    ~Phase() override = default;

    const std::string& name() const { return name_; }

    /// @brief Kind of phase, used in summaries
    virtual const char* typeName() const { return "Phase"; }

private:
    std::string name_;
};

} // namespace PorePhase
