#include "porephase/context/Phase.hpp"
#include "porephase/util/Exceptions.hpp"

namespace PorePhase {

Phase::Phase(const std::string& name, const ElementCounts& counts)
    : PropertyStore(counts), name_(name) {
    if (name_.empty() || name_.find('.') != std::string::npos) {
        throw InvalidKeyError(name_);
    }
}

} // namespace PorePhase
