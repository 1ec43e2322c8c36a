#include "porephase/context/Diagnostics.hpp"
#include <iostream>

namespace PorePhase {

const Finding& Diagnostics::record(Severity severity, int code,
                                   const std::string& key, const std::string& message) {
    Finding f;
    f.severity = severity;
    f.code = code;
    f.key = key;
    f.message = message;
    findings_.push_back(f);

    if (echo_) {
        if (severity == Severity::Warning) {
            std::cerr << "Warning: " << message << "\n";
        } else {
            std::cerr << message << "\n";
        }
    }
    return findings_.back();
}

std::vector<Finding> Diagnostics::since(std::size_t mark) const {
    if (mark >= findings_.size()) {
        return {};
    }
    return std::vector<Finding>(findings_.begin() + static_cast<std::ptrdiff_t>(mark),
                                findings_.end());
}

bool Diagnostics::hasWarnings() const {
    for (const auto& f : findings_) {
        if (f.severity == Severity::Warning) {
            return true;
        }
    }
    return false;
}

int Diagnostics::countCode(int code) const {
    int count = 0;
    for (const auto& f : findings_) {
        if (f.code == code) {
            ++count;
        }
    }
    return count;
}

} // namespace PorePhase
