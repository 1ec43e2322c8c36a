/// @file Diagnostics.hpp
/// @brief Advisory findings recorded by mixture operations
/// @details Soft conditions (e.g. mole fractions outside [0, 1]) are not
/// errors. They are recorded here, separate from return values, and can
/// optionally be echoed to std::cerr.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace PorePhase {

enum class Severity {
    Info,
    Warning
};

struct Finding {
    Severity severity = Severity::Info;
    int code = 0;          ///< ErrorCode value
    std::string key;       ///< Property key concerned, may be empty
    std::string message;
};

class Diagnostics {
public:
    Diagnostics() = default;

    /// @brief Echo every new finding to std::cerr
    void setEcho(bool enable) { echo_ = enable; }
    bool isEchoing() const { return echo_; }

    /// @brief Append a finding
    /// @return Reference to the stored finding
    const Finding& record(Severity severity, int code,
                          const std::string& key, const std::string& message);

    const std::vector<Finding>& findings() const { return findings_; }

    std::size_t size() const { return findings_.size(); }
    bool empty() const { return findings_.empty(); }

    /// @brief Findings recorded after the given position
    /// @param mark Value of size() taken before an operation
    std::vector<Finding> since(std::size_t mark) const;

    bool hasWarnings() const;

    /// @brief Number of findings carrying this code
    int countCode(int code) const;

    void clear() { findings_.clear(); }

private:
    std::vector<Finding> findings_;
    bool echo_ = false;
};

} // namespace PorePhase
