/// @file HealthChecker.hpp
/// @brief Audit of the unity invariant of a mixture's composition

#pragma once

#include "porephase/util/Constants.hpp"
#include <Eigen/Dense>
#include <vector>

namespace PorePhase {

// Forward declarations
class Mixture;
class CompositionReconciler;
struct Tolerances;

/// @brief Instances where the aggregate mole fraction is not unity
struct HealthReport {
    std::vector<Eigen::Index> tooLow;       ///< Aggregate below 1
    std::vector<Eigen::Index> tooHigh;      ///< Aggregate above 1
    std::vector<Eigen::Index> unspecified;  ///< Aggregate is NaN

    /// @brief True if every instance sums to unity
    bool isHealthy() const {
        return tooLow.empty() && tooHigh.empty() && unspecified.empty();
    }
};

class HealthChecker {
public:
    HealthChecker(const Mixture& mixture,
                  CompositionReconciler& reconciler,
                  const Tolerances& tolerances);

    /// @brief Recompute the aggregate and classify every instance
    /// @details Purely diagnostic, never throws on an unhealthy mixture
    HealthReport check(Constants::ElementKind element);

private:
    const Mixture& mixture_;
    CompositionReconciler& reconciler_;
    const Tolerances& tolerances_;
};

} // namespace PorePhase
