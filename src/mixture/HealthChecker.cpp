#include "porephase/mixture/HealthChecker.hpp"
#include "porephase/mixture/CompositionReconciler.hpp"
#include "porephase/Mixture.hpp"
#include "porephase/util/Tolerances.hpp"

#include <cmath>

namespace PorePhase {

HealthChecker::HealthChecker(const Mixture& mixture,
                             CompositionReconciler& reconciler,
                             const Tolerances& tolerances)
    : mixture_(mixture),
      reconciler_(reconciler),
      tolerances_(tolerances) {
}

HealthReport HealthChecker::check(Constants::ElementKind element) {
    HealthReport report;
    reconciler_.recomputeAggregate(element);

    const Eigen::VectorXd total = mixture_.get(CompositionReconciler::aggregateKey(element));
    const double tol = tolerances_[kTolUnity];
    for (Eigen::Index i = 0; i < total.size(); ++i) {
        if (std::isnan(total(i))) {
            report.unspecified.push_back(i);
        } else if (total(i) < 1.0 - tol) {
            report.tooLow.push_back(i);
        } else if (total(i) > 1.0 + tol) {
            report.tooHigh.push_back(i);
        }
    }
    return report;
}

} // namespace PorePhase
