// ============================================================================
// Fragment 3.1 - Log-normal Fit (Method of Moments) + Disruption Transform
// File: lognormal_fit.cpp
// ============================================================================

#include "lognormal_fit.hpp"

#include "engine/core/require.hpp"

#include <cmath>
#include <string>

namespace newsvendor::stats {

void DistributionParameters::validate() const {
    require_finite(mu, "DistributionParameters.mu");
    require_positive(sigma, "DistributionParameters.sigma");
}

DistributionParameters fit_lognormal(double natural_mean, double natural_sigma) {
    require_positive(natural_mean, "natural_mean");
    require_positive(natural_sigma, "natural_sigma");

    const double m2 = natural_mean * natural_mean;
    const double s2 = natural_sigma * natural_sigma;

    const double total = s2 + m2;
    require_positive(total, "natural_sigma^2 + natural_mean^2");

    const double log_arg = s2 / m2 + 1.0;
    NEWSVENDOR_REQUIRE(is_finite(log_arg) && log_arg > 1.0, DomainError,
                       "fit_lognormal: variance ratio underflows (sigma would be 0)");

    DistributionParameters p;
    p.mu = std::log(m2 / std::sqrt(total));
    p.sigma = std::sqrt(std::log(log_arg));
    p.validate();
    return p;
}

double natural_mean(const DistributionParameters& p) {
    p.validate();
    const double m = std::exp(p.mu + 0.5 * p.sigma * p.sigma);
    require_finite(m, "natural_mean");
    return m;
}

NaturalMoments natural_moments(const DistributionParameters& p) {
    NaturalMoments out;
    out.mean = natural_mean(p);
    const double s2 = p.sigma * p.sigma;
    out.stdev = std::sqrt(std::expm1(s2) * std::exp(2.0 * p.mu + s2));
    require_finite(out.stdev, "natural_stdev");
    return out;
}

DistributionParameters disrupted(const DistributionParameters& p, double multiplier) {
    NEWSVENDOR_REQUIRE(is_finite(multiplier) && multiplier > 0.0, InvalidArgumentError,
                       "disrupted: multiplier must be finite and > 0");
    DistributionParameters out = p;
    out.sigma = p.sigma * multiplier;
    out.validate();
    return out;
}

} // namespace newsvendor::stats
