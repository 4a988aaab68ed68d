// ============================================================================
// Fragment 3.1 - Log-normal Fit (Method of Moments) + Disruption Transform
// File: lognormal_fit.hpp
// ============================================================================
//
// Purpose:
// - Convert a natural-scale demand description (mean m, std-dev s) into the
//   log-normal location/scale (mu, sigma) with the same first two moments:
//       mu    = ln( m^2 / sqrt(s^2 + m^2) )
//       sigma = sqrt( ln( s^2/m^2 + 1 ) )
// - Back-transform (mu, sigma) into natural moments.
// - Disruption: rescale sigma by a multiplier, mu unchanged.
//
// Hardening:
// - Domain violations throw DomainError; NaN never escapes.
//
// ============================================================================

#pragma once

namespace newsvendor::stats {

struct DistributionParameters final {
    double mu = 0.0;     // log-scale location
    double sigma = 1.0;  // log-scale scale, > 0

    void validate() const;

    bool operator==(const DistributionParameters& o) const noexcept {
        return mu == o.mu && sigma == o.sigma;
    }
    bool operator!=(const DistributionParameters& o) const noexcept { return !(*this == o); }
};

struct NaturalMoments final {
    double mean = 0.0;
    double stdev = 0.0;
};

// Method-of-moments fit. Requires finite natural_mean > 0 and natural_sigma > 0.
DistributionParameters fit_lognormal(double natural_mean, double natural_sigma);

// E[X] = exp(mu + sigma^2/2)
double natural_mean(const DistributionParameters& p);

// Mean and std-dev of the log-normal described by p.
NaturalMoments natural_moments(const DistributionParameters& p);

// sigma *= multiplier; mu untouched. Multiplier must be finite and > 0.
DistributionParameters disrupted(const DistributionParameters& p, double multiplier);

} // namespace newsvendor::stats
