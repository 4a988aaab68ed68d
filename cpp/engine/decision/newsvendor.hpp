#pragma once
/*
================================================================================
Fragment 4.1 - Decision: Critical Fractile + Optimal Order Quantity
FILE: cpp/engine/decision/newsvendor.hpp

Purpose:
  - Newsvendor critical fractile   cf = Cu / (Cu + Co)
        Cu = retail - wholesale  (underage)
        Co = wholesale - salvage (overage)
  - Optimal order quantity: the log-normal demand quantile at cf,
        Q* = E[D] * exp( Phi^-1(cf) * sigma ),  E[D] = exp(mu + sigma^2/2)

Notes:
  - Deterministic: no randomness on this path. Uses the treatment's current
    (possibly disrupted) parameters.
  - The linear back-transform E[D] + Phi^-1(cf) * sd(D) is NOT used; it can
    go negative for high-variance profiles.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/core/unit_costs.hpp"
#include "engine/stats/lognormal_fit.hpp"
#include "engine/treatment/treatment.hpp"

namespace newsvendor {

// Throws InvalidArgumentError if costs violate retail >= wholesale >= salvage
// or Cu + Co == 0.
double critical_fractile(const UnitCosts& costs);

// Standard normal quantile. p must be in (0, 1).
double standard_normal_quantile(double p);

// Log-normal quantile at cf in the form above. cf in [0, 1]; cf == 0 gives 0,
// cf == 1 throws DomainError (unbounded).
double lognormal_order_quantity(const stats::DistributionParameters& params, double cf);

// Fits (and caches) the treatment's parameters if needed.
double optimal_order_quantity(Treatment& t, const CostSettings& costs = CostSettings{});

// Q* rounded to the nearest whole unit, for display / integer order fields.
long long optimal_order_units(Treatment& t, const CostSettings& costs = CostSettings{});

}  // namespace newsvendor
