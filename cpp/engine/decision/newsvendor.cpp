/*
================================================================================
Fragment 4.1 - Decision: Critical Fractile + Optimal Order Quantity (Implementation)
FILE: cpp/engine/decision/newsvendor.cpp
================================================================================
*/

#include "engine/decision/newsvendor.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/require.hpp"

#include <boost/math/distributions/normal.hpp>

#include <cmath>
#include <string>

namespace newsvendor {

double critical_fractile(const UnitCosts& costs) {
  try {
    costs.validate_or_throw();
  } catch (const ValidationError& e) {
    NEWSVENDOR_THROW(InvalidArgumentError, "critical_fractile: " + e.message());
  }
  const double cu = costs.underage_cost();
  const double co = costs.overage_cost();
  NEWSVENDOR_REQUIRE(cu + co > 0.0, InvalidArgumentError,
                     "critical_fractile: underage + overage cost is zero");
  return clamp01(cu / (cu + co));
}

double standard_normal_quantile(double p) {
  NEWSVENDOR_REQUIRE(is_finite(p) && p > 0.0 && p < 1.0, DomainError,
                     "standard_normal_quantile: p must be in (0, 1)");
  static const boost::math::normal_distribution<double> kStdNormal(0.0, 1.0);
  return boost::math::quantile(kStdNormal, p);
}

double lognormal_order_quantity(const stats::DistributionParameters& params, double cf) {
  NEWSVENDOR_REQUIRE(is_finite(cf) && cf >= 0.0 && cf <= 1.0, DomainError,
                     "lognormal_order_quantity: cf must be in [0, 1]");
  // Co == 0: every unit is worth stocking, the quantile is unbounded.
  NEWSVENDOR_REQUIRE(cf < 1.0, DomainError,
                     "lognormal_order_quantity: cf == 1 has no finite quantile");
  if (cf == 0.0) return 0.0;

  const double mean = stats::natural_mean(params);
  const double q = mean * std::exp(standard_normal_quantile(cf) * params.sigma);
  require_nonnegative(q, "optimal order quantity");
  return q;
}

double optimal_order_quantity(Treatment& t, const CostSettings& costs) {
  const double cf = critical_fractile(unit_costs(t, costs));
  return lognormal_order_quantity(t.distribution_parameters(), cf);
}

long long optimal_order_units(Treatment& t, const CostSettings& costs) {
  return std::llround(optimal_order_quantity(t, costs));
}

}  // namespace newsvendor
