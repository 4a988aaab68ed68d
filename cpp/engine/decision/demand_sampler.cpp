/*
================================================================================
Fragment 4.2 - Decision: Demand Sample Batches (Implementation)
FILE: cpp/engine/decision/demand_sampler.cpp
================================================================================
*/

#include "engine/decision/demand_sampler.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/require.hpp"

#include <cstddef>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace newsvendor {

DemandSampler::DemandSampler(const GameSettings& settings)
    : DemandSampler(settings, make_rng(settings.sampling.seed)) {}

DemandSampler::DemandSampler(const GameSettings& settings, Rng rng)
    : settings_(settings), rng_(std::move(rng)) {
  settings_.validate_or_throw();
}

std::vector<double> sample_lognormal(const stats::DistributionParameters& params, std::int64_t size, Rng& rng) {
  NEWSVENDOR_REQUIRE(size > 0, InvalidArgumentError, "sample_lognormal: size must be a positive integer");
  params.validate();

  std::lognormal_distribution<double> dist(params.mu, params.sigma);
  std::vector<double> out;
  out.reserve(static_cast<std::size_t>(size));
  for (std::int64_t i = 0; i < size; ++i) {
    const double x = dist(rng);
    if (!is_finite(x)) {
      std::ostringstream oss;
      oss << "sample_lognormal: draw overflowed (mu=" << params.mu << ", sigma=" << params.sigma << ")";
      NEWSVENDOR_THROW(DomainError, oss.str());
    }
    out.push_back(x);
  }
  return out;
}

const std::vector<double>& DemandSampler::draw(Treatment& t, std::int64_t size, bool disrupt) {
  if (size <= 0 || size > settings_.sampling.max_size) {
    std::ostringstream oss;
    oss << "demand samples: size must be a positive integer no larger than the configured "
        << "sampling.max_size (" << settings_.sampling.max_size << "), got " << size;
    NEWSVENDOR_THROW(InvalidArgumentError, oss.str());
  }

  const auto& cache = t.demand_sample_cache();
  if (!disrupt && cache && static_cast<std::int64_t>(cache->size()) == size) {
    return *cache;
  }

  const double multiplier = settings_.disruption.sigma_multiplier;
  const stats::DistributionParameters params =
      disrupt ? stats::disrupted(t.distribution_parameters(), multiplier) : t.distribution_parameters();

  std::vector<double> batch = sample_lognormal(params, size, rng_);
  if (disrupt) {
    t.apply_disruption(multiplier);
  }
  log_debug("treatment " + std::to_string(t.index()) + ": drew " + std::to_string(size) + " demand samples");
  return t.store_demand_samples(std::move(batch));
}

}  // namespace newsvendor
