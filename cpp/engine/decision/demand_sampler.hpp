#pragma once
/*
================================================================================
Fragment 4.2 - Decision: Demand Sample Batches (Cache + Disruption)
FILE: cpp/engine/decision/demand_sampler.hpp

Purpose:
  - Draw i.i.d. log-normal demand batches for simulation / scoring.
  - Reuse the treatment's last batch while the requested size is unchanged.
  - Apply a disruption (sigma *= multiplier, permanent) before redrawing.

Contract of draw(t, size, disrupt):
  1. size <= 0 or size > settings.sampling.max_size (a configured cap)
     -> InvalidArgumentError, nothing mutated.
  2. cached batch of exactly `size` and !disrupt -> that same batch.
  3. disrupt -> t.apply_disruption(multiplier) (compounds on repeat).
  4. draw `size` samples with the current (mu, sigma), replace the cache.

A disrupted draw samples with the disrupted parameters first and commits the
disruption only once the batch is good. A draw that overflows to a non-finite
value (sigma compounded too far) throws DomainError with the treatment's
parameters, disruption count and cache unchanged.

The returned reference points into the treatment and stays valid until the
next draw on that treatment.
================================================================================
*/

#include "engine/core/random.hpp"
#include "engine/core/settings.hpp"
#include "engine/treatment/treatment.hpp"

#include <cstdint>
#include <vector>

namespace newsvendor {

class DemandSampler final {
 public:
  explicit DemandSampler(const GameSettings& settings = GameSettings::defaults());
  DemandSampler(const GameSettings& settings, Rng rng);

  const std::vector<double>& draw(Treatment& t, std::int64_t size, bool disrupt = false);

  // Uses settings.sampling.default_size.
  const std::vector<double>& draw(Treatment& t) { return draw(t, settings_.sampling.default_size, false); }

  const GameSettings& settings() const noexcept { return settings_; }
  Rng& rng() noexcept { return rng_; }

 private:
  GameSettings settings_;
  Rng rng_;
};

// Fresh batch from explicit parameters; touches no cache.
// Throws DomainError if any draw is not finite.
std::vector<double> sample_lognormal(const stats::DistributionParameters& params, std::int64_t size, Rng& rng);

}  // namespace newsvendor
