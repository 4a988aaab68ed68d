#pragma once
/*
================================================================================
Fragment 1.5 - Core: Game Settings (Hardened)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every externally supplied knob of the treatment/demand engine
    (unit-cost triples, holding cost, sampling sizes, disruption multiplier,
    RNG seed) in a single validated object.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - Cost, sampling and disruption defaults reproduce the fielded game.
================================================================================
*/

#include <cmath>
#include <cstdint>

#include "engine/core/errors.hpp"
#include "engine/core/unit_costs.hpp"

namespace newsvendor {

// ----------------------------- Costs -----------------------------------------
struct CostSettings {
  // Shared by every treatment except the alternate one.
  UnitCosts default_costs{25.0, 14.0, 6.0};

  // Low-wholesale economics (critical fractile close to 1).
  UnitCosts alternate_costs{24.0, 5.5, 5.0};

  // Treatment index that uses alternate_costs. -1 disables the alternate triple.
  int alternate_index = 3;

  // Per unit of stock carried into a period of the multi-period game.
  double holding_cost = 1.0;

  void validate_or_throw() const {
    default_costs.validate_or_throw();
    alternate_costs.validate_or_throw();
    if (alternate_index < -1) {
      throw ValidationError("CostSettings: alternate_index must be >= -1");
    }
    if (!(holding_cost >= 0.0) || !std::isfinite(holding_cost)) {
      throw ValidationError("CostSettings: holding_cost must be finite and >= 0");
    }
    if (default_costs.underage_cost() + default_costs.overage_cost() <= 0.0) {
      throw ValidationError("CostSettings: default_costs has zero total cost");
    }
    if (alternate_costs.underage_cost() + alternate_costs.overage_cost() <= 0.0) {
      throw ValidationError("CostSettings: alternate_costs has zero total cost");
    }
  }
};

// ----------------------------- Sampling --------------------------------------
struct SamplingSettings {
  // Demand draws per batch when the caller does not ask for a size.
  std::int64_t default_size = 10000;

  // Hard cap on a single batch.
  std::int64_t max_size = 10'000'000;

  // 0 = nondeterministic (std::random_device); otherwise a reproducible stream.
  std::uint64_t seed = 0;

  void validate_or_throw() const {
    if (max_size < 1 || max_size > 100'000'000) {
      throw ValidationError("SamplingSettings: max_size outside sane bounds");
    }
    if (default_size < 1 || default_size > max_size) {
      throw ValidationError("SamplingSettings: default_size must be in [1, max_size]");
    }
  }
};

// ----------------------------- Disruption ------------------------------------
struct DisruptionSettings {
  // Applied to the log-normal sigma on every disruption. mu is never touched.
  double sigma_multiplier = 2.0;

  void validate_or_throw() const {
    if (!(sigma_multiplier > 0.0) || sigma_multiplier > 100.0) {
      throw ValidationError("DisruptionSettings: sigma_multiplier must be in (0, 100]");
    }
  }
};

// ----------------------------- GameSettings ----------------------------------
struct GameSettings {
  CostSettings costs;
  SamplingSettings sampling;
  DisruptionSettings disruption;

  void validate_or_throw() const {
    costs.validate_or_throw();
    sampling.validate_or_throw();
    disruption.validate_or_throw();
  }

  static GameSettings defaults() {
    GameSettings s;
    return s;
  }
};

}  // namespace newsvendor
