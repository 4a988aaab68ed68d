#pragma once
/*
================================================================================
Fragment 2.2 - Treatment: Assignment, Derived Caches, Extensions
FILE: cpp/engine/treatment/treatment.hpp

Purpose:
  - A participant's treatment: an index into kTreatmentProfiles plus the
    state derived from it during a session.
  - Owns (exclusively) the lazily fitted log-normal parameters, the
    disruption count and the last demand-sample batch.
  - Carries caller-attached extension values (any JSON) that survive
    serialization untouched.

Lifecycle:
  - index is fixed at construction.
  - distribution_parameters() fits on first use and caches.
  - apply_disruption() rescales the cached sigma. Monotonic: there is no way
    back to the undisrupted parameters on the same instance.

Not thread-safe. Wrap in SharedTreatment for shared use.
================================================================================
*/

#include "engine/core/json.hpp"
#include "engine/core/random.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/unit_costs.hpp"
#include "engine/stats/lognormal_fit.hpp"
#include "engine/treatment/profiles.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace newsvendor {

// Serialized field names. Every other member of a treatment document is an extension.
namespace fields {
inline constexpr std::string_view kIdx = "idx";
inline constexpr std::string_view kMu = "mu";
inline constexpr std::string_view kSigma = "sigma";
inline constexpr std::string_view kDisruptions = "disruptions";
inline constexpr std::string_view kDemandSamples = "demand_rvs";
}  // namespace fields

// Plain snapshot of everything a Treatment holds. Used for (de)serialization.
struct TreatmentState {
  int index = 0;
  std::optional<stats::DistributionParameters> parameters;
  int disruptions = 0;
  std::optional<std::vector<double>> demand_samples;
  std::map<std::string, JsonValue> extensions;
};

class Treatment {
 public:
  using Extensions = std::map<std::string, JsonValue>;

  // Throws InvalidArgumentError if index is outside [0, kTreatmentCount).
  explicit Treatment(int index);

  // Uniformly random index.
  static Treatment choose(Rng& rng);
  static Treatment choose();

  // Rebuild from a snapshot. Throws InvalidArgumentError on inconsistent state.
  static Treatment from_state(TreatmentState state);
  TreatmentState state() const;

  int index() const noexcept { return index_; }
  const TreatmentProfile& profile() const { return treatment_profile(index_); }

  // ------------------------- Distribution parameters -------------------------
  // Lazily fitted from the profile; cached until disrupted.
  const stats::DistributionParameters& distribution_parameters();
  const std::optional<stats::DistributionParameters>& cached_distribution_parameters() const noexcept {
    return parameters_;
  }

  // ------------------------- Disruption --------------------------------------
  // sigma *= multiplier (fitting first if needed). Compounds on repeat.
  const stats::DistributionParameters& apply_disruption(double multiplier);
  int disruption_count() const noexcept { return disruptions_; }
  bool is_disrupted() const noexcept { return disruptions_ > 0; }

  // ------------------------- Demand sample cache -----------------------------
  const std::optional<std::vector<double>>& demand_sample_cache() const noexcept { return demand_samples_; }
  // Values must be finite and >= 0 (InvalidArgumentError otherwise).
  const std::vector<double>& store_demand_samples(std::vector<double> values);

  // ------------------------- Extensions --------------------------------------
  const Extensions& extensions() const noexcept { return extensions_; }
  const JsonValue* extension(const std::string& key) const noexcept;
  // Throws InvalidArgumentError for empty or reserved keys.
  void set_extension(const std::string& key, JsonValue value);
  bool erase_extension(const std::string& key);

  // Field names owned by the serialized form ("idx", "mu", ...).
  static bool is_reserved_key(std::string_view key) noexcept;

 private:
  int index_ = 0;
  std::optional<stats::DistributionParameters> parameters_;
  int disruptions_ = 0;
  std::optional<std::vector<double>> demand_samples_;
  Extensions extensions_;
};

// Per-unit economics of a treatment: alternate triple iff index == alternate_index.
UnitCosts unit_costs(const Treatment& t, const CostSettings& costs = CostSettings{});

}  // namespace newsvendor
