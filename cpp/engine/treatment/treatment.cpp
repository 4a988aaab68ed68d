/*
================================================================================
Fragment 2.2 - Treatment: Assignment, Derived Caches, Extensions (Implementation)
FILE: cpp/engine/treatment/treatment.cpp
================================================================================
*/

#include "engine/treatment/treatment.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/require.hpp"

#include <sstream>
#include <utility>

namespace newsvendor {

Treatment::Treatment(int index) : index_(index) {
  if (!is_valid_treatment_index(index)) {
    std::ostringstream oss;
    oss << "Treatment: index " << index << " outside [0, " << kTreatmentCount - 1 << "]";
    NEWSVENDOR_THROW(InvalidArgumentError, oss.str());
  }
}

Treatment Treatment::choose(Rng& rng) {
  std::uniform_int_distribution<int> pick(0, static_cast<int>(kTreatmentCount) - 1);
  Treatment t(pick(rng));
  log_debug("treatment chosen: idx=" + std::to_string(t.index()));
  return t;
}

Treatment Treatment::choose() {
  Rng rng = make_rng(0);
  return choose(rng);
}

Treatment Treatment::from_state(TreatmentState state) {
  Treatment t(state.index);

  if (state.parameters) {
    state.parameters->validate();
  }
  NEWSVENDOR_REQUIRE(state.disruptions >= 0, InvalidArgumentError,
                     "Treatment: disruption count must be >= 0");
  NEWSVENDOR_REQUIRE(state.disruptions == 0 || state.parameters.has_value(), InvalidArgumentError,
                     "Treatment: disrupted state requires cached parameters");
  if (state.demand_samples) {
    NEWSVENDOR_REQUIRE(!state.demand_samples->empty(), InvalidArgumentError,
                       "Treatment: cached demand samples must not be empty");
    for (double v : *state.demand_samples) {
      NEWSVENDOR_REQUIRE(is_finite(v) && v >= 0.0, InvalidArgumentError,
                         "Treatment: cached demand samples must be finite and >= 0");
    }
  }
  for (const auto& kv : state.extensions) {
    NEWSVENDOR_REQUIRE(!kv.first.empty() && !is_reserved_key(kv.first), InvalidArgumentError,
                       "Treatment: invalid extension key '" + kv.first + "'");
  }

  t.parameters_ = state.parameters;
  t.disruptions_ = state.disruptions;
  t.demand_samples_ = std::move(state.demand_samples);
  t.extensions_ = std::move(state.extensions);
  return t;
}

TreatmentState Treatment::state() const {
  TreatmentState s;
  s.index = index_;
  s.parameters = parameters_;
  s.disruptions = disruptions_;
  s.demand_samples = demand_samples_;
  s.extensions = extensions_;
  return s;
}

const stats::DistributionParameters& Treatment::distribution_parameters() {
  if (!parameters_) {
    const TreatmentProfile& p = profile();
    parameters_ = stats::fit_lognormal(p.natural_mean, p.natural_sigma);
    log_debug("treatment " + std::to_string(index_) + ": fitted mu=" + std::to_string(parameters_->mu) +
              " sigma=" + std::to_string(parameters_->sigma));
  }
  return *parameters_;
}

const stats::DistributionParameters& Treatment::apply_disruption(double multiplier) {
  // Fit first so the disruption applies to the treatment's own baseline.
  const stats::DistributionParameters next = stats::disrupted(distribution_parameters(), multiplier);
  parameters_ = next;
  ++disruptions_;
  log_info("treatment " + std::to_string(index_) + ": disruption #" + std::to_string(disruptions_) +
           " applied, sigma=" + std::to_string(next.sigma));
  return *parameters_;
}

const std::vector<double>& Treatment::store_demand_samples(std::vector<double> values) {
  NEWSVENDOR_REQUIRE(!values.empty(), InvalidArgumentError,
                     "Treatment: refusing to cache an empty demand batch");
  for (double v : values) {
    NEWSVENDOR_REQUIRE(is_finite(v) && v >= 0.0, InvalidArgumentError,
                       "Treatment: cached demand samples must be finite and >= 0");
  }
  demand_samples_ = std::move(values);
  return *demand_samples_;
}

const JsonValue* Treatment::extension(const std::string& key) const noexcept {
  auto it = extensions_.find(key);
  return it == extensions_.end() ? nullptr : &it->second;
}

void Treatment::set_extension(const std::string& key, JsonValue value) {
  NEWSVENDOR_REQUIRE(!key.empty(), InvalidArgumentError, "Treatment: extension key must not be empty");
  NEWSVENDOR_REQUIRE(!is_reserved_key(key), InvalidArgumentError,
                     "Treatment: '" + key + "' is a reserved field name");
  extensions_[key] = std::move(value);
}

bool Treatment::erase_extension(const std::string& key) {
  return extensions_.erase(key) > 0;
}

bool Treatment::is_reserved_key(std::string_view key) noexcept {
  return key == fields::kIdx || key == fields::kMu || key == fields::kSigma ||
         key == fields::kDisruptions || key == fields::kDemandSamples;
}

UnitCosts unit_costs(const Treatment& t, const CostSettings& costs) {
  return t.index() == costs.alternate_index ? costs.alternate_costs : costs.default_costs;
}

}  // namespace newsvendor
