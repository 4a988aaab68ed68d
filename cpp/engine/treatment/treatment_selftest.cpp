/*
  Fragment 2.5 - Treatment Selftest

  Objective
  ---------
  Framework-free selftest that validates:
    1) Random assignment only ever yields indices 0..5 and reaches all six.
    2) Unit costs are the alternate triple for index 3 only.
    3) Distribution parameters are fitted lazily, cached, and match the
       profile table for every index.
    4) Disruption rescales sigma, keeps mu, and compounds.
    5) Extensions reject reserved / empty keys.
    6) SharedTreatment serializes concurrent fit + disrupt.

  Expected use
  ------------
      ./treatment_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/random.hpp"
#include "engine/treatment/shared_treatment.hpp"
#include "engine/treatment/treatment.hpp"

namespace newsvendor {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

template <typename Err, typename Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  bool threw = false;
  try {
    fn();
  } catch (const Err&) {
    threw = true;
  }
  expect_true(threw, msg);
}

void test_choose() {
  Rng rng = make_rng(12345);
  std::set<int> seen;
  bool in_range = true;
  for (int i = 0; i < 2000; ++i) {
    const Treatment t = Treatment::choose(rng);
    if (!is_valid_treatment_index(t.index())) in_range = false;
    seen.insert(t.index());
  }
  expect_true(in_range, "choose: index always in [0, 5]");
  expect_true(seen.size() == kTreatmentCount, "choose: all six indices reached");

  const Treatment fresh = Treatment::choose();
  expect_true(!fresh.cached_distribution_parameters().has_value(), "choose: nothing cached yet");
  expect_true(!fresh.is_disrupted(), "choose: not disrupted");
  expect_true(!fresh.demand_sample_cache().has_value(), "choose: no demand cache");
}

void test_construct_rejects() {
  expect_throws<InvalidArgumentError>([] { Treatment t(-1); }, "ctor: index -1");
  expect_throws<InvalidArgumentError>([] { Treatment t(6); }, "ctor: index 6");
}

void test_unit_costs() {
  const CostSettings cs;
  for (int i = 0; i < static_cast<int>(kTreatmentCount); ++i) {
    const UnitCosts c = unit_costs(Treatment(i), cs);
    const UnitCosts expected = (i == 3) ? UnitCosts{24.0, 5.5, 5.0} : UnitCosts{25.0, 14.0, 6.0};
    expect_true(c == expected, "unit_costs: idx " + std::to_string(i));
  }

  CostSettings none;
  none.alternate_index = -1;
  expect_true(unit_costs(Treatment(3), none) == none.default_costs, "unit_costs: alternate disabled");
}

void test_parameters_match_profiles() {
  for (int i = 0; i < static_cast<int>(kTreatmentCount); ++i) {
    Treatment t(i);
    const TreatmentProfile& p = t.profile();
    const stats::DistributionParameters got = t.distribution_parameters();
    const stats::DistributionParameters expected = stats::fit_lognormal(p.natural_mean, p.natural_sigma);
    expect_true(got == expected, "params: idx " + std::to_string(i) + " matches fit of profile");
  }

  // Pairs with identical demand profiles give identical parameters.
  Treatment t0(0), t4(4), t1(1), t5(5), t2(2), t3(3);
  expect_true(t0.distribution_parameters() == t4.distribution_parameters(), "params: 0 == 4");
  expect_true(t1.distribution_parameters() == t5.distribution_parameters(), "params: 1 == 5");
  expect_true(t2.distribution_parameters() == t3.distribution_parameters(), "params: 2 == 3");
}

void test_parameters_cached() {
  Treatment t(1);
  expect_true(!t.cached_distribution_parameters(), "cache: empty before first use");
  const stats::DistributionParameters* first = &t.distribution_parameters();
  expect_true(t.cached_distribution_parameters().has_value(), "cache: filled after first use");
  const stats::DistributionParameters* second = &t.distribution_parameters();
  expect_true(first == second, "cache: same object on repeat");
}

void test_disruption() {
  Treatment t(2);
  const stats::DistributionParameters base = t.distribution_parameters();

  const stats::DistributionParameters once = t.apply_disruption(2.0);
  expect_true(once.mu == base.mu, "disrupt: mu unchanged");
  expect_true(once.sigma == 2.0 * base.sigma, "disrupt: sigma doubled");
  expect_true(t.disruption_count() == 1 && t.is_disrupted(), "disrupt: counted");
  expect_true(t.distribution_parameters() == once, "disrupt: cache holds disrupted params");

  t.apply_disruption(2.0);
  expect_true(t.distribution_parameters().sigma == 4.0 * base.sigma, "disrupt: compounds");
  expect_true(t.disruption_count() == 2, "disrupt: count 2");

  // Disrupting before any fit still starts from the profile baseline.
  Treatment fresh(2);
  fresh.apply_disruption(2.0);
  expect_true(fresh.distribution_parameters() == once, "disrupt: fits first");

  expect_throws<InvalidArgumentError>([&t] { t.apply_disruption(0.0); }, "disrupt: zero multiplier");
  expect_true(t.disruption_count() == 2, "disrupt: failed call leaves count");
}

void test_demand_cache() {
  Treatment t(0);
  expect_throws<InvalidArgumentError>([&t] { t.store_demand_samples({}); }, "demand cache: empty rejected");
  expect_true(!t.demand_sample_cache(), "demand cache: still empty");
  const std::vector<double>& stored = t.store_demand_samples({1.0, 2.0, 3.0});
  expect_true(stored.size() == 3 && &stored == &*t.demand_sample_cache(), "demand cache: stored in place");
}

void test_extensions() {
  Treatment t(4);
  t.set_extension("round", JsonValue::number(7));
  t.set_extension("player", JsonValue::string("p-17"));
  const JsonValue* r = t.extension("round");
  expect_true(r && r->is_number() && r->as_number() == 7.0, "ext: read back");
  expect_true(t.extension("nope") == nullptr, "ext: absent -> nullptr");

  for (const char* k : {"idx", "mu", "sigma", "disruptions", "demand_rvs"}) {
    expect_true(Treatment::is_reserved_key(k), std::string("ext: reserved ") + k);
    expect_throws<InvalidArgumentError>([&t, k] { t.set_extension(k, JsonValue::null()); },
                                        std::string("ext: set reserved ") + k);
  }
  expect_throws<InvalidArgumentError>([&t] { t.set_extension("", JsonValue::null()); }, "ext: empty key");

  expect_true(t.erase_extension("round"), "ext: erase present");
  expect_true(!t.erase_extension("round"), "ext: erase absent");
  expect_true(t.extensions().size() == 1, "ext: one left");
}

void test_from_state_rejects() {
  TreatmentState s;
  s.index = 1;
  s.disruptions = 1;
  expect_throws<InvalidArgumentError>([s] { (void)Treatment::from_state(s); },
                                      "from_state: disrupted without params");

  TreatmentState bad_key;
  bad_key.extensions["mu"] = JsonValue::number(1.0);
  expect_throws<InvalidArgumentError>([bad_key] { (void)Treatment::from_state(bad_key); },
                                      "from_state: reserved extension key");

  TreatmentState neg;
  neg.demand_samples = std::vector<double>{1.0, -2.0};
  expect_throws<InvalidArgumentError>([neg] { (void)Treatment::from_state(neg); },
                                      "from_state: negative demand sample");
}

void test_shared_treatment() {
  SharedTreatment shared(Treatment(0));
  const double base_sigma = shared.with_lock([](Treatment& t) { return t.distribution_parameters().sigma; });

  constexpr int kThreads = 8;
  std::vector<std::thread> pool;
  pool.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    pool.emplace_back([&shared] {
      shared.with_lock([](Treatment& t) { t.apply_disruption(2.0); });
    });
  }
  for (auto& th : pool) th.join();

  const Treatment snap = shared.snapshot();
  expect_true(snap.disruption_count() == kThreads, "shared: every disruption counted");
  expect_true(snap.cached_distribution_parameters()->sigma == base_sigma * 256.0,
              "shared: sigma scaled 2^8");
  expect_true(shared.index() == 0, "shared: index");
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_choose();
  test_construct_rejects();
  test_unit_costs();
  test_parameters_match_profiles();
  test_parameters_cached();
  test_disruption();
  test_demand_cache();
  test_extensions();
  test_from_state_rejects();
  test_shared_treatment();

  if (g_fail_count != 0) {
    std::cerr << "\ntreatment_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\ntreatment_selftest: all passed\n";
  return 0;
}
