/*
  Fragment 4.5 - Demand Sampler Selftest

  Objective
  ---------
  Framework-free selftest that validates the batch cache contract:
    1) Same size, no disruption -> the identical cached batch (same storage).
    2) Different size -> a fresh batch of that size replaces the cache.
    3) disrupt -> sigma doubles (mu kept), compounds, and a new batch is drawn
       even when the size is unchanged.
    4) Invalid sizes are rejected before anything is mutated.
    5) A fixed seed reproduces the same stream.
    6) Batch statistics match the fitted distribution.
    7) Compounded disruptions that overflow a draw leave the treatment
       untouched, so its serialized state always restores.

  Expected use
  ------------
      ./demand_sampler_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/demand_sampler.hpp"
#include "engine/stats/sample_distribution.hpp"
#include "engine/treatment/treatment.hpp"
#include "engine/treatment/treatment_json.hpp"

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

GameSettings seeded(std::uint64_t seed) {
  GameSettings s = GameSettings::defaults();
  s.sampling.seed = seed;
  return s;
}

void test_cache_reuse() {
  DemandSampler sampler(seeded(1));
  Treatment t(0);

  const std::vector<double>& first = sampler.draw(t, 100);
  const std::vector<double> copy = first;
  const std::vector<double>& second = sampler.draw(t, 100);

  expect_true(first.size() == 100, "reuse: size 100");
  expect_true(&first == &second, "reuse: same storage");
  expect_true(second == copy, "reuse: same values");
  expect_true(!t.is_disrupted(), "reuse: no disruption");
}

void test_resize_redraws() {
  DemandSampler sampler(seeded(2));
  Treatment t(1);

  const std::vector<double> a = sampler.draw(t, 100);
  const std::vector<double>& b = sampler.draw(t, 200);
  expect_true(b.size() == 200, "resize: new size");
  expect_true(t.demand_sample_cache()->size() == 200, "resize: cache replaced");

  const std::vector<double> c = sampler.draw(t, 100);
  expect_true(c.size() == 100, "resize: back to 100");
  expect_true(c != a, "resize: back to 100 draws fresh values");
}

void test_default_size() {
  GameSettings s = seeded(3);
  s.sampling.default_size = 250;
  DemandSampler sampler(s);
  Treatment t(2);
  expect_true(sampler.draw(t).size() == 250, "default size: from settings");
}

void test_disruption() {
  DemandSampler sampler(seeded(4));
  Treatment t(2);

  const std::vector<double> before = sampler.draw(t, 100);
  const stats::DistributionParameters base = t.distribution_parameters();

  const std::vector<double>& after = sampler.draw(t, 100, true);
  expect_true(t.disruption_count() == 1, "disrupt: counted");
  expect_true(t.distribution_parameters().mu == base.mu, "disrupt: mu kept");
  expect_true(t.distribution_parameters().sigma == 2.0 * base.sigma, "disrupt: sigma doubled");
  expect_true(after.size() == 100 && after != before, "disrupt: same size still redraws");

  const std::vector<double> cached = after;
  expect_true(sampler.draw(t, 100) == cached, "disrupt: later plain draw reuses disrupted batch");
  expect_true(t.disruption_count() == 1, "disrupt: plain draw does not disrupt");

  sampler.draw(t, 100, true);
  expect_true(t.distribution_parameters().sigma == 4.0 * base.sigma, "disrupt: compounds to 4x");
  expect_true(t.disruption_count() == 2, "disrupt: count 2");

  GameSettings triple = seeded(5);
  triple.disruption.sigma_multiplier = 3.0;
  DemandSampler sampler3(triple);
  Treatment u(0);
  const double sigma0 = u.distribution_parameters().sigma;
  sampler3.draw(u, 10, true);
  expect_true(u.distribution_parameters().sigma == 3.0 * sigma0, "disrupt: configured multiplier");
}

void test_invalid_sizes() {
  GameSettings s = seeded(6);
  s.sampling.max_size = 1000;
  s.sampling.default_size = 100;
  DemandSampler sampler(s);
  Treatment t(3);

  const std::vector<double> before = sampler.draw(t, 50);
  const stats::DistributionParameters params = t.distribution_parameters();

  for (std::int64_t bad : {std::int64_t{0}, std::int64_t{-1}, std::int64_t{-100}, std::int64_t{1001}}) {
    expect_throws<InvalidArgumentError>([&] { sampler.draw(t, bad, true); },
                                        "invalid size " + std::to_string(bad) + " rejected");
  }
  std::string message;
  try {
    sampler.draw(t, 1001);
  } catch (const InvalidArgumentError& e) {
    message = e.what();
  }
  expect_true(message.find("configured sampling.max_size (1000)") != std::string::npos,
              "invalid size: message names the configured cap");
  expect_true(t.disruption_count() == 0, "invalid size: no disruption applied");
  expect_true(t.distribution_parameters() == params, "invalid size: parameters untouched");
  expect_true(*t.demand_sample_cache() == before, "invalid size: cache untouched");
}

void test_seed_reproducible() {
  DemandSampler a(seeded(99));
  DemandSampler b(seeded(99));
  DemandSampler c(seeded(100));
  Treatment ta(5), tb(5), tc(5);
  const std::vector<double> xa = a.draw(ta, 500);
  expect_true(xa == b.draw(tb, 500), "seed: same seed, same batch");
  expect_true(xa != c.draw(tc, 500), "seed: different seed, different batch");
}

void test_batch_statistics() {
  DemandSampler sampler(seeded(7));
  Treatment t(2);
  const std::vector<double>& xs = sampler.draw(t, 200000);

  bool all_positive = true;
  for (double x : xs) {
    if (!(x > 0.0) || !std::isfinite(x)) all_positive = false;
  }
  expect_true(all_positive, "stats: samples positive and finite");

  const stats::Summary s = stats::summarize(xs);
  // Profile 2: mean 500, sd 150. Standard error of the mean ~0.34.
  expect_true(std::fabs(s.mean - 500.0) < 5.0, "stats: mean near 500");
  expect_true(std::fabs(s.stdev - 150.0) < 5.0, "stats: stdev near 150");
}

void test_sample_lognormal_standalone() {
  Rng rng = make_rng(8);
  const stats::DistributionParameters p = stats::fit_lognormal(100.0, 50.0);
  const std::vector<double> xs = sample_lognormal(p, 10, rng);
  expect_true(xs.size() == 10, "sample_lognormal: size");
  expect_throws<InvalidArgumentError>([&] { (void)sample_lognormal(p, 0, rng); }, "sample_lognormal: size 0");
}

bool restores(const Treatment& t) {
  try {
    const Treatment back = deserialize_treatment(serialize_treatment(t));
    return back.disruption_count() == t.disruption_count() &&
           back.demand_sample_cache() == t.demand_sample_cache();
  } catch (const NewsvendorError& e) {
    std::cerr << "  " << e.what() << "\n";
    return false;
  }
}

void test_repeated_disruption_overflow() {
  DemandSampler sampler(seeded(11));
  Treatment t(0);

  bool overflowed = false;
  for (int k = 1; k <= 16 && !overflowed; ++k) {
    const int count = t.disruption_count();
    const stats::DistributionParameters params = t.distribution_parameters();
    const auto cache = t.demand_sample_cache();
    try {
      sampler.draw(t, 10000, true);
    } catch (const DomainError&) {
      overflowed = true;
      expect_true(t.disruption_count() == count, "overflow: disruption not committed");
      expect_true(t.distribution_parameters() == params, "overflow: parameters unchanged");
      expect_true(t.demand_sample_cache() == cache, "overflow: cache unchanged");
    }
    expect_true(restores(t), "repeated disruption: state restores after draw " + std::to_string(k));
  }
  expect_true(overflowed, "overflow: compounded sigma eventually rejected");

  Treatment u(0);
  expect_throws<InvalidArgumentError>(
      [&u] { u.store_demand_samples({1.0, std::numeric_limits<double>::infinity()}); },
      "store: non-finite sample rejected");
  expect_true(!u.demand_sample_cache().has_value(), "store: cache untouched on reject");
}

void test_settings_validated() {
  GameSettings s = GameSettings::defaults();
  s.sampling.default_size = 0;
  expect_throws<ValidationError>([&s] { DemandSampler bad(s); }, "ctor: invalid settings rejected");
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_cache_reuse();
  test_resize_redraws();
  test_default_size();
  test_disruption();
  test_invalid_sizes();
  test_seed_reproducible();
  test_batch_statistics();
  test_sample_lognormal_standalone();
  test_repeated_disruption_overflow();
  test_settings_validated();

  if (g_fail_count != 0) {
    std::cerr << "\ndemand_sampler_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\ndemand_sampler_selftest: all passed\n";
  return 0;
}
