/*
  Fragment 4.4 - Newsvendor Decision Selftest

  Objective
  ---------
  Framework-free selftest that validates:
    1) Critical fractile for the default and alternate cost triples.
    2) Optimal order quantity against reference values for every profile.
    3) Determinism (no randomness on the decision path).
    4) A disrupted treatment orders more when cf > 0.5.
    5) Domain guards on the quantile and cost inputs.

  Expected use
  ------------
      ./newsvendor_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/decision/newsvendor.hpp"
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

void expect_rel(double got, double expected, double rel_tol, std::string_view msg) {
  if (!(std::fabs(got - expected) <= rel_tol * std::fabs(expected))) {
    fail(msg);
    std::cerr.precision(17);
    std::cerr << "  got:      " << got << "\n";
    std::cerr << "  expected: " << expected << "\n";
  } else {
    pass(msg);
  }
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

void test_critical_fractile() {
  const CostSettings cs;
  expect_rel(critical_fractile(cs.default_costs), 11.0 / 19.0, 1e-15, "cf: default triple = 11/19");
  expect_rel(critical_fractile(cs.alternate_costs), 18.5 / 19.0, 1e-15, "cf: alternate triple = 18.5/19");

  expect_true(critical_fractile(UnitCosts{10.0, 10.0, 0.0}) == 0.0, "cf: zero margin = 0");
  expect_true(critical_fractile(UnitCosts{10.0, 4.0, 4.0}) == 1.0, "cf: zero overage = 1");

  expect_throws<InvalidArgumentError>([] { (void)critical_fractile(UnitCosts{5.0, 5.0, 5.0}); },
                                      "cf: Cu + Co == 0");
  expect_throws<InvalidArgumentError>([] { (void)critical_fractile(UnitCosts{10.0, 12.0, 6.0}); },
                                      "cf: retail below wholesale");
  expect_throws<InvalidArgumentError>([] { (void)critical_fractile(UnitCosts{25.0, 14.0, -1.0}); },
                                      "cf: negative salvage");
}

void test_standard_normal_quantile() {
  expect_true(std::fabs(standard_normal_quantile(0.5)) < 1e-15, "z: median is 0");
  expect_rel(standard_normal_quantile(0.975), 1.9599639845400536, 1e-12, "z: 0.975");
  expect_rel(standard_normal_quantile(0.025), -1.9599639845400536, 1e-12, "z: 0.025 symmetric");

  expect_throws<DomainError>([] { (void)standard_normal_quantile(0.0); }, "z: p = 0");
  expect_throws<DomainError>([] { (void)standard_normal_quantile(1.0); }, "z: p = 1");
  expect_throws<DomainError>([] { (void)standard_normal_quantile(-0.1); }, "z: p < 0");
}

void test_order_quantity_reference() {
  const double expected[kTreatmentCount] = {
      109.86683621958862, 118.03912856292814, 530.110626953582,
      883.1614333576148,  109.86683621958862, 118.03912856292814,
  };
  for (int i = 0; i < static_cast<int>(kTreatmentCount); ++i) {
    Treatment t(i);
    expect_rel(optimal_order_quantity(t), expected[i], 1e-9, "ooq: idx " + std::to_string(i));
  }

  Treatment t0(0);
  expect_true(optimal_order_units(t0) == 110, "ooq: idx 0 rounds to 110 units");
  Treatment t3(3);
  expect_true(optimal_order_units(t3) == 883, "ooq: idx 3 rounds to 883 units");
}

void test_order_quantity_deterministic() {
  Treatment a(2);
  Treatment b(2);
  const double qa = optimal_order_quantity(a);
  expect_true(qa == optimal_order_quantity(a), "determinism: repeat call");
  expect_true(qa == optimal_order_quantity(b), "determinism: fresh instance");
}

void test_disrupted_orders_more() {
  const double expected_disrupted[kTreatmentCount] = {
      168.69346412936576, 394.09142275555746, 639.5916179126732,
      1775.2108102510624, 168.69346412936576, 394.09142275555746,
  };
  for (int i = 0; i < static_cast<int>(kTreatmentCount); ++i) {
    Treatment t(i);
    const double before = optimal_order_quantity(t);
    t.apply_disruption(2.0);
    const double after = optimal_order_quantity(t);
    expect_true(after > before, "disrupted: idx " + std::to_string(i) + " orders more");
    expect_rel(after, expected_disrupted[i], 1e-9, "disrupted: idx " + std::to_string(i) + " reference");
  }
}

void test_lognormal_order_quantity_edges() {
  const stats::DistributionParameters p = stats::fit_lognormal(100.0, 50.0);
  expect_true(lognormal_order_quantity(p, 0.0) == 0.0, "q(cf=0) = 0");
  expect_throws<DomainError>([p] { (void)lognormal_order_quantity(p, 1.0); }, "q(cf=1) unbounded");
  expect_throws<DomainError>([p] { (void)lognormal_order_quantity(p, 1.5); }, "q(cf>1)");

  // z(0.5) = 0, so the order is the natural mean.
  expect_rel(lognormal_order_quantity(p, 0.5), 100.0, 1e-12, "q(cf=0.5) = E[D]");

  CostSettings cs;
  cs.alternate_index = -1;
  Treatment t3(3);
  Treatment t2(2);
  expect_true(optimal_order_quantity(t3, cs) == optimal_order_quantity(t2, cs),
              "alternate disabled: idx 3 orders like idx 2");
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_critical_fractile();
  test_standard_normal_quantile();
  test_order_quantity_reference();
  test_order_quantity_deterministic();
  test_disrupted_orders_more();
  test_lognormal_order_quantity_edges();

  if (g_fail_count != 0) {
    std::cerr << "\nnewsvendor_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nnewsvendor_selftest: all passed\n";
  return 0;
}
