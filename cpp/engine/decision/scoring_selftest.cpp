/*
  Fragment 4.6 - Scoring Selftest

  Framework-free. Non-zero return code indicates failure.
      ./scoring_selftest
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/decision/demand_sampler.hpp"
#include "engine/decision/newsvendor.hpp"
#include "engine/decision/scoring.hpp"

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << a << "  expected: " << b << "\n";
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

const UnitCosts kDefault{25.0, 14.0, 6.0};

void test_score_period() {
  const PeriodOutcome over = score_period(kDefault, 1.0, 0.0, 100.0, 80.0);
  expect_near(over.sold_units, 80.0, 0.0, "over: sold");
  expect_near(over.stock_after, 20.0, 0.0, "over: stock carried");
  expect_near(over.revenue, 2000.0, 1e-9, "over: revenue");
  expect_near(over.cost, 1400.0, 1e-9, "over: cost");
  expect_near(over.profit, 600.0, 1e-9, "over: profit, nothing salvaged");

  // Carried stock is sold first and charged the holding cost.
  const PeriodOutcome carried = score_period(kDefault, 1.0, 20.0, 100.0, 150.0);
  expect_near(carried.sold_units, 120.0, 0.0, "carried: sells stock plus order");
  expect_near(carried.stock_after, 0.0, 0.0, "carried: stock cleared");
  expect_near(carried.cost, 1420.0, 1e-9, "carried: wholesale plus holding");
  expect_near(carried.profit, 1580.0, 1e-9, "carried: profit");

  const PeriodOutcome none = score_period(kDefault, 1.0, 0.0, 0.0, 40.0);
  expect_near(none.profit, 0.0, 0.0, "zero order: zero profit");

  const double nan = std::numeric_limits<double>::quiet_NaN();
  expect_throws<InvalidArgumentError>([] { (void)score_period(kDefault, 1.0, 0.0, -1.0, 10.0); },
                                      "reject: negative order");
  expect_throws<InvalidArgumentError>([nan] { (void)score_period(kDefault, 1.0, 0.0, 10.0, nan); },
                                      "reject: NaN demand");
  expect_throws<InvalidArgumentError>([] { (void)score_period(kDefault, 1.0, -5.0, 10.0, 10.0); },
                                      "reject: negative stock");
  expect_throws<InvalidArgumentError>([] { (void)score_period(kDefault, -1.0, 0.0, 10.0, 10.0); },
                                      "reject: negative holding cost");
  expect_throws<InvalidArgumentError>(
      [] { (void)score_period(UnitCosts{10.0, 20.0, 0.0}, 1.0, 0.0, 1.0, 1.0); }, "reject: invalid costs");
}

void test_score_periods() {
  const GameScore g = score_periods(kDefault, 1.0, {100.0, 100.0, 0.0}, {80.0, 150.0, 40.0});
  expect_true(g.periods.size() == 3, "periods: length");
  expect_true(g.periods[0].period == 1 && g.periods[2].period == 3, "periods: numbered from 1");
  expect_near(g.periods[0].stock_before, 0.0, 0.0, "periods: game starts empty");
  expect_near(g.periods[1].stock_before, 20.0, 0.0, "periods: leftover carried forward");
  expect_near(g.periods[0].cumulative_profit, 600.0, 1e-9, "periods: cumulative 1");
  expect_near(g.periods[1].cumulative_profit, 2180.0, 1e-9, "periods: cumulative 2");
  expect_near(g.periods[2].cumulative_profit, 2180.0, 1e-9, "periods: cumulative 3");
  expect_near(g.total_profit, 2180.0, 1e-9, "periods: total");
  expect_near(g.final_stock, 0.0, 0.0, "periods: final stock");

  const GameScore held = score_periods(kDefault, 2.0, {50.0, 0.0}, {30.0, 10.0});
  expect_near(held.periods[1].cost, 40.0, 1e-9, "held: holding on carried stock");
  expect_near(held.total_profit, 260.0, 1e-9, "held: total");
  expect_near(held.final_stock, 10.0, 0.0, "held: stock left at game end");

  const GameSettings defaults = GameSettings::defaults();
  const GameScore configured =
      score_periods(kDefault, defaults.costs.holding_cost, {50.0, 0.0}, {30.0, 10.0});
  expect_near(configured.total_profit, 280.0, 1e-9, "configured holding cost: total");

  const GameScore empty = score_periods(kDefault, 1.0, {}, {});
  expect_true(empty.periods.empty() && empty.total_profit == 0.0, "periods: empty game");

  expect_throws<InvalidArgumentError>([] { (void)score_periods(kDefault, 1.0, {1.0}, {1.0, 2.0}); },
                                      "periods: length mismatch");
}

void test_evaluate_order_exact() {
  const OrderEvaluation e = evaluate_order(kDefault, 100.0, {50.0, 100.0, 150.0, 200.0});
  expect_near(e.expected_profit, 862.5, 1e-9, "eval: expected profit");
  expect_near(e.expected_sales, 87.5, 1e-9, "eval: expected sales");
  expect_near(e.expected_leftover, 12.5, 1e-9, "eval: expected leftover");
  expect_near(e.fill_rate, 0.7, 1e-12, "eval: fill rate");
  expect_near(e.stockout_probability, 0.5, 1e-12, "eval: P(D > q)");
  expect_near(e.demand.mean, 125.0, 1e-9, "eval: demand mean");
  expect_near(e.demand_percentiles.p50, 125.0, 1e-9, "eval: demand median");
  expect_true(e.demand.n == 4, "eval: n");

  expect_throws<InvalidArgumentError>([] { (void)evaluate_order(kDefault, 10.0, {}); }, "eval: empty batch");
  expect_throws<InvalidArgumentError>([] { (void)evaluate_order(kDefault, 10.0, {5.0, -1.0}); },
                                      "eval: negative demand");
}

// Over a large batch, the optimal quantity should beat nearby alternatives.
void test_optimal_beats_neighbours() {
  GameSettings s = GameSettings::defaults();
  s.sampling.seed = 2024;
  DemandSampler sampler(s);

  for (int idx : {0, 3}) {
    Treatment t(idx);
    const UnitCosts c = unit_costs(t, s.costs);
    const double q = optimal_order_quantity(t, s.costs);
    const std::vector<double>& batch = sampler.draw(t, 200000);

    const double best = evaluate_order(c, q, batch).expected_profit;
    const double lower = evaluate_order(c, 0.7 * q, batch).expected_profit;
    const double upper = evaluate_order(c, 1.3 * q, batch).expected_profit;
    expect_true(best > lower, "optimal vs 0.7q: idx " + std::to_string(idx));
    expect_true(best > upper, "optimal vs 1.3q: idx " + std::to_string(idx));
  }
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_score_period();
  test_score_periods();
  test_evaluate_order_exact();
  test_optimal_beats_neighbours();

  if (g_fail_count != 0) {
    std::cerr << "\nscoring_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nscoring_selftest: all passed\n";
  return 0;
}
