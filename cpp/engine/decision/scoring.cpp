/*
================================================================================
Fragment 4.3 - Decision: Period Scoring + Order Evaluation (Implementation)
FILE: cpp/engine/decision/scoring.cpp
================================================================================
*/

#include "engine/decision/scoring.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/require.hpp"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <string>

namespace newsvendor {
namespace {

void require_costs(const UnitCosts& costs, const char* ctx) {
  try {
    costs.validate_or_throw();
  } catch (const ValidationError& e) {
    NEWSVENDOR_THROW(InvalidArgumentError, std::string(ctx) + ": " + e.message());
  }
}

void require_units(double units, const char* what) {
  NEWSVENDOR_REQUIRE(is_finite(units) && units >= 0.0, InvalidArgumentError,
                     std::string(what) + " must be finite and >= 0");
}

}  // namespace

PeriodOutcome score_period(const UnitCosts& costs,
                           double holding_cost,
                           double stock_before,
                           double order_units,
                           double demand_units) {
  require_costs(costs, "score_period");
  require_units(holding_cost, "holding_cost");
  require_units(stock_before, "stock_before");
  require_units(order_units, "order_units");
  require_units(demand_units, "demand_units");

  PeriodOutcome o;
  o.stock_before = stock_before;
  o.order_units = order_units;
  o.demand_units = demand_units;
  const double available = stock_before + order_units;
  o.sold_units = std::min(available, demand_units);
  o.stock_after = available - o.sold_units;
  o.revenue = costs.retail_price * o.sold_units;
  o.cost = costs.wholesale_price * order_units + holding_cost * stock_before;
  o.profit = o.revenue - o.cost;
  o.cumulative_profit = o.profit;
  return o;
}

GameScore score_periods(const UnitCosts& costs,
                        double holding_cost,
                        const std::vector<double>& orders,
                        const std::vector<double>& demands) {
  NEWSVENDOR_REQUIRE(orders.size() == demands.size(), InvalidArgumentError,
                     "score_periods: orders and demands differ in length");

  GameScore g;
  g.periods.reserve(orders.size());
  double stock = 0.0;
  double running = 0.0;
  for (std::size_t i = 0; i < orders.size(); ++i) {
    PeriodOutcome o = score_period(costs, holding_cost, stock, orders[i], demands[i]);
    running += o.profit;
    o.period = static_cast<int>(i) + 1;
    o.cumulative_profit = running;
    stock = o.stock_after;
    g.periods.push_back(o);
  }
  g.total_profit = running;
  g.final_stock = stock;
  return g;
}

OrderEvaluation evaluate_order(const UnitCosts& costs,
                               double order_units,
                               const std::vector<double>& demand_samples) {
  require_costs(costs, "evaluate_order");
  require_units(order_units, "order_units");
  NEWSVENDOR_REQUIRE(!demand_samples.empty(), InvalidArgumentError,
                     "evaluate_order: demand batch is empty");

  std::vector<double> profits;
  profits.reserve(demand_samples.size());
  double sales = 0.0;
  double leftover = 0.0;
  for (double d : demand_samples) {
    require_units(d, "demand sample");
    const double sold = std::min(order_units, d);
    const double left = order_units - sold;
    profits.push_back(costs.retail_price * sold - costs.wholesale_price * order_units +
                      costs.salvage_price * left);
    sales += sold;
    leftover += left;
  }

  const stats::Summary profit = stats::summarize(profits);
  const stats::SampleDistribution demand(demand_samples);
  const double n = static_cast<double>(demand_samples.size());

  OrderEvaluation e;
  e.order_units = order_units;
  e.expected_profit = profit.mean;
  e.profit_stdev = profit.stdev;
  e.expected_sales = sales / n;
  e.expected_leftover = leftover / n;
  e.demand = demand.summary();
  e.fill_rate = clamp01(safe_div(e.expected_sales, e.demand.mean, 1.0));
  e.stockout_probability = demand.exceedance(order_units);
  e.demand_percentiles = demand.percentiles();
  return e;
}

}  // namespace newsvendor
