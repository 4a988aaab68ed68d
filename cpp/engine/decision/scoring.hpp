#pragma once
/*
================================================================================
Fragment 4.3 - Decision: Period Scoring + Order Evaluation
FILE: cpp/engine/decision/scoring.hpp

Purpose:
  - Score one period of the multi-period game. Unsold stock carries over
    and is charged a holding cost; nothing is salvaged:
        available    = stock_before + order
        sold         = min(available, demand)
        stock_after  = available - sold
        revenue      = retail * sold
        cost         = wholesale * order + holding * stock_before
        profit       = revenue - cost
  - Score a game of periods, starting from empty stock, with cumulative
    profit carried on every period.
  - Evaluate a candidate order quantity over a demand batch as a single
    newsvendor period (leftover salvaged, no carry-over): expected profit,
    fill rate, stockout probability, demand quantiles.
================================================================================
*/

#include "engine/core/unit_costs.hpp"
#include "engine/stats/sample_distribution.hpp"

#include <vector>

namespace newsvendor {

struct PeriodOutcome {
  int period = 1;  // 1-based
  double stock_before = 0.0;
  double order_units = 0.0;
  double demand_units = 0.0;
  double sold_units = 0.0;
  double stock_after = 0.0;
  double revenue = 0.0;
  double cost = 0.0;
  double profit = 0.0;
  double cumulative_profit = 0.0;
};

struct GameScore {
  std::vector<PeriodOutcome> periods;
  double total_profit = 0.0;
  double final_stock = 0.0;
};

struct OrderEvaluation {
  double order_units = 0.0;
  double expected_profit = 0.0;
  double profit_stdev = 0.0;
  double expected_sales = 0.0;
  double expected_leftover = 0.0;
  double fill_rate = 0.0;              // E[sold] / E[demand]
  double stockout_probability = 0.0;   // P(D > order)
  stats::Summary demand;
  stats::Percentiles demand_percentiles;
};

// Throws InvalidArgumentError on negative / non-finite units, a negative
// holding cost or invalid costs. period and cumulative_profit are left for
// the caller (score_periods fills them).
PeriodOutcome score_period(const UnitCosts& costs,
                           double holding_cost,
                           double stock_before,
                           double order_units,
                           double demand_units);

// orders.size() must equal demands.size(). Stock starts at zero.
GameScore score_periods(const UnitCosts& costs,
                        double holding_cost,
                        const std::vector<double>& orders,
                        const std::vector<double>& demands);

// Single-period newsvendor profit: retail * sold - wholesale * order +
// salvage * leftover. demand_samples must be non-empty.
OrderEvaluation evaluate_order(const UnitCosts& costs,
                               double order_units,
                               const std::vector<double>& demand_samples);

}  // namespace newsvendor
