/*
================================================================================
Fragment 5.0 - CLI: Main Entry Point (newsvendor_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line harness over the treatment/demand engine. A front end (or a
    person at a terminal) can assign a treatment, inspect its economics,
    draw demand, apply the disruption and carry the state between calls.

Usage:
  newsvendor_cli <command> [options]

Commands:
  choose      Assign a random treatment and print its state
  costs       Unit costs + critical fractile
  params      Log-normal parameters (fitted) and natural moments
  ooq         Optimal order quantity
  sample      Draw a demand batch and summarize it
  disrupt     Draw a disrupted demand batch and summarize it
  score       Evaluate an order quantity against a demand batch
  roundtrip   Serialize and restore the treatment, report equality
  help        Show help message

Options:
  --idx <0..5>          Treatment index (default: random)
  --state <path|->      Restore the treatment from serialized state
  --out-state <path|->  Write the treatment state after the command
  --size <n>            Demand batch size (default from settings)
  --order <units>       Order quantity for 'score' (default: optimal)
  --seed <n>            RNG seed (0 = nondeterministic)
  --config <path>       Settings JSON
  --log-level <lvl>     debug|info|warn|error|off

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/settings_json.hpp"
#include "engine/decision/demand_sampler.hpp"
#include "engine/decision/newsvendor.hpp"
#include "engine/decision/scoring.hpp"
#include "engine/stats/sample_distribution.hpp"
#include "engine/treatment/treatment.hpp"
#include "engine/treatment/treatment_json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace newsvendor;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

struct Args {
  std::string cmd = "help";
  std::optional<int> idx;
  std::string state_path;
  std::string out_state_path;
  std::optional<std::int64_t> size;
  std::optional<double> order;
  std::optional<std::uint64_t> seed;
  std::string config_path;
};

void print_help() {
  std::cout << R"(
newsvendor_cli - Newsvendor treatment / demand engine

Usage:
  newsvendor_cli <command> [options]

Commands:
  choose      Assign a random treatment and print its state
  costs       Unit costs + critical fractile
  params      Log-normal parameters and natural moments
  ooq         Optimal order quantity
  sample      Draw a demand batch and summarize it
  disrupt     Draw a disrupted demand batch and summarize it
  score       Evaluate an order quantity against a demand batch
  roundtrip   Serialize and restore the treatment
  help        Show this help message

Options:
  --idx <0..5>          Treatment index (default: random)
  --state <path|->      Restore the treatment from serialized state
  --out-state <path|->  Write the treatment state after the command
  --size <n>            Demand batch size
  --order <units>       Order quantity for 'score' (default: optimal)
  --seed <n>            RNG seed (0 = nondeterministic)
  --config <path>       Settings JSON
  --log-level <lvl>     debug|info|warn|error|off

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

bool parse_i64(const char* s, std::int64_t* out) {
  if (!s || !out || !*s) return false;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) return false;
  *out = static_cast<std::int64_t>(v);
  return true;
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc >= 2) a->cmd = argv[1];

  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      *err = "missing value for " + flag;
      return false;
    }

    if (flag == "--idx") {
      std::int64_t n = 0;
      if (!parse_i64(v, &n) || !is_valid_treatment_index(n)) {
        *err = "--idx must be an integer in [0, " + std::to_string(kTreatmentCount - 1) + "]";
        return false;
      }
      a->idx = static_cast<int>(n);
    } else if (flag == "--state") {
      a->state_path = v;
    } else if (flag == "--out-state") {
      a->out_state_path = v;
    } else if (flag == "--size") {
      std::int64_t n = 0;
      if (!parse_i64(v, &n) || n <= 0) {
        *err = "--size must be a positive integer";
        return false;
      }
      a->size = n;
    } else if (flag == "--order") {
      double q = 0.0;
      if (!parse_double(v, &q) || q < 0.0) {
        *err = "--order must be a non-negative number";
        return false;
      }
      a->order = q;
    } else if (flag == "--seed") {
      std::int64_t n = 0;
      if (!parse_i64(v, &n) || n < 0) {
        *err = "--seed must be a non-negative integer";
        return false;
      }
      a->seed = static_cast<std::uint64_t>(n);
    } else if (flag == "--config") {
      a->config_path = v;
    } else if (flag == "--log-level") {
      const auto lvl = parse_log_level(v);
      if (!lvl) {
        *err = "--log-level must be debug|info|warn|error|off";
        return false;
      }
      set_log_level(*lvl);
    } else {
      *err = "unknown option " + flag;
      return false;
    }
  }
  return true;
}

std::string read_all(const std::string& path) {
  std::ostringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
    return ss.str();
  }
  std::ifstream f(path);
  if (!f.is_open()) throw IOError("cannot open '" + path + "'");
  ss << f.rdbuf();
  return ss.str();
}

void write_all(const std::string& path, const std::string& text) {
  if (path == "-") {
    std::cout << text << "\n";
    return;
  }
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) throw IOError("cannot write '" + path + "'");
  f << text << "\n";
  if (!f) throw IOError("write failed for '" + path + "'");
}

Treatment load_treatment(const Args& a, Rng& rng) {
  if (!a.state_path.empty()) return deserialize_treatment(read_all(a.state_path));
  if (a.idx) return Treatment(*a.idx);
  return Treatment::choose(rng);
}

void print_costs(const UnitCosts& c) {
  std::cout << "  retail_price:    " << c.retail_price << "\n";
  std::cout << "  wholesale_price: " << c.wholesale_price << "\n";
  std::cout << "  salvage_price:   " << c.salvage_price << "\n";
  std::cout << "  underage_cost:   " << c.underage_cost() << "\n";
  std::cout << "  overage_cost:    " << c.overage_cost() << "\n";
}

void print_batch(const std::vector<double>& batch) {
  const stats::SampleDistribution dist(batch);
  const stats::Summary& s = dist.summary();
  const stats::Percentiles pct = dist.percentiles();
  std::cout << "  n:     " << s.n << "\n";
  std::cout << "  mean:  " << s.mean << "\n";
  std::cout << "  stdev: " << s.stdev << "\n";
  std::cout << "  min:   " << s.min << "\n";
  std::cout << "  p50:   " << pct.p50 << "\n";
  std::cout << "  p90:   " << pct.p90 << "\n";
  std::cout << "  p99:   " << pct.p99 << "\n";
  std::cout << "  max:   " << s.max << "\n";
}

int run(const Args& a) {
  GameSettings settings = GameSettings::defaults();
  if (!a.config_path.empty()) settings = load_settings_file(a.config_path, settings);
  if (a.seed) settings.sampling.seed = *a.seed;
  settings.validate_or_throw();

  DemandSampler sampler(settings);
  Treatment t = load_treatment(a, sampler.rng());
  const std::int64_t size = a.size.value_or(settings.sampling.default_size);

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Treatment: idx=" << t.index()
            << " (natural mean " << t.profile().natural_mean
            << ", sd " << t.profile().natural_sigma << ")\n";

  if (a.cmd == "choose") {
    std::cout << serialize_treatment(t, 2) << "\n";
  } else if (a.cmd == "costs") {
    const UnitCosts c = unit_costs(t, settings.costs);
    print_costs(c);
    std::cout << "  critical_fractile: " << critical_fractile(c) << "\n";
  } else if (a.cmd == "params") {
    const stats::DistributionParameters& p = t.distribution_parameters();
    const stats::NaturalMoments m = stats::natural_moments(p);
    std::cout << "  mu:            " << p.mu << "\n";
    std::cout << "  sigma:         " << p.sigma << "\n";
    std::cout << "  disruptions:   " << t.disruption_count() << "\n";
    std::cout << "  natural_mean:  " << m.mean << "\n";
    std::cout << "  natural_stdev: " << m.stdev << "\n";
  } else if (a.cmd == "ooq") {
    std::cout << "  optimal_order_quantity: " << optimal_order_quantity(t, settings.costs) << "\n";
    std::cout << "  optimal_order_units:    " << optimal_order_units(t, settings.costs) << "\n";
  } else if (a.cmd == "sample" || a.cmd == "disrupt") {
    const bool disrupt = (a.cmd == "disrupt");
    const std::vector<double>& batch = sampler.draw(t, size, disrupt);
    std::cout << "Demand batch" << (disrupt ? " (disrupted)" : "") << ":\n";
    print_batch(batch);
    std::cout << "  sigma now: " << t.distribution_parameters().sigma << "\n";
  } else if (a.cmd == "score") {
    const UnitCosts c = unit_costs(t, settings.costs);
    const double q = a.order ? *a.order : optimal_order_quantity(t, settings.costs);
    const OrderEvaluation e = evaluate_order(c, q, sampler.draw(t, size, false));
    std::cout << "Order evaluation (q=" << e.order_units << "):\n";
    std::cout << "  expected_profit:      " << e.expected_profit << "\n";
    std::cout << "  profit_stdev:         " << e.profit_stdev << "\n";
    std::cout << "  expected_sales:       " << e.expected_sales << "\n";
    std::cout << "  expected_leftover:    " << e.expected_leftover << "\n";
    std::cout << "  fill_rate:            " << e.fill_rate << "\n";
    std::cout << "  stockout_probability: " << e.stockout_probability << "\n";
  } else if (a.cmd == "roundtrip") {
    t.distribution_parameters();
    const std::string blob = serialize_treatment(t);
    const Treatment back = deserialize_treatment(blob);
    const bool same = back.index() == t.index() &&
                      back.cached_distribution_parameters() == t.cached_distribution_parameters();
    std::cout << "  blob: " << blob << "\n";
    std::cout << "  round-trip: " << (same ? "EQUAL" : "MISMATCH") << "\n";
    if (!same) return COMPUTATION_FAILED;
  } else {
    std::cerr << "Unknown command: " << a.cmd << "\n";
    std::cerr << "Run 'newsvendor_cli help' for usage information.\n";
    return INVALID_ARGS;
  }

  if (!a.out_state_path.empty()) write_all(a.out_state_path, serialize_treatment(t));
  return SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  // stdout carries command output (and --out-state -) only.
  set_log_sinks(&std::cerr, &std::cerr);

  Args a;
  std::string err;
  if (!parse_args(argc, argv, &a, &err)) {
    std::cerr << "Error: " << err << "\n";
    return INVALID_ARGS;
  }

  if (a.cmd == "help" || a.cmd == "-h" || a.cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  try {
    return run(a);
  } catch (const ValidationError& e) {
    log_error(e.what());
    return VALIDATION_FAILED;
  } catch (const DeserializationError& e) {
    log_error(e.what());
    return VALIDATION_FAILED;
  } catch (const IOError& e) {
    log_error(e.what());
    return IO_ERROR;
  } catch (const std::exception& e) {
    log_error(e.what());
    return COMPUTATION_FAILED;
  }
}
