/*
  Fragment 2.6 - Treatment JSON Round-Trip Selftest

  Objective
  ---------
  Framework-free selftest that validates:
    1) serialize -> deserialize preserves idx for every profile, and cached
       parameters come back bit-identical.
    2) Disruption count and the demand-sample batch survive.
    3) Extension members are preserved verbatim.
    4) Malformed / out-of-range / inconsistent documents raise
       DeserializationError.
    5) Output is deterministic.

  Expected use
  ------------
      ./treatment_json_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_rejected(std::string_view blob, std::string_view msg) {
  bool threw = false;
  try {
    (void)deserialize_treatment(blob);
  } catch (const DeserializationError& e) {
    threw = true;
    std::cerr << "       (" << e.message() << ")\n";
  }
  expect_true(threw, msg);
}

void test_round_trip_all_profiles() {
  for (int i = 0; i < static_cast<int>(kTreatmentCount); ++i) {
    const std::string tag = "rt idx " + std::to_string(i);

    Treatment bare(i);
    const Treatment bare_back = deserialize_treatment(serialize_treatment(bare));
    expect_true(bare_back.index() == i, tag + ": index (no cache)");
    expect_true(!bare_back.cached_distribution_parameters(), tag + ": nothing cached");

    Treatment fitted(i);
    fitted.distribution_parameters();
    const Treatment back = deserialize_treatment(serialize_treatment(fitted));
    expect_true(back.index() == i, tag + ": index");
    expect_true(back.cached_distribution_parameters() == fitted.cached_distribution_parameters(),
                tag + ": parameters bit-identical");
  }
}

void test_disruption_and_samples_survive() {
  Treatment t(1);
  t.apply_disruption(2.0);
  t.apply_disruption(2.0);
  t.store_demand_samples({12.5, 0.0, 301.25, 99.0});

  const Treatment back = deserialize_treatment(serialize_treatment(t));
  expect_true(back.disruption_count() == 2, "rt: disruption count");
  expect_true(back.cached_distribution_parameters() == t.cached_distribution_parameters(),
              "rt: disrupted parameters");
  expect_true(back.demand_sample_cache() == t.demand_sample_cache(), "rt: demand batch");
}

void test_extensions_preserved() {
  Treatment t(5);
  JsonValue::Object history;
  history["orders"] = JsonValue::array({JsonValue::number(80), JsonValue::number(95.5)});
  t.set_extension("history", JsonValue::object(history));
  t.set_extension("player", JsonValue::string("abc"));
  t.set_extension("flag", JsonValue::boolean(true));

  const Treatment back = deserialize_treatment(serialize_treatment(t));
  expect_true(back.extensions() == t.extensions(), "ext: preserved verbatim");

  // Unknown members from a foreign writer are kept as extensions too.
  const Treatment foreign = deserialize_treatment(R"({"idx": 2, "session": {"round": 3}})");
  const JsonValue* session = foreign.extension("session");
  expect_true(session && session->is_object(), "ext: foreign member kept");
}

void test_deterministic_output() {
  Treatment a(3);
  Treatment b(3);
  a.distribution_parameters();
  b.distribution_parameters();
  a.set_extension("z", JsonValue::number(1));
  a.set_extension("a", JsonValue::number(2));
  b.set_extension("a", JsonValue::number(2));
  b.set_extension("z", JsonValue::number(1));
  expect_eq_str(serialize_treatment(a), serialize_treatment(b), "determinism: insertion order irrelevant");

  const std::string once = serialize_treatment(a);
  expect_eq_str(serialize_treatment(deserialize_treatment(once)), once, "determinism: stable re-serialize");
  expect_true(once.find('\n') == std::string::npos, "determinism: compact single line");
}

void test_minimal_document() {
  const Treatment t = deserialize_treatment(R"({"idx": 4})");
  expect_true(t.index() == 4, "minimal: idx only");
  expect_true(!t.is_disrupted(), "minimal: not disrupted");

  const Treatment empty_rvs = deserialize_treatment(R"({"idx": 0, "demand_rvs": []})");
  expect_true(!empty_rvs.demand_sample_cache(), "minimal: empty demand_rvs is no cache");
}

void test_rejects() {
  expect_rejected("", "reject: empty");
  expect_rejected("not json", "reject: garbage");
  expect_rejected("{\"idx\": 1", "reject: truncated");
  expect_rejected("[1, 2]", "reject: root array");
  expect_rejected("{}", "reject: missing idx");
  expect_rejected(R"({"idx": 6})", "reject: idx 6");
  expect_rejected(R"({"idx": -1})", "reject: idx -1");
  expect_rejected(R"({"idx": 1.5})", "reject: non-integer idx");
  expect_rejected(R"({"idx": "1"})", "reject: string idx");
  expect_rejected(R"({"idx": 1, "mu": 4.0})", "reject: mu without sigma");
  expect_rejected(R"({"idx": 1, "mu": 4.0, "sigma": 0})", "reject: sigma 0");
  expect_rejected(R"({"idx": 1, "disruptions": -1})", "reject: negative disruptions");
  expect_rejected(R"({"idx": 1, "disruptions": 1})", "reject: disrupted without parameters");
  expect_rejected(R"({"idx": 1, "demand_rvs": 5})", "reject: demand_rvs not array");
  expect_rejected(R"({"idx": 1, "demand_rvs": [1, "x"]})", "reject: non-numeric sample");
  expect_rejected(R"({"idx": 1, "demand_rvs": [1, -3]})", "reject: negative sample");
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_round_trip_all_profiles();
  test_disruption_and_samples_survive();
  test_extensions_preserved();
  test_deterministic_output();
  test_minimal_document();
  test_rejects();

  if (g_fail_count != 0) {
    std::cerr << "\ntreatment_json_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\ntreatment_json_selftest: all passed\n";
  return 0;
}
