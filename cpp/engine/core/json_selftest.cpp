/*
  Fragment 1.8 - JSON + Settings Selftest

  Objective
  ---------
  Framework-free selftest that validates:
    1) Parser rejects malformed input and reports line/column.
    2) Emitter writes non-finite numbers as null and integral numbers
       without a fraction.
    3) Doubles survive text with bit-identical values.
    4) Settings documents override only what they name and are validated.

  Expected use
  ------------
      ./json_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/json.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/settings_json.hpp"

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

bool parses(std::string_view text) {
  JsonValue v;
  return parse_json(text, &v);
}

void test_parser_basics() {
  JsonValue v;
  JsonParseError err;
  const bool ok = parse_json(R"({"a": [1, 2.5, -3e2], "b": "x\ny", "c": null, "d": true})", &v, &err);
  expect_true(ok, "parse: valid document");
  if (!ok) return;

  expect_true(v.is_object(), "parse: root is object");
  const JsonValue* a = v.find("a");
  expect_true(a && a->is_array() && a->as_array().size() == 3, "parse: array of three");
  if (a && a->is_array() && a->as_array().size() == 3) {
    expect_true(a->as_array()[2].as_number() == -300.0, "parse: exponent");
  }
  const JsonValue* b = v.find("b");
  expect_true(b && b->is_string() && b->as_string() == "x\ny", "parse: string escape");
  const JsonValue* c = v.find("c");
  expect_true(c && c->is_null(), "parse: null");
  const JsonValue* d = v.find("d");
  expect_true(d && d->is_bool() && d->as_bool(), "parse: true");
  expect_true(v.find("missing") == nullptr, "parse: absent key -> nullptr");
}

void test_parser_rejects() {
  expect_true(!parses(""), "reject: empty input");
  expect_true(!parses("{"), "reject: unterminated object");
  expect_true(!parses("{\"a\":1} x"), "reject: trailing characters");
  expect_true(!parses("{\"a\":1,\"a\":2}"), "reject: duplicate key");
  expect_true(!parses("[NaN]"), "reject: NaN literal");
  expect_true(!parses("[1,]"), "reject: trailing comma");
  expect_true(!parses("{'a':1}"), "reject: single quotes");

  std::string deep;
  for (int i = 0; i < 100; ++i) deep += "[";
  for (int i = 0; i < 100; ++i) deep += "]";
  expect_true(!parses(deep), "reject: nesting too deep");

  JsonValue v;
  JsonParseError err;
  const bool ok = parse_json("{\n  \"a\": tru\n}", &v, &err);
  expect_true(!ok, "reject: bad literal");
  expect_true(err.line == 2, "reject: error line reported");
  expect_true(!err.message.empty(), "reject: error message present");
  expect_true(v.is_null(), "reject: output untouched on failure");
}

void test_emitter() {
  JsonValue::Object o;
  o["n"] = JsonValue::number(3.0);
  o["inf"] = JsonValue::number(std::numeric_limits<double>::infinity());
  o["s"] = JsonValue::string("q\"uote");
  o["arr"] = JsonValue::array({JsonValue::boolean(false), JsonValue::null()});

  expect_eq_str(to_json(JsonValue::object(o), 0),
                R"({"arr":[false,null],"inf":null,"n":3,"s":"q\"uote"})",
                "emit: compact, sorted, non-finite -> null");

  const std::string pretty = to_json(JsonValue::object(o), 2);
  expect_true(pretty.find('\n') != std::string::npos, "emit: indented form is multi-line");

  JsonValue back;
  expect_true(parse_json(pretty, &back), "emit: indented form parses");
}

void test_double_round_trip() {
  const double xs[] = {4.4935984103309865, 0.47238072707743883, 0.1, 1e-300, 123456789.125};
  for (double x : xs) {
    JsonValue back;
    const std::string text = to_json(JsonValue::number(x), 0);
    const bool ok = parse_json(text, &back);
    if (!ok || !back.is_number() || back.as_number() != x) {
      fail("double round trip: " + text);
      return;
    }
  }
  pass("double round trip: bit-identical");
}

void test_value_semantics() {
  JsonValue::Object inner;
  inner["k"] = JsonValue::number(1.0);
  JsonValue::Object o;
  o["nested"] = JsonValue::object(inner);
  const JsonValue original = JsonValue::object(o);

  JsonValue copy = original;
  copy.as_object()["nested"].as_object()["k"] = JsonValue::number(2.0);
  expect_true(original.find("nested")->find("k")->as_number() == 1.0, "value: copy is deep");
  expect_true(copy != original, "value: edited copy differs");

  JsonValue moved = std::move(copy);
  expect_true(moved.find("nested")->find("k")->as_number() == 2.0, "value: move keeps members");
  expect_true(copy.is_null() && copy.find("nested") == nullptr, "value: moved-from is null");

  copy = original;
  expect_true(copy == original, "value: copy assignment");
}

void test_accessor_mismatch() {
  bool threw = false;
  try {
    (void)JsonValue::string("x").as_number();
  } catch (const InvalidArgumentError&) {
    threw = true;
  }
  expect_true(threw, "accessor: type mismatch throws InvalidArgumentError");
}

void test_settings_overrides() {
  const GameSettings base = GameSettings::defaults();
  const GameSettings s = parse_settings_json(
      R"({"sampling": {"default_size": 500, "seed": 42},
          "disruption": {"sigma_multiplier": 3}})",
      base);

  expect_true(s.sampling.default_size == 500, "settings: default_size override");
  expect_true(s.sampling.seed == 42, "settings: seed override");
  expect_true(s.disruption.sigma_multiplier == 3.0, "settings: multiplier override");
  expect_true(s.sampling.max_size == base.sampling.max_size, "settings: max_size untouched");
  expect_true(s.costs.default_costs == base.costs.default_costs, "settings: costs untouched");
  expect_true(s.costs.alternate_index == 3, "settings: alternate_index default");
  expect_true(s.costs.holding_cost == 1.0, "settings: holding_cost default");

  const GameSettings h = parse_settings_json(R"({"costs": {"holding_cost": 0.5}})");
  expect_true(h.costs.holding_cost == 0.5, "settings: holding_cost override");
}

void test_settings_round_trip() {
  GameSettings s = GameSettings::defaults();
  s.costs.alternate_index = -1;
  s.costs.default_costs = UnitCosts{30.0, 10.0, 2.0};
  s.sampling.seed = 7;

  const std::string text = to_json(settings_to_json(s));
  const GameSettings back = parse_settings_json(text);
  expect_true(back.costs.alternate_index == -1, "settings rt: alternate_index");
  expect_true(back.costs.default_costs == s.costs.default_costs, "settings rt: default costs");
  expect_true(back.sampling.seed == 7, "settings rt: seed");
}

template <typename Fn>
void expect_validation_error(Fn&& fn, std::string_view msg) {
  bool threw = false;
  try {
    fn();
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, msg);
}

void test_settings_rejects() {
  expect_validation_error([] { (void)parse_settings_json("{bad"); }, "settings: malformed JSON");
  expect_validation_error([] { (void)parse_settings_json("[]"); }, "settings: root not object");
  expect_validation_error([] { (void)parse_settings_json(R"({"sampling": {"default_size": 0}})"); },
                          "settings: default_size 0");
  expect_validation_error([] { (void)parse_settings_json(R"({"sampling": {"default_size": 2.5}})"); },
                          "settings: fractional default_size");
  expect_validation_error([] { (void)parse_settings_json(R"({"sampling": {"seed": -1}})"); },
                          "settings: negative seed");
  expect_validation_error(
      [] { (void)parse_settings_json(R"({"costs": {"default": {"salvage_price": 20}}})"); },
      "settings: salvage above wholesale");
  expect_validation_error([] { (void)parse_settings_json(R"({"disruption": {"sigma_multiplier": 0}})"); },
                          "settings: zero multiplier");
  expect_validation_error([] { (void)parse_settings_json(R"({"costs": {"holding_cost": -1}})"); },
                          "settings: negative holding_cost");
  expect_validation_error([] { (void)parse_settings_json(R"({"costs": 5})"); },
                          "settings: section not object");
}

void test_settings_missing_file() {
  bool threw = false;
  try {
    (void)load_settings_file("/nonexistent/newsvendor/settings.json");
  } catch (const IOError& e) {
    threw = (e.code() == ErrorCode::IoError);
  }
  expect_true(threw, "settings: missing file -> IOError");
}

void test_log_level_parse() {
  expect_true(parse_log_level("debug") == LogLevel::DEBUG, "log level: debug");
  expect_true(parse_log_level("WARN") == LogLevel::WARN, "log level: case-insensitive");
  expect_true(parse_log_level("Off") == LogLevel::OFF, "log level: off");
  expect_true(!parse_log_level("verbose").has_value(), "log level: unknown rejected");
  expect_true(!parse_log_level("").has_value(), "log level: empty rejected");
}

void test_log_sinks() {
  std::ostringstream info;
  std::ostringstream warn;
  set_log_sinks(&info, &warn);
  set_log_level(LogLevel::INFO);

  log_debug("hidden-debug");
  log_info("visible-info");
  log_error("visible-error");

  set_log_level(LogLevel::OFF);
  log_error("hidden-error");

  set_log_sinks(nullptr, nullptr);
  set_log_level(LogLevel::WARN);

  const std::string i = info.str();
  const std::string w = warn.str();
  expect_true(i.find("hidden-debug") == std::string::npos, "log sink: below level dropped");
  expect_true(i.find("[INFO] visible-info") != std::string::npos, "log sink: info routed to info sink");
  expect_true(w.find("[ERROR] visible-error") != std::string::npos, "log sink: error routed to warn sink");
  expect_true(w.find("hidden-error") == std::string::npos, "log sink: OFF silences everything");
  expect_true(!i.empty() && i.front() == '[' && i.find("Z][INFO]") != std::string::npos,
              "log sink: UTC timestamp prefix");
}

}  // namespace
}  // namespace newsvendor

int main() {
  using namespace newsvendor;
  set_log_level(LogLevel::WARN);

  test_parser_basics();
  test_parser_rejects();
  test_emitter();
  test_double_round_trip();
  test_value_semantics();
  test_accessor_mismatch();
  test_settings_overrides();
  test_settings_round_trip();
  test_settings_rejects();
  test_settings_missing_file();
  test_log_level_parse();
  test_log_sinks();

  if (g_fail_count != 0) {
    std::cerr << "\njson_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\njson_selftest: all passed\n";
  return 0;
}
