/*
================================================================================
Fragment 1.7 - Core: Settings Loader (Implementation)
FILE: cpp/engine/core/settings_json.cpp
================================================================================
*/

#include "engine/core/settings_json.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace newsvendor {
namespace {

const JsonValue* section(const JsonValue& doc, const char* key) {
  const JsonValue* v = doc.find(key);
  if (v && !v->is_object()) {
    throw ValidationError(std::string("settings: '") + key + "' must be an object");
  }
  return v;
}

void read_number(const JsonValue& obj, const char* key, double& out) {
  const JsonValue* v = obj.find(key);
  if (!v) return;
  if (!v->is_number()) {
    throw ValidationError(std::string("settings: '") + key + "' must be a number");
  }
  out = v->as_number();
}

template <typename Int>
void read_integer(const JsonValue& obj, const char* key, Int& out) {
  if (!obj.find(key)) return;
  double d = 0.0;
  read_number(obj, key, d);
  const double lo = static_cast<double>(std::numeric_limits<Int>::min());
  const double hi = static_cast<double>(std::numeric_limits<Int>::max());
  if (std::floor(d) != d || d < lo || d >= hi) {
    throw ValidationError(std::string("settings: '") + key + "' must be an integer in range");
  }
  out = static_cast<Int>(d);
}

void read_costs(const JsonValue& obj, const char* key, UnitCosts& out) {
  const JsonValue* v = section(obj, key);
  if (!v) return;
  read_number(*v, "retail_price", out.retail_price);
  read_number(*v, "wholesale_price", out.wholesale_price);
  read_number(*v, "salvage_price", out.salvage_price);
}

JsonValue costs_to_json(const UnitCosts& c) {
  JsonValue::Object o;
  o["retail_price"] = JsonValue::number(c.retail_price);
  o["wholesale_price"] = JsonValue::number(c.wholesale_price);
  o["salvage_price"] = JsonValue::number(c.salvage_price);
  return JsonValue::object(std::move(o));
}

}  // namespace

GameSettings settings_from_json(const JsonValue& doc, const GameSettings& base) {
  if (!doc.is_object()) {
    throw ValidationError("settings: root must be an object");
  }

  GameSettings s = base;

  if (const JsonValue* costs = section(doc, "costs")) {
    read_costs(*costs, "default", s.costs.default_costs);
    read_costs(*costs, "alternate", s.costs.alternate_costs);
    read_integer(*costs, "alternate_index", s.costs.alternate_index);
    read_number(*costs, "holding_cost", s.costs.holding_cost);
  }

  if (const JsonValue* sampling = section(doc, "sampling")) {
    read_integer(*sampling, "default_size", s.sampling.default_size);
    read_integer(*sampling, "max_size", s.sampling.max_size);
    std::int64_t seed = static_cast<std::int64_t>(s.sampling.seed);
    read_integer(*sampling, "seed", seed);
    if (seed < 0) {
      throw ValidationError("settings: 'seed' must be >= 0");
    }
    s.sampling.seed = static_cast<std::uint64_t>(seed);
  }

  if (const JsonValue* disruption = section(doc, "disruption")) {
    read_number(*disruption, "sigma_multiplier", s.disruption.sigma_multiplier);
  }

  s.validate_or_throw();
  return s;
}

GameSettings parse_settings_json(std::string_view text, const GameSettings& base) {
  JsonValue doc;
  JsonParseError err;
  if (!parse_json(text, &doc, &err)) {
    std::ostringstream oss;
    oss << "settings: invalid JSON at line " << err.line << ", col " << err.col << ": " << err.message;
    throw ValidationError(oss.str());
  }
  return settings_from_json(doc, base);
}

GameSettings load_settings_file(const std::string& path, const GameSettings& base) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw IOError("settings: cannot open '" + path + "'");
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    throw IOError("settings: read failed for '" + path + "'");
  }

  GameSettings s = parse_settings_json(ss.str(), base);
  log_info("settings loaded from " + path);
  return s;
}

JsonValue settings_to_json(const GameSettings& s) {
  JsonValue::Object costs;
  costs["default"] = costs_to_json(s.costs.default_costs);
  costs["alternate"] = costs_to_json(s.costs.alternate_costs);
  costs["alternate_index"] = JsonValue::number(s.costs.alternate_index);
  costs["holding_cost"] = JsonValue::number(s.costs.holding_cost);

  JsonValue::Object sampling;
  sampling["default_size"] = JsonValue::number(static_cast<double>(s.sampling.default_size));
  sampling["max_size"] = JsonValue::number(static_cast<double>(s.sampling.max_size));
  sampling["seed"] = JsonValue::number(static_cast<double>(s.sampling.seed));

  JsonValue::Object disruption;
  disruption["sigma_multiplier"] = JsonValue::number(s.disruption.sigma_multiplier);

  JsonValue::Object root;
  root["costs"] = JsonValue::object(std::move(costs));
  root["sampling"] = JsonValue::object(std::move(sampling));
  root["disruption"] = JsonValue::object(std::move(disruption));
  return JsonValue::object(std::move(root));
}

}  // namespace newsvendor
