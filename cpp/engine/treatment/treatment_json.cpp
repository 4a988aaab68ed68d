/*
================================================================================
Fragment 2.3 - Treatment: JSON Serialization (Implementation)
FILE: cpp/engine/treatment/treatment_json.cpp
================================================================================
*/

#include "engine/treatment/treatment_json.hpp"

#include "engine/core/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace newsvendor {
namespace {

std::string key_of(std::string_view k) { return std::string(k); }

int read_integer_field(const JsonValue& v, std::string_view name, long long lo, long long hi) {
  if (!v.is_number()) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: '" + key_of(name) + "' must be a number");
  }
  const double d = v.as_number();
  if (std::floor(d) != d) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: '" + key_of(name) + "' must be an integer");
  }
  if (d < static_cast<double>(lo) || d > static_cast<double>(hi)) {
    std::ostringstream oss;
    oss << "treatment: '" << name << "' = " << d << " outside [" << lo << ", " << hi << "]";
    NEWSVENDOR_THROW(DeserializationError, oss.str());
  }
  return static_cast<int>(d);
}

double read_number_field(const JsonValue& v, std::string_view name) {
  if (!v.is_number()) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: '" + key_of(name) + "' must be a number");
  }
  return v.as_number();
}

}  // namespace

JsonValue treatment_to_json_value(const Treatment& t) {
  const TreatmentState s = t.state();

  JsonValue::Object o = s.extensions;
  o[key_of(fields::kIdx)] = JsonValue::number(s.index);

  if (s.parameters) {
    o[key_of(fields::kMu)] = JsonValue::number(s.parameters->mu);
    o[key_of(fields::kSigma)] = JsonValue::number(s.parameters->sigma);
  }
  if (s.disruptions > 0) {
    o[key_of(fields::kDisruptions)] = JsonValue::number(s.disruptions);
  }
  if (s.demand_samples) {
    JsonValue::Array arr;
    arr.reserve(s.demand_samples->size());
    for (double x : *s.demand_samples) arr.push_back(JsonValue::number(x));
    o[key_of(fields::kDemandSamples)] = JsonValue::array(std::move(arr));
  }
  return JsonValue::object(std::move(o));
}

std::string serialize_treatment(const Treatment& t, int indent_spaces) {
  return to_json(treatment_to_json_value(t), indent_spaces);
}

Treatment treatment_from_json_value(const JsonValue& doc) {
  if (!doc.is_object()) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: root must be an object");
  }

  TreatmentState s;

  const JsonValue* idx = doc.find(key_of(fields::kIdx));
  if (!idx) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: missing required field 'idx'");
  }
  s.index = read_integer_field(*idx, fields::kIdx, 0, static_cast<long long>(kTreatmentCount) - 1);

  const JsonValue* mu = doc.find(key_of(fields::kMu));
  const JsonValue* sigma = doc.find(key_of(fields::kSigma));
  if ((mu == nullptr) != (sigma == nullptr)) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: 'mu' and 'sigma' must appear together");
  }
  if (mu && sigma) {
    stats::DistributionParameters p;
    p.mu = read_number_field(*mu, fields::kMu);
    p.sigma = read_number_field(*sigma, fields::kSigma);
    if (!(p.sigma > 0.0)) {
      NEWSVENDOR_THROW(DeserializationError, "treatment: 'sigma' must be > 0");
    }
    s.parameters = p;
  }

  if (const JsonValue* d = doc.find(key_of(fields::kDisruptions))) {
    s.disruptions = read_integer_field(*d, fields::kDisruptions, 0, 1000);
  }

  if (const JsonValue* rvs = doc.find(key_of(fields::kDemandSamples))) {
    if (!rvs->is_array()) {
      NEWSVENDOR_THROW(DeserializationError, "treatment: 'demand_rvs' must be an array");
    }
    std::vector<double> values;
    values.reserve(rvs->as_array().size());
    for (const JsonValue& x : rvs->as_array()) {
      values.push_back(read_number_field(x, fields::kDemandSamples));
    }
    // An empty cache is the same as no cache.
    if (!values.empty()) s.demand_samples = std::move(values);
  }

  for (const auto& [key, value] : doc.as_object()) {
    if (!Treatment::is_reserved_key(key)) s.extensions.emplace(key, value);
  }

  try {
    return Treatment::from_state(std::move(s));
  } catch (const InvalidArgumentError& e) {
    NEWSVENDOR_THROW(DeserializationError, "treatment: inconsistent state: " + e.message());
  }
}

Treatment deserialize_treatment(std::string_view blob) {
  JsonValue doc;
  JsonParseError err;
  if (!parse_json(blob, &doc, &err)) {
    std::ostringstream oss;
    oss << "treatment: malformed JSON at line " << err.line << ", col " << err.col
        << " (offset " << err.offset << "): " << err.message;
    NEWSVENDOR_THROW(DeserializationError, oss.str());
  }
  return treatment_from_json_value(doc);
}

}  // namespace newsvendor
