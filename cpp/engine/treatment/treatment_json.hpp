#pragma once
/*
================================================================================
Fragment 2.3 - Treatment: JSON Serialization
FILE: cpp/engine/treatment/treatment_json.hpp

Wire format (one JSON object):
  idx          integer 0..5 (required)
  mu, sigma    cached log-normal parameters (both or neither)
  disruptions  non-negative integer (default 0)
  demand_rvs   array of finite numbers >= 0 (the cached sample batch)
  <any other>  extension value, preserved verbatim

Hardening:
  - Doubles are written with round-trip precision, so a restored treatment
    has bit-identical cached parameters.
  - Malformed input throws DeserializationError with line/column.
================================================================================
*/

#include "engine/core/json.hpp"
#include "engine/treatment/treatment.hpp"

#include <string>
#include <string_view>

namespace newsvendor {

JsonValue treatment_to_json_value(const Treatment& t);

// indent_spaces <= 0 gives a compact single line (the session-storage form).
std::string serialize_treatment(const Treatment& t, int indent_spaces = 0);

Treatment treatment_from_json_value(const JsonValue& doc);

Treatment deserialize_treatment(std::string_view blob);

}  // namespace newsvendor
