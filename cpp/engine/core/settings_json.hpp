#pragma once
/*
================================================================================
Fragment 1.7 - Core: Settings Loader (JSON)
FILE: cpp/engine/core/settings_json.hpp

Document shape (every member optional; missing members keep defaults):

  {
    "costs": {
      "default":   {"retail_price": 25, "wholesale_price": 14, "salvage_price": 6},
      "alternate": {"retail_price": 24, "wholesale_price": 5.5, "salvage_price": 5},
      "alternate_index": 3
    },
    "sampling":   {"default_size": 10000, "max_size": 10000000, "seed": 0},
    "disruption": {"sigma_multiplier": 2.0}
  }

Unknown keys are ignored (forward compatible). The result is validated.
================================================================================
*/

#include "engine/core/json.hpp"
#include "engine/core/settings.hpp"

#include <string>
#include <string_view>

namespace newsvendor {

// Apply overrides from an already parsed document onto `base`.
// Throws ValidationError on wrong member types or invalid values.
GameSettings settings_from_json(const JsonValue& doc, const GameSettings& base = GameSettings::defaults());

// Parse + apply. Throws ValidationError on malformed JSON.
GameSettings parse_settings_json(std::string_view text, const GameSettings& base = GameSettings::defaults());

// Read a settings file. Throws IOError if unreadable.
GameSettings load_settings_file(const std::string& path, const GameSettings& base = GameSettings::defaults());

JsonValue settings_to_json(const GameSettings& s);

}  // namespace newsvendor
