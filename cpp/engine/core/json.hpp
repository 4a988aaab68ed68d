#pragma once
/*
================================================================================
Fragment 1.6 - Core: JSON Value, Parser + Emitter
FILE: cpp/engine/core/json.hpp

Purpose:
  - Owned JSON document model used by treatment serialization and settings.
  - Strict parser: rejects NaN/Inf literals, trailing characters, bad escapes.
  - Deterministic emitter: stable (sorted) key order, non-finite numbers as
    null, doubles written with round-trip precision.

Hardening:
  - No third-party JSON dependency (simple, controlled parser/emitter).
  - Parse errors report byte offset + 1-based line/column.
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace newsvendor {

enum class JsonType { Null, Bool, Number, String, Object, Array };

const char* to_string(JsonType t) noexcept;

class JsonValue {
 public:
  // Object is held through a pointer: std::map makes no promise about an
  // incomplete mapped type, std::vector does (C++17).
  using Object = std::map<std::string, JsonValue>;
  using Array = std::vector<JsonValue>;

  JsonValue() = default;
  JsonValue(const JsonValue& o);
  JsonValue(JsonValue&& o) noexcept;
  JsonValue& operator=(const JsonValue& o);
  JsonValue& operator=(JsonValue&& o) noexcept;
  ~JsonValue();

  static JsonValue null() { return JsonValue(); }
  static JsonValue boolean(bool v);
  static JsonValue number(double v);
  static JsonValue string(std::string v);
  static JsonValue object(Object v = {});
  static JsonValue array(Array v = {});

  JsonType type() const noexcept { return type_; }
  bool is_null() const noexcept { return type_ == JsonType::Null; }
  bool is_bool() const noexcept { return type_ == JsonType::Bool; }
  bool is_number() const noexcept { return type_ == JsonType::Number; }
  bool is_string() const noexcept { return type_ == JsonType::String; }
  bool is_object() const noexcept { return type_ == JsonType::Object; }
  bool is_array() const noexcept { return type_ == JsonType::Array; }

  // Typed accessors throw InvalidArgumentError on type mismatch.
  bool as_bool() const;
  double as_number() const;
  const std::string& as_string() const;
  const Object& as_object() const;
  Object& as_object();
  const Array& as_array() const;
  Array& as_array();

  // Object member lookup; nullptr if not an object or key absent.
  const JsonValue* find(const std::string& key) const noexcept;

  bool operator==(const JsonValue& o) const;
  bool operator!=(const JsonValue& o) const { return !(*this == o); }

 private:
  JsonType type_ = JsonType::Null;
  bool bool_ = false;
  double num_ = 0.0;
  std::string str_;
  std::unique_ptr<Object> obj_;  // set iff type_ == Object
  Array arr_;
};

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

/// Parse one JSON document. Returns false and fills `err` on failure;
/// `out` is left untouched on failure.
bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

/// Serialize. indent_spaces <= 0 emits a compact single line.
std::string to_json(const JsonValue& v, int indent_spaces = 2);

}  // namespace newsvendor
