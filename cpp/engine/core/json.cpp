/*
================================================================================
Fragment 1.6 - Core: JSON Value, Parser + Emitter (Implementation)
FILE: cpp/engine/core/json.cpp
================================================================================
*/

#include "engine/core/json.hpp"

#include "engine/core/errors.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <iomanip>
#include <istream>
#include <locale>
#include <sstream>
#include <string>
#include <utility>

namespace newsvendor {

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::Null:   return "null";
    case JsonType::Bool:   return "bool";
    case JsonType::Number: return "number";
    case JsonType::String: return "string";
    case JsonType::Object: return "object";
    case JsonType::Array:  return "array";
    default:               return "unknown";
  }
}

// ----------------------------- JsonValue --------------------------------------

JsonValue::JsonValue(const JsonValue& o)
    : type_(o.type_),
      bool_(o.bool_),
      num_(o.num_),
      str_(o.str_),
      obj_(o.obj_ ? std::make_unique<Object>(*o.obj_) : nullptr),
      arr_(o.arr_) {}

JsonValue::JsonValue(JsonValue&& o) noexcept
    : type_(o.type_),
      bool_(o.bool_),
      num_(o.num_),
      str_(std::move(o.str_)),
      obj_(std::move(o.obj_)),
      arr_(std::move(o.arr_)) {
  o.type_ = JsonType::Null;
}

JsonValue& JsonValue::operator=(const JsonValue& o) {
  if (this != &o) {
    JsonValue tmp(o);
    *this = std::move(tmp);
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& o) noexcept {
  if (this != &o) {
    type_ = o.type_;
    bool_ = o.bool_;
    num_ = o.num_;
    str_ = std::move(o.str_);
    obj_ = std::move(o.obj_);
    arr_ = std::move(o.arr_);
    o.type_ = JsonType::Null;
  }
  return *this;
}

JsonValue::~JsonValue() = default;

JsonValue JsonValue::boolean(bool v) {
  JsonValue j;
  j.type_ = JsonType::Bool;
  j.bool_ = v;
  return j;
}

JsonValue JsonValue::number(double v) {
  JsonValue j;
  j.type_ = JsonType::Number;
  j.num_ = v;
  return j;
}

JsonValue JsonValue::string(std::string v) {
  JsonValue j;
  j.type_ = JsonType::String;
  j.str_ = std::move(v);
  return j;
}

JsonValue JsonValue::object(Object v) {
  JsonValue j;
  j.type_ = JsonType::Object;
  j.obj_ = std::make_unique<Object>(std::move(v));
  return j;
}

JsonValue JsonValue::array(Array v) {
  JsonValue j;
  j.type_ = JsonType::Array;
  j.arr_ = std::move(v);
  return j;
}

static void require_type(JsonType have, JsonType want) {
  if (have != want) {
    NEWSVENDOR_THROW(InvalidArgumentError,
                     std::string("JsonValue: expected ") + to_string(want) + ", have " + to_string(have));
  }
}

bool JsonValue::as_bool() const {
  require_type(type_, JsonType::Bool);
  return bool_;
}

double JsonValue::as_number() const {
  require_type(type_, JsonType::Number);
  return num_;
}

const std::string& JsonValue::as_string() const {
  require_type(type_, JsonType::String);
  return str_;
}

const JsonValue::Object& JsonValue::as_object() const {
  require_type(type_, JsonType::Object);
  return *obj_;
}

JsonValue::Object& JsonValue::as_object() {
  require_type(type_, JsonType::Object);
  return *obj_;
}

const JsonValue::Array& JsonValue::as_array() const {
  require_type(type_, JsonType::Array);
  return arr_;
}

JsonValue::Array& JsonValue::as_array() {
  require_type(type_, JsonType::Array);
  return arr_;
}

const JsonValue* JsonValue::find(const std::string& key) const noexcept {
  if (type_ != JsonType::Object) return nullptr;
  auto it = obj_->find(key);
  return it == obj_->end() ? nullptr : &it->second;
}

bool JsonValue::operator==(const JsonValue& o) const {
  if (type_ != o.type_) return false;
  switch (type_) {
    case JsonType::Null:   return true;
    case JsonType::Bool:   return bool_ == o.bool_;
    case JsonType::Number: return num_ == o.num_;
    case JsonType::String: return str_ == o.str_;
    case JsonType::Object: return *obj_ == *o.obj_;
    case JsonType::Array:  return arr_ == o.arr_;
  }
  return false;
}

// ----------------------------- Parser -----------------------------------------
namespace {

// Treatment and settings documents are shallow; deeper input is rejected.
constexpr int kMaxDepth = 64;

class Parser {
 public:
  Parser(std::string_view in, JsonParseError* err) : in_(in), err_(err) {}

  bool document(JsonValue& out) {
    if (!value(out, 0)) return false;
    skip_space();
    if (!at_end()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool at_end() const { return pos_ >= in_.size(); }
  char peek() const { return in_[pos_]; }

  void step() {
    if (in_[pos_] == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++pos_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = pos_;
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_space() {
    while (!at_end()) {
      const char ch = peek();
      if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') return;
      step();
    }
  }

  // Skips whitespace, then consumes ch if it is next.
  bool consume(char ch) {
    skip_space();
    if (at_end() || peek() != ch) return false;
    step();
    return true;
  }

  bool value(JsonValue& out, int depth) {
    skip_space();
    if (at_end()) return fail("Unexpected end of input");
    if (depth > kMaxDepth) return fail("Nesting too deep");

    switch (peek()) {
      case '{': return object(out, depth);
      case '[': return array(out, depth);
      case '"': {
        std::string s;
        if (!string(s)) return false;
        out = JsonValue::string(std::move(s));
        return true;
      }
      case 't': return keyword("true", JsonValue::boolean(true), out);
      case 'f': return keyword("false", JsonValue::boolean(false), out);
      case 'n': return keyword("null", JsonValue::null(), out);
      default: break;
    }

    double d = 0.0;
    if (!number(d)) return false;
    out = JsonValue::number(d);
    return true;
  }

  bool keyword(std::string_view word, JsonValue v, JsonValue& out) {
    if (in_.substr(pos_, word.size()) != word) return fail("Invalid literal");
    for (std::size_t i = 0; i < word.size(); ++i) step();
    out = std::move(v);
    return true;
  }

  bool object(JsonValue& out, int depth) {
    step();  // '{'
    JsonValue::Object members;
    if (consume('}')) {
      out = JsonValue::object(std::move(members));
      return true;
    }

    for (;;) {
      skip_space();
      if (at_end() || peek() != '"') return fail("Expected object key");
      std::string key;
      if (!string(key)) return false;
      if (members.find(key) != members.end()) return fail("Duplicate object key: " + key);
      if (!consume(':')) return fail("Expected ':'");

      JsonValue member;
      if (!value(member, depth + 1)) return false;
      members.emplace(std::move(key), std::move(member));

      if (consume(',')) continue;
      if (consume('}')) break;
      return fail(at_end() ? "Unexpected end of input in object" : "Expected ',' or '}'");
    }
    out = JsonValue::object(std::move(members));
    return true;
  }

  bool array(JsonValue& out, int depth) {
    step();  // '['
    JsonValue::Array items;
    if (consume(']')) {
      out = JsonValue::array(std::move(items));
      return true;
    }

    for (;;) {
      JsonValue item;
      if (!value(item, depth + 1)) return false;
      items.push_back(std::move(item));

      if (consume(',')) continue;
      if (consume(']')) break;
      return fail(at_end() ? "Unexpected end of input in array" : "Expected ',' or ']'");
    }
    out = JsonValue::array(std::move(items));
    return true;
  }

  bool string(std::string& out) {
    step();  // opening quote
    out.clear();
    while (!at_end()) {
      const char ch = peek();
      if (ch == '"') {
        step();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Control character in string");
      step();
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }

      if (at_end()) break;
      const char esc = peek();
      step();
      switch (esc) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u':
          if (!unicode_escape(out)) return false;
          break;
        default:
          return fail(std::string("Invalid escape '\\") + esc + "'");
      }
    }
    return fail("Unterminated string");
  }

  bool hex_quad(std::uint32_t& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (at_end()) return fail("Truncated \\u escape");
      const char ch = peek();
      std::uint32_t nibble = 0;
      if (ch >= '0' && ch <= '9') nibble = static_cast<std::uint32_t>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') nibble = static_cast<std::uint32_t>(ch - 'a' + 10);
      else if (ch >= 'A' && ch <= 'F') nibble = static_cast<std::uint32_t>(ch - 'A' + 10);
      else return fail("Bad hex digit in \\u escape");
      out = (out << 4) | nibble;
      step();
    }
    return true;
  }

  // After "\u": one BMP code unit, or a surrogate pair "\uD8xx\uDCxx".
  bool unicode_escape(std::string& out) {
    std::uint32_t cp = 0;
    if (!hex_quad(cp)) return false;
    if (cp >= 0xDC00 && cp <= 0xDFFF) return fail("Lone low surrogate");
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (in_.substr(pos_, 2) != "\\u") return fail("High surrogate without low surrogate");
      step();
      step();
      std::uint32_t low = 0;
      if (!hex_quad(low)) return false;
      if (low < 0xDC00 || low > 0xDFFF) return fail("Bad low surrogate");
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }
    put_utf8(out, cp);
    return true;
  }

  static void put_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
      return;
    }
    int tail = 0;
    unsigned char lead = 0;
    if (cp < 0x800) {
      tail = 1;
      lead = 0xC0;
    } else if (cp < 0x10000) {
      tail = 2;
      lead = 0xE0;
    } else {
      tail = 3;
      lead = 0xF0;
    }
    out.push_back(static_cast<char>(lead | (cp >> (6 * tail))));
    for (int shift = 6 * (tail - 1); shift >= 0; shift -= 6) {
      out.push_back(static_cast<char>(0x80 | ((cp >> shift) & 0x3F)));
    }
  }

  // Strict JSON grammar: optional '-', int without leading zeros, optional
  // fraction and exponent. NaN/Infinity are not numbers here.
  bool number(double& out) {
    const std::size_t start = pos_;
    auto digits = [this] {
      std::size_t n = 0;
      while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        step();
        ++n;
      }
      return n;
    };

    if (!at_end() && peek() == '-') step();
    if (at_end()) return fail("Expected number");
    if (peek() == '0') {
      step();
    } else if (digits() == 0) {
      return fail("Unexpected token");
    }
    if (!at_end() && peek() == '.') {
      step();
      if (digits() == 0) return fail("Expected digits after '.'");
    }
    if (!at_end() && (peek() == 'e' || peek() == 'E')) {
      step();
      if (!at_end() && (peek() == '+' || peek() == '-')) step();
      if (digits() == 0) return fail("Expected exponent digits");
    }

    const std::string text(in_.substr(start, pos_ - start));
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    double v = 0.0;
    iss >> v;
    if (iss.fail() || !std::isfinite(v)) return fail("Number out of range: " + text);
    out = v;
    return true;
  }

  std::string_view in_;
  std::size_t pos_ = 0;
  int line_ = 1;
  int col_ = 1;
  JsonParseError* err_ = nullptr;
};

// ----------------------------- Writer -----------------------------------------

class Writer {
 public:
  explicit Writer(int indent) : indent_(indent) { os_.imbue(std::locale::classic()); }

  std::string finish() { return os_.str(); }

  void write(const JsonValue& v) {
    switch (v.type()) {
      case JsonType::Null:   os_ << "null"; break;
      case JsonType::Bool:   os_ << (v.as_bool() ? "true" : "false"); break;
      case JsonType::Number: write_number(v.as_number()); break;
      case JsonType::String: write_string(v.as_string()); break;
      case JsonType::Object: write_object(v.as_object()); break;
      case JsonType::Array:  write_array(v.as_array()); break;
    }
  }

 private:
  void newline() {
    if (indent_ <= 0) return;
    os_ << '\n' << std::string(static_cast<std::size_t>(depth_ * indent_), ' ');
  }

  void write_number(double d) {
    if (!std::isfinite(d)) {
      os_ << "null";
      return;
    }
    // Whole numbers inside the exactly representable range print as integers.
    if (d == std::trunc(d) && std::fabs(d) < 9007199254740992.0) {
      os_ << static_cast<long long>(d);
      return;
    }
    os_ << std::setprecision(17) << d;
  }

  void write_string(const std::string& s) {
    os_ << '"';
    for (const char ch : s) {
      switch (ch) {
        case '"':  os_ << "\\\""; break;
        case '\\': os_ << "\\\\"; break;
        case '\b': os_ << "\\b"; break;
        case '\f': os_ << "\\f"; break;
        case '\n': os_ << "\\n"; break;
        case '\r': os_ << "\\r"; break;
        case '\t': os_ << "\\t"; break;
        default:
          if (static_cast<unsigned char>(ch) < 0x20) {
            static const char* kHex = "0123456789abcdef";
            const auto u = static_cast<unsigned char>(ch);
            os_ << "\\u00" << kHex[u >> 4] << kHex[u & 0x0F];
          } else {
            os_ << ch;
          }
      }
    }
    os_ << '"';
  }

  // Members come out in key order (std::map), so output is deterministic.
  void write_object(const JsonValue::Object& members) {
    if (members.empty()) {
      os_ << "{}";
      return;
    }
    os_ << '{';
    ++depth_;
    const char* sep = "";
    for (const auto& [key, member] : members) {
      os_ << sep;
      sep = ",";
      newline();
      write_string(key);
      os_ << (indent_ > 0 ? ": " : ":");
      write(member);
    }
    --depth_;
    newline();
    os_ << '}';
  }

  void write_array(const JsonValue::Array& items) {
    if (items.empty()) {
      os_ << "[]";
      return;
    }
    os_ << '[';
    ++depth_;
    const char* sep = "";
    for (const JsonValue& item : items) {
      os_ << sep;
      sep = ",";
      newline();
      write(item);
    }
    --depth_;
    newline();
    os_ << ']';
  }

  std::ostringstream os_;
  int indent_ = 2;
  int depth_ = 0;
};

}  // namespace

bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  Parser parser(text, err);
  if (!parser.document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  const std::string buf = ss.str();
  return parse_json(std::string_view(buf), out, err);
}

std::string to_json(const JsonValue& v, int indent_spaces) {
  Writer w(indent_spaces);
  w.write(v);
  return w.finish();
}

}  // namespace newsvendor
