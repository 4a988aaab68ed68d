#pragma once
/*
================================================================================
Fragment 1.2 - Core: Error Types (Hardened, Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types so validation and runtime failures are:
      * searchable (stable ErrorCode)
      * catchable by category
      * reportable to the calling front end cleanly

Hardening:
  - Every error carries the throw site (file/line/function).
  - Use NEWSVENDOR_REQUIRE / NEWSVENDOR_THROW so the site is captured.
================================================================================
*/

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace newsvendor {

// Stable error codes. Keep these values stable once public.
enum class ErrorCode : std::uint16_t {
  Ok = 0,

  InvalidArgument = 10,
  InvalidConfig = 11,

  ParseError = 20,

  DomainError = 30,

  IoError = 40,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::Ok:              return "Ok";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::InvalidConfig:   return "InvalidConfig";
    case ErrorCode::ParseError:      return "ParseError";
    case ErrorCode::DomainError:     return "DomainError";
    case ErrorCode::IoError:         return "IoError";
    default:                         return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Base error for the engine.
class NewsvendorError : public std::runtime_error {
 public:
  NewsvendorError(ErrorCode code, std::string msg, ErrorSite site = {})
      : std::runtime_error(build_what(code, msg, site)),
        code_(code),
        message_(std::move(msg)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  static std::string build_what(ErrorCode code, const std::string& msg, const ErrorSite& site) {
    std::ostringstream oss;
    oss << "[newsvendor " << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << (msg.empty() ? std::string("<empty error message>") : msg);
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.func && *site.func) oss << " (" << site.func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ErrorSite site_;
};

// Serialized treatment state is malformed or names an unknown treatment.
class DeserializationError : public NewsvendorError {
 public:
  explicit DeserializationError(std::string msg, ErrorSite site = {})
      : NewsvendorError(ErrorCode::ParseError, std::move(msg), site) {}
};

// Caller passed a value outside the operation's contract.
class InvalidArgumentError : public NewsvendorError {
 public:
  explicit InvalidArgumentError(std::string msg, ErrorSite site = {})
      : NewsvendorError(ErrorCode::InvalidArgument, std::move(msg), site) {}
};

// Numerically invalid state (broken profile table, non-finite results).
// Programming error: never retried.
class DomainError : public NewsvendorError {
 public:
  explicit DomainError(std::string msg, ErrorSite site = {})
      : NewsvendorError(ErrorCode::DomainError, std::move(msg), site) {}
};

// Configuration failed validation.
class ValidationError : public NewsvendorError {
 public:
  explicit ValidationError(std::string msg, ErrorSite site = {})
      : NewsvendorError(ErrorCode::InvalidConfig, std::move(msg), site) {}
};

// I/O or filesystem related issues.
class IOError : public NewsvendorError {
 public:
  explicit IOError(std::string msg, ErrorSite site = {})
      : NewsvendorError(ErrorCode::IoError, std::move(msg), site) {}
};

}  // namespace newsvendor

#define NEWSVENDOR_SITE ::newsvendor::ErrorSite{__FILE__, __func__, __LINE__}

// Throw an engine error type with site info.
#define NEWSVENDOR_THROW(TYPE, MSG) throw TYPE((MSG), NEWSVENDOR_SITE)

// Require macro (hard fail for invalid states).
#define NEWSVENDOR_REQUIRE(COND, TYPE, MSG) \
  do {                                      \
    if (!(COND)) {                          \
      NEWSVENDOR_THROW(TYPE, MSG);          \
    }                                       \
  } while (0)
