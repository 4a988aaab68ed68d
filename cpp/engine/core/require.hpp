#pragma once
/*
===============================================================================
Fragment 1.3 - Hardened Math Utilities + Require Glue
FILE: cpp/engine/core/require.hpp
===============================================================================
*/

#include "engine/core/errors.hpp"

#include <cmath>
#include <string>

namespace newsvendor {

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

inline double clamp01(double p) noexcept {
  if (!is_finite(p)) return 0.0;
  if (p < 0.0) return 0.0;
  if (p > 1.0) return 1.0;
  return p;
}

// Safe division (never NaN/Inf)
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
  if (!is_finite(num) || !is_finite(den)) return fallback;
  if (den == 0.0) return fallback;
  const double q = num / den;
  return is_finite(q) ? q : fallback;
}

// -----------------------------
// Require wrappers
// Numeric domain violations are DomainError; argument checks stay with the caller.
// -----------------------------
inline void require_finite(double x, const char* what) {
  NEWSVENDOR_REQUIRE(is_finite(x), DomainError,
                     std::string(what ? what : "value") + " is not finite");
}

inline void require_positive(double x, const char* what) {
  NEWSVENDOR_REQUIRE(is_finite(x) && x > 0.0, DomainError,
                     std::string(what ? what : "value") + " must be finite and > 0");
}

inline void require_nonnegative(double x, const char* what) {
  NEWSVENDOR_REQUIRE(is_finite(x) && x >= 0.0, DomainError,
                     std::string(what ? what : "value") + " must be finite and >= 0");
}

}  // namespace newsvendor
