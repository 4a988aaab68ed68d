#pragma once
/*
================================================================================
Fragment 1.4 - Core: Unit Economics
FILE: cpp/engine/core/unit_costs.hpp

Purpose:
  - Per-unit retail / wholesale / salvage prices of one treatment.
  - Overage / underage costs feed the critical fractile.

Invariant (validate_or_throw):
  retail >= wholesale >= salvage >= 0, all finite.
================================================================================
*/

#include "engine/core/errors.hpp"

#include <cmath>

namespace newsvendor {

struct UnitCosts {
  double retail_price = 25.0;     // revenue per unit sold
  double wholesale_price = 14.0;  // cost per unit ordered
  double salvage_price = 6.0;     // recovered per unsold unit

  // Cost of ordering one unit too many.
  double overage_cost() const { return wholesale_price - salvage_price; }

  // Margin lost by ordering one unit too few.
  double underage_cost() const { return retail_price - wholesale_price; }

  void validate_or_throw() const {
    if (!std::isfinite(retail_price) || !std::isfinite(wholesale_price) || !std::isfinite(salvage_price)) {
      throw ValidationError("UnitCosts: prices must be finite");
    }
    if (salvage_price < 0.0) {
      throw ValidationError("UnitCosts: salvage_price must be >= 0");
    }
    if (wholesale_price < salvage_price) {
      throw ValidationError("UnitCosts: wholesale_price must be >= salvage_price");
    }
    if (retail_price < wholesale_price) {
      throw ValidationError("UnitCosts: retail_price must be >= wholesale_price");
    }
  }

  bool operator==(const UnitCosts& o) const {
    return retail_price == o.retail_price &&
           wholesale_price == o.wholesale_price &&
           salvage_price == o.salvage_price;
  }
  bool operator!=(const UnitCosts& o) const { return !(*this == o); }
};

}  // namespace newsvendor
