#pragma once
/*
================================================================================
Fragment 2.1 - Treatment: Demand Profile Table
FILE: cpp/engine/treatment/profiles.hpp

Purpose:
  - The six fixed demand profiles a participant can be assigned.
  - Indexing is static: the table is constexpr, never built at runtime.

Notes:
  - Profiles 2 and 3 share demand; 3 differs only in unit costs
    (see CostSettings::alternate_index).
================================================================================
*/

#include <array>
#include <cstddef>

namespace newsvendor {

struct TreatmentProfile {
  int index = 0;
  double natural_mean = 0.0;   // demand mean, units
  double natural_sigma = 0.0;  // demand std-dev, units
};

inline constexpr std::size_t kTreatmentCount = 6;

inline constexpr std::array<TreatmentProfile, kTreatmentCount> kTreatmentProfiles{{
    {0, 100.0, 50.0},
    {1, 100.0, 100.0},
    {2, 500.0, 150.0},
    {3, 500.0, 150.0},
    {4, 100.0, 50.0},
    {5, 100.0, 100.0},
}};

constexpr bool is_valid_treatment_index(long long idx) noexcept {
  return idx >= 0 && idx < static_cast<long long>(kTreatmentCount);
}

// Caller must pass a valid index (see Treatment, which enforces it).
constexpr const TreatmentProfile& treatment_profile(int idx) {
  return kTreatmentProfiles[static_cast<std::size_t>(idx)];
}

}  // namespace newsvendor
