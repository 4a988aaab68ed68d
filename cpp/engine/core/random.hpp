#pragma once
/*
================================================================================
Fragment 1.8 - Core: Random Engine
FILE: cpp/engine/core/random.hpp

Purpose:
  - One engine type for every stochastic path (treatment choice, demand draws).
  - seed != 0 gives a reproducible stream; seed == 0 draws from random_device.
================================================================================
*/

#include <cstdint>
#include <random>

namespace newsvendor {

using Rng = std::mt19937_64;

inline Rng make_rng(std::uint64_t seed) {
  if (seed != 0) return Rng(seed);
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  return Rng(seq);
}

}  // namespace newsvendor
