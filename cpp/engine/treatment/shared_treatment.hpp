#pragma once
/*
================================================================================
Fragment 2.4 - Treatment: Locked Wrapper for Shared Use
FILE: cpp/engine/treatment/shared_treatment.hpp

A Treatment is single-owner by default. When one instance is reachable from
several threads (a shared service), every access goes through with_lock() so
fit-then-cache and the undisrupted -> disrupted transition are never
interleaved.
================================================================================
*/

#include "engine/treatment/treatment.hpp"

#include <mutex>
#include <utility>

namespace newsvendor {

class SharedTreatment final {
 public:
  explicit SharedTreatment(Treatment t) : treatment_(std::move(t)) {}

  SharedTreatment(const SharedTreatment&) = delete;
  SharedTreatment& operator=(const SharedTreatment&) = delete;

  // Runs fn(Treatment&) while holding the per-instance lock.
  // Do not let references into the treatment escape fn.
  template <typename Fn>
  decltype(auto) with_lock(Fn&& fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::forward<Fn>(fn)(treatment_);
  }

  // Consistent copy of the current state.
  Treatment snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return treatment_;
  }

  int index() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return treatment_.index();
  }

 private:
  mutable std::mutex mtx_;
  Treatment treatment_;
};

}  // namespace newsvendor
