// ============================================================================
// Fragment 3.2 - Sample Distribution over a Demand Batch
// File: sample_distribution.hpp
// ============================================================================
//
// Purpose:
// - Summary statistics (count, extrema, mean, sample std-dev) of a batch.
// - Immutable empirical distribution of a batch: P(X <= x), P(X > x), and
//   interpolated quantiles for reporting.
//
// Hardening:
// - Non-finite values are rejected (InvalidArgumentError), never dropped, so
//   the statistics always describe the whole batch.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <vector>

namespace newsvendor::stats {

struct Summary final {
    std::size_t n = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stdev = 0.0;  // n-1 denominator; 0 for n < 2
};

// One pass, no copy. Empty input gives a zeroed Summary.
Summary summarize(const std::vector<double>& xs);

struct Percentiles final {
    double p50 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

class SampleDistribution final {
public:
    // Takes ownership and sorts. Throws InvalidArgumentError if xs is empty
    // or holds a non-finite value.
    explicit SampleDistribution(std::vector<double> xs);

    std::size_t size() const noexcept { return sorted_.size(); }
    const Summary& summary() const noexcept { return summary_; }
    const std::vector<double>& sorted() const noexcept { return sorted_; }

    // P(X <= x)
    double cdf(double x) const;

    // P(X > x)
    double exceedance(double x) const;

    // Linear interpolation between order statistics; p is clamped to [0, 1].
    double quantile(double p) const;

    Percentiles percentiles() const;

private:
    std::vector<double> sorted_;
    Summary summary_;
};

} // namespace newsvendor::stats
