// ============================================================================
// Fragment 3.2 - Sample Distribution over a Demand Batch
// File: sample_distribution.cpp
// ============================================================================

#include "sample_distribution.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/require.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace newsvendor::stats {

Summary summarize(const std::vector<double>& xs) {
    Summary s;
    if (xs.empty()) return s;

    s.min = xs.front();
    s.max = xs.front();

    // Welford
    double mean = 0.0;
    double m2 = 0.0;
    for (double x : xs) {
        ++s.n;
        s.min = std::min(s.min, x);
        s.max = std::max(s.max, x);
        const double delta = x - mean;
        mean += delta / static_cast<double>(s.n);
        m2 += delta * (x - mean);
    }
    s.mean = mean;
    s.stdev = (s.n > 1) ? std::sqrt(m2 / static_cast<double>(s.n - 1)) : 0.0;
    return s;
}

SampleDistribution::SampleDistribution(std::vector<double> xs) : sorted_(std::move(xs)) {
    NEWSVENDOR_REQUIRE(!sorted_.empty(), InvalidArgumentError, "SampleDistribution: empty batch");
    for (double x : sorted_) {
        NEWSVENDOR_REQUIRE(is_finite(x), InvalidArgumentError, "SampleDistribution: non-finite sample");
    }
    std::sort(sorted_.begin(), sorted_.end());
    summary_ = summarize(sorted_);
}

double SampleDistribution::cdf(double x) const {
    const auto it = std::upper_bound(sorted_.begin(), sorted_.end(), x);
    return static_cast<double>(std::distance(sorted_.begin(), it)) / static_cast<double>(sorted_.size());
}

double SampleDistribution::exceedance(double x) const {
    const auto it = std::upper_bound(sorted_.begin(), sorted_.end(), x);
    return static_cast<double>(std::distance(it, sorted_.end())) / static_cast<double>(sorted_.size());
}

double SampleDistribution::quantile(double p) const {
    const std::size_t n = sorted_.size();
    if (n == 1) return sorted_.front();

    const double pos = clamp01(p) * static_cast<double>(n - 1);
    const std::size_t lo = static_cast<std::size_t>(pos);
    if (lo + 1 >= n) return sorted_.back();
    const double frac = pos - static_cast<double>(lo);
    return sorted_[lo] + frac * (sorted_[lo + 1] - sorted_[lo]);
}

Percentiles SampleDistribution::percentiles() const {
    Percentiles p;
    p.p50 = quantile(0.50);
    p.p90 = quantile(0.90);
    p.p95 = quantile(0.95);
    p.p99 = quantile(0.99);
    return p;
}

} // namespace newsvendor::stats
