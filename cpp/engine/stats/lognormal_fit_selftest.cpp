// ============================================================================
// Fragment 3.2 - Log-normal Fit Selftest
// File: lognormal_fit_selftest.cpp
// ============================================================================
//
// Framework-free. Non-zero return code indicates failure.
//
//   ./lognormal_fit_selftest
//
// ============================================================================

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/stats/sample_distribution.hpp"
#include "engine/stats/lognormal_fit.hpp"

namespace newsvendor::stats {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
    std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
    if (!v) fail(msg);
    else pass(msg);
}

void expect_near(double a, double b, double tol, std::string_view msg) {
    if (!(std::fabs(a - b) <= tol)) {
        fail(msg);
        std::cerr.precision(17);
        std::cerr << "  got:      " << a << "\n";
        std::cerr << "  expected: " << b << "\n";
    } else {
        pass(msg);
    }
}

template <typename Err, typename Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
    bool threw = false;
    try {
        fn();
    } catch (const Err&) {
        threw = true;
    }
    expect_true(threw, msg);
}

void test_known_fits() {
    const DistributionParameters a = fit_lognormal(100.0, 50.0);
    expect_near(a.mu, 4.4935984103309865, 1e-12, "fit(100,50): mu");
    expect_near(a.sigma, 0.47238072707743883, 1e-12, "fit(100,50): sigma");

    const DistributionParameters b = fit_lognormal(100.0, 100.0);
    expect_near(b.mu, std::log(100.0 / std::sqrt(2.0)), 1e-12, "fit(100,100): mu");
    expect_near(b.sigma, std::sqrt(std::log(2.0)), 1e-12, "fit(100,100): sigma");

    const DistributionParameters c = fit_lognormal(500.0, 150.0);
    expect_near(c.mu, 6.171519250301666, 1e-12, "fit(500,150): mu");
    expect_near(c.sigma, 0.293560379208524, 1e-12, "fit(500,150): sigma");
}

void test_moments_recovered() {
    const double cases[][2] = {{100.0, 50.0}, {100.0, 100.0}, {500.0, 150.0}, {3.0, 0.01}};
    for (const auto& cs : cases) {
        const NaturalMoments m = natural_moments(fit_lognormal(cs[0], cs[1]));
        expect_near(m.mean, cs[0], 1e-9 * cs[0], "moments: mean recovered");
        expect_near(m.stdev, cs[1], 1e-7 * cs[0], "moments: stdev recovered");
    }
}

void test_fit_rejects() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    expect_throws<DomainError>([] { (void)fit_lognormal(0.0, 10.0); }, "fit: mean 0");
    expect_throws<DomainError>([] { (void)fit_lognormal(-5.0, 10.0); }, "fit: negative mean");
    expect_throws<DomainError>([] { (void)fit_lognormal(100.0, 0.0); }, "fit: sigma 0");
    expect_throws<DomainError>([nan] { (void)fit_lognormal(nan, 10.0); }, "fit: NaN mean");
    expect_throws<DomainError>([] { (void)fit_lognormal(1e200, 1e-200); }, "fit: variance ratio underflow");
}

void test_disruption() {
    const DistributionParameters p = fit_lognormal(100.0, 50.0);
    const DistributionParameters d = disrupted(p, 2.0);
    expect_true(d.mu == p.mu, "disrupted: mu unchanged");
    expect_true(d.sigma == 2.0 * p.sigma, "disrupted: sigma doubled");
    expect_true(disrupted(d, 2.0).sigma == 4.0 * p.sigma, "disrupted: compounds");

    // Same mu, larger sigma: the mean grows.
    expect_true(natural_mean(d) > natural_mean(p), "disrupted: natural mean grows");

    expect_throws<InvalidArgumentError>([p] { (void)disrupted(p, 0.0); }, "disrupted: zero multiplier");
    expect_throws<InvalidArgumentError>([p] { (void)disrupted(p, -1.0); }, "disrupted: negative multiplier");
}

void test_validate() {
    DistributionParameters p;
    p.sigma = 0.0;
    expect_throws<DomainError>([p] { p.validate(); }, "validate: sigma 0");
    p.sigma = 1.0;
    p.mu = std::numeric_limits<double>::infinity();
    expect_throws<DomainError>([p] { p.validate(); }, "validate: infinite mu");
}

void test_sample_distribution() {
    const SampleDistribution e(std::vector<double>{5.0, 1.0, 3.0, 2.0, 4.0});
    expect_true(e.size() == 5, "sample dist: size");
    expect_true(e.sorted().front() == 1.0 && e.sorted().back() == 5.0, "sample dist: sorted");
    expect_near(e.summary().mean, 3.0, 1e-12, "sample dist: mean");
    expect_near(e.summary().stdev, std::sqrt(2.5), 1e-12, "sample dist: sample stdev");
    expect_near(e.cdf(3.0), 0.6, 1e-12, "sample dist: P(X <= 3)");
    expect_near(e.exceedance(3.0), 0.4, 1e-12, "sample dist: P(X > 3)");
    expect_near(e.exceedance(0.0), 1.0, 1e-12, "sample dist: P(X > 0)");
    expect_near(e.quantile(0.5), 3.0, 1e-12, "sample dist: median");
    expect_near(e.quantile(0.0), 1.0, 1e-12, "sample dist: q0 = min");
    expect_near(e.quantile(1.0), 5.0, 1e-12, "sample dist: q1 = max");
    expect_near(e.quantile(0.9), 4.6, 1e-12, "sample dist: q0.9 interpolated");

    const Summary empty = summarize({});
    expect_true(empty.n == 0 && empty.mean == 0.0, "summarize: empty");
    const Summary one = summarize({7.0});
    expect_true(one.n == 1 && one.stdev == 0.0 && one.min == 7.0 && one.max == 7.0, "summarize: single");

    const double inf = std::numeric_limits<double>::infinity();
    expect_throws<InvalidArgumentError>([] { SampleDistribution d(std::vector<double>{}); }, "sample dist: empty rejected");
    expect_throws<InvalidArgumentError>([inf] { SampleDistribution d(std::vector<double>{1.0, inf}); },
                                        "sample dist: non-finite rejected");
}

} // namespace
} // namespace newsvendor::stats

int main() {
    using namespace newsvendor::stats;

    test_known_fits();
    test_moments_recovered();
    test_fit_rejects();
    test_disruption();
    test_validate();
    test_sample_distribution();

    if (g_fail_count != 0) {
        std::cerr << "\nlognormal_fit_selftest: " << g_fail_count << " failure(s)\n";
        return 1;
    }
    std::cerr << "\nlognormal_fit_selftest: all passed\n";
    return 0;
}
