/*
 * Statistics summarizer and HRV metric tests.
 */
#include <cmath>
#include <stdexcept>
#include <vector>
#include "TestHarness.hpp"
#include "Hrv.hpp"
#include "Statistics.hpp"

bool test_percentile_linear_interpolation() {
    std::vector<double> v{4.0, 1.0, 3.0, 2.0};
    TEST_ASSERT_NEAR(percentile(v, 25.0), 1.75, 1e-12, "Q1 interpolated between ranks");
    TEST_ASSERT_NEAR(percentile(v, 75.0), 3.25, 1e-12, "Q3 interpolated between ranks");
    TEST_ASSERT_NEAR(median(v), 2.5, 1e-12, "Median of even count");
    TEST_ASSERT_NEAR(percentile(v, 0.0), 1.0, 1e-12, "0th percentile is the minimum");
    TEST_ASSERT_NEAR(percentile(v, 100.0), 4.0, 1e-12, "100th percentile is the maximum");
    return true;
}

bool test_iqr_bounds() {
    std::vector<double> v{1.0, 2.0, 3.0, 4.0, 5.0};
    IqrBounds b = iqr_bounds(v, 1.5);
    TEST_ASSERT_NEAR(b.q1, 2.0, 1e-12, "Q1");
    TEST_ASSERT_NEAR(b.q3, 4.0, 1e-12, "Q3");
    TEST_ASSERT_NEAR(b.lower, -1.0, 1e-12, "Lower fence");
    TEST_ASSERT_NEAR(b.upper, 7.0, 1e-12, "Upper fence");
    TEST_ASSERT(b.contains(7.0) && !b.contains(7.0001), "Fences are inclusive");
    return true;
}

bool test_summary_of_rr_values() {
    std::vector<double> rr{800.0, 820.0, 780.0, 810.0};
    std::vector<double> ts{10.0, 10.8, 11.6, 12.4};
    auto r = summarize(rr, ts, true);
    TEST_ASSERT(r.has_value(), "Summary produced");
    TEST_ASSERT(r->count == 4, "Count");
    TEST_ASSERT_NEAR(r->mean, 802.5, 1e-9, "Mean");
    TEST_ASSERT_NEAR(r->median, 805.0, 1e-9, "Median");
    TEST_ASSERT(r->min == 780.0 && r->max == 820.0, "Min and max");
    TEST_ASSERT_NEAR(r->std_dev, std::sqrt(875.0 / 4.0), 1e-9, "Population std");
    TEST_ASSERT_NEAR(r->iqr, 812.5 - 795.0, 1e-9, "IQR");
    TEST_ASSERT_NEAR(r->duration, 2.4, 1e-9, "Duration from first to last timestamp");
    TEST_ASSERT(r->rmssd && r->sdnn, "RR metrics present");
    TEST_ASSERT_NEAR(*r->rmssd, std::sqrt(2900.0 / 3.0), 1e-9, "RMSSD");
    TEST_ASSERT(!r->pnn50, "pNN50 not part of the segment summary");
    return true;
}

bool test_sdnn_differs_from_std_dev_by_bessel_factor() {
    std::vector<double> rr{800.0, 820.0, 780.0, 810.0};
    std::vector<double> ts{0.0, 1.0, 2.0, 3.0};
    auto r = summarize(rr, ts, true);
    TEST_ASSERT(r.has_value() && r->sdnn, "Summary with SDNN");
    const double n = 4.0;
    TEST_ASSERT_NEAR(*r->sdnn, r->std_dev * std::sqrt(n / (n - 1.0)), 1e-9, "SDNN = std_dev * sqrt(N/(N-1))");
    TEST_ASSERT(std::fabs(*r->sdnn - r->std_dev) > 1.0, "The two spreads differ");
    return true;
}

bool test_non_rr_channel_has_no_hrv() {
    std::vector<double> hr{70.0, 72.0, 71.0};
    std::vector<double> ts{0.0, 1.0, 2.0};
    auto r = summarize(hr, ts, false);
    TEST_ASSERT(r.has_value(), "Summary produced");
    TEST_ASSERT(!r->rmssd && !r->sdnn, "No RR metrics on heart rate");
    return true;
}

bool test_single_value() {
    std::vector<double> rr{800.0};
    std::vector<double> ts{5.0};
    auto r = summarize(rr, ts, true);
    TEST_ASSERT(r.has_value(), "Summary produced");
    TEST_ASSERT(r->duration == 0.0, "Single timestamp has zero duration");
    TEST_ASSERT(r->std_dev == 0.0 && r->iqr == 0.0, "No spread");
    TEST_ASSERT(!r->rmssd && !r->sdnn, "RMSSD and SDNN absent, not zero");
    return true;
}

bool test_empty_and_mismatched_input() {
    std::vector<double> none;
    auto empty = summarize(none, none, true);
    TEST_ASSERT(!empty.has_value(), "Empty input yields no-data marker");
    TEST_ASSERT(empty.error() == "No data available", "No-data message");

    std::vector<double> v{1.0, 2.0};
    std::vector<double> ts{0.0};
    auto mismatched = summarize(v, ts, false);
    TEST_ASSERT(!mismatched.has_value(), "Mismatched arrays rejected");
    return true;
}

bool test_pnn50() {
    std::vector<double> rr{800.0, 900.0, 820.0, 870.0};
    // diffs 100, -80, 50: a difference of exactly 50 ms does not count
    TEST_ASSERT_NEAR(*pnn50(rr), 50.0, 1e-9, "Two of four");
    std::vector<double> rr2{800.0, 900.0, 820.0, 871.0};
    TEST_ASSERT_NEAR(*pnn50(rr2), 75.0, 1e-9, "Three of four");
    std::vector<double> one{800.0};
    TEST_ASSERT_NEAR(*pnn50(one), 0.0, 1e-12, "Single value has no differences");
    std::vector<double> none;
    TEST_ASSERT(!pnn50(none), "Empty series omits pNN50");
    return true;
}

bool test_compute_hrv_guards() {
    std::vector<double> one{812.0};
    HrvMetrics m = compute_hrv(one);
    TEST_ASSERT(!m.rmssd && !m.sdnn, "One value omits RMSSD and SDNN");
    TEST_ASSERT(m.pnn50.has_value(), "pNN50 defined for one value");
    return true;
}

bool test_normalize_rr_units() {
    std::vector<double> seconds{0.8, 0.82, 0.79};
    auto ms = normalize_rr_units(seconds);
    TEST_ASSERT_NEAR(ms[0], 800.0, 1e-9, "Seconds scaled to ms");
    TEST_ASSERT_NEAR(ms[1], 820.0, 1e-9, "Seconds scaled to ms");
    std::vector<double> already{800.0, 820.0};
    auto same = normalize_rr_units(already);
    TEST_ASSERT(same[0] == 800.0 && same[1] == 820.0, "ms left untouched");
    return true;
}

bool test_clean_rr_interpolates_outlier() {
    std::vector<double> rr(21, 800.0);
    rr[9] = 790.0;
    rr[10] = 3000.0;
    rr[11] = 810.0;
    auto cleaned = clean_rr_intervals(rr, 3.0);
    TEST_ASSERT(cleaned.size() == rr.size(), "Length preserved");
    TEST_ASSERT_NEAR(cleaned[10], 800.0, 1e-9, "Outlier replaced by interpolation");
    TEST_ASSERT(cleaned[9] == 790.0 && cleaned[11] == 810.0, "Neighbours untouched");
    return true;
}

bool test_clean_rr_extrapolates_at_edges() {
    std::vector<double> rr{3000.0};
    for (int i = 0; i < 20; ++i) rr.push_back((i % 2) ? 810.0 : 800.0);
    auto cleaned = clean_rr_intervals(rr, 3.0);
    TEST_ASSERT_NEAR(cleaned[0], 790.0, 1e-9, "Leading outlier extrapolated from the first two valid values");

    std::vector<double> flat(10, 800.0);
    auto same = clean_rr_intervals(flat, 3.0);
    TEST_ASSERT(same == flat, "Constant series returned unchanged");
    return true;
}

bool test_rr_window_tracker() {
    RrWindowTracker tracker(4, 3.0);
    TEST_ASSERT(!tracker.add(800.0), "Window not complete");
    TEST_ASSERT(!tracker.add(900.0), "Window not complete");
    TEST_ASSERT(!tracker.add(800.0), "Window not complete");
    auto m = tracker.add(900.0);
    TEST_ASSERT(m.has_value(), "Metrics on a full window");
    TEST_ASSERT_NEAR(*m->rmssd, 100.0, 1e-9, "RMSSD of alternating series");
    TEST_ASSERT_NEAR(*m->sdnn, std::sqrt(10000.0 / 3.0), 1e-9, "SDNN of alternating series");
    TEST_ASSERT(tracker.pending() == 0, "Next window starts empty");

    bool threw = false;
    try {
        RrWindowTracker bad(1, 3.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Window below 2 rejected");
    threw = false;
    try {
        RrWindowTracker bad(50, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero z threshold rejected");
    threw = false;
    try {
        RrWindowTracker bad(50, -3.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Negative z threshold rejected");
    return true;
}

int main() {
    printf("Statistics Test Suite\n");
    printf("===================================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_percentile_linear_interpolation);
    RUN_TEST(test_iqr_bounds);
    RUN_TEST(test_summary_of_rr_values);
    RUN_TEST(test_sdnn_differs_from_std_dev_by_bessel_factor);
    RUN_TEST(test_non_rr_channel_has_no_hrv);
    RUN_TEST(test_single_value);
    RUN_TEST(test_empty_and_mismatched_input);
    RUN_TEST(test_pnn50);
    RUN_TEST(test_compute_hrv_guards);
    RUN_TEST(test_normalize_rr_units);
    RUN_TEST(test_clean_rr_interpolates_outlier);
    RUN_TEST(test_clean_rr_extrapolates_at_edges);
    RUN_TEST(test_rr_window_tracker);

    PRINT_RESULTS();
    return (failed == 0) ? 0 : 1;
}
