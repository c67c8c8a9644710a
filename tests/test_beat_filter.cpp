/*
 * Outlier filter, beat history and BPM estimator tests.
 */
#include <stdexcept>
#include <vector>
#include "TestHarness.hpp"
#include "BeatFilter.hpp"
#include "BeatHistory.hpp"
#include "BpmEstimator.hpp"

namespace {
// 20 beats with intervals cycling 0.75, 0.8125, 0.875, 0.8125 s (mean 0.8125)
BeatHistory make_full_history() {
    const double pattern[] = {0.75, 0.8125, 0.875, 0.8125};
    BeatHistory h(20);
    double t = 100.0;
    h.push(t);
    for (int i = 0; i < 19; ++i) {
        t += pattern[i % 4];
        h.push(t);
    }
    return h;
}
} // namespace

bool test_history_is_fifo_bounded() {
    BeatHistory h(3);
    h.push(1.0);
    h.push(2.0);
    h.push(3.0);
    h.push(4.0);
    TEST_ASSERT(h.size() == 3, "History capped at capacity");
    TEST_ASSERT(h.timestamps().front() == 2.0, "Oldest beat evicted first");
    TEST_ASSERT(h.back() == 4.0, "Newest beat at the back");
    TEST_ASSERT(h.intervals().size() == 2, "N beats give N-1 intervals");
    return true;
}

bool test_short_history_accepts_everything() {
    BeatFilter f(20, 1.5);
    BeatHistory h(20);
    for (int i = 0; i < 10; ++i) h.push(i * 0.8);
    TEST_ASSERT(!f.is_outlier(h.back() + 5.0, h), "No judgment below min_history");
    auto res = f.accept_or_substitute(h.back() + 5.0, h);
    TEST_ASSERT(res.verdict == BeatVerdict::Accepted, "Beat accepted unconditionally");
    TEST_ASSERT(h.size() == 11, "History grows by one");
    return true;
}

bool test_regular_beat_is_accepted() {
    BeatFilter f(20, 1.5);
    BeatHistory h = make_full_history();
    const double next = h.back() + 0.8125;
    TEST_ASSERT(!f.is_outlier(next, h), "Interval inside the fences");
    auto res = f.accept_or_substitute(next, h);
    TEST_ASSERT(res.verdict == BeatVerdict::Accepted, "Regular beat accepted");
    TEST_ASSERT(h.back() == next, "Real timestamp appended");
    TEST_ASSERT(h.size() == 20, "History stays at capacity");
    return true;
}

bool test_late_beat_is_substituted() {
    BeatFilter f(20, 1.5);
    BeatHistory h = make_full_history();
    const double prev = h.back();
    TEST_ASSERT(f.is_outlier(prev + 2.0, h), "Missed beat gives a long outlier interval");
    auto res = f.accept_or_substitute(prev + 2.0, h);
    TEST_ASSERT(res.verdict == BeatVerdict::Substituted, "Outlier substituted");
    TEST_ASSERT_NEAR(res.inserted, prev + 0.8125, 1e-9, "Synthetic beat at mean interval");
    TEST_ASSERT_NEAR(h.back(), prev + 0.8125, 1e-9, "Synthetic beat appended");
    TEST_ASSERT(h.size() == 20, "History length unchanged at capacity");
    return true;
}

bool test_early_beat_is_substituted() {
    BeatFilter f(20, 1.5);
    BeatHistory h = make_full_history();
    TEST_ASSERT(f.is_outlier(h.back() + 0.1, h), "Double-counted beat gives a short outlier interval");
    return true;
}

bool test_count_grows_by_one_either_way() {
    BeatFilter f(5, 1.5);
    BeatHistory h(8);
    double t = 0.0;
    for (int i = 0; i < 12; ++i) {
        const size_t before = h.size();
        t += (i == 9) ? 4.0 : 0.75 + 0.0625 * (i % 3);
        f.accept_or_substitute(t, h);
        const size_t expected = before < h.capacity() ? before + 1 : h.capacity();
        TEST_ASSERT(h.size() == expected, "History grows by exactly one, capped");
    }
    return true;
}

bool test_bpm_needs_two_beats() {
    std::vector<double> none;
    std::vector<double> one{12.0};
    TEST_ASSERT(calculate_bpm(none) == 0.0, "Empty history gives 0");
    TEST_ASSERT(calculate_bpm(one) == 0.0, "Single beat gives 0");
    return true;
}

bool test_bpm_constant_interval() {
    std::vector<double> ts;
    for (int i = 0; i < 20; ++i) ts.push_back(i * 0.8);
    TEST_ASSERT_NEAR(calculate_bpm(ts), 75.0, 1e-6, "0.8 s interval is 75 BPM");
    return true;
}

bool test_bpm_ignores_outlier_interval() {
    BeatHistory h(20);
    double t = 0.0;
    for (int i = 0; i < 20; ++i) {
        h.push(t);
        t += (i == 10) ? 3.0 : 0.75;
    }
    TEST_ASSERT_NEAR(calculate_bpm(h), 80.0, 1e-9, "Long gap excluded from the mean");
    return true;
}

bool test_invalid_filter_configuration() {
    bool threw = false;
    try {
        BeatFilter f(1, 1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "min_history below 2 rejected");
    threw = false;
    try {
        BeatFilter f(20, -1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Negative IQR multiplier rejected");
    threw = false;
    try {
        BeatHistory h(1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "History capacity below 2 rejected");
    return true;
}

int main() {
    printf("Beat Filter / BPM Test Suite\n");
    printf("===================================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_history_is_fifo_bounded);
    RUN_TEST(test_short_history_accepts_everything);
    RUN_TEST(test_regular_beat_is_accepted);
    RUN_TEST(test_late_beat_is_substituted);
    RUN_TEST(test_early_beat_is_substituted);
    RUN_TEST(test_count_grows_by_one_either_way);
    RUN_TEST(test_bpm_needs_two_beats);
    RUN_TEST(test_bpm_constant_interval);
    RUN_TEST(test_bpm_ignores_outlier_interval);
    RUN_TEST(test_invalid_filter_configuration);

    PRINT_RESULTS();
    return (failed == 0) ? 0 : 1;
}
