/*
 * PPGVitals signal stage tests
 * SignalFilter, PeakDetector and FrequencyAnalyzer
 */

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "FrequencyAnalyzer.hpp"
#include "PeakDetector.hpp"
#include "SignalFilter.hpp"
#include "TestHarness.hpp"

namespace {
std::vector<double> sinusoid(double freq_hz, double fs, std::size_t n, double amplitude = 1.0, double offset = 0.0) {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = offset + amplitude * std::sin(2.0 * M_PI * freq_hz * static_cast<double>(i) / fs);
    }
    return out;
}

// Deterministic pseudo-random values in [-1, 1].
std::vector<double> noise(std::size_t n, std::uint32_t seed) {
    std::vector<double> out(n);
    for (auto& v : out) {
        seed = seed * 1664525u + 1013904223u;
        v = static_cast<double>(seed >> 8) / static_cast<double>(1u << 24) * 2.0 - 1.0;
    }
    return out;
}
} // namespace

// Test: output length and first sample are preserved without detrend
bool test_filter_preserves_length_and_first_sample() {
    const FilterProfile profile{0.3, false};
    for (std::size_t n : {1u, 2u, 7u, 64u, 301u}) {
        const auto in = noise(n, static_cast<std::uint32_t>(n));
        const auto out = SignalFilter::apply(in, profile);
        TEST_ASSERT(out.size() == in.size(), "Length changed");
        TEST_ASSERT(out[0] == in[0], "First sample changed");
    }
    return true;
}

// Test: EMA recurrence
bool test_filter_ema_values() {
    const auto out = SignalFilter::apply({0.0, 10.0, 10.0, 10.0}, FilterProfile{0.5, false});
    TEST_NEAR(out[0], 0.0, 1e-12, "out[0]");
    TEST_NEAR(out[1], 5.0, 1e-12, "out[1]");
    TEST_NEAR(out[2], 7.5, 1e-12, "out[2]");
    TEST_NEAR(out[3], 8.75, 1e-12, "out[3]");
    return true;
}

// Test: detrend removes the end-to-end line
bool test_filter_detrend() {
    std::vector<double> ramp(50);
    for (std::size_t i = 0; i < ramp.size(); ++i) ramp[i] = 100.0 + 2.0 * static_cast<double>(i);
    const auto out = SignalFilter::apply(ramp, FilterProfile{1.0, true});
    TEST_ASSERT(out.size() == ramp.size(), "Length changed");
    for (double v : out) {
        TEST_NEAR(v, 0.0, 1e-9, "Linear input should detrend to zero");
    }
    const auto empty = SignalFilter::apply({}, FilterProfile{0.5, true});
    TEST_ASSERT(empty.empty(), "Empty input should give empty output");
    return true;
}

// Test: ring buffer evicts oldest samples
bool test_filter_ring_buffer() {
    SignalFilter filter(3, FilterProfile{1.0, false});
    for (int i = 1; i <= 5; ++i) filter.add_sample(i);
    const auto w = filter.window();
    TEST_ASSERT(filter.buffer_size() == 3, "Buffer should be at capacity");
    TEST_ASSERT(w[0] == 3.0 && w[1] == 4.0 && w[2] == 5.0, "Oldest samples should be evicted");
    TEST_ASSERT(filter.filtered() == w, "alpha 1 without detrend is identity");
    filter.clear();
    TEST_ASSERT(filter.buffer_size() == 0, "clear() should empty the buffer");
    return true;
}

// Test: invalid construction
bool test_filter_rejects_bad_arguments() {
    bool threw = false;
    try {
        SignalFilter f(0, FilterProfile{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero capacity should throw");

    threw = false;
    try {
        SignalFilter f(10, FilterProfile{0.0, true});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "alpha 0 should throw");
    return true;
}

// Test: local maxima on a short hand-made signal
bool test_peaks_local_maxima() {
    const auto peaks = detect_peaks({0, 1, 5, 3, 1, 4, 2}, 1, 0.0);
    TEST_ASSERT(peaks.size() == 2, "Expected two peaks");
    TEST_ASSERT(peaks[0] == 2 && peaks[1] == 5, "Peaks at indices 2 and 5");
    return true;
}

// Test: boundary indices are never reported
bool test_peaks_respect_edges() {
    for (std::size_t r = 1; r <= 5; ++r) {
        for (std::uint32_t seed = 1; seed <= 20; ++seed) {
            const auto signal = noise(40 + seed, seed);
            for (std::size_t i : detect_peaks(signal, r, -1.0)) {
                TEST_ASSERT(i >= r, "Peak inside leading edge");
                TEST_ASSERT(i < signal.size() - r, "Peak inside trailing edge");
            }
        }
    }
    // Maxima right at the edges are excluded
    const auto edge = detect_peaks({9, 1, 2, 1, 9}, 1, 0.0);
    TEST_ASSERT(edge.size() == 1 && edge[0] == 2, "Only the interior maximum counts");
    return true;
}

// Test: threshold and short inputs give empty results
bool test_peaks_threshold_and_short_input() {
    TEST_ASSERT(detect_peaks({0, 1, 5, 3, 1, 4, 2}, 1, 10.0).empty(), "Nothing above threshold");
    TEST_ASSERT(detect_peaks({0, 1, 5, 3, 1, 4, 2}, 1, 4.0).size() == 1, "Only 5 exceeds 4");
    TEST_ASSERT(detect_peaks({0, 5, 0}, 2, 0.0).empty(), "Shorter than the window");
    TEST_ASSERT(detect_peaks({}, 1, 0.0).empty(), "Empty input");
    return true;
}

// Test: every sample equal to its window maximum is reported
bool test_peaks_ties_all_reported() {
    const auto plateau = detect_peaks({0, 2, 2, 0, 0}, 1, 0.0);
    TEST_ASSERT(plateau.size() == 2, "Both plateau samples qualify");
    TEST_ASSERT(plateau[0] == 1 && plateau[1] == 2, "Ascending order");

    // The equal maximum at index 0 is never evaluated but still bounds index 2
    const auto edge_tie = detect_peaks({5, 0, 5, 0, 0}, 2, 0.0);
    TEST_ASSERT(edge_tie.size() == 1 && edge_tie[0] == 2, "Interior tie with an edge sample");

    const auto twin = detect_peaks({0, 0, 0, 9, 0, 9, 0, 0, 0}, 3, 0.0);
    TEST_ASSERT(twin.size() == 2 && twin[0] == 3 && twin[1] == 5, "Equal maxima in one window");

    // Beat selection keeps the first sample of the plateau
    const auto beats = PeakDetector::select_beats({0, 2, 2, 0, 0}, plateau, 2);
    TEST_ASSERT(beats.size() == 1 && beats[0] == 1, "First occurrence kept");
    return true;
}

// Test: dicrotic waves and close maxima are not beats
bool test_select_beats() {
    std::vector<double> pulses;
    for (int k = 0; k < 3; ++k) {
        pulses.insert(pulses.end(), {0, 4, 10, 6, 3, 4, 2, 0});
    }
    const auto maxima = detect_peaks(pulses, 1, 0.0);
    TEST_ASSERT(maxima.size() == 6, "Systolic and dicrotic maxima detected");
    const auto beats = PeakDetector::select_beats(pulses, maxima, 3);
    TEST_ASSERT(beats.size() == 3, "One beat per pulse");
    TEST_ASSERT(beats[0] == 2 && beats[1] == 10 && beats[2] == 18, "Systolic peaks kept");
    TEST_ASSERT(PeakDetector::select_beats(pulses, maxima, 3, 0.0).size() == 6, "Zero ratio keeps every maximum");

    const std::vector<double> close{0, 5, 1, 8, 0, 0, 0, 0};
    const auto both = detect_peaks(close, 1, 0.0);
    TEST_ASSERT(both.size() == 2, "Two maxima");
    const auto higher = PeakDetector::select_beats(close, both, 3);
    TEST_ASSERT(higher.size() == 1 && higher[0] == 3, "Higher peak wins inside the refractory period");
    TEST_ASSERT(PeakDetector::select_beats(close, both, 1).size() == 2, "Outside it both are beats");
    TEST_ASSERT(PeakDetector::select_beats(close, {}, 3).empty(), "No candidates");
    return true;
}

// Test: timestamps and intervals
bool test_peaks_intervals() {
    const std::vector<double> signal{0, 3, 0, 0, 4, 0, 0, 5, 0};
    const std::vector<double> ts{0, 100, 200, 300, 400, 500, 600, 700, 800};
    PeakDetector detector(1, 0.0);
    const auto peaks = PeakDetector::to_peaks(detector.detect(signal), signal, ts);
    TEST_ASSERT(peaks.size() == 3, "Three peaks");
    TEST_ASSERT(peaks[1].timestamp_ms == 400.0 && peaks[1].amplitude == 4.0, "Peak metadata");
    const auto iv = PeakDetector::intervals_ms(peaks);
    TEST_ASSERT(iv.size() == 2 && iv[0] == 300.0 && iv[1] == 300.0, "Intervals");
    TEST_ASSERT(PeakDetector::intervals_ms({}).empty(), "No intervals without peaks");
    return true;
}

// Test: five cycles at 30 Hz through filter and detector
bool test_sinusoid_five_cycles() {
    const auto raw = sinusoid(1.0, 30.0, 150);
    const auto filtered = SignalFilter::apply(raw, FilterProfile{0.5, false});
    const auto peaks = detect_peaks(filtered, 5, 0.0);
    TEST_ASSERT(peaks.size() == 5, "Expected exactly five peaks");
    for (std::size_t i = 1; i < peaks.size(); ++i) {
        const double spacing = static_cast<double>(peaks[i] - peaks[i - 1]);
        TEST_NEAR(spacing, 30.0, 1.0, "Peak spacing off the period");
    }
    return true;
}

// Test: dominant frequency of a 1.2 Hz tone
bool test_fft_dominant_frequency() {
    const double fs = 30.0;
    FrequencyAnalyzer analyzer(fs, true);
    const auto spectrum = analyzer.transform(sinusoid(1.2, fs, 300, 5.0, 120.0));
    TEST_ASSERT(spectrum.size() == 256, "N/2 bins for a 512-point transform");
    const auto top = FrequencyAnalyzer::dominant_bin(spectrum, 0.7, 3.5);
    TEST_ASSERT(top.has_value(), "Dominant bin expected");
    TEST_NEAR(top->frequency, 1.2, fs / 512.0, "Dominant frequency");
    return true;
}

// Test: bins, padding and short inputs
bool test_fft_layout() {
    FrequencyAnalyzer analyzer(32.0);
    TEST_ASSERT(analyzer.transform({}).empty(), "Empty input");
    TEST_ASSERT(analyzer.transform({1.0}).empty(), "Single sample");
    const auto spectrum = analyzer.transform(sinusoid(4.0, 32.0, 32));
    TEST_ASSERT(spectrum.size() == 16, "N/2 bins");
    for (std::size_t k = 0; k < spectrum.size(); ++k) {
        TEST_NEAR(spectrum[k].frequency, static_cast<double>(k), 1e-12, "Bin k at k * fs / N");
    }
    TEST_NEAR(spectrum[4].magnitude, 16.0, 1e-9, "Unwindowed tone magnitude is N/2");
    TEST_ASSERT(FrequencyAnalyzer::padded_length(300) == 512, "Next power of two");
    TEST_ASSERT(FrequencyAnalyzer::padded_length(256) == 256, "Power of two unchanged");
    return true;
}

// Test: band power and empty dominant search
bool test_fft_band_power() {
    const std::vector<SpectrumBin> spectrum{{0.0, 9.0}, {0.1, 1.0}, {0.2, 2.0}, {0.3, 3.0}};
    TEST_NEAR(FrequencyAnalyzer::band_power(spectrum, 0.1, 0.3), 5.0, 1e-12, "1 + 4");
    TEST_ASSERT(!FrequencyAnalyzer::dominant_bin(spectrum, 1.0, 2.0), "No bins in band");
    const auto top = FrequencyAnalyzer::dominant_bin(spectrum, 0.0, 1.0);
    TEST_ASSERT(top && top->frequency == 0.3, "DC bin is skipped");
    bool threw = false;
    try {
        FrequencyAnalyzer bad(0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero sample rate should throw");
    return true;
}

int main() {
    printf("PPGVitals Signal Test Suite\n");
    printf("===================================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_filter_preserves_length_and_first_sample);
    RUN_TEST(test_filter_ema_values);
    RUN_TEST(test_filter_detrend);
    RUN_TEST(test_filter_ring_buffer);
    RUN_TEST(test_filter_rejects_bad_arguments);
    RUN_TEST(test_peaks_local_maxima);
    RUN_TEST(test_peaks_respect_edges);
    RUN_TEST(test_peaks_threshold_and_short_input);
    RUN_TEST(test_peaks_ties_all_reported);
    RUN_TEST(test_select_beats);
    RUN_TEST(test_peaks_intervals);
    RUN_TEST(test_sinusoid_five_cycles);
    RUN_TEST(test_fft_dominant_frequency);
    RUN_TEST(test_fft_layout);
    RUN_TEST(test_fft_band_power);

    TEST_SUMMARY("Signal");
    return failed == 0 ? 0 : 1;
}
