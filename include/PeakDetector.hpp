#pragma once
#include <cstddef>
#include <vector>

struct Peak {
    std::size_t index{0};
    double timestamp_ms{0.0};
    double amplitude{0.0};
};

/**
 * @class PeakDetector
 * @brief Local-maximum heartbeat detector over a filtered window.
 */
class PeakDetector {
public:
    PeakDetector(std::size_t window_radius, double threshold);

    /**
     * @brief Indices i in [r, len - r) where signal[i] is the maximum of the
     * closed window [i - r, i + r] and exceeds the threshold.
     * Every index equal to its window maximum is reported, so a plateau
     * yields one index per sample. select_beats() keeps the first of them.
     * @return Ascending indices; empty when nothing clears the threshold.
     */
    std::vector<std::size_t> detect(const std::vector<double>& signal) const;

    /**
     * @brief Reduces detected maxima to one systolic peak per beat.
     * A candidate is dropped when its rise from the lowest sample since the
     * previous candidate is under prominence_ratio of the largest rise in the
     * window (dicrotic waves). Within refractory samples of a kept peak only
     * the higher one survives; on equal height the earlier one is kept.
     * @param indices Ascending output of detect() on the same signal.
     */
    static std::vector<std::size_t> select_beats(const std::vector<double>& signal,
                                                 const std::vector<std::size_t>& indices,
                                                 std::size_t refractory,
                                                 double prominence_ratio = 0.5);

    /**
     * @brief Attaches timestamps and amplitudes to detected indices.
     * @param timestamps_ms Per-sample timestamps aligned with signal.
     */
    static std::vector<Peak> to_peaks(const std::vector<std::size_t>& indices,
                                      const std::vector<double>& signal,
                                      const std::vector<double>& timestamps_ms);

    /**
     * @brief Successive peak-to-peak intervals in milliseconds.
     */
    static std::vector<double> intervals_ms(const std::vector<Peak>& peaks);

    std::size_t window_radius() const { return m_radius; }
    double threshold() const { return m_threshold; }

private:
    std::size_t m_radius;
    double m_threshold;
};

/**
 * @brief Free-function form of PeakDetector::detect.
 */
std::vector<std::size_t> detect_peaks(const std::vector<double>& signal, std::size_t window_radius, double threshold);
