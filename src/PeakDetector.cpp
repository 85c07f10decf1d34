#include "PeakDetector.hpp"
#include <algorithm>

PeakDetector::PeakDetector(std::size_t window_radius, double threshold)
    : m_radius(window_radius), m_threshold(threshold) {}

std::vector<std::size_t> PeakDetector::detect(const std::vector<double>& signal) const {
    std::vector<std::size_t> peaks;
    const std::size_t n = signal.size();
    const std::size_t r = m_radius;
    if (n < 2 * r + 1) {
        return peaks;
    }

    for (std::size_t i = r; i + r < n; ++i) {
        const double v = signal[i];
        if (!(v > m_threshold)) {
            continue;
        }
        const auto first = signal.begin() + static_cast<std::ptrdiff_t>(i - r);
        const auto last = signal.begin() + static_cast<std::ptrdiff_t>(i + r + 1);
        if (v == *std::max_element(first, last)) {
            peaks.push_back(i);
        }
    }
    return peaks;
}

std::vector<std::size_t> PeakDetector::select_beats(const std::vector<double>& signal,
                                                    const std::vector<std::size_t>& indices,
                                                    std::size_t refractory,
                                                    double prominence_ratio) {
    std::vector<std::size_t> beats;
    if (indices.empty() || indices.back() >= signal.size()) {
        return beats;
    }

    // 1. Rise of each candidate above the trough since the previous one
    std::vector<double> rise;
    rise.reserve(indices.size());
    std::size_t from = 0;
    for (std::size_t idx : indices) {
        const auto trough = std::min_element(signal.begin() + static_cast<std::ptrdiff_t>(from),
                                             signal.begin() + static_cast<std::ptrdiff_t>(idx + 1));
        rise.push_back(signal[idx] - *trough);
        from = idx;
    }
    const double cutoff = prominence_ratio * *std::max_element(rise.begin(), rise.end());

    // 2. Refractory period around each kept beat
    for (std::size_t k = 0; k < indices.size(); ++k) {
        const std::size_t idx = indices[k];
        if (rise[k] < cutoff) {
            continue;
        }
        if (!beats.empty() && idx - beats.back() < refractory) {
            if (signal[idx] > signal[beats.back()]) {
                beats.back() = idx;
            }
            continue;
        }
        beats.push_back(idx);
    }
    return beats;
}

std::vector<Peak> PeakDetector::to_peaks(const std::vector<std::size_t>& indices,
                                         const std::vector<double>& signal,
                                         const std::vector<double>& timestamps_ms) {
    std::vector<Peak> out;
    out.reserve(indices.size());
    for (std::size_t idx : indices) {
        if (idx >= signal.size() || idx >= timestamps_ms.size()) {
            continue;
        }
        out.push_back({idx, timestamps_ms[idx], signal[idx]});
    }
    return out;
}

std::vector<double> PeakDetector::intervals_ms(const std::vector<Peak>& peaks) {
    std::vector<double> out;
    for (std::size_t i = 1; i < peaks.size(); ++i) {
        out.push_back(peaks[i].timestamp_ms - peaks[i - 1].timestamp_ms);
    }
    return out;
}

std::vector<std::size_t> detect_peaks(const std::vector<double>& signal, std::size_t window_radius, double threshold) {
    return PeakDetector(window_radius, threshold).detect(signal);
}
