#include "FrequencyAnalyzer.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <numeric>
#include <cmath>
#include <stdexcept>

FrequencyAnalyzer::FrequencyAnalyzer(double sampling_rate_hz, bool hamming_window)
    : m_fs(sampling_rate_hz), m_hamming(hamming_window) {
    if (!(sampling_rate_hz > 0.0)) {
        throw std::invalid_argument("FrequencyAnalyzer sampling rate must be positive");
    }
}

std::size_t FrequencyAnalyzer::padded_length(std::size_t n) {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

std::vector<SpectrumBin> FrequencyAnalyzer::transform(const std::vector<double>& signal) const {
    if (signal.size() < 2) {
        return {};
    }
    const std::size_t n = signal.size();
    const std::size_t N = padded_length(n);

    // 1. Copy into a zero-padded buffer
    std::vector<double> H(N, 0.0);
    std::copy(signal.begin(), signal.end(), H.begin());

    // 2. Mean removal and Hamming window over the real samples only
    if (m_hamming) {
        const double mean = std::accumulate(signal.begin(), signal.end(), 0.0) / static_cast<double>(n);
        for (std::size_t i = 0; i < n; ++i) {
            H[i] = (H[i] - mean) * (0.54 - 0.46 * std::cos(2.0 * CV_PI * i / (n - 1)));
        }
    }

    // 3. FFT Analysis
    cv::Mat planes[] = { cv::Mat_<double>(H), cv::Mat::zeros(static_cast<int>(N), 1, CV_64F) }, complex;
    cv::merge(planes, 2, complex);
    cv::dft(complex, complex);
    cv::split(complex, planes);
    cv::magnitude(planes[0], planes[1], planes[0]);

    std::vector<SpectrumBin> spectrum;
    spectrum.reserve(N / 2);
    for (std::size_t k = 0; k < N / 2; ++k) {
        spectrum.push_back({k * m_fs / static_cast<double>(N), planes[0].at<double>(static_cast<int>(k))});
    }
    return spectrum;
}

std::optional<SpectrumBin> FrequencyAnalyzer::dominant_bin(const std::vector<SpectrumBin>& spectrum,
                                                           double min_hz, double max_hz) {
    std::optional<SpectrumBin> best;
    for (std::size_t k = 1; k < spectrum.size(); ++k) {
        const auto& bin = spectrum[k];
        if (bin.frequency < min_hz || bin.frequency > max_hz) {
            continue;
        }
        if (!best || bin.magnitude > best->magnitude) {
            best = bin;
        }
    }
    if (best && !(best->magnitude > 0.0)) {
        return std::nullopt;
    }
    return best;
}

double FrequencyAnalyzer::band_power(const std::vector<SpectrumBin>& spectrum, double low_hz, double high_hz) {
    double power = 0.0;
    for (const auto& bin : spectrum) {
        if (bin.frequency >= low_hz && bin.frequency < high_hz) {
            power += bin.magnitude * bin.magnitude;
        }
    }
    return power;
}
