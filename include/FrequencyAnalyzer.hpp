#pragma once
#include <cstddef>
#include <optional>
#include <vector>

struct SpectrumBin {
    double frequency{0.0};
    double magnitude{0.0};
};

/**
 * @class FrequencyAnalyzer
 * @brief Magnitude spectrum of a window via a power-of-two DFT.
 */
class FrequencyAnalyzer {
public:
    /**
     * @param sampling_rate_hz Rate of the analysed signal.
     * @param hamming_window Remove the mean and apply a Hamming window before the transform.
     */
    explicit FrequencyAnalyzer(double sampling_rate_hz, bool hamming_window = false);

    /**
     * @brief Zero-pads to the next power of two N and transforms.
     * @return N/2 bins ascending by frequency, bin k at k * fs / N.
     * Empty for inputs shorter than two samples.
     */
    std::vector<SpectrumBin> transform(const std::vector<double>& signal) const;

    /**
     * @brief Strongest non-DC bin whose frequency lies in [min_hz, max_hz].
     */
    static std::optional<SpectrumBin> dominant_bin(const std::vector<SpectrumBin>& spectrum,
                                                   double min_hz, double max_hz);

    /**
     * @brief Sum of squared magnitudes over bins in [low_hz, high_hz).
     */
    static double band_power(const std::vector<SpectrumBin>& spectrum, double low_hz, double high_hz);

    static std::size_t padded_length(std::size_t n);

    double sampling_rate() const { return m_fs; }

private:
    double m_fs;
    bool m_hamming;
};
