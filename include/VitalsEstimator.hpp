#pragma once
#include <optional>
#include <utility>
#include <vector>
#include "Config.hpp"
#include "FeatureExtractor.hpp"
#include "FrequencyAnalyzer.hpp"
#include "Vitals.hpp"

/**
 * @struct ChannelAmplitude
 * @brief Pulsatile (AC) and steady (DC) components of one colour channel.
 */
struct ChannelAmplitude {
    double ac{0.0};
    double dc{0.0};

    /** AC as half the peak-to-peak range, DC as the mean. */
    static ChannelAmplitude from_samples(const std::vector<double>& samples);
};

struct EstimatorInputs {
    std::vector<double> intervals_ms;        // current window
    std::vector<double> interval_history_ms; // accumulated over the session
    ChannelAmplitude red;
    std::optional<ChannelAmplitude> ir;
    std::vector<double> transit_times_ms;
    std::optional<PPGFeatureSet> features;
    std::vector<SpectrumBin> spectrum;
};

/**
 * @class VitalsEstimator
 * @brief Turns intervals, channel amplitudes, transit times and morphology
 * into raw heart rate, SpO2, pressure and HRV estimates.
 */
class VitalsEstimator {
public:
    /**
     * @param config Calibration, HRV rules and tolerances.
     * @param min_bpm Lower edge of the heart-rate band used for the spectral cross-check.
     * @param max_bpm Upper edge of that band.
     * @param min_feature_confidence Morphology below this confidence is treated as missing.
     */
    VitalsEstimator(const AppConfig::Estimator& config, double min_bpm, double max_bpm,
                    double min_feature_confidence);

    RawVitalsEstimate estimate(const EstimatorInputs& in) const;

    /** @brief 60000 / mean interval; absent with fewer than two intervals. */
    static std::optional<double> bpm(const std::vector<double>& intervals_ms);

    std::optional<double> spo2(const ChannelAmplitude& red, const std::optional<ChannelAmplitude>& ir) const;

    /**
     * @brief Systolic and diastolic pressure from the configured regression.
     */
    std::optional<std::pair<double, double>> pressure(const std::vector<double>& transit_times_ms,
                                                      const std::optional<PPGFeatureSet>& features) const;

    /** @brief Time-domain, LF/HF and arrhythmia class over the interval history. */
    std::optional<HrvMetrics> hrv(const std::vector<double>& history_ms) const;

    /**
     * @brief LF (0.04-0.15 Hz) over HF (0.15-0.40 Hz) power of the
     * resampled interval series.
     */
    std::optional<double> lf_hf(const std::vector<double>& history_ms) const;

private:
    AppConfig::Estimator m_cfg;
    double m_min_bpm;
    double m_max_bpm;
    double m_min_feature_confidence;
};
