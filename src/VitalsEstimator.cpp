#include "VitalsEstimator.hpp"
#include "Scoring.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>

namespace {
double mean(const std::vector<double>& v) {
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double std_pop(const std::vector<double>& v) {
    const double m = mean(v);
    double sq = 0.0;
    for (double x : v) sq += (x - m) * (x - m);
    return std::sqrt(sq / static_cast<double>(v.size()));
}
} // namespace

ChannelAmplitude ChannelAmplitude::from_samples(const std::vector<double>& samples) {
    if (samples.empty()) {
        return {};
    }
    const auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
    return {(*hi - *lo) / 2.0, mean(samples)};
}

VitalsEstimator::VitalsEstimator(const AppConfig::Estimator& config, double min_bpm, double max_bpm,
                                 double min_feature_confidence)
    : m_cfg(config), m_min_bpm(min_bpm), m_max_bpm(max_bpm),
      m_min_feature_confidence(min_feature_confidence) {}

std::optional<double> VitalsEstimator::bpm(const std::vector<double>& intervals_ms) {
    if (intervals_ms.size() < 2) {
        return std::nullopt;
    }
    const double m = mean(intervals_ms);
    if (!(m > 0.0)) {
        return std::nullopt;
    }
    return 60000.0 / m;
}

std::optional<double> VitalsEstimator::spo2(const ChannelAmplitude& red,
                                            const std::optional<ChannelAmplitude>& ir) const {
    if (!m_cfg.spo2 || !ir) {
        return std::nullopt;
    }
    if (red.dc <= 0.0 || ir->dc <= 0.0 || red.ac <= 0.0 || ir->ac <= 0.0) {
        return std::nullopt;
    }
    // Ratio of ratios through the configured calibration curve
    const double R = (red.ac / red.dc) / (ir->ac / ir->dc);
    const auto& c = *m_cfg.spo2;
    const double value = c.c0 + c.c1 * R + c.c2 * R * R;
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return std::clamp(value, 0.0, 100.0);
}

std::optional<std::pair<double, double>> VitalsEstimator::pressure(
    const std::vector<double>& transit_times_ms, const std::optional<PPGFeatureSet>& features) const {
    if (!m_cfg.blood_pressure) {
        return std::nullopt;
    }
    const auto& sys = m_cfg.blood_pressure->systolic;
    const auto& dia = m_cfg.blood_pressure->diastolic;

    double ptt = 0.0;
    if (sys.ptt != 0.0 || dia.ptt != 0.0) {
        if (transit_times_ms.empty() || transit_times_ms.size() < m_cfg.min_transit_samples) {
            return std::nullopt;
        }
        ptt = mean(transit_times_ms);
    }

    double aix = 0.0;
    double si = 0.0;
    if (sys.aix != 0.0 || sys.si != 0.0 || dia.aix != 0.0 || dia.si != 0.0) {
        if (!features || features->confidence < m_min_feature_confidence) {
            return std::nullopt;
        }
        aix = features->augmentation_index;
        si = features->stiffness_index;
    }

    const auto eval = [&](const PressureModel& m) {
        return m.intercept + m.ptt * ptt + m.aix * aix + m.si * si;
    };
    const double systolic = eval(sys);
    const double diastolic = eval(dia);
    if (!std::isfinite(systolic) || !std::isfinite(diastolic)) {
        return std::nullopt;
    }
    return std::make_pair(systolic, diastolic);
}

std::optional<double> VitalsEstimator::lf_hf(const std::vector<double>& history_ms) const {
    const auto& h = m_cfg.hrv;
    if (history_ms.size() < std::max<std::size_t>(h.min_intervals_lfhf, 2)) {
        return std::nullopt;
    }

    // 1. Beat times in seconds
    std::vector<double> t(history_ms.size());
    double acc = 0.0;
    for (std::size_t i = 0; i < history_ms.size(); ++i) {
        acc += history_ms[i] / 1000.0;
        t[i] = acc;
    }

    // 2. Linear resampling onto an even grid
    const double span = t.back() - t.front();
    const auto count = static_cast<std::size_t>(std::floor(span * h.resample_hz)) + 1;
    if (count < 2) {
        return std::nullopt;
    }
    std::vector<double> series(count);
    std::size_t j = 0;
    for (std::size_t k = 0; k < count; ++k) {
        const double tk = t.front() + static_cast<double>(k) / h.resample_hz;
        while (j + 2 < t.size() && t[j + 1] < tk) ++j;
        const double dt = t[j + 1] - t[j];
        const double w = dt > 0.0 ? std::clamp((tk - t[j]) / dt, 0.0, 1.0) : 0.0;
        series[k] = history_ms[j] + w * (history_ms[j + 1] - history_ms[j]);
    }

    // 3. Band powers
    const FrequencyAnalyzer analyzer(h.resample_hz, true);
    const auto spectrum = analyzer.transform(series);
    const double lf = FrequencyAnalyzer::band_power(spectrum, 0.04, 0.15);
    const double hf = FrequencyAnalyzer::band_power(spectrum, 0.15, 0.40);
    if (hf <= 1e-12) {
        return std::nullopt;
    }
    return lf / hf;
}

std::optional<HrvMetrics> VitalsEstimator::hrv(const std::vector<double>& history_ms) const {
    const auto& h = m_cfg.hrv;
    if (history_ms.size() < std::max<std::size_t>(h.min_intervals, 2)) {
        return std::nullopt;
    }
    const double m = mean(history_ms);
    if (!(m > 0.0)) {
        return std::nullopt;
    }

    HrvMetrics out;
    out.sdnn = std_pop(history_ms);

    double sumsq = 0.0;
    int over50 = 0;
    for (std::size_t i = 1; i < history_ms.size(); ++i) {
        const double d = history_ms[i] - history_ms[i - 1];
        sumsq += d * d;
        if (std::fabs(d) > 50.0) ++over50;
    }
    const auto diffs = static_cast<double>(history_ms.size() - 1);
    out.rmssd = std::sqrt(sumsq / diffs);
    out.pnn50 = 100.0 * over50 / diffs;
    out.lfhf = lf_hf(history_ms);

    const double cv = out.sdnn / m;
    const double mean_bpm = 60000.0 / m;
    if (cv > h.cv_threshold && out.rmssd > h.rmssd_threshold_ms) {
        out.type = ArrhythmiaType::Irregular;
    } else if (mean_bpm < h.bradycardia_bpm) {
        out.type = ArrhythmiaType::Bradycardia;
    } else if (mean_bpm > h.tachycardia_bpm) {
        out.type = ArrhythmiaType::Tachycardia;
    }
    out.has_arrhythmia = out.type != ArrhythmiaType::Normal;
    return out;
}

RawVitalsEstimate VitalsEstimator::estimate(const EstimatorInputs& in) const {
    RawVitalsEstimate est;
    est.bpm = bpm(in.intervals_ms);
    est.spo2 = spo2(in.red, in.ir);
    if (auto bp = pressure(in.transit_times_ms, in.features)) {
        est.systolic = bp->first;
        est.diastolic = bp->second;
    }
    est.hrv = hrv(in.interval_history_ms);

    if (!est.bpm) {
        est.confidence = 0.0;
        return est;
    }

    // Mean of whichever quality scores are available
    std::vector<double> scores;
    const double m = mean(in.intervals_ms);
    scores.push_back(std::clamp(1.0 - std_pop(in.intervals_ms) / m, 0.0, 1.0));

    if (auto dominant = FrequencyAnalyzer::dominant_bin(in.spectrum, m_min_bpm / 60.0, m_max_bpm / 60.0)) {
        const double spectral_bpm = dominant->frequency * 60.0;
        const double tol = m_cfg.spectral_tolerance_bpm;
        scores.push_back(range_score(spectral_bpm, std::max(1.0, *est.bpm - tol), *est.bpm + tol));
        spdlog::debug("Spectral cross-check: peaks {:.1f} bpm, spectrum {:.1f} bpm (mag {:.3f})",
            *est.bpm, spectral_bpm, dominant->magnitude);
    }
    if (in.features) {
        scores.push_back(in.features->confidence);
    }
    est.confidence = std::clamp(mean(scores), 0.0, 1.0);
    return est;
}
