#pragma once
#include <optional>
#include <string_view>
#include <vector>

/**
 * @struct RawSample
 * @brief One per-frame multi-channel intensity reading.
 * Timestamps are steady-clock milliseconds and strictly increasing per session.
 */
struct RawSample {
    double timestamp_ms{0.0};
    double red{0.0};
    std::optional<double> ir;
    std::optional<double> ambient;
};

/**
 * @brief Stage-local failure kinds. None of them are fatal; each one turns
 * into "no output this frame" at the stage that raised it.
 */
enum class Issue {
    InsufficientSamples,
    NoNotchFound,
    DegenerateInterval,
    OutOfRangeEstimate,
    UpstreamAcquisitionFailure,
    LowSignalQuality
};

std::string_view to_string(Issue issue);

enum class ArrhythmiaType { Normal, Bradycardia, Tachycardia, Irregular };

std::string_view to_string(ArrhythmiaType type);

struct HrvMetrics {
    bool has_arrhythmia{false};
    ArrhythmiaType type{ArrhythmiaType::Normal};
    double sdnn{0.0};
    double rmssd{0.0};
    double pnn50{0.0};
    std::optional<double> lfhf;
};

/**
 * @struct RawVitalsEstimate
 * @brief Unvalidated estimator output. Absent fields had insufficient data.
 */
struct RawVitalsEstimate {
    std::optional<double> bpm;
    std::optional<double> spo2;
    std::optional<double> systolic;
    std::optional<double> diastolic;
    std::optional<HrvMetrics> hrv;
    double confidence{0.0};
};

struct ValidatedVitals {
    double bpm{0.0};
    double systolic{0.0};
    double diastolic{0.0};
};
