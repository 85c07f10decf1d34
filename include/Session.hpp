#pragma once
#include <chrono>
#include <deque>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Config.hpp"
#include "FeatureExtractor.hpp"
#include "FrequencyAnalyzer.hpp"
#include "PeakDetector.hpp"
#include "SessionExporter.hpp"
#include "SignalFilter.hpp"
#include "SignalQuality.hpp"
#include "VitalsEstimator.hpp"
#include "VitalsValidator.hpp"
#include "Vitals.hpp"

enum class FrameOutcome { Accepted, Rejected, NoEstimate, Dropped };

std::string_view to_string(FrameOutcome outcome);

/**
 * @struct FrameResult
 * @brief What one frame produced. vitals always holds displayable values.
 */
struct FrameResult {
    double timestamp_ms{0.0};
    ValidatedVitals vitals;
    FrameOutcome outcome{FrameOutcome::NoEstimate};
    std::vector<Issue> issues;
    RawVitalsEstimate estimate;
    std::optional<PPGFeatureSet> features;
    double quality{0.0};
    std::size_t peak_count{0};      // systolic beats in the window
    bool pressure_measured{false};  // false: vitals carry the stored or fallback pair
};

/**
 * @class Session
 * @brief One measurement: owns the sample ring buffer, peak list, interval and
 * transit histories and the validator state. Nothing is shared between sessions.
 */
class Session {
public:
    using ResultCallback = std::function<void(const FrameResult&)>;

    /**
     * @param config Pipeline configuration; copied.
     * @throws std::invalid_argument on an unusable filter or sample rate.
     */
    explicit Session(const AppConfig& config);

    /**
     * @brief Ingests one sample and runs the pipeline for it.
     * A push made while a frame is still being processed (from the result
     * callback) is dropped.
     * @return std::expected containing the frame result, or an error for a
     * stopped session or a non-increasing timestamp.
     */
    std::expected<FrameResult, std::string> push(const RawSample& sample);

    /**
     * @brief Most recent frame result (fallback vitals before the first frame).
     */
    const FrameResult& latest() const { return m_latest; }

    /**
     * @brief Registers the per-frame notification. Dropped frames do not notify.
     */
    void on_result(ResultCallback cb) { m_callback = std::move(cb); }

    /**
     * @brief Halts ingestion and discards every session-owned buffer.
     */
    void stop();
    bool stopped() const { return m_stopped; }

    /**
     * @brief Builds the export record from the retained raw history, then stops.
     */
    SessionRecord finish(std::optional<EnvironmentConditions> environment = std::nullopt);

    const ValidatorState& validator_state() const { return m_state; }
    const std::vector<Peak>& peaks() const { return m_peaks; }
    std::vector<double> interval_history() const { return {m_intervals.begin(), m_intervals.end()}; }
    std::vector<double> transit_history() const { return {m_transits.begin(), m_transits.end()}; }
    std::size_t buffer_size() const { return m_red.buffer_size(); }
    std::size_t window_size() const { return m_red.capacity(); }
    std::size_t dropped_frames() const { return m_dropped; }

private:
    FrameResult process(const RawSample& sample);
    bool record_beats();
    void update_cycle(const std::vector<double>& filtered, const std::vector<std::size_t>& indices,
                      FrameResult& result);
    std::vector<std::size_t> beat_indices(const std::vector<double>& filtered,
                                          const std::vector<SpectrumBin>& spectrum) const;
    EstimatorInputs gather_inputs() const;
    void finalize(FrameResult& result);

    AppConfig m_cfg;
    double m_fs;
    double m_min_interval_ms;
    double m_max_interval_ms;

    SignalFilter m_red;
    std::deque<std::optional<double>> m_ir;
    std::deque<double> m_timestamps;
    PeakDetector m_detector;
    FrequencyAnalyzer m_analyzer;
    FeatureExtractor m_extractor;
    VitalsEstimator m_estimator;
    VitalsValidator m_validator;
    SignalQuality m_quality;

    ValidatorState m_state;
    std::vector<Peak> m_peaks;
    std::vector<double> m_window_intervals;
    std::vector<SpectrumBin> m_spectrum;
    std::deque<double> m_intervals;
    std::deque<double> m_transits;
    std::optional<double> m_last_beat_ms;
    std::optional<PPGFeatureSet> m_last_features;
    std::optional<double> m_last_timestamp;
    std::deque<double> m_raw_history;

    FrameResult m_latest;
    ResultCallback m_callback;
    bool m_processing{false};
    bool m_stopped{false};

    std::chrono::system_clock::time_point m_created_at;
    std::size_t m_frames{0};
    std::size_t m_accepted{0};
    std::size_t m_rejected{0};
    std::size_t m_no_estimate{0};
    std::size_t m_low_quality{0};
    std::size_t m_dropped{0};
    std::size_t m_beats{0};
    double m_quality_sum{0.0};
    double m_confidence_sum{0.0};
};
