#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/**
 * @struct FilterProfile
 * @brief Filter and detector settings tuned for one class of capture device.
 */
struct FilterProfile {
    double alpha{0.2};
    bool detrend{true};
    std::size_t window_radius{5};
    double threshold{0.6};
};

struct ValueRange {
    double min;
    double max;
};

/**
 * @struct Sensitivity
 * @brief Multipliers applied to the tunable parameter of each stage.
 */
struct Sensitivity {
    double brightness{1.0};           // all raw channels
    double red_intensity{1.0};        // raw red channel
    double signal_amplification{1.0}; // filtered waveform
    double noise_reduction{1.0};      // divides the filter alpha
    double peak_detection{1.0};       // peak threshold
    double heartbeat_threshold{1.0};  // minimum feature confidence
    double response_time{1.0};        // analysis window length
    double signal_stability{1.0};     // quality threshold
};

/** spo2 = c0 + c1 * R + c2 * R^2 */
struct Spo2Calibration {
    double c0{0.0};
    double c1{0.0};
    double c2{0.0};
};

/** value = intercept + ptt * transit_ms + aix * AIx + si * SI */
struct PressureModel {
    double intercept{0.0};
    double ptt{0.0};
    double aix{0.0};
    double si{0.0};
};

struct PressureCalibration {
    PressureModel systolic;
    PressureModel diastolic;
};

/**
 * @struct AppConfig
 * @brief Runtime configuration loaded from YAML. Every key has a default.
 */
struct AppConfig {
    struct {
        double fps{30.0};
        double acquisition_fps{30.0};
        cv::Rect frame_roi;
        std::string source{"0"};
    } camera;

    struct Analysis {
        double sample_rate_hz{30.0};
        double window_seconds{10.0};
        std::string filter_profile_name{"torch"};
        FilterProfile filter_profile;
        std::map<std::string, FilterProfile> filter_profiles;
        std::size_t peak_window_radius{5}; // from the profile unless set
        double peak_threshold{0.6};
        bool hamming_window{true};
        double min_bpm{40.0};
        double max_bpm{200.0};
        std::size_t interval_history{64};
        std::size_t transit_history{16};
    } analysis;

    Sensitivity sensitivity;

    struct Quality {
        bool enabled{true};
        double min_intensity{50.0};
        double max_intensity{255.0};
        ValueRange optimal{150.0, 230.0};
        double threshold{0.15};
        double min_red{20.0};
    } quality;

    struct Features {
        ValueRange augmentation{0.1, 0.4};
        ValueRange reflection{0.2, 0.7};
        ValueRange stiffness{5.0, 15.0};
        double min_confidence{0.5};
    } features;

    struct Hrv {
        std::size_t min_intervals{5};
        std::size_t min_intervals_lfhf{16};
        double resample_hz{4.0};
        double cv_threshold{0.2};
        double rmssd_threshold_ms{80.0};
        double bradycardia_bpm{60.0};
        double tachycardia_bpm{100.0};
    };

    struct Estimator {
        std::optional<Spo2Calibration> spo2;
        std::optional<PressureCalibration> blood_pressure;
        std::size_t min_transit_samples{3};
        double spectral_tolerance_bpm{10.0};
        Hrv hrv;
    } estimator;

    struct Validator {
        ValueRange bpm{40.0, 200.0};
        ValueRange systolic{80.0, 200.0};
        ValueRange diastolic{40.0, 130.0};
        double fallback_bpm{0.0};
        double fallback_systolic{120.0};
        double fallback_diastolic{80.0};
    } validator;

    struct {
        std::string path;
        std::size_t max_samples{18000};
    } record;

    struct {
        std::string level{"info"};
    } logging;

    /** @brief Analysis window length in samples after the response_time multiplier. */
    std::size_t window_samples() const;

    /** @brief Active filter profile with the noise_reduction multiplier applied. */
    FilterProfile effective_filter_profile() const;

    /**
     * @brief Parses a YAML file into the struct.
     * @return std::expected containing config or error string.
     */
    static std::expected<AppConfig, std::string> load(const std::string& path);

    /**
     * @brief Parses YAML text into the struct.
     * @return std::expected containing config or error string.
     */
    static std::expected<AppConfig, std::string> parse(const std::string& text);
};
