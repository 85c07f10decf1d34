#include "Config.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {
template <typename T>
T get(const YAML::Node& parent, const char* key, T fallback) {
    if (!parent || !parent.IsMap()) {
        return fallback;
    }
    const YAML::Node child = parent[key];
    if (!child) {
        return fallback;
    }
    return child.as<T>();
}

ValueRange get_range(const YAML::Node& parent, const char* key, ValueRange fallback) {
    if (!parent || !parent.IsMap() || !parent[key]) {
        return fallback;
    }
    auto v = parent[key].as<std::vector<double>>();
    if (v.size() != 2) {
        throw std::runtime_error(std::string("'") + key + "' must be a [min, max] pair");
    }
    return {v[0], v[1]};
}

FilterProfile parse_profile(const YAML::Node& node, FilterProfile fallback) {
    FilterProfile p;
    p.alpha = get(node, "alpha", fallback.alpha);
    p.detrend = get(node, "detrend", fallback.detrend);
    p.window_radius = get<std::size_t>(node, "window_radius", fallback.window_radius);
    p.threshold = get(node, "threshold", fallback.threshold);
    return p;
}

PressureModel parse_pressure_model(const YAML::Node& node) {
    PressureModel m;
    m.intercept = get(node, "intercept", 0.0);
    m.ptt = get(node, "ptt", 0.0);
    m.aix = get(node, "aix", 0.0);
    m.si = get(node, "si", 0.0);
    return m;
}

std::expected<void, std::string> validate(const AppConfig& c) {
    const auto ordered = [](const ValueRange& r) { return r.min < r.max; };
    if (c.analysis.sample_rate_hz <= 0.0) {
        return std::unexpected("analysis.sample_rate_hz must be positive");
    }
    if (c.analysis.window_seconds <= 0.0) {
        return std::unexpected("analysis.window_seconds must be positive");
    }
    if (c.analysis.peak_window_radius < 1) {
        return std::unexpected("analysis.peak_window_radius must be at least 1");
    }
    if (!(c.analysis.min_bpm > 0.0 && c.analysis.min_bpm < c.analysis.max_bpm)) {
        return std::unexpected("analysis.min_bpm must be positive and below max_bpm");
    }
    for (const auto& [name, profile] : c.analysis.filter_profiles) {
        if (!(profile.alpha > 0.0 && profile.alpha <= 1.0)) {
            return std::unexpected("filter profile '" + name + "': alpha must be in (0, 1]");
        }
    }
    if (!(c.analysis.filter_profile.alpha > 0.0 && c.analysis.filter_profile.alpha <= 1.0)) {
        return std::unexpected("analysis.filter_profile: alpha must be in (0, 1]");
    }
    if (!ordered(c.validator.bpm) || !ordered(c.validator.systolic) || !ordered(c.validator.diastolic)) {
        return std::unexpected("validator ranges must satisfy min < max");
    }
    if (c.validator.fallback_systolic <= c.validator.fallback_diastolic) {
        return std::unexpected("validator fallback systolic must exceed fallback diastolic");
    }
    if (!ordered(c.features.augmentation) || !ordered(c.features.reflection) || !ordered(c.features.stiffness)) {
        return std::unexpected("feature ranges must satisfy min < max");
    }
    if (c.sensitivity.noise_reduction <= 0.0 || c.sensitivity.response_time <= 0.0) {
        return std::unexpected("sensitivity noise_reduction and response_time must be positive");
    }
    if (c.estimator.hrv.resample_hz <= 0.0) {
        return std::unexpected("estimator.hrv.resample_hz must be positive");
    }
    return {};
}

std::expected<AppConfig, std::string> from_node(const YAML::Node& node) {
    AppConfig c;

    const YAML::Node camera = node["camera"];
    c.camera.fps = get(camera, "fps", 30.0);
    c.camera.acquisition_fps = get(camera, "acquisition_fps", c.camera.fps);
    c.camera.acquisition_fps = std::clamp(c.camera.acquisition_fps, 1.0, 240.0);
    c.camera.source = get(camera, "source", std::string("0"));
    if (camera && camera["frame_roi"]) {
        auto roi = camera["frame_roi"].as<std::vector<int>>();
        if (roi.size() != 4) {
            return std::unexpected("camera.frame_roi must have 4 entries");
        }
        c.camera.frame_roi = cv::Rect(roi[0], roi[1], roi[2], roi[3]);
    }

    const YAML::Node analysis = node["analysis"];
    c.analysis.sample_rate_hz = get(analysis, "sample_rate_hz", 30.0);
    c.analysis.window_seconds = get(analysis, "window_seconds", 10.0);
    c.analysis.hamming_window = get(analysis, "spectrum_window", std::string("hamming")) == "hamming";
    c.analysis.min_bpm = get(analysis, "min_bpm", 40.0);
    c.analysis.max_bpm = get(analysis, "max_bpm", 200.0);
    c.analysis.interval_history = get<std::size_t>(analysis, "interval_history", 64);
    c.analysis.transit_history = get<std::size_t>(analysis, "transit_history", 16);

    // Built-in capture profiles; entries under filter_profiles override or extend them.
    c.analysis.filter_profiles = {
        {"torch", FilterProfile{0.2, true, 5, 0.6}},
        {"webcam", FilterProfile{0.3, false, 3, 0.5}},
    };
    if (analysis && analysis["filter_profiles"]) {
        for (const auto& entry : analysis["filter_profiles"]) {
            c.analysis.filter_profiles[entry.first.as<std::string>()] =
                parse_profile(entry.second, FilterProfile{});
        }
    }
    const YAML::Node profile = analysis ? analysis["filter_profile"] : YAML::Node();
    if (profile && profile.IsMap()) {
        c.analysis.filter_profile_name = "inline";
        c.analysis.filter_profile = parse_profile(profile, FilterProfile{});
    } else {
        c.analysis.filter_profile_name = profile ? profile.as<std::string>() : std::string("torch");
        auto it = c.analysis.filter_profiles.find(c.analysis.filter_profile_name);
        if (it == c.analysis.filter_profiles.end()) {
            return std::unexpected("Unknown filter profile: " + c.analysis.filter_profile_name);
        }
        c.analysis.filter_profile = it->second;
    }
    // Explicit detector keys override the profile's own settings.
    c.analysis.peak_window_radius =
        get<std::size_t>(analysis, "peak_window_radius", c.analysis.filter_profile.window_radius);
    c.analysis.peak_threshold = get(analysis, "peak_threshold", c.analysis.filter_profile.threshold);

    const YAML::Node s = node["sensitivity"];
    c.sensitivity.brightness = get(s, "brightness", 1.0);
    c.sensitivity.red_intensity = get(s, "red_intensity", 1.0);
    c.sensitivity.signal_amplification = get(s, "signal_amplification", 1.0);
    c.sensitivity.noise_reduction = get(s, "noise_reduction", 1.0);
    c.sensitivity.peak_detection = get(s, "peak_detection", 1.0);
    c.sensitivity.heartbeat_threshold = get(s, "heartbeat_threshold", 1.0);
    c.sensitivity.response_time = get(s, "response_time", 1.0);
    c.sensitivity.signal_stability = get(s, "signal_stability", 1.0);

    const YAML::Node q = node["quality"];
    c.quality.enabled = get(q, "enabled", true);
    c.quality.min_intensity = get(q, "min_intensity", 50.0);
    c.quality.max_intensity = get(q, "max_intensity", 255.0);
    c.quality.optimal = get_range(q, "optimal", c.quality.optimal);
    c.quality.threshold = get(q, "threshold", 0.15);
    c.quality.min_red = get(q, "min_red", 20.0);

    const YAML::Node f = node["features"];
    c.features.augmentation = get_range(f, "augmentation_index", c.features.augmentation);
    c.features.reflection = get_range(f, "reflection_index", c.features.reflection);
    c.features.stiffness = get_range(f, "stiffness_index", c.features.stiffness);
    c.features.min_confidence = get(f, "min_confidence", 0.5);

    const YAML::Node e = node["estimator"];
    c.estimator.min_transit_samples = get<std::size_t>(e, "min_transit_samples", 3);
    c.estimator.spectral_tolerance_bpm = get(e, "spectral_tolerance_bpm", 10.0);
    const YAML::Node hrv = e ? e["hrv"] : YAML::Node();
    c.estimator.hrv.min_intervals = get<std::size_t>(hrv, "min_intervals", 5);
    c.estimator.hrv.min_intervals_lfhf = get<std::size_t>(hrv, "min_intervals_lfhf", 16);
    c.estimator.hrv.resample_hz = get(hrv, "resample_hz", 4.0);
    c.estimator.hrv.cv_threshold = get(hrv, "cv_threshold", 0.2);
    c.estimator.hrv.rmssd_threshold_ms = get(hrv, "rmssd_threshold_ms", 80.0);
    c.estimator.hrv.bradycardia_bpm = get(hrv, "bradycardia_bpm", 60.0);
    c.estimator.hrv.tachycardia_bpm = get(hrv, "tachycardia_bpm", 100.0);

    // Calibration is opt-in: without it SpO2 and pressure stay absent.
    const YAML::Node cal = node["calibration"];
    if (cal && cal["spo2"]) {
        Spo2Calibration sp;
        sp.c0 = get(cal["spo2"], "c0", 0.0);
        sp.c1 = get(cal["spo2"], "c1", 0.0);
        sp.c2 = get(cal["spo2"], "c2", 0.0);
        c.estimator.spo2 = sp;
    }
    if (cal && cal["blood_pressure"]) {
        const YAML::Node bp = cal["blood_pressure"];
        if (!bp["systolic"] || !bp["diastolic"]) {
            return std::unexpected("calibration.blood_pressure needs systolic and diastolic models");
        }
        c.estimator.blood_pressure = PressureCalibration{
            parse_pressure_model(bp["systolic"]), parse_pressure_model(bp["diastolic"])};
    }

    const YAML::Node v = node["validator"];
    c.validator.bpm = get_range(v, "bpm", c.validator.bpm);
    c.validator.systolic = get_range(v, "systolic", c.validator.systolic);
    c.validator.diastolic = get_range(v, "diastolic", c.validator.diastolic);
    c.validator.fallback_bpm = get(v, "fallback_bpm", 0.0);
    c.validator.fallback_systolic = get(v, "fallback_systolic", 120.0);
    c.validator.fallback_diastolic = get(v, "fallback_diastolic", 80.0);

    const YAML::Node r = node["record"];
    c.record.path = get(r, "path", std::string());
    c.record.max_samples = get<std::size_t>(r, "max_samples", 18000);

    c.logging.level = get(node["logging"], "level", std::string("info"));
    std::transform(c.logging.level.begin(), c.logging.level.end(), c.logging.level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (auto ok = validate(c); !ok) {
        return std::unexpected(ok.error());
    }
    return c;
}
} // namespace

std::size_t AppConfig::window_samples() const {
    const double seconds = analysis.window_seconds * sensitivity.response_time;
    return std::max<std::size_t>(
        2 * analysis.peak_window_radius + 1,
        static_cast<std::size_t>(std::lround(seconds * analysis.sample_rate_hz)));
}

FilterProfile AppConfig::effective_filter_profile() const {
    FilterProfile p = analysis.filter_profile;
    p.alpha = std::clamp(p.alpha / sensitivity.noise_reduction, 1e-3, 1.0);
    return p;
}

std::expected<AppConfig, std::string> AppConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("Config missing: " + path);
    }
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

std::expected<AppConfig, std::string> AppConfig::parse(const std::string& text) {
    try {
        return from_node(YAML::Load(text));
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}
