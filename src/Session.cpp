#include "Session.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
// Fraction of the dominant beat period in which a second peak is not a new beat.
constexpr double kRefractoryFraction = 0.5;

template <typename T>
void push_capped(std::deque<T>& d, T value, std::size_t cap) {
    d.push_back(std::move(value));
    while (d.size() > cap) d.pop_front();
}

struct BusyGuard {
    bool& flag;
    explicit BusyGuard(bool& f) : flag(f) { flag = true; }
    ~BusyGuard() { flag = false; }
};
} // namespace

std::string_view to_string(FrameOutcome outcome) {
    switch (outcome) {
        case FrameOutcome::Accepted: return "Accepted";
        case FrameOutcome::Rejected: return "Rejected";
        case FrameOutcome::NoEstimate: return "NoEstimate";
        case FrameOutcome::Dropped: return "Dropped";
    }
    return "Unknown";
}

Session::Session(const AppConfig& config)
    : m_cfg(config),
      m_fs(config.analysis.sample_rate_hz),
      m_min_interval_ms(60000.0 / config.analysis.max_bpm),
      m_max_interval_ms(60000.0 / config.analysis.min_bpm),
      m_red(config.window_samples(), config.effective_filter_profile()),
      m_detector(config.analysis.peak_window_radius,
                 config.analysis.peak_threshold * config.sensitivity.peak_detection),
      m_analyzer(config.analysis.sample_rate_hz, config.analysis.hamming_window),
      m_extractor(config.features),
      m_estimator(config.estimator, config.analysis.min_bpm, config.analysis.max_bpm,
                  config.features.min_confidence * config.sensitivity.heartbeat_threshold),
      m_validator(config.validator),
      m_quality(config.quality, config.sensitivity.signal_stability),
      m_created_at(std::chrono::system_clock::now()) {
    m_latest.vitals = m_validator.last_valid(m_state);
    spdlog::info("Session started: window {} samples (~{:.1f}s), profile '{}' (alpha {:.3f}, detrend {}), "
        "peaks r={} above {:.2f}", m_red.capacity(), m_red.capacity() / m_fs, m_cfg.analysis.filter_profile_name,
        m_red.profile().alpha, m_red.profile().detrend, m_detector.window_radius(), m_detector.threshold());
}

std::expected<FrameResult, std::string> Session::push(const RawSample& sample) {
    if (m_stopped) {
        return std::unexpected("Session stopped");
    }
    if (m_processing) {
        ++m_dropped;
        FrameResult dropped;
        dropped.timestamp_ms = sample.timestamp_ms;
        dropped.vitals = m_latest.vitals;
        dropped.outcome = FrameOutcome::Dropped;
        spdlog::debug("Frame at {:.1f} ms dropped: previous frame still processing", sample.timestamp_ms);
        return dropped;
    }
    if (!std::isfinite(sample.timestamp_ms) ||
        (m_last_timestamp && !(sample.timestamp_ms > *m_last_timestamp))) {
        spdlog::warn("Out-of-order sample at {:.1f} ms (last {:.1f} ms)",
            sample.timestamp_ms, m_last_timestamp.value_or(0.0));
        return std::unexpected("Sample timestamps must be strictly increasing");
    }
    m_last_timestamp = sample.timestamp_ms;

    BusyGuard busy(m_processing);
    return process(sample);
}

FrameResult Session::process(const RawSample& sample) {
    FrameResult result;
    result.timestamp_ms = sample.timestamp_ms;
    ++m_frames;

    // 1. Channel gains and quality gate
    const double gain = m_cfg.sensitivity.brightness;
    const double red = sample.red * gain * m_cfg.sensitivity.red_intensity;
    std::optional<double> ir;
    if (sample.ir) {
        ir = *sample.ir * gain;
    }
    result.quality = m_quality.score(red);
    m_quality_sum += result.quality;
    if (!m_quality.is_acceptable(red, result.quality)) {
        ++m_low_quality;
        result.issues.push_back(Issue::LowSignalQuality);
        finalize(result);
        return result;
    }

    // 2. Ring buffers
    m_red.add_sample(red);
    push_capped(m_ir, ir, m_red.capacity());
    push_capped(m_timestamps, sample.timestamp_ms, m_red.capacity());
    push_capped(m_raw_history, red, m_cfg.record.max_samples);

    if (m_red.buffer_size() < 2 * m_detector.window_radius() + 1) {
        result.issues.push_back(Issue::InsufficientSamples);
        finalize(result);
        return result;
    }

    // 3. Filter, transform, detect systolic beats
    auto filtered = m_red.filtered();
    for (auto& v : filtered) {
        v *= m_cfg.sensitivity.signal_amplification;
    }
    m_spectrum = m_analyzer.transform(filtered);
    const auto indices = beat_indices(filtered, m_spectrum);
    const std::vector<double> timestamps(m_timestamps.begin(), m_timestamps.end());
    m_peaks = PeakDetector::to_peaks(indices, filtered, timestamps);
    m_window_intervals.clear();
    for (double iv : PeakDetector::intervals_ms(m_peaks)) {
        if (iv >= m_min_interval_ms && iv <= m_max_interval_ms) {
            m_window_intervals.push_back(iv);
        }
    }
    result.peak_count = m_peaks.size();
    spdlog::debug("Frame {:.1f} ms: {} peaks, {} intervals in window", sample.timestamp_ms,
        m_peaks.size(), m_window_intervals.size());

    // 4. Beat bookkeeping and morphology of the newest complete cycle
    if (record_beats()) {
        update_cycle(filtered, indices, result);
    }
    result.features = m_last_features;

    // 5. Estimate, then gate
    result.estimate = m_estimator.estimate(gather_inputs());
    if (!result.estimate.bpm) {
        result.issues.push_back(Issue::InsufficientSamples);
        finalize(result);
        return result;
    }

    // Without a pressure estimate the stored pair is gated alongside the new bpm.
    result.pressure_measured = result.estimate.systolic && result.estimate.diastolic;
    const ValidatedVitals stored = m_validator.last_valid(m_state);
    const ValidatedVitals candidate{
        *result.estimate.bpm,
        result.estimate.systolic.value_or(stored.systolic),
        result.estimate.diastolic.value_or(stored.diastolic)};
    const auto validation = m_validator.validate(m_state, candidate);
    m_state = validation.state;
    result.vitals = validation.vitals;
    result.outcome = validation.accepted ? FrameOutcome::Accepted : FrameOutcome::Rejected;
    if (validation.reason) {
        result.issues.push_back(*validation.reason);
    }
    finalize(result);
    return result;
}

std::vector<std::size_t> Session::beat_indices(const std::vector<double>& filtered,
                                               const std::vector<SpectrumBin>& spectrum) const {
    double period_ms = m_min_interval_ms;
    const auto dominant = FrequencyAnalyzer::dominant_bin(
        spectrum, m_cfg.analysis.min_bpm / 60.0, m_cfg.analysis.max_bpm / 60.0);
    if (dominant && dominant->frequency > 0.0) {
        period_ms = std::max(m_min_interval_ms, 1000.0 / dominant->frequency);
    }
    const auto refractory = static_cast<std::size_t>(std::lround(kRefractoryFraction * period_ms * m_fs / 1000.0));
    const auto candidates = m_detector.detect(filtered);
    auto beats = PeakDetector::select_beats(filtered, candidates, refractory);
    if (beats.size() != candidates.size()) {
        spdlog::trace("{} of {} maxima kept as beats (refractory {} samples)",
            beats.size(), candidates.size(), refractory);
    }
    return beats;
}

bool Session::record_beats() {
    bool new_beat = false;
    const double spacing = m_min_interval_ms / 2.0;
    for (const auto& p : m_peaks) {
        if (m_last_beat_ms && p.timestamp_ms <= *m_last_beat_ms + spacing) {
            continue;
        }
        if (m_last_beat_ms) {
            const double iv = p.timestamp_ms - *m_last_beat_ms;
            if (iv >= m_min_interval_ms && iv <= m_max_interval_ms) {
                push_capped(m_intervals, iv, m_cfg.analysis.interval_history);
            }
        }
        m_last_beat_ms = p.timestamp_ms;
        ++m_beats;
        new_beat = true;
    }
    return new_beat;
}

void Session::update_cycle(const std::vector<double>& filtered, const std::vector<std::size_t>& indices,
                           FrameResult& result) {
    const auto cycle = FeatureExtractor::latest_cycle(filtered, indices);
    if (!cycle) {
        return;
    }
    // Foot-to-peak time stands in for the pulse transit time.
    const double transit_ms = static_cast<double>(cycle->peak - cycle->begin) * 1000.0 / m_fs;
    push_capped(m_transits, transit_ms, m_cfg.analysis.transit_history);

    auto features = m_extractor.extract(cycle->samples, m_fs);
    if (features) {
        m_last_features = *features;
    } else {
        m_last_features.reset();
        result.issues.push_back(features.error());
        spdlog::debug("Cycle [{}, {}] has no features: {}", cycle->begin, cycle->end, to_string(features.error()));
    }
}

EstimatorInputs Session::gather_inputs() const {
    EstimatorInputs in;
    in.intervals_ms = m_window_intervals;
    in.interval_history_ms.assign(m_intervals.begin(), m_intervals.end());
    in.red = ChannelAmplitude::from_samples(m_red.window());
    const bool has_ir = !m_ir.empty() &&
        std::all_of(m_ir.begin(), m_ir.end(), [](const auto& v) { return v.has_value(); });
    if (has_ir) {
        std::vector<double> ir;
        ir.reserve(m_ir.size());
        for (const auto& v : m_ir) ir.push_back(*v);
        in.ir = ChannelAmplitude::from_samples(ir);
    }
    in.transit_times_ms.assign(m_transits.begin(), m_transits.end());
    in.features = m_last_features;
    in.spectrum = m_spectrum;
    return in;
}

void Session::finalize(FrameResult& result) {
    switch (result.outcome) {
        case FrameOutcome::Accepted:
            ++m_accepted;
            m_confidence_sum += result.estimate.confidence;
            break;
        case FrameOutcome::Rejected:
            ++m_rejected;
            m_confidence_sum += result.estimate.confidence;
            break;
        default:
            result.vitals = m_validator.last_valid(m_state);
            ++m_no_estimate;
            break;
    }
    m_latest = result;
    if (m_callback) {
        m_callback(m_latest);
    }
}

void Session::stop() {
    if (m_stopped) {
        return;
    }
    m_stopped = true;
    m_red.clear();
    m_ir.clear();
    m_timestamps.clear();
    m_raw_history.clear();
    m_peaks.clear();
    m_window_intervals.clear();
    m_spectrum.clear();
    m_intervals.clear();
    m_transits.clear();
    m_last_beat_ms.reset();
    m_last_features.reset();
    m_state = ValidatorState{};
    spdlog::info("Session stopped after {} frames ({} accepted, {} rejected, {} without estimate, {} dropped)",
        m_frames, m_accepted, m_rejected, m_no_estimate, m_dropped);
}

SessionRecord Session::finish(std::optional<EnvironmentConditions> environment) {
    SessionRecord rec;
    rec.created_at = m_created_at;
    rec.sampling_rate = m_fs;
    rec.raw_signal.assign(m_raw_history.begin(), m_raw_history.end());
    rec.filtered_signal = SignalFilter::apply(rec.raw_signal, m_red.profile());
    for (auto& v : rec.filtered_signal) {
        v *= m_cfg.sensitivity.signal_amplification;
    }
    rec.peak_locations = beat_indices(rec.filtered_signal, m_analyzer.transform(rec.filtered_signal));

    const auto frames = static_cast<double>(m_frames);
    const auto estimated = static_cast<double>(m_accepted + m_rejected);
    auto& q = rec.signal_quality_metrics;
    q["frames"] = frames;
    q["frames_accepted"] = static_cast<double>(m_accepted);
    q["frames_rejected"] = static_cast<double>(m_rejected);
    q["frames_without_estimate"] = static_cast<double>(m_no_estimate);
    q["frames_low_quality"] = static_cast<double>(m_low_quality);
    q["frames_dropped"] = static_cast<double>(m_dropped);
    q["beats"] = static_cast<double>(m_beats);
    q["mean_quality"] = frames > 0 ? m_quality_sum / frames : 0.0;
    q["mean_confidence"] = estimated > 0 ? m_confidence_sum / estimated : 0.0;
    const auto amp = ChannelAmplitude::from_samples(rec.raw_signal);
    q["perfusion_index"] = amp.dc > 0.0 ? 200.0 * amp.ac / amp.dc : 0.0;

    rec.environmental_conditions = std::move(environment);
    stop();
    return rec;
}
