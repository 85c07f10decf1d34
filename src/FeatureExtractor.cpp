#include "FeatureExtractor.hpp"
#include "Scoring.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

FeatureExtractor::FeatureExtractor(const AppConfig::Features& ranges)
    : m_ranges(ranges) {}

std::optional<DicroticNotch> FeatureExtractor::find_notch(const std::vector<double>& cycle, std::size_t peak_index) {
    for (std::size_t i = peak_index + 1; i + 1 < cycle.size(); ++i) {
        if (cycle[i] < cycle[i - 1] && cycle[i] < cycle[i + 1]) {
            return DicroticNotch{i, cycle[i]};
        }
    }
    return std::nullopt;
}

std::expected<PPGFeatureSet, Issue> FeatureExtractor::extract(const std::vector<double>& cycle,
                                                              double sampling_rate_hz) const {
    if (cycle.size() < 3 || !(sampling_rate_hz > 0.0)) {
        return std::unexpected(Issue::InsufficientSamples);
    }

    // 1. Systolic peak (first occurrence of the global maximum)
    const auto top = std::max_element(cycle.begin(), cycle.end());
    const double peak = *top;
    const auto peak_index = static_cast<std::size_t>(top - cycle.begin());

    // 2. Dicrotic notch
    const auto notch = find_notch(cycle, peak_index);
    if (!notch) {
        return std::unexpected(Issue::NoNotchFound);
    }

    const double ms_per_sample = 1000.0 / sampling_rate_hz;
    const double time_to_notch_ms = static_cast<double>(notch->index - peak_index) * ms_per_sample;
    if (time_to_notch_ms == 0.0 || peak == 0.0) {
        return std::unexpected(Issue::DegenerateInterval);
    }

    // 3. Indices
    PPGFeatureSet f;
    f.augmentation_index = (peak - notch->amplitude) / peak;
    f.reflection_index = time_to_notch_ms / peak;
    const double pulse_interval_ms = static_cast<double>(cycle.size()) * ms_per_sample;
    f.stiffness_index = pulse_interval_ms / time_to_notch_ms;

    double area = 0.0;
    for (std::size_t i = peak_index; i <= notch->index; ++i) {
        area += cycle[i];
    }
    f.elasticity_coefficient = area / time_to_notch_ms;

    // 4. Confidence from physiologically normal ranges
    const double aix_score = range_score(f.augmentation_index, m_ranges.augmentation.min, m_ranges.augmentation.max);
    const double ri_score = range_score(f.reflection_index, m_ranges.reflection.min, m_ranges.reflection.max);
    const double si_score = range_score(f.stiffness_index, m_ranges.stiffness.min, m_ranges.stiffness.max);
    f.confidence = std::clamp(aix_score * 0.4 + ri_score * 0.3 + si_score * 0.3, 0.0, 1.0);

    const bool finite = std::isfinite(f.augmentation_index) && std::isfinite(f.reflection_index) &&
                        std::isfinite(f.stiffness_index) && std::isfinite(f.elasticity_coefficient) &&
                        std::isfinite(f.confidence);
    if (!finite) {
        return std::unexpected(Issue::DegenerateInterval);
    }

    spdlog::debug("Features: AIx {:.3f}, RI {:.3f}, SI {:.2f}, EC {:.3f}, confidence {:.2f}",
        f.augmentation_index, f.reflection_index, f.stiffness_index, f.elasticity_coefficient, f.confidence);
    return f;
}

std::optional<PulseCycle> FeatureExtractor::latest_cycle(const std::vector<double>& signal,
                                                         const std::vector<std::size_t>& peaks) {
    if (peaks.size() < 3) {
        return std::nullopt;
    }
    const std::size_t prev = peaks[peaks.size() - 3];
    const std::size_t mid = peaks[peaks.size() - 2];
    const std::size_t next = peaks[peaks.size() - 1];
    if (next >= signal.size() || !(prev < mid && mid < next)) {
        return std::nullopt;
    }

    const auto foot = [&signal](std::size_t a, std::size_t b) {
        const auto it = std::min_element(signal.begin() + static_cast<std::ptrdiff_t>(a),
                                         signal.begin() + static_cast<std::ptrdiff_t>(b + 1));
        return static_cast<std::size_t>(it - signal.begin());
    };

    PulseCycle c;
    c.begin = foot(prev, mid);
    c.end = foot(mid, next);
    c.peak = mid;
    if (c.end <= c.begin + 1) {
        return std::nullopt;
    }
    c.samples.assign(signal.begin() + static_cast<std::ptrdiff_t>(c.begin),
                     signal.begin() + static_cast<std::ptrdiff_t>(c.end + 1));
    const double base = *std::min_element(c.samples.begin(), c.samples.end());
    for (auto& v : c.samples) {
        v -= base;
    }
    return c;
}
