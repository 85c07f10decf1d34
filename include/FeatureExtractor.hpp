#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>
#include "Config.hpp"
#include "Vitals.hpp"

struct DicroticNotch {
    std::size_t index{0};
    double amplitude{0.0};
};

struct PPGFeatureSet {
    double augmentation_index{0.0};
    double reflection_index{0.0};
    double stiffness_index{0.0};
    double elasticity_coefficient{0.0};
    double confidence{0.0};
};

/**
 * @struct PulseCycle
 * @brief One foot-to-foot beat inside a filtered window, referenced to its own minimum.
 */
struct PulseCycle {
    std::size_t begin{0};        // foot before the systolic peak
    std::size_t end{0};          // foot after it (inclusive)
    std::size_t peak{0};         // systolic peak, window index
    std::vector<double> samples; // signal[begin..end] minus the cycle minimum
};

/**
 * @class FeatureExtractor
 * @brief Pulse-wave morphology of a single cycle.
 */
class FeatureExtractor {
public:
    explicit FeatureExtractor(const AppConfig::Features& ranges);

    /**
     * @brief Computes augmentation, reflection, stiffness and elasticity
     * indices and a range-based confidence for one pulse cycle.
     * @param cycle At least three filtered samples covering one beat.
     * @param sampling_rate_hz Rate of the cycle samples.
     * @return Feature set, or the Issue that made it unavailable.
     */
    std::expected<PPGFeatureSet, Issue> extract(const std::vector<double>& cycle, double sampling_rate_hz) const;

    /**
     * @brief First sample after peak_index lower than both neighbours.
     */
    static std::optional<DicroticNotch> find_notch(const std::vector<double>& cycle, std::size_t peak_index);

    /**
     * @brief Selects the most recent complete foot-to-foot cycle.
     * Needs at least three peaks: the cycle around the second to last peak
     * is bounded by the minima between it and its neighbours.
     */
    static std::optional<PulseCycle> latest_cycle(const std::vector<double>& signal,
                                                  const std::vector<std::size_t>& peaks);

private:
    AppConfig::Features m_ranges;
};
