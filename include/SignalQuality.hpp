#pragma once
#include "Config.hpp"

/**
 * @class SignalQuality
 * @brief Per-frame intensity quality and finger-presence gate.
 */
class SignalQuality {
public:
    SignalQuality(const AppConfig::Quality& cfg, double signal_stability);

    /**
     * @brief 0 outside the usable intensity range, otherwise the range score
     * of the red mean against the optimal band.
     */
    double score(double red) const;

    /**
     * @brief Whether a frame with this red mean and score should be processed.
     */
    bool is_acceptable(double red, double score) const;

    bool enabled() const { return m_cfg.enabled; }

private:
    AppConfig::Quality m_cfg;
    double m_threshold;
};
