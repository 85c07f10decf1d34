#include "SignalQuality.hpp"
#include "Scoring.hpp"
#include <cmath>

SignalQuality::SignalQuality(const AppConfig::Quality& cfg, double signal_stability)
    : m_cfg(cfg), m_threshold(cfg.threshold * signal_stability) {}

double SignalQuality::score(double red) const {
    if (!m_cfg.enabled) {
        return 1.0;
    }
    if (!std::isfinite(red) || red < m_cfg.min_intensity || red > m_cfg.max_intensity) {
        return 0.0;
    }
    return range_score(red, m_cfg.optimal.min, m_cfg.optimal.max);
}

bool SignalQuality::is_acceptable(double red, double score) const {
    if (!m_cfg.enabled) {
        return true;
    }
    return score >= m_threshold && red >= m_cfg.min_red;
}
