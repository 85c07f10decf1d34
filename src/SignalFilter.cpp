#include "SignalFilter.hpp"
#include <stdexcept>

SignalFilter::SignalFilter(std::size_t capacity, const FilterProfile& profile)
    : m_capacity(capacity), m_profile(profile) {
    if (capacity == 0) {
        throw std::invalid_argument("SignalFilter capacity must be positive");
    }
    if (!(profile.alpha > 0.0 && profile.alpha <= 1.0)) {
        throw std::invalid_argument("SignalFilter alpha must be in (0, 1]");
    }
}

void SignalFilter::add_sample(double value) {
    m_buffer.push_back(value);
    if (m_buffer.size() > m_capacity) m_buffer.pop_front();
}

std::vector<double> SignalFilter::window() const {
    return {m_buffer.begin(), m_buffer.end()};
}

std::vector<double> SignalFilter::filtered() const {
    return apply(window(), m_profile);
}

std::vector<double> SignalFilter::apply(const std::vector<double>& samples, const FilterProfile& profile) {
    std::vector<double> out(samples.size());
    if (samples.empty()) {
        return out;
    }

    out[0] = samples[0];
    for (std::size_t i = 1; i < samples.size(); ++i) {
        out[i] = profile.alpha * samples[i] + (1.0 - profile.alpha) * out[i - 1];
    }

    const std::size_t n = out.size();
    if (profile.detrend && n > 1) {
        // Line through the first and last filtered values.
        const double first = out[0];
        const double slope = (out[n - 1] - first) / static_cast<double>(n - 1);
        for (std::size_t i = 0; i < n; ++i) {
            out[i] -= first + slope * static_cast<double>(i);
        }
    }
    return out;
}
