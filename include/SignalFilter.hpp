#pragma once
#include <deque>
#include <vector>
#include "Config.hpp"

/**
 * @class SignalFilter
 * @brief Exponential low-pass smoothing with optional linear detrend, plus the
 * bounded ring buffer of recent intensities owned by a session.
 */
class SignalFilter {
public:
    /**
     * @param capacity Number of samples kept in the ring buffer.
     * @param profile Smoothing factor and detrend flag.
     */
    SignalFilter(std::size_t capacity, const FilterProfile& profile);

    /**
     * @brief Appends a sample, evicting the oldest one when full.
     */
    void add_sample(double value);

    /**
     * @brief Buffer contents, oldest first.
     */
    std::vector<double> window() const;

    /**
     * @brief Filters the current buffer contents with the configured profile.
     */
    std::vector<double> filtered() const;

    void clear() { m_buffer.clear(); }

    std::size_t buffer_size() const { return m_buffer.size(); }
    std::size_t capacity() const { return m_capacity; }
    const FilterProfile& profile() const { return m_profile; }

    /**
     * @brief EMA low-pass: out[0] = in[0], out[i] = a*in[i] + (1-a)*out[i-1].
     * With detrend, the line through the first and last filtered values is
     * subtracted. Output has the same length as the input.
     */
    static std::vector<double> apply(const std::vector<double>& samples, const FilterProfile& profile);

private:
    std::deque<double> m_buffer;
    std::size_t m_capacity;
    FilterProfile m_profile;
};
