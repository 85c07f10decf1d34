#include "FrameLoop.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

void RunningStats::add(double x) {
    if (count == 0) {
        min = max = x;
    } else {
        min = std::min(min, x);
        max = std::max(max, x);
    }
    ++count;
    const double delta = x - mean;
    mean += delta / static_cast<double>(count);
    const double delta2 = x - mean;
    m2 += delta * delta2;
}

double RunningStats::variance() const {
    return (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
}

FrameLoop::FrameLoop(double acquisition_fps) {
    if (!(acquisition_fps > 0.0)) {
        throw std::invalid_argument("acquisition_fps must be positive");
    }
    m_interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / acquisition_fps));
}

std::expected<LoopStats, std::string> FrameLoop::run(FrameSource& source, Session& session) {
    using clock = std::chrono::steady_clock;
    const auto ms = [](auto d) { return std::chrono::duration<double, std::milli>(d).count(); };

    m_stats = LoopStats{};
    m_window_ms = RunningStats{};
    m_last_stats_log = clock::now();
    bool buffer_ready_logged = false;

    while (!m_cancelled.load() && !session.stopped()) {
        const auto frame_start = clock::now();

        // 1. Acquire
        auto sample = source.read();
        if (!sample) {
            spdlog::warn("{}: {}", to_string(Issue::UpstreamAcquisitionFailure), sample.error());
            return std::unexpected(sample.error());
        }
        ++m_stats.frames;

        // 2. Process
        auto result = session.push(*sample);
        if (!result) {
            ++m_stats.rejected_samples;
            if (session.stopped()) {
                break;
            }
            spdlog::warn("Sample skipped: {}", result.error());
        }
        if (!buffer_ready_logged && session.buffer_size() >= session.window_size()) {
            spdlog::info("Buffer filled: {} samples", session.window_size());
            buffer_ready_logged = true;
        }

        // 3. Pace; shed whatever ticks the frame overran
        const auto now = clock::now();
        const auto elapsed = now - frame_start;
        m_stats.frame_ms.add(ms(elapsed));
        m_window_ms.add(ms(elapsed));
        if (elapsed >= m_interval) {
            const auto missed = static_cast<std::size_t>(elapsed / m_interval);
            ++m_stats.overruns;
            m_stats.shed += missed;
            source.discard(missed);
            if (elapsed > m_interval * 2) {
                spdlog::warn("Frame processing overrun: {:.1f} ms (interval {:.1f} ms), shedding {} frame(s)",
                    ms(elapsed), ms(m_interval), missed);
            } else {
                spdlog::debug("Frame processing overrun: {:.1f} ms, shedding {} frame(s)", ms(elapsed), missed);
            }
        } else {
            if (spdlog::should_log(spdlog::level::debug)) {
                log_timing(now);
            }
            std::this_thread::sleep_for(m_interval - elapsed);
        }
    }
    spdlog::info("Frame loop ended after {} frames ({} overruns, {} shed)",
        m_stats.frames, m_stats.overruns, m_stats.shed);
    return m_stats;
}

void FrameLoop::log_timing(std::chrono::steady_clock::time_point now) {
    if (now - m_last_stats_log <= std::chrono::seconds(2) || m_window_ms.count < 2) {
        return;
    }
    const double interval_ms = std::chrono::duration<double, std::milli>(m_interval).count();
    spdlog::debug("Frame time: mean {:.2f} ms (std {:.2f}), min {:.2f}, max {:.2f}, budget {:.2f} ms",
        m_window_ms.mean, std::sqrt(m_window_ms.variance()), m_window_ms.min, m_window_ms.max, interval_ms);
    m_last_stats_log = now;
    m_window_ms = RunningStats{};
}
