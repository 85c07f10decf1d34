#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include "Session.hpp"
#include "Vitals.hpp"

/**
 * @class FrameSource
 * @brief Producer of per-frame channel averages.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Reads the next sample.
     * @return std::expected containing the sample, or an error when the
     * source failed or ran out of frames.
     */
    virtual std::expected<RawSample, std::string> read() = 0;

    /**
     * @brief Skips frames that could not be processed in time.
     */
    virtual void discard(std::size_t count) { (void)count; }
};

/**
 * @struct RunningStats
 * @brief Welford accumulator for frame timing.
 */
struct RunningStats {
    std::size_t count{0};
    double mean{0.0};
    double m2{0.0};
    double min{0.0};
    double max{0.0};

    void add(double x);
    double variance() const;
};

struct LoopStats {
    std::size_t frames{0};
    std::size_t rejected_samples{0};
    std::size_t overruns{0};
    std::size_t shed{0};
    RunningStats frame_ms;
};

/**
 * @class FrameLoop
 * @brief Drives one session at a fixed acquisition rate. One frame per tick,
 * one sleep per tick; frames missed during an overrun are shed, never queued.
 */
class FrameLoop {
public:
    /**
     * @throws std::invalid_argument if acquisition_fps is not positive.
     */
    explicit FrameLoop(double acquisition_fps);

    /**
     * @brief Runs until cancelled, the session stops, or the source fails.
     * The frame in flight when cancel() is called still completes.
     * @return Loop statistics, or the source error that ended the loop.
     */
    std::expected<LoopStats, std::string> run(FrameSource& source, Session& session);

    /** @brief Safe to call from a signal handler or a result callback. */
    void cancel() { m_cancelled.store(true); }
    bool cancelled() const { return m_cancelled.load(); }

    std::chrono::steady_clock::duration interval() const { return m_interval; }
    const LoopStats& stats() const { return m_stats; }

private:
    void log_timing(std::chrono::steady_clock::time_point now);

    std::chrono::steady_clock::duration m_interval;
    std::atomic<bool> m_cancelled{false};
    LoopStats m_stats;
    RunningStats m_window_ms;
    std::chrono::steady_clock::time_point m_last_stats_log;
};
