#pragma once
#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include "Config.hpp"
#include "FrameLoop.hpp"

/**
 * @class CameraSource
 * @brief Fingertip capture through cv::VideoCapture (device index or video file).
 */
class CameraSource : public FrameSource {
    struct Token {
        explicit Token() = default;
    };

public:
    /** @brief Reachable only through open(). */
    CameraSource(Token, const cv::Rect& roi);

    /**
     * @brief Opens camera.source; a string of digits selects a device index.
     * @return std::expected containing the source, or an error if it cannot be opened.
     */
    static std::expected<std::unique_ptr<CameraSource>, std::string> open(const AppConfig& config);

    std::expected<RawSample, std::string> read() override;
    void discard(std::size_t count) override;

    /**
     * @brief Averages the ROI of a BGR frame into one sample.
     * red = R, ir = 0.8 G + 0.2 B (pseudo-IR for RGB sensors), ambient = B.
     * An empty roi selects a centre square of at most 150 px.
     */
    static RawSample channel_sample(const cv::Mat& frame, const cv::Rect& roi, double timestamp_ms);

    /** @brief Clips roi to the frame, or picks the centre square when roi is empty. */
    static cv::Rect effective_roi(const cv::Mat& frame, const cv::Rect& roi);

private:
    cv::VideoCapture m_capture;
    cv::Rect m_roi;
    cv::Mat m_frame;
    std::chrono::steady_clock::time_point m_start;
};
