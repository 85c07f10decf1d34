#include "CameraSource.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {
constexpr int kCentreRoiSide = 150;

bool is_device_index(const std::string& source) {
    return !source.empty() &&
        std::all_of(source.begin(), source.end(), [](unsigned char ch) { return std::isdigit(ch); });
}
} // namespace

CameraSource::CameraSource(Token, const cv::Rect& roi)
    : m_roi(roi), m_start(std::chrono::steady_clock::now()) {}

std::expected<std::unique_ptr<CameraSource>, std::string> CameraSource::open(const AppConfig& config) {
    auto cam_start = std::chrono::steady_clock::now();
    auto src = std::make_unique<CameraSource>(Token{}, config.camera.frame_roi);
    const std::string& source = config.camera.source;
    const bool opened = is_device_index(source)
        ? src->m_capture.open(std::stoi(source))
        : src->m_capture.open(source);
    if (!opened || !src->m_capture.isOpened()) {
        return std::unexpected("Could not open capture source '" + source + "'");
    }
    src->m_capture.set(cv::CAP_PROP_FPS, config.camera.fps);
    spdlog::info("Capture '{}' opened in {:.1f} ms", source, std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - cam_start).count());
    spdlog::info("Capture props: {}x{} @ {:.1f} fps",
        src->m_capture.get(cv::CAP_PROP_FRAME_WIDTH),
        src->m_capture.get(cv::CAP_PROP_FRAME_HEIGHT),
        src->m_capture.get(cv::CAP_PROP_FPS));
    src->m_start = std::chrono::steady_clock::now();
    return src;
}

std::expected<RawSample, std::string> CameraSource::read() {
    if (!m_capture.read(m_frame) || m_frame.empty()) {
        return std::unexpected("Capture returned no frame");
    }
    const double t = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - m_start).count();
    return channel_sample(m_frame, m_roi, t);
}

void CameraSource::discard(std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        if (!m_capture.grab()) {
            break;
        }
    }
}

cv::Rect CameraSource::effective_roi(const cv::Mat& frame, const cv::Rect& roi) {
    const cv::Rect bounds(0, 0, frame.cols, frame.rows);
    if (roi.area() > 0) {
        return roi & bounds;
    }
    const int side = std::min({kCentreRoiSide, frame.cols, frame.rows});
    return cv::Rect((frame.cols - side) / 2, (frame.rows - side) / 2, side, side);
}

RawSample CameraSource::channel_sample(const cv::Mat& frame, const cv::Rect& roi, double timestamp_ms) {
    RawSample s;
    s.timestamp_ms = timestamp_ms;
    const cv::Rect r = effective_roi(frame, roi);
    if (r.area() <= 0) {
        return s;
    }
    const cv::Scalar bgr = cv::mean(frame(r));
    s.red = bgr[2];
    s.ir = 0.8 * bgr[1] + 0.2 * bgr[0];
    s.ambient = bgr[0];
    return s;
}
