#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <spdlog/spdlog.h>
#include "CameraSource.hpp"
#include "Config.hpp"
#include "FrameLoop.hpp"
#include "Session.hpp"
#include "SessionExporter.hpp"

namespace {
FrameLoop* g_loop = nullptr;

void on_signal(int) {
    if (g_loop) {
        g_loop->cancel();
    }
}

std::string config_path(int argc, char** argv) {
    if (argc > 1) {
        return argv[1];
    }
    if (const char* env = std::getenv("PPGVITALS_CONFIG_PATH")) {
        return env;
    }
    return "config.yaml";
}

std::string optional_text(const std::optional<double>& v) {
    return v ? std::to_string(static_cast<int>(*v + 0.5)) : std::string("--");
}

std::string pressure_text(const FrameResult& r) {
    if (!r.pressure_measured) {
        return "--/--";
    }
    return optional_text(r.vitals.systolic) + "/" + optional_text(r.vitals.diastolic);
}
} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Starting PPGVitals monitor...");

    auto app_start = std::chrono::steady_clock::now();
    const std::string path = config_path(argc, argv);
    auto config_res = AppConfig::load(path);
    if (!config_res) {
        spdlog::error("Config Error: {}", config_res.error());
        return 1;
    }
    const auto config = *config_res;
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("Config {} loaded in {:.1f} ms", path, std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - app_start).count());
    spdlog::info("Camera fps={}, acquisition_fps={}, sample_rate_hz={}, window_seconds={}",
        config.camera.fps, config.camera.acquisition_fps, config.analysis.sample_rate_hz,
        config.analysis.window_seconds);
    if (!config.estimator.spo2 || !config.estimator.blood_pressure) {
        spdlog::info("No calibration for {}; those values stay unreported",
            !config.estimator.spo2 && !config.estimator.blood_pressure ? "SpO2 or blood pressure"
            : !config.estimator.spo2 ? "SpO2" : "blood pressure");
    }

    try {
        auto source = CameraSource::open(config);
        if (!source) {
            spdlog::error("{}: {}", to_string(Issue::UpstreamAcquisitionFailure), source.error());
            return 1;
        }

        Session session(config);
        auto last_report = std::chrono::steady_clock::now();
        session.on_result([&last_report](const FrameResult& r) {
            if (r.outcome == FrameOutcome::Rejected) {
                spdlog::debug("Estimate rejected, holding {:.1f} BPM", r.vitals.bpm);
            }
            auto now = std::chrono::steady_clock::now();
            if (now - last_report < std::chrono::seconds(2)) {
                return;
            }
            last_report = now;
            spdlog::info("BPM {:.1f}  BP {}  SpO2 {}  confidence {:.2f}  quality {:.2f}  [{}]",
                r.vitals.bpm, pressure_text(r), optional_text(r.estimate.spo2),
                r.estimate.confidence, r.quality, to_string(r.outcome));
            if (r.estimate.hrv) {
                const auto& h = *r.estimate.hrv;
                spdlog::info("HRV SDNN {:.1f} ms  RMSSD {:.1f} ms  pNN50 {:.1f}%  rhythm {}",
                    h.sdnn, h.rmssd, h.pnn50, to_string(h.type));
            }
        });

        FrameLoop loop(config.camera.acquisition_fps);
        g_loop = &loop;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        auto run = loop.run(**source, session);
        g_loop = nullptr;
        if (!run) {
            spdlog::warn("Capture ended: {}", run.error());
        }

        const auto& last = session.latest();
        spdlog::info("Last valid vitals: BPM {:.1f}, BP {}", last.vitals.bpm, pressure_text(last));

        EnvironmentConditions env{
            {"source", config.camera.source},
            {"acquisition_fps", config.camera.acquisition_fps},
            {"filter_profile", config.analysis.filter_profile_name},
            {"torch", config.analysis.filter_profile_name == "torch"},
        };
        const SessionRecord record = session.finish(std::move(env));
        if (!config.record.path.empty()) {
            if (auto written = SessionExporter::write(record, config.record.path); !written) {
                spdlog::error("Export failed: {}", written.error());
                return 1;
            }
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
