#include "SessionExporter.hpp"
#include <yaml-cpp/yaml.h>
#include <ctime>
#include <fstream>
#include <spdlog/spdlog.h>

std::string SessionExporter::format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string SessionExporter::to_yaml(const SessionRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "created_at" << YAML::Value << format_timestamp(record.created_at);
    out << YAML::Key << "sampling_rate" << YAML::Value << record.sampling_rate;
    out << YAML::Key << "raw_signal" << YAML::Value << YAML::Flow << record.raw_signal;
    out << YAML::Key << "filtered_signal" << YAML::Value << YAML::Flow << record.filtered_signal;
    out << YAML::Key << "peak_locations" << YAML::Value << YAML::Flow << record.peak_locations;

    out << YAML::Key << "signal_quality_metrics" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, value] : record.signal_quality_metrics) {
        out << YAML::Key << name << YAML::Value << value;
    }
    out << YAML::EndMap;

    if (record.environmental_conditions) {
        out << YAML::Key << "environmental_conditions" << YAML::Value << YAML::BeginMap;
        for (const auto& [name, value] : *record.environmental_conditions) {
            out << YAML::Key << name << YAML::Value;
            std::visit([&out](const auto& v) { out << v; }, value);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return out.c_str();
}

std::expected<void, std::string> SessionExporter::write(const SessionRecord& record, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return std::unexpected("Cannot open record file: " + path);
    }
    file << to_yaml(record) << '\n';
    if (!file) {
        return std::unexpected("Failed writing record file: " + path);
    }
    spdlog::info("Session record written to {} ({} samples, {} peaks)",
        path, record.raw_signal.size(), record.peak_locations.size());
    return {};
}
