#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using EnvironmentValue = std::variant<double, std::string, bool>;
using EnvironmentConditions = std::map<std::string, EnvironmentValue>;

/**
 * @struct SessionRecord
 * @brief Export record produced once per completed measurement session.
 */
struct SessionRecord {
    std::vector<double> raw_signal;
    std::vector<double> filtered_signal;
    std::vector<std::size_t> peak_locations;
    double sampling_rate{0.0};
    std::map<std::string, double> signal_quality_metrics;
    std::optional<EnvironmentConditions> environmental_conditions;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @class SessionExporter
 * @brief Serializes session records to YAML for the persistence collaborator.
 */
class SessionExporter {
public:
    static std::string to_yaml(const SessionRecord& record);

    /**
     * @brief Writes the record to a file, replacing any existing one.
     * @return std::expected carrying an error string on failure.
     */
    static std::expected<void, std::string> write(const SessionRecord& record, const std::string& path);

    /** @brief ISO-8601 UTC timestamp, e.g. 2026-10-19T08:30:00Z. */
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
};
