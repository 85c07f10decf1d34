#include "Vitals.hpp"

std::string_view to_string(Issue issue) {
    switch (issue) {
        case Issue::InsufficientSamples: return "InsufficientSamples";
        case Issue::NoNotchFound: return "NoNotchFound";
        case Issue::DegenerateInterval: return "DegenerateInterval";
        case Issue::OutOfRangeEstimate: return "OutOfRangeEstimate";
        case Issue::UpstreamAcquisitionFailure: return "UpstreamAcquisitionFailure";
        case Issue::LowSignalQuality: return "LowSignalQuality";
    }
    return "Unknown";
}

std::string_view to_string(ArrhythmiaType type) {
    switch (type) {
        case ArrhythmiaType::Normal: return "Normal";
        case ArrhythmiaType::Bradycardia: return "Bradycardia";
        case ArrhythmiaType::Tachycardia: return "Tachycardia";
        case ArrhythmiaType::Irregular: return "Irregular";
    }
    return "Unknown";
}
