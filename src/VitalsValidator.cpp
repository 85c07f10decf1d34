#include "VitalsValidator.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
bool within(double v, const ValueRange& r) {
    return std::isfinite(v) && v >= r.min && v <= r.max;
}
} // namespace

VitalsValidator::VitalsValidator(const AppConfig::Validator& bounds)
    : m_bounds(bounds) {}

bool VitalsValidator::in_bounds(const ValidatedVitals& c) const {
    return within(c.bpm, m_bounds.bpm) && within(c.systolic, m_bounds.systolic) &&
           within(c.diastolic, m_bounds.diastolic) && c.systolic > c.diastolic;
}

ValidatedVitals VitalsValidator::last_valid(const ValidatorState& state) const {
    if (state.status == ValidatorState::Status::Empty) {
        return {m_bounds.fallback_bpm, m_bounds.fallback_systolic, m_bounds.fallback_diastolic};
    }
    return {state.last_valid_bpm, state.last_valid_systolic, state.last_valid_diastolic};
}

ValidationResult VitalsValidator::validate(const ValidatorState& state, const ValidatedVitals& candidate) const {
    ValidationResult r;
    if (in_bounds(candidate)) {
        r.vitals = candidate;
        r.accepted = true;
        r.state.status = ValidatorState::Status::Valid;
        r.state.last_valid_bpm = candidate.bpm;
        r.state.last_valid_systolic = candidate.systolic;
        r.state.last_valid_diastolic = candidate.diastolic;
        return r;
    }

    spdlog::warn("Rejected estimate: bpm {:.1f}, pressure {:.0f}/{:.0f}",
        candidate.bpm, candidate.systolic, candidate.diastolic);
    r.vitals = last_valid(state);
    r.state = state;
    r.reason = Issue::OutOfRangeEstimate;
    return r;
}
