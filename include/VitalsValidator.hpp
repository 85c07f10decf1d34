#pragma once
#include <optional>
#include "Config.hpp"
#include "Vitals.hpp"

/**
 * @struct ValidatorState
 * @brief Hysteresis state owned by one session. Empty until the first acceptance.
 */
struct ValidatorState {
    enum class Status { Empty, Valid } status{Status::Empty};
    double last_valid_bpm{0.0};
    double last_valid_systolic{0.0};
    double last_valid_diastolic{0.0};
};

struct ValidationResult {
    ValidatedVitals vitals;
    ValidatorState state;
    bool accepted{false};
    std::optional<Issue> reason;
};

/**
 * @class VitalsValidator
 * @brief Accepts or rejects raw estimates against physiological bounds.
 * Stateless: the caller passes its state in and stores the returned one.
 */
class VitalsValidator {
public:
    explicit VitalsValidator(const AppConfig::Validator& bounds);

    /**
     * @brief Gates one candidate.
     * Accepted when bpm, systolic and diastolic are within their closed ranges
     * and systolic > diastolic; the candidate is emitted and stored.
     * Otherwise the stored last-valid values (or the fallbacks while Empty)
     * are emitted and the state is returned unchanged.
     */
    ValidationResult validate(const ValidatorState& state, const ValidatedVitals& candidate) const;

    /** @brief What a rejection emits for the given state. */
    ValidatedVitals last_valid(const ValidatorState& state) const;

    bool in_bounds(const ValidatedVitals& candidate) const;

private:
    AppConfig::Validator m_bounds;
};
