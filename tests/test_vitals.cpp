/*
 * PPGVitals estimation tests
 * VitalsEstimator and VitalsValidator
 */

#include <cmath>
#include <vector>

#include "Config.hpp"
#include "VitalsEstimator.hpp"
#include "VitalsValidator.hpp"
#include "TestHarness.hpp"

namespace {
VitalsEstimator make_estimator(const AppConfig::Estimator& cfg = AppConfig::Estimator{}) {
    return VitalsEstimator(cfg, 40.0, 200.0, 0.5);
}

AppConfig::Estimator calibrated() {
    AppConfig::Estimator cfg;
    cfg.spo2 = Spo2Calibration{110.0, -25.0, 0.0};
    PressureCalibration bp;
    bp.systolic = PressureModel{120.0, -0.1, 0.0, 0.0};
    bp.diastolic = PressureModel{80.0, -0.05, 0.0, 0.0};
    cfg.blood_pressure = bp;
    return cfg;
}

std::vector<double> modulated_intervals(double freq_hz, std::size_t count) {
    std::vector<double> out;
    double t = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double iv = 1000.0 + 50.0 * std::sin(2.0 * M_PI * freq_hz * t);
        out.push_back(iv);
        t += iv / 1000.0;
    }
    return out;
}
} // namespace

// Test: heart rate from intervals
bool test_bpm_from_intervals() {
    const auto bpm = VitalsEstimator::bpm({800.0, 800.0, 800.0});
    TEST_ASSERT(bpm.has_value(), "BPM expected");
    TEST_NEAR(*bpm, 75.0, 1e-9, "60000 / 800");
    TEST_ASSERT(!VitalsEstimator::bpm({800.0}), "One interval is not enough");
    TEST_ASSERT(!VitalsEstimator::bpm({}), "No intervals");
    return true;
}

// Test: missing inputs degrade to absent fields
bool test_estimate_degrades() {
    const auto est = make_estimator().estimate(EstimatorInputs{});
    TEST_ASSERT(!est.bpm && !est.spo2 && !est.systolic && !est.diastolic && !est.hrv, "All fields absent");
    TEST_NEAR(est.confidence, 0.0, 1e-12, "No confidence without BPM");

    EstimatorInputs in;
    in.intervals_ms = {800.0, 800.0, 800.0};
    in.red = {2.0, 180.0};
    in.ir = ChannelAmplitude{2.0, 150.0};
    const auto partial = make_estimator().estimate(in);
    TEST_ASSERT(partial.bpm.has_value(), "BPM present");
    TEST_ASSERT(!partial.spo2, "SpO2 needs calibration");
    TEST_ASSERT(!partial.systolic && !partial.diastolic, "Pressure needs calibration");
    TEST_NEAR(partial.confidence, 1.0, 1e-12, "Perfectly regular intervals");
    return true;
}

// Test: ratio of ratios through the calibration curve
bool test_spo2_calibrated() {
    const auto est = make_estimator(calibrated());
    const auto spo2 = est.spo2(ChannelAmplitude{1.0, 100.0}, ChannelAmplitude{2.0, 100.0});
    TEST_ASSERT(spo2.has_value(), "SpO2 expected");
    TEST_NEAR(*spo2, 97.5, 1e-9, "110 - 25 * 0.5");
    TEST_ASSERT(!est.spo2(ChannelAmplitude{1.0, 100.0}, std::nullopt), "Needs a second channel");
    TEST_ASSERT(!est.spo2(ChannelAmplitude{1.0, 0.0}, ChannelAmplitude{2.0, 100.0}), "Zero DC");

    auto cfg = calibrated();
    cfg.spo2 = Spo2Calibration{200.0, 0.0, 0.0};
    const auto clamped = make_estimator(cfg).spo2(ChannelAmplitude{1.0, 100.0}, ChannelAmplitude{2.0, 100.0});
    TEST_ASSERT(clamped && *clamped == 100.0, "Clamped to 100");
    return true;
}

// Test: pressure regression over transit time and morphology
bool test_pressure_calibrated() {
    const auto est = make_estimator(calibrated());
    const auto bp = est.pressure({200.0, 200.0, 200.0}, std::nullopt);
    TEST_ASSERT(bp.has_value(), "Pressure expected");
    TEST_NEAR(bp->first, 100.0, 1e-9, "120 - 0.1 * 200");
    TEST_NEAR(bp->second, 70.0, 1e-9, "80 - 0.05 * 200");
    TEST_ASSERT(!est.pressure({200.0, 200.0}, std::nullopt), "Too few transit samples");

    auto cfg = calibrated();
    cfg.blood_pressure->systolic.aix = 10.0;
    const auto morph = make_estimator(cfg);
    PPGFeatureSet weak;
    weak.augmentation_index = 0.3;
    weak.confidence = 0.2;
    TEST_ASSERT(!morph.pressure({200.0, 200.0, 200.0}, weak), "Low-confidence morphology is missing input");
    PPGFeatureSet good = weak;
    good.confidence = 0.9;
    const auto with_aix = morph.pressure({200.0, 200.0, 200.0}, good);
    TEST_ASSERT(with_aix && std::fabs(with_aix->first - 103.0) < 1e-9, "Systolic includes AIx term");
    return true;
}

// Test: time-domain HRV
bool test_hrv_time_domain() {
    const auto hrv = make_estimator().hrv({800.0, 900.0, 800.0, 900.0, 800.0});
    TEST_ASSERT(hrv.has_value(), "HRV expected");
    TEST_NEAR(hrv->sdnn, std::sqrt(2400.0), 1e-9, "Population SDNN");
    TEST_NEAR(hrv->rmssd, 100.0, 1e-9, "RMSSD");
    TEST_NEAR(hrv->pnn50, 100.0, 1e-9, "pNN50");
    TEST_ASSERT(!hrv->lfhf, "LF/HF needs a longer history");
    TEST_ASSERT(!make_estimator().hrv({800.0, 800.0, 800.0, 800.0}), "Too few intervals");
    return true;
}

// Test: arrhythmia classification
bool test_hrv_arrhythmia_rules() {
    const auto est = make_estimator();
    const std::vector<double> regular(10, 1000.0);
    auto h = est.hrv(regular);
    TEST_ASSERT(h && h->type == ArrhythmiaType::Normal && !h->has_arrhythmia, "60 bpm is normal");

    h = est.hrv(std::vector<double>(10, 1200.0));
    TEST_ASSERT(h && h->type == ArrhythmiaType::Bradycardia && h->has_arrhythmia, "50 bpm");

    h = est.hrv(std::vector<double>(10, 500.0));
    TEST_ASSERT(h && h->type == ArrhythmiaType::Tachycardia, "120 bpm");

    std::vector<double> alternating;
    for (int i = 0; i < 10; ++i) alternating.push_back(i % 2 ? 1000.0 : 600.0);
    h = est.hrv(alternating);
    TEST_ASSERT(h && h->type == ArrhythmiaType::Irregular, "CV 0.25 and RMSSD 400");
    return true;
}

// Test: LF/HF responds to the modulation band
bool test_lf_hf_ratio() {
    const auto est = make_estimator();
    const auto lf = est.lf_hf(modulated_intervals(0.1, 64));
    const auto hf = est.lf_hf(modulated_intervals(0.3, 64));
    TEST_ASSERT(lf.has_value() && hf.has_value(), "Both ratios expected");
    TEST_ASSERT(*lf > 1.0, "Slow modulation is LF dominated");
    TEST_ASSERT(*hf < 1.0, "Fast modulation is HF dominated");
    TEST_ASSERT(!est.lf_hf(std::vector<double>(15, 1000.0)), "Below minimum history");
    return true;
}

// Test: first plausible estimate is accepted and stored
bool test_validator_accepts_plausible() {
    VitalsValidator validator(AppConfig::Validator{});
    const ValidatorState empty;
    const auto r = validator.validate(empty, {75.0, 150.0, 95.0});
    TEST_ASSERT(r.accepted, "Should accept");
    TEST_ASSERT(!r.reason, "No reason on acceptance");
    TEST_ASSERT(r.state.status == ValidatorState::Status::Valid, "State becomes Valid");
    TEST_ASSERT(r.state.last_valid_bpm == 75.0 && r.state.last_valid_systolic == 150.0 &&
                r.state.last_valid_diastolic == 95.0, "Stored as last valid");
    TEST_ASSERT(r.vitals.bpm == 75.0, "Candidate emitted");
    return true;
}

// Test: out-of-range rate falls back to the stored values
bool test_validator_rejects_out_of_range() {
    VitalsValidator validator(AppConfig::Validator{});
    const auto first = validator.validate(ValidatorState{}, {75.0, 150.0, 95.0});
    const ValidatorState before = first.state;
    const auto r = validator.validate(first.state, {210.0, 150.0, 95.0});
    TEST_ASSERT(!r.accepted, "Should reject");
    TEST_ASSERT(r.reason && *r.reason == Issue::OutOfRangeEstimate, "Rejection reason");
    TEST_ASSERT(r.vitals.bpm == 75.0, "Previous rate emitted");
    TEST_ASSERT(r.state.status == before.status && r.state.last_valid_bpm == before.last_valid_bpm &&
                r.state.last_valid_systolic == before.last_valid_systolic &&
                r.state.last_valid_diastolic == before.last_valid_diastolic, "State unchanged");
    return true;
}

// Test: systolic must exceed diastolic
bool test_validator_rejects_inverted_pressure() {
    VitalsValidator validator(AppConfig::Validator{});
    const auto r = validator.validate(ValidatorState{}, {75.0, 100.0, 110.0});
    TEST_ASSERT(!r.accepted, "Inverted pressure rejected");
    TEST_ASSERT(r.state.status == ValidatorState::Status::Empty, "Still Empty");
    TEST_ASSERT(r.vitals.bpm == 0.0 && r.vitals.systolic == 120.0 && r.vitals.diastolic == 80.0,
                "Fallback values while Empty");
    TEST_ASSERT(!validator.validate(ValidatorState{}, {75.0, 120.0, 120.0}).accepted, "Equal pressures rejected");
    TEST_ASSERT(!validator.validate(ValidatorState{}, {NAN, 120.0, 80.0}).accepted, "NaN rejected");
    return true;
}

// Test: output invariants over a grid of candidates
bool test_validator_output_invariants() {
    VitalsValidator validator(AppConfig::Validator{});
    ValidatorState state;
    for (double bpm = 0.0; bpm <= 260.0; bpm += 13.0) {
        for (double sys = 60.0; sys <= 220.0; sys += 20.0) {
            for (double dia = 30.0; dia <= 150.0; dia += 20.0) {
                const auto r = validator.validate(state, {bpm, sys, dia});
                const bool in_range = r.vitals.bpm >= 40.0 && r.vitals.bpm <= 200.0;
                TEST_ASSERT(in_range || r.vitals.bpm == 0.0, "Emitted rate outside band and not fallback");
                if (r.accepted) {
                    TEST_ASSERT(r.vitals.systolic > r.vitals.diastolic, "Accepted inverted pressure");
                }
                state = r.state;
            }
        }
    }
    return true;
}

int main() {
    printf("PPGVitals Vitals Test Suite\n");
    printf("===================================\n\n");

    int total = 0, passed = 0, failed = 0;

    RUN_TEST(test_bpm_from_intervals);
    RUN_TEST(test_estimate_degrades);
    RUN_TEST(test_spo2_calibrated);
    RUN_TEST(test_pressure_calibrated);
    RUN_TEST(test_hrv_time_domain);
    RUN_TEST(test_hrv_arrhythmia_rules);
    RUN_TEST(test_lf_hf_ratio);
    RUN_TEST(test_validator_accepts_plausible);
    RUN_TEST(test_validator_rejects_out_of_range);
    RUN_TEST(test_validator_rejects_inverted_pressure);
    RUN_TEST(test_validator_output_invariants);

    TEST_SUMMARY("Vitals");
    return failed == 0 ? 0 : 1;
}
