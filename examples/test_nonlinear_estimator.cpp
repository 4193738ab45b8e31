// Nonlinear Fingerprint Estimator Validation Test
//
// Purpose: Validate the iterative estimator and its Taylor order
//
// Tests:
// 1. Error non-increasing from FIRST to THIRD order (averaged)
// 2. evaluate() at the fingerprint position
// 3. Noisy readings: covariance and chi^2 available
// 4. Initial position used as starting point
// 5. 3D scene
// 6. Fitter iteration cap reported as EstimationFailure
// 7. Configuration validation
// 8. Constant query bias: mean removal beats raw readings
// 9. Per-source path-loss exponent
// 10. Propagated uncertainties widen the covariance
// 11. Covariance grows with the path-loss exponent std
//
// Expected Results:
// - mean error(FIRST) >= mean error(SECOND) >= mean error(THIRD)
// - Third order error < 1 mm on noise-free scenes

#include "estimator/nonlinear_fingerprint_estimator.hpp"
#include "validation/synthetic_radio_map.hpp"
#include "core/errors.hpp"
#include "test_harness.hpp"

#include <algorithm>
#include <optional>
#include <string>

using namespace rfloc;

namespace {

// Sources on a ring around the surveyed area, fingerprints inside it
std::vector<LocatedRadioSource2d> ring_sources(int count, double radius, double exponent = 2.0) {
    std::vector<LocatedRadioSource2d> sources;
    for (int i = 0; i < count; i++) {
        const double angle = 2.0 * M_PI * i / count + 0.3;
        sources.emplace_back("src-" + std::to_string(i),
                             Point2d(radius * std::cos(angle), radius * std::sin(angle)),
                             DEFAULT_FREQUENCY_HZ, -60.0, exponent);
    }
    return sources;
}

// Same readings, each carrying the given standard deviation
std::vector<RssiReading> with_std(const std::vector<RssiReading>& readings, double std_dbm) {
    std::vector<RssiReading> result;
    for (const auto& reading : readings) {
        result.emplace_back(reading.source_id(), reading.rssi_dbm(), std_dbm);
    }
    return result;
}

SyntheticRadioMap2d::SceneParams survey_area(double rssi_noise_std = 0.0);

struct UncertainScene {
    std::vector<LocatedRadioSource2d> sources;
    std::vector<LocatedFingerprint2d> located;
    RssiFingerprint query;
};

// Noise-free scene whose inputs all carry uncertainty
UncertainScene uncertain_scene(double exponent_std) {
    UncertainScene scene;
    scene.sources = ring_sources(5, 80.0);
    for (auto& source : scene.sources) {
        source.path_loss_exponent_std = exponent_std;
        source.position_covariance = PositionCovariance<2>(100.0 * PositionCovariance<2>::Identity());
    }

    SyntheticRadioMap2d map(survey_area(), 77);
    for (const auto& fp : map.generate_located_fingerprints(scene.sources, 100)) {
        scene.located.emplace_back(with_std(fp.readings(), 0.1), fp.position(),
                                   PositionCovariance<2>(PositionCovariance<2>::Identity()));
    }
    const RssiFingerprint exact = map.measure(scene.sources, Point2d(4.0, -6.0));
    scene.query = RssiFingerprint(with_std(exact.readings(), 0.1));
    return scene;
}

double covariance_trace(NonlinearFingerprintEstimator2d& estimator) {
    estimator.estimate();
    return estimator.covariance()->trace();
}

SyntheticRadioMap2d::SceneParams survey_area(double rssi_noise_std) {
    auto params = SyntheticRadioMap2d::SceneParams::default_params();
    params.region_min = -20.0;
    params.region_max = 20.0;
    params.rssi_noise_std = rssi_noise_std;
    return params;
}

}  // namespace

// ========== Test 1: Order ==========

bool test_order_accuracy() {
    TEST("Error non-increasing from FIRST to THIRD order");

    SyntheticRadioMap2d map(survey_area(), 2024);
    auto sources = ring_sources(5, 80.0);
    auto located = map.generate_located_fingerprints(sources, 100);

    const int trials = 50;
    double errors[3] = {0.0, 0.0, 0.0};
    const TaylorOrder orders[3] = {TaylorOrder::FIRST, TaylorOrder::SECOND, TaylorOrder::THIRD};

    for (int trial = 0; trial < trials; trial++) {
        const Point2d truth = map.random_position();
        NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, truth), sources);

        for (int i = 0; i < 3; i++) {
            estimator.set_order(orders[i]);
            estimator.estimate();
            errors[i] += (*estimator.estimated_position() - truth).norm() / trials;
        }
    }

    for (int i = 0; i < 3; i++) {
        std::cout << "  " << to_string(orders[i]) << " mean error: " << errors[i] << " m" << std::endl;
    }
    EXPECT_TRUE(errors[0] >= errors[1]);
    EXPECT_TRUE(errors[1] >= errors[2]);
    EXPECT_TRUE(errors[2] < 1e-3);

    TEST_PASS();
}

// ========== Test 2: evaluate() ==========

bool test_evaluate() {
    TEST("evaluate() at the fingerprint position");

    NonlinearFingerprintEstimator2d estimator;
    EXPECT_TRUE(estimator.order() == TaylorOrder::THIRD);

    // [Pr_f, p_f, s, n]
    VectorXd point(NonlinearFingerprintEstimator2d::POINT_SIZE);
    point << -70.0, 10.0, 0.0, 0.0, 0.0, 2.0;
    VectorXd params(2);
    params << 10.0, 0.0;
    VectorXd derivatives(2);

    const double c = 10.0 * 2.0 / std::log(10.0);
    for (TaylorOrder order : {TaylorOrder::FIRST, TaylorOrder::SECOND, TaylorOrder::THIRD}) {
        estimator.set_order(order);
        EXPECT_NEAR(estimator.evaluate(0, point, params, derivatives), -70.0, 1e-12);
        EXPECT_NEAR(derivatives(0), -c / 10.0, 1e-12);
        EXPECT_NEAR(derivatives(1), 0.0, 1e-12);
    }

    // One metre further away along the source direction
    params << 11.0, 0.0;
    estimator.set_order(TaylorOrder::SECOND);
    EXPECT_NEAR(estimator.evaluate(0, point, params, derivatives), -70.825, 1e-3);

    TEST_PASS();
}

// ========== Test 3: Noisy Readings ==========

bool test_noisy_covariance() {
    TEST("Noisy readings: covariance and chi^2 available");

    SyntheticRadioMap2d map(survey_area(1.0), 31);
    auto sources = ring_sources(6, 60.0);
    auto located = map.generate_located_fingerprints(sources, 200);

    const Point2d truth(3.0, -4.0);
    NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, truth), sources);
    estimator.set_min_max_nearest_fingerprints(3, 3);
    estimator.estimate();

    EXPECT_TRUE(estimator.estimated_position().has_value());
    EXPECT_TRUE(estimator.covariance().has_value());

    const auto& cov = *estimator.covariance();
    EXPECT_TRUE(cov(0, 0) > 0.0 && cov(1, 1) > 0.0);
    EXPECT_NEAR(cov(0, 1), cov(1, 0), 1e-9);
    EXPECT_TRUE(estimator.chi_sq() > 0.0);
    EXPECT_TRUE(estimator.diagnostics().equations == 18);
    EXPECT_TRUE(estimator.nearest_fingerprints().size() == 3);

    const double error = (*estimator.estimated_position() - truth).norm();
    std::cout << "  error with 1 dB noise: " << error << " m" << std::endl;
    log_diagnostics(estimator.diagnostics());
    EXPECT_TRUE(std::isfinite(error));

    TEST_PASS();
}

// ========== Test 4: Initial Position ==========

bool test_initial_position() {
    TEST("Initial position used as starting point");

    SyntheticRadioMap2d map(survey_area(), 8);
    auto sources = ring_sources(5, 80.0);
    auto located = map.generate_located_fingerprints(sources, 100);

    const Point2d truth(-7.5, 12.0);
    NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, truth), sources);

    estimator.set_initial_position(Point2d(-7.0, 11.0));
    EXPECT_TRUE(estimator.initial_position().has_value());
    estimator.estimate();
    const Point2d from_guess = *estimator.estimated_position();

    estimator.set_initial_position(std::nullopt);
    EXPECT_TRUE(!estimator.initial_position().has_value());
    estimator.estimate();
    const Point2d from_nearest = *estimator.estimated_position();

    // Same objective, same minimum
    EXPECT_NEAR((from_guess - from_nearest).norm(), 0.0, 1e-4);
    EXPECT_NEAR((from_nearest - truth).norm(), 0.0, 1e-2);

    TEST_PASS();
}

// ========== Test 5: 3D ==========

bool test_3d_scene() {
    TEST("3D scene");

    std::vector<LocatedRadioSource3d> sources;
    for (int i = 0; i < 6; i++) {
        const double angle = 2.0 * M_PI * i / 6.0;
        const double z = (i % 2 == 0) ? 40.0 : -40.0;
        sources.emplace_back("src-" + std::to_string(i),
                             Point3d(70.0 * std::cos(angle), 70.0 * std::sin(angle), z),
                             DEFAULT_FREQUENCY_HZ, -60.0);
    }

    auto params = SyntheticRadioMap3d::SceneParams::default_params();
    params.region_min = -15.0;
    params.region_max = 15.0;
    SyntheticRadioMap3d map(params, 64);
    auto located = map.generate_located_fingerprints(sources, 400);

    double max_error = 0.0;
    for (int trial = 0; trial < 10; trial++) {
        const Point3d truth = map.random_position();
        NonlinearFingerprintEstimator3d estimator(located, map.measure(sources, truth), sources);
        estimator.estimate();
        max_error = std::max(max_error, (*estimator.estimated_position() - truth).norm());
        EXPECT_TRUE(estimator.covariance()->rows() == 3);
    }

    std::cout << "  max error: " << max_error << " m" << std::endl;
    EXPECT_TRUE(max_error < 1e-2);

    TEST_PASS();
}

// ========== Test 6: Iteration Cap ==========

bool test_iteration_cap() {
    TEST("Fitter iteration cap reported as EstimationFailure");

    SyntheticRadioMap2d map(survey_area(), 5);
    auto sources = ring_sources(5, 80.0);
    auto located = map.generate_located_fingerprints(sources, 50);

    NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, Point2d(1.0, 2.0)),
                                              sources);
    estimator.estimate();
    EXPECT_TRUE(estimator.estimated_position().has_value());

    NonlinearEstimatorConfig<2> config = estimator.nonlinear_config();
    config.max_iterations = 1;
    estimator.set_nonlinear_config(config);

    EXPECT_THROW(estimator.estimate(), EstimationFailure);
    EXPECT_TRUE(!estimator.estimated_position().has_value());
    EXPECT_TRUE(!estimator.covariance().has_value());
    EXPECT_TRUE(!estimator.is_locked());

    TEST_PASS();
}

// ========== Test 7: Configuration ==========

bool test_configuration() {
    TEST("Configuration validation");

    NonlinearFingerprintEstimator2d estimator;
    EXPECT_NEAR(estimator.fallback_rssi_std_dbm(), 1.0, 1e-12);

    estimator.set_fallback_rssi_std_dbm(TINY_RSSI_STD);
    EXPECT_NEAR(estimator.fallback_rssi_std_dbm(), TINY_RSSI_STD, 1e-18);
    EXPECT_THROW(estimator.set_fallback_rssi_std_dbm(1e-13), ConfigurationError);
    EXPECT_THROW(estimator.set_fallback_rssi_std_dbm(-1.0), ConfigurationError);
    EXPECT_NEAR(estimator.fallback_rssi_std_dbm(), TINY_RSSI_STD, 1e-18);

    NonlinearEstimatorConfig<2> config;
    config.tolerance = -1.0;
    EXPECT_THROW(estimator.set_nonlinear_config(config), ConfigurationError);

    EXPECT_TRUE(!estimator.is_ready());
    EXPECT_THROW(estimator.estimate(), NotReadyError);

    TEST_PASS();
}

// ========== Test 8: Biased Query ==========

bool test_biased_query() {
    TEST("Constant query bias: mean removal beats raw readings");

    SyntheticRadioMap2d map(survey_area(), 4321);
    auto sources = ring_sources(5, 80.0);
    auto located = map.generate_located_fingerprints(sources, 100);

    const int trials = 30;
    const double bias_dbm = 1.0;
    double error_raw = 0.0;
    double error_no_mean = 0.0;

    for (int trial = 0; trial < trials; trial++) {
        const Point2d truth = map.random_position();
        NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, truth, bias_dbm),
                                                  sources);

        estimator.set_finder_mode(FinderMode::RAW);
        estimator.set_remove_means_from_fingerprint_readings(false);
        estimator.estimate();
        error_raw += (*estimator.estimated_position() - truth).norm() / trials;

        estimator.set_finder_mode(FinderMode::MEAN_REMOVED);
        estimator.set_remove_means_from_fingerprint_readings(true);
        estimator.estimate();
        error_no_mean += (*estimator.estimated_position() - truth).norm() / trials;
    }

    std::cout << "  mean error without mean removal: " << error_raw << " m" << std::endl;
    std::cout << "  mean error with mean removal:    " << error_no_mean << " m" << std::endl;
    EXPECT_TRUE(error_no_mean < error_raw);
    EXPECT_TRUE(error_no_mean < 1e-3);

    TEST_PASS();
}

// ========== Test 9: Per-Source Exponent ==========

bool test_source_path_loss_exponent() {
    TEST("Per-source path-loss exponent");

    auto params = survey_area();
    params.path_loss_exponent = 3.0;
    SyntheticRadioMap2d map(params, 555);
    auto sources = ring_sources(5, 80.0, 3.0);
    auto located = map.generate_located_fingerprints(sources, 100);

    double error_source = 0.0;
    double error_default = 0.0;
    for (int trial = 0; trial < 10; trial++) {
        const Point2d truth = map.random_position();
        NonlinearFingerprintEstimator2d estimator(located, map.measure(sources, truth), sources);
        EXPECT_NEAR(estimator.path_loss_exponent(), 2.0, 1e-12);

        estimator.set_use_sources_path_loss_exponent_when_available(true);
        estimator.estimate();
        error_source = std::max(error_source, (*estimator.estimated_position() - truth).norm());

        estimator.set_use_sources_path_loss_exponent_when_available(false);
        estimator.estimate();
        error_default += (*estimator.estimated_position() - truth).norm() / 10.0;
    }

    std::cout << "  source exponent max error: " << error_source << " m" << std::endl;
    std::cout << "  default exponent mean error: " << error_default << " m" << std::endl;
    EXPECT_TRUE(error_source < 1e-2);
    EXPECT_TRUE(error_default > 0.1);

    TEST_PASS();
}

// ========== Test 10: Propagation Toggles ==========

bool test_propagation_toggles() {
    TEST("Propagated uncertainties widen the covariance");

    UncertainScene scene = uncertain_scene(0.5);
    NonlinearFingerprintEstimator2d estimator(scene.located, scene.query, scene.sources);
    estimator.set_min_max_nearest_fingerprints(3, 3);

    EXPECT_TRUE(estimator.propagate_fingerprint_rssi_std());
    EXPECT_TRUE(estimator.propagate_path_loss_exponent_std());
    EXPECT_TRUE(estimator.propagate_fingerprint_position_covariance());
    EXPECT_TRUE(estimator.propagate_source_position_covariance());
    const double all_on = covariance_trace(estimator);

    auto set_all = [&estimator](bool on) {
        estimator.set_propagate_fingerprint_rssi_std(on);
        estimator.set_propagate_path_loss_exponent_std(on);
        estimator.set_propagate_fingerprint_position_covariance(on);
        estimator.set_propagate_source_position_covariance(on);
    };

    // Query std alone
    set_all(false);
    const double baseline = covariance_trace(estimator);

    const std::string names[4] = {"fingerprint rssi std", "path-loss exponent std",
                                  "fingerprint position covariance",
                                  "source position covariance"};
    double largest_single = 0.0;
    for (int i = 0; i < 4; i++) {
        set_all(false);
        if (i == 0) estimator.set_propagate_fingerprint_rssi_std(true);
        if (i == 1) estimator.set_propagate_path_loss_exponent_std(true);
        if (i == 2) estimator.set_propagate_fingerprint_position_covariance(true);
        if (i == 3) estimator.set_propagate_source_position_covariance(true);

        const double trace = covariance_trace(estimator);
        std::cout << "  " << names[i] << ": trace ratio " << trace / baseline << std::endl;
        EXPECT_TRUE(trace > baseline * 1.001);
        largest_single = std::max(largest_single, trace);
    }

    std::cout << "  all terms: trace ratio " << all_on / baseline << std::endl;
    EXPECT_TRUE(all_on > largest_single);

    TEST_PASS();
}

// ========== Test 11: Exponent Std ==========

bool test_exponent_std_growth() {
    TEST("Covariance grows with the path-loss exponent std");

    double previous = 0.0;
    for (double exponent_std : {0.1, 0.5, 1.0}) {
        UncertainScene scene = uncertain_scene(exponent_std);
        NonlinearFingerprintEstimator2d estimator(scene.located, scene.query, scene.sources);
        estimator.set_min_max_nearest_fingerprints(3, 3);
        estimator.set_propagate_fingerprint_rssi_std(false);
        estimator.set_propagate_fingerprint_position_covariance(false);
        estimator.set_propagate_source_position_covariance(false);

        const double trace = covariance_trace(estimator);
        std::cout << "  exponent std " << exponent_std << ": trace " << trace << std::endl;
        EXPECT_TRUE(trace > previous);
        previous = trace;
    }

    // The exponent std is rejected when it cannot describe a spread
    UncertainScene scene = uncertain_scene(0.5);
    scene.sources[2].path_loss_exponent_std = 0.0;
    NonlinearFingerprintEstimator2d estimator;
    EXPECT_THROW(estimator.set_sources(scene.sources), ConfigurationError);

    TEST_PASS();
}

int main() {
    std::cout << "\n============================================" << std::endl;
    std::cout << "  Nonlinear Fingerprint Estimator Validation Test" << std::endl;
    std::cout << "============================================\n" << std::endl;

    test_order_accuracy();
    test_evaluate();
    test_noisy_covariance();
    test_initial_position();
    test_3d_scene();
    test_iteration_cap();
    test_configuration();
    test_biased_query();
    test_source_path_loss_exponent();
    test_propagation_toggles();
    test_exponent_std_growth();

    return print_summary("Nonlinear Fingerprint Estimator");
}
