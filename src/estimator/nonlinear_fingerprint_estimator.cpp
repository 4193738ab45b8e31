// Nonlinear Fingerprint Position Estimator Implementation
#include "estimator/nonlinear_fingerprint_estimator.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfloc {

template <int Dim>
void NonlinearEstimatorConfig<Dim>::validate() const {
    if (!(fallback_rssi_std_dbm >= TINY_RSSI_STD)) {
        throw ConfigurationError("fallback RSSI standard deviation is too small");
    }
    if (max_iterations < 1) {
        throw ConfigurationError("fitter iteration cap must be at least 1");
    }
    if (!(tolerance > 0.0)) {
        throw ConfigurationError("fitter tolerance must be positive");
    }
    if (initial_position && !initial_position->allFinite()) {
        throw ConfigurationError("initial position must be finite");
    }
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_nonlinear_config(
    const NonlinearEstimatorConfig<Dim>& config) {
    this->check_unlocked();
    config.validate();
    nonlinear_config_ = config;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_order(TaylorOrder order) {
    this->check_unlocked();
    nonlinear_config_.order = order;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_fallback_rssi_std_dbm(double std_dbm) {
    this->check_unlocked();
    NonlinearEstimatorConfig<Dim> config = nonlinear_config_;
    config.fallback_rssi_std_dbm = std_dbm;
    config.validate();
    nonlinear_config_ = config;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_initial_position(
    const std::optional<Point<Dim>>& position) {
    this->check_unlocked();
    NonlinearEstimatorConfig<Dim> config = nonlinear_config_;
    config.initial_position = position;
    config.validate();
    nonlinear_config_ = config;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_propagate_fingerprint_rssi_std(bool propagate) {
    this->check_unlocked();
    nonlinear_config_.propagate_fingerprint_rssi_std = propagate;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_propagate_path_loss_exponent_std(bool propagate) {
    this->check_unlocked();
    nonlinear_config_.propagate_path_loss_exponent_std = propagate;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_propagate_fingerprint_position_covariance(
    bool propagate) {
    this->check_unlocked();
    nonlinear_config_.propagate_fingerprint_position_covariance = propagate;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::set_propagate_source_position_covariance(bool propagate) {
    this->check_unlocked();
    nonlinear_config_.propagate_source_position_covariance = propagate;
}

template <int Dim>
double NonlinearFingerprintEstimator<Dim>::observation_std(
    const typename FingerprintEstimator<Dim>::MatchedReading& match,
    const LocatedFingerprint<Dim>& located,
    const Point<Dim>& expansion_point) const {

    const NonlinearEstimatorConfig<Dim>& config = nonlinear_config_;

    std::optional<double> propagated;
    if (config.propagates_any()) {
        std::optional<double> rssi_variance;
        if (config.propagate_fingerprint_rssi_std && match.fingerprint_rssi_std) {
            rssi_variance = (*match.fingerprint_rssi_std) * (*match.fingerprint_rssi_std);
        }
        std::optional<double> exponent_variance;
        if (config.propagate_path_loss_exponent_std && match.path_loss_exponent_std) {
            exponent_variance = (*match.path_loss_exponent_std) * (*match.path_loss_exponent_std);
        }
        std::optional<PositionCovariance<Dim>> fingerprint_covariance;
        if (config.propagate_fingerprint_position_covariance) {
            fingerprint_covariance = located.position_covariance();
        }
        std::optional<PositionCovariance<Dim>> source_covariance;
        if (config.propagate_source_position_covariance) {
            source_covariance = match.source->position_covariance;
        }

        propagated = propagate_rssi_variance<Dim>(
            config.order, match.fingerprint_rssi, located.position(), match.source->position,
            match.path_loss_exponent, expansion_point, rssi_variance, exponent_variance,
            fingerprint_covariance, source_covariance);
    }

    double sigma = config.fallback_rssi_std_dbm;
    if (propagated && match.query_rssi_std) {
        sigma = std::sqrt(*propagated + (*match.query_rssi_std) * (*match.query_rssi_std));
    } else if (propagated) {
        sigma = std::sqrt(*propagated);
    } else if (match.query_rssi_std) {
        sigma = *match.query_rssi_std;
    }

    if (!(sigma >= TINY_RSSI_STD)) {
        sigma = config.fallback_rssi_std_dbm;
    }
    return sigma;
}

template <int Dim>
double NonlinearFingerprintEstimator<Dim>::evaluate(int /*index*/, const VectorXd& point,
                                                    const VectorXd& params,
                                                    VectorXd& derivatives) const {
    const double fingerprint_rssi = point(0);
    const Point<Dim> fingerprint_position = point.template segment<Dim>(1);
    const Point<Dim> source_position = point.template segment<Dim>(1 + Dim);
    const double path_loss_exponent = point(1 + 2 * Dim);
    const Point<Dim> position = params.template head<Dim>();

    Point<Dim> gradient;
    const double rssi = taylor_expected_rssi<Dim>(nonlinear_config_.order, fingerprint_rssi,
                                                  fingerprint_position, source_position,
                                                  path_loss_exponent, position, &gradient);
    derivatives = gradient;
    return rssi;
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::estimate_position() {
    NearestFingerprintFinder<Dim> finder(this->located_fingerprints(), this->finder_mode());
    const RssiFingerprint& query = *this->fingerprint();

    const int min_k = this->min_nearest_fingerprints();
    const int max_k = this->effective_max_nearest_fingerprints();

    int previous_count = -1;

    for (int k = min_k; k <= max_k; k++) {
        const auto neighbours = finder.find_k_nearest_to(query, k);
        const int count = static_cast<int>(neighbours.size());
        if (count == 0 || count <= previous_count) {
            // No more fingerprints share a source with the query
            break;
        }
        previous_count = count;

        const Point<Dim> initial = nonlinear_config_.initial_position
                                       ? *nonlinear_config_.initial_position
                                       : neighbours.front().fingerprint->position();

        // === Collect observations ===
        std::vector<VectorXd> points;
        std::vector<double> values;
        std::vector<double> sigmas;

        for (const auto& neighbour : neighbours) {
            const LocatedFingerprint<Dim>& located = *neighbour.fingerprint;
            for (const auto& match : this->match_readings(located)) {
                VectorXd point(POINT_SIZE);
                point(0) = match.fingerprint_rssi;
                point.template segment<Dim>(1) = located.position();
                point.template segment<Dim>(1 + Dim) = match.source->position;
                point(1 + 2 * Dim) = match.path_loss_exponent;

                points.push_back(point);
                values.push_back(match.query_rssi);
                sigmas.push_back(observation_std(match, located, initial));
            }
        }

        const int observations = static_cast<int>(points.size());
        if (observations < Dim) {
            LOG_DEBUG("Nonlinear estimator: k=%d gives %d observations, need %d",
                      k, observations, Dim);
            continue;
        }

        MatrixXd x(observations, POINT_SIZE);
        VectorXd y(observations);
        VectorXd sigma(observations);
        for (int i = 0; i < observations; i++) {
            x.row(i) = points[i].transpose();
            y(i) = values[i];
            sigma(i) = sigmas[i];
        }

        // === Fit ===
        LevenbergMarquardtFitter::Options options;
        options.max_iterations = nonlinear_config_.max_iterations;
        options.tolerance = nonlinear_config_.tolerance;

        LevenbergMarquardtFitter fitter(
            [this](int i, const VectorXd& point, const VectorXd& params, VectorXd& dyda) {
                return evaluate(i, point, params, dyda);
            },
            options);
        fitter.set_input_data(x, y, sigma);

        const LevenbergMarquardtFitter::FitResult fit = fitter.fit(initial);

        std::vector<LocatedFingerprint<Dim>> used;
        used.reserve(neighbours.size());
        for (const auto& neighbour : neighbours) {
            used.push_back(*neighbour.fingerprint);
        }

        EstimationDiagnostics diagnostics;
        diagnostics.nearest_fingerprints = count;
        diagnostics.equations = observations;
        diagnostics.attempts = 1;
        diagnostics.iterations = fit.iterations;
        diagnostics.chi_sq = fit.chi_sq;

        covariance_ = Covariance(fit.covariance);
        chi_sq_ = fit.chi_sq;
        this->store_result(fit.params.template head<Dim>(), std::move(used), diagnostics);

        LOG_DEBUG("Nonlinear estimator (%s): k=%d, %d observations, %d iterations",
                  to_string(nonlinear_config_.order), count, observations, fit.iterations);
        return;
    }

    throw NotReadyError("not enough readings to build " + std::to_string(Dim) +
                        " observations");
}

template <int Dim>
void NonlinearFingerprintEstimator<Dim>::clear_result() {
    FingerprintEstimator<Dim>::clear_result();
    covariance_.reset();
    chi_sq_ = 0.0;
}

template struct NonlinearEstimatorConfig<2>;
template struct NonlinearEstimatorConfig<3>;
template class NonlinearFingerprintEstimator<2>;
template class NonlinearFingerprintEstimator<3>;

}  // namespace rfloc
