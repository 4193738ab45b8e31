// Nonlinear Fingerprint Position Estimator
//
// Purpose: Iterative least-squares position estimate fitting the received
// power of the query to a Taylor expansion of the log-distance model around
// the nearest located fingerprints.
//
// Observations:
//   One per (located reading, known source, query reading of that source):
//     point = [Pr_fa, p_f (Dim), s_a (Dim), n_a]
//     y     = Pr_qa
//     sigma = sqrt(var_p + sigma_q^2), sqrt(var_p), sigma_q, or the fallback
//
// Variance propagation:
//   var_p is the first-order propagation (math/rssi_taylor.hpp) of the
//   enabled uncertainties, evaluated at the initial position of the fit:
//     - fingerprint reading std
//     - source path-loss exponent std (only when the source exponent is used)
//     - fingerprint position covariance
//     - source position covariance
//   With only the fingerprint reading std enabled, var_p = sigma_f^2.
//
// Model:
//   Pr_qa(x) ~ Taylor expansion of Pr(x) = K - 5 n_a log10(|x - s_a|^2)
//   around p_f, truncated at the configured order (see math/rssi_taylor.hpp).
//   Only the position x is fitted; power and exponent are known.
//
// Initial position:
//   Configured initial position, else the position of the nearest
//   fingerprint under the configured finder mode.
//
// Sample Usage:
//   NonlinearFingerprintEstimator<2> estimator(located, query, sources);
//   estimator.set_order(TaylorOrder::SECOND);
//   estimator.estimate();
//   auto cov = estimator.covariance();
//
// Expected Output:
//   - Estimated position, Dim x Dim covariance and chi^2
//   - EstimationFailure if the fit does not converge (no retry with larger k)

#pragma once

#include "estimator/fingerprint_estimator.hpp"
#include "math/lm_fitter.hpp"
#include "math/rssi_taylor.hpp"

#include <optional>

namespace rfloc {

/**
 * @brief Settings specific to the nonlinear estimator
 */
template <int Dim>
struct NonlinearEstimatorConfig {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    TaylorOrder order;                          ///< Expansion order of the model
    double fallback_rssi_std_dbm;               ///< Sigma when no reading carries one [dB]
    std::optional<Point<Dim>> initial_position; ///< Start of the fit, if known
    int max_iterations;                         ///< Fitter iteration cap
    double tolerance;                           ///< Fitter chi^2 convergence threshold

    // Uncertainties propagated into the observation sigma
    bool propagate_fingerprint_rssi_std;
    bool propagate_path_loss_exponent_std;
    bool propagate_fingerprint_position_covariance;
    bool propagate_source_position_covariance;

    NonlinearEstimatorConfig()
        : order(TaylorOrder::THIRD),
          fallback_rssi_std_dbm(1.0),
          max_iterations(1000),
          tolerance(1e-9),
          propagate_fingerprint_rssi_std(true),
          propagate_path_loss_exponent_std(true),
          propagate_fingerprint_position_covariance(true),
          propagate_source_position_covariance(true) {}

    bool propagates_any() const {
        return propagate_fingerprint_rssi_std || propagate_path_loss_exponent_std ||
               propagate_fingerprint_position_covariance || propagate_source_position_covariance;
    }

    /**
     * @throws ConfigurationError on invalid values
     */
    void validate() const;
};

template <int Dim>
class NonlinearFingerprintEstimator : public FingerprintEstimator<Dim> {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    using Covariance = Eigen::Matrix<double, Dim, Dim>;

    /// Layout of an observation point: [Pr_fa, p_f, s_a, n_a]
    static constexpr int POINT_SIZE = 2 * Dim + 2;

    NonlinearFingerprintEstimator() = default;

    /**
     * @throws ConfigurationError if any collection is empty
     */
    NonlinearFingerprintEstimator(const std::vector<LocatedFingerprint<Dim>>& located_fingerprints,
                                  const RssiFingerprint& fingerprint,
                                  const std::vector<LocatedRadioSource<Dim>>& sources,
                                  FingerprintEstimatorListener<Dim>* listener = nullptr)
        : FingerprintEstimator<Dim>(located_fingerprints, fingerprint, sources, listener) {}

    // ========== Configuration ==========

    const NonlinearEstimatorConfig<Dim>& nonlinear_config() const { return nonlinear_config_; }

    /**
     * @throws LockedError, ConfigurationError
     */
    void set_nonlinear_config(const NonlinearEstimatorConfig<Dim>& config);

    TaylorOrder order() const { return nonlinear_config_.order; }
    void set_order(TaylorOrder order);

    double fallback_rssi_std_dbm() const { return nonlinear_config_.fallback_rssi_std_dbm; }

    /**
     * @throws LockedError, ConfigurationError if below TINY_RSSI_STD
     */
    void set_fallback_rssi_std_dbm(double std_dbm);

    const std::optional<Point<Dim>>& initial_position() const {
        return nonlinear_config_.initial_position;
    }

    /**
     * @brief Set or clear (nullopt) the initial position of the fit
     */
    void set_initial_position(const std::optional<Point<Dim>>& position);

    bool propagate_fingerprint_rssi_std() const {
        return nonlinear_config_.propagate_fingerprint_rssi_std;
    }
    void set_propagate_fingerprint_rssi_std(bool propagate);

    bool propagate_path_loss_exponent_std() const {
        return nonlinear_config_.propagate_path_loss_exponent_std;
    }
    void set_propagate_path_loss_exponent_std(bool propagate);

    bool propagate_fingerprint_position_covariance() const {
        return nonlinear_config_.propagate_fingerprint_position_covariance;
    }
    void set_propagate_fingerprint_position_covariance(bool propagate);

    bool propagate_source_position_covariance() const {
        return nonlinear_config_.propagate_source_position_covariance;
    }
    void set_propagate_source_position_covariance(bool propagate);

    // ========== Model ==========

    /**
     * @brief Predicted query RSSI of one observation
     *
     * @param index Observation index
     * @param point Observation point [Pr_fa, p_f, s_a, n_a]
     * @param params Current position estimate (Dim entries)
     * @param derivatives Receives d(prediction)/d(position) (Dim entries)
     * @return Predicted RSSI [dBm]
     */
    double evaluate(int index, const VectorXd& point, const VectorXd& params,
                    VectorXd& derivatives) const;

    // ========== Results ==========

    /**
     * @brief Covariance of the estimated position, set after a successful estimate()
     */
    const std::optional<Covariance>& covariance() const { return covariance_; }

    /**
     * @brief Chi^2 of the last successful fit
     */
    double chi_sq() const { return chi_sq_; }

protected:
    void estimate_position() override;
    void clear_result() override;

private:
    NonlinearEstimatorConfig<Dim> nonlinear_config_;

    /**
     * @brief Standard deviation of one observation [dB]
     */
    double observation_std(const typename FingerprintEstimator<Dim>::MatchedReading& match,
                           const LocatedFingerprint<Dim>& located,
                           const Point<Dim>& expansion_point) const;

    std::optional<Covariance> covariance_;
    double chi_sq_ = 0.0;
};

using NonlinearFingerprintEstimator2d = NonlinearFingerprintEstimator<2>;
using NonlinearFingerprintEstimator3d = NonlinearFingerprintEstimator<3>;

}  // namespace rfloc
