// Fingerprint Position Estimator Base
//
// Purpose: Shared configuration, readiness checks, lock discipline and
// listener notification for every fingerprint-based position estimator.
//
// States:
//   Unlocked + NotReady  -> required inputs missing
//   Unlocked + Ready     -> located fingerprints, query fingerprint and
//                           sources are set
//   Locked               -> estimate() in progress
//
// Transitions:
//   - Any setter while Locked throws LockedError and mutates nothing
//   - estimate() while Locked throws LockedError
//   - estimate() while NotReady throws NotReadyError
//   - estimate(): lock, clear previous result, on_estimate_start,
//     estimate_position(), on_estimate_end, unlock
//   - A failed estimate() leaves estimated_position() unset and skips
//     on_estimate_end; the lock is always released
//
// Sample Usage:
//   LinearFingerprintEstimator<2> estimator(located, query, sources);
//   estimator.set_min_max_nearest_fingerprints(1, 3);
//   estimator.estimate();
//   Point2d p = *estimator.estimated_position();
//
// Expected Output:
//   - estimated_position() set after each successful estimate()
//   - is_locked() false after estimate() returns or throws

#pragma once

#include "core/radio_types.hpp"
#include "finder/nearest_fingerprint_finder.hpp"
#include "utils/lock_guard.hpp"
#include "utils/logger.hpp"

#include <optional>
#include <vector>

namespace rfloc {

/**
 * @brief Configuration shared by linear and nonlinear estimators
 */
struct FingerprintEstimatorConfig {
    int min_nearest_fingerprints;     ///< Smallest k requested from the finder (>= 1)
    int max_nearest_fingerprints;     ///< Largest k, negative for the collection size
    double path_loss_exponent;        ///< Default path-loss exponent (> 0)
    bool use_sources_path_loss_exponent_when_available;
    FinderMode finder_mode;           ///< Metric selecting the working set
    bool remove_means_from_fingerprint_readings;

    FingerprintEstimatorConfig()
        : min_nearest_fingerprints(1),
          max_nearest_fingerprints(-1),
          path_loss_exponent(DEFAULT_PATH_LOSS_EXPONENT),
          use_sources_path_loss_exponent_when_available(true),
          finder_mode(FinderMode::MEAN_REMOVED),
          remove_means_from_fingerprint_readings(false) {}

    /**
     * @throws ConfigurationError if bounds or exponent are invalid
     */
    void validate() const;
};

template <int Dim>
class FingerprintEstimator;

/**
 * @brief Receives estimation start/end notifications
 *
 * Callbacks run while the estimator is locked.
 */
template <int Dim>
class FingerprintEstimatorListener {
public:
    virtual ~FingerprintEstimatorListener() = default;

    virtual void on_estimate_start(FingerprintEstimator<Dim>& estimator) = 0;
    virtual void on_estimate_end(FingerprintEstimator<Dim>& estimator) = 0;
};

template <int Dim>
class FingerprintEstimator {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    using Listener = FingerprintEstimatorListener<Dim>;

    virtual ~FingerprintEstimator() = default;

    FingerprintEstimator(const FingerprintEstimator&) = delete;
    FingerprintEstimator& operator=(const FingerprintEstimator&) = delete;

    // ========== Inputs ==========

    const std::vector<LocatedFingerprint<Dim>>& located_fingerprints() const {
        return located_fingerprints_;
    }

    /**
     * @throws LockedError, ConfigurationError if empty
     */
    void set_located_fingerprints(const std::vector<LocatedFingerprint<Dim>>& fingerprints);

    const std::optional<RssiFingerprint>& fingerprint() const { return fingerprint_; }

    /**
     * @brief Set the fingerprint whose position is estimated
     * @throws LockedError, ConfigurationError if empty
     */
    void set_fingerprint(const RssiFingerprint& fingerprint);

    const std::vector<LocatedRadioSource<Dim>>& sources() const { return sources_; }

    /**
     * @throws LockedError, ConfigurationError if empty or a path-loss
     * exponent std is not strictly positive
     */
    void set_sources(const std::vector<LocatedRadioSource<Dim>>& sources);

    FingerprintEstimatorListener<Dim>* listener() const { return listener_; }

    /**
     * @brief Set listener (not owned, may be null)
     */
    void set_listener(FingerprintEstimatorListener<Dim>* listener);

    // ========== Configuration ==========

    const FingerprintEstimatorConfig& config() const { return config_; }

    /**
     * @throws LockedError, ConfigurationError
     */
    void set_config(const FingerprintEstimatorConfig& config);

    int min_nearest_fingerprints() const { return config_.min_nearest_fingerprints; }
    int max_nearest_fingerprints() const { return config_.max_nearest_fingerprints; }

    /**
     * @param min_nearest At least 1
     * @param max_nearest At least min_nearest, or negative for no bound
     * @throws LockedError, ConfigurationError
     */
    void set_min_max_nearest_fingerprints(int min_nearest, int max_nearest);

    double path_loss_exponent() const { return config_.path_loss_exponent; }
    void set_path_loss_exponent(double path_loss_exponent);

    bool use_sources_path_loss_exponent_when_available() const {
        return config_.use_sources_path_loss_exponent_when_available;
    }
    void set_use_sources_path_loss_exponent_when_available(bool use);

    FinderMode finder_mode() const { return config_.finder_mode; }
    void set_finder_mode(FinderMode mode);

    bool remove_means_from_fingerprint_readings() const {
        return config_.remove_means_from_fingerprint_readings;
    }
    void set_remove_means_from_fingerprint_readings(bool remove);

    // ========== Estimation ==========

    bool is_locked() const { return locked_; }

    /**
     * @brief True when located fingerprints (at least Dim readings in
     * total), the query fingerprint and sources are set
     */
    virtual bool is_ready() const;

    /**
     * @brief Estimate the position of the query fingerprint
     *
     * @throws LockedError if called while an estimation runs
     * @throws NotReadyError if inputs are missing or too few equations
     * @throws EstimationFailure on numerical failure
     */
    void estimate();

    const std::optional<Point<Dim>>& estimated_position() const { return estimated_position_; }

    /**
     * @brief Located fingerprints used by the last successful estimation
     */
    const std::vector<LocatedFingerprint<Dim>>& nearest_fingerprints() const {
        return nearest_fingerprints_;
    }

    const EstimationDiagnostics& diagnostics() const { return diagnostics_; }

protected:
    FingerprintEstimator();
    FingerprintEstimator(const std::vector<LocatedFingerprint<Dim>>& located_fingerprints,
                         const RssiFingerprint& fingerprint,
                         const std::vector<LocatedRadioSource<Dim>>& sources,
                         FingerprintEstimatorListener<Dim>* listener);

    /**
     * @brief Run the estimation algorithm
     *
     * Called with the estimator locked and ready. Implementations finish
     * by calling store_result().
     */
    virtual void estimate_position() = 0;

    /**
     * @brief Forget the previous result, called before each estimation
     */
    virtual void clear_result();

    void store_result(const Point<Dim>& position,
                      std::vector<LocatedFingerprint<Dim>> nearest,
                      const EstimationDiagnostics& diagnostics);

    /**
     * @throws LockedError if locked
     */
    void check_unlocked() const;

    /**
     * @brief Largest k to request, bounded by the collection size
     */
    int effective_max_nearest_fingerprints() const;

    /**
     * @brief Source with the given id, or nullptr
     */
    const LocatedRadioSource<Dim>* find_source(const std::string& source_id) const;

    /**
     * @brief Path-loss exponent to use for a source under the current config
     */
    double path_loss_exponent_for(const LocatedRadioSource<Dim>& source) const;

    /**
     * @brief Reading of a located fingerprint matched with its source and
     * with the query reading of the same source
     */
    struct MatchedReading {
        const LocatedRadioSource<Dim>* source;
        double fingerprint_rssi;   ///< [dBm], de-meaned if configured
        double query_rssi;         ///< [dBm], de-meaned if configured
        std::optional<double> fingerprint_rssi_std;
        std::optional<double> query_rssi_std;
        double path_loss_exponent;
        std::optional<double> path_loss_exponent_std;   ///< Only with the source's exponent
    };

    /**
     * @brief Readings of a located fingerprint usable for estimation
     *
     * A reading is kept when its source is known and the query fingerprint
     * measured the same source. Sources located exactly at the fingerprint
     * position are skipped with a warning.
     */
    std::vector<MatchedReading> match_readings(const LocatedFingerprint<Dim>& located) const;

private:
    std::vector<LocatedFingerprint<Dim>> located_fingerprints_;
    std::optional<RssiFingerprint> fingerprint_;
    std::vector<LocatedRadioSource<Dim>> sources_;
    FingerprintEstimatorListener<Dim>* listener_;

    FingerprintEstimatorConfig config_;
    bool locked_;

    std::optional<Point<Dim>> estimated_position_;
    std::vector<LocatedFingerprint<Dim>> nearest_fingerprints_;
    EstimationDiagnostics diagnostics_;
};

}  // namespace rfloc
