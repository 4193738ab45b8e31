// Linear Fingerprint Position Estimator
//
// Purpose: Closed-form position estimate from the k nearest located
// fingerprints, by eliminating the quadratic term of the range equations.
//
// Model:
//   For a located fingerprint f at p_f and a source a at s_a measured both
//   at f (Pr_fa) and by the query (Pr_qa), the log-distance law relative to
//   the surveyed point gives the squared distance from the query to s_a:
//
//     d_a^2 = |p_f - s_a|^2 * 10^((Pr_fa - Pr_qa) / (5 * n_a))
//
//   Transmitted power and carrier frequency cancel. With |x - s_a|^2 = d_a^2
//   for every source a of the same fingerprint, subtracting the equations of
//   two sources a, b removes |x|^2:
//
//     2 (s_b - s_a)^T x = d_a^2 - d_b^2 + |s_b|^2 - |s_a|^2
//
//   All pairwise rows of the selected fingerprints are stacked into A x = b
//   and solved in the least-squares sense by column-pivoting Householder QR.
//
// k selection:
//   k runs from min_nearest_fingerprints up to max_nearest_fingerprints (the
//   collection size when negative). The first k whose system has full rank
//   gives the estimate.
//
// Sample Usage:
//   LinearFingerprintEstimator<2> estimator(located, query, sources);
//   estimator.set_finder_mode(FinderMode::RAW);
//   estimator.estimate();
//
// Expected Output:
//   - Exact position for noise-free readings following the model
//   - NotReadyError if no k yields at least Dim equations
//   - EstimationFailure if every k yields a rank-deficient system

#pragma once

#include "estimator/fingerprint_estimator.hpp"

#include <vector>

namespace rfloc {

template <int Dim>
class LinearFingerprintEstimator : public FingerprintEstimator<Dim> {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    LinearFingerprintEstimator() = default;

    /**
     * @throws ConfigurationError if any collection is empty
     */
    LinearFingerprintEstimator(const std::vector<LocatedFingerprint<Dim>>& located_fingerprints,
                               const RssiFingerprint& fingerprint,
                               const std::vector<LocatedRadioSource<Dim>>& sources,
                               FingerprintEstimatorListener<Dim>* listener = nullptr)
        : FingerprintEstimator<Dim>(located_fingerprints, fingerprint, sources, listener) {}

protected:
    void estimate_position() override;

private:
    /**
     * @brief Append the pairwise equations of one located fingerprint
     */
    void append_equations(const LocatedFingerprint<Dim>& located,
                         std::vector<Eigen::Matrix<double, 1, Dim>>& rows,
                         std::vector<double>& rhs) const;
};

using LinearFingerprintEstimator2d = LinearFingerprintEstimator<2>;
using LinearFingerprintEstimator3d = LinearFingerprintEstimator<3>;

}  // namespace rfloc
