// Linear Fingerprint Position Estimator Implementation
#include "estimator/linear_fingerprint_estimator.hpp"
#include "core/errors.hpp"
#include "math/propagation_model.hpp"

#include <Eigen/QR>

#include <string>
#include <utility>
#include <vector>

namespace rfloc {

template <int Dim>
void LinearFingerprintEstimator<Dim>::append_equations(
    const LocatedFingerprint<Dim>& located,
    std::vector<Eigen::Matrix<double, 1, Dim>>& rows,
    std::vector<double>& rhs) const {

    const auto matches = this->match_readings(located);
    const size_t m = matches.size();

    // Squared distance from the query to every matched source
    std::vector<double> sqr_distances(m);
    for (size_t i = 0; i < m; i++) {
        const auto& match = matches[i];
        const double ref_sqr_distance =
            (located.position() - match.source->position).squaredNorm();
        sqr_distances[i] = propagation::squared_distance_from_reference(
            ref_sqr_distance, match.fingerprint_rssi, match.query_rssi,
            match.path_loss_exponent);
    }

    for (size_t a = 0; a < m; a++) {
        const Point<Dim>& sa = matches[a].source->position;
        for (size_t b = a + 1; b < m; b++) {
            const Point<Dim>& sb = matches[b].source->position;

            rows.push_back(2.0 * (sb - sa).transpose());
            rhs.push_back(sqr_distances[a] - sqr_distances[b] +
                          sb.squaredNorm() - sa.squaredNorm());
        }
    }
}

template <int Dim>
void LinearFingerprintEstimator<Dim>::estimate_position() {
    NearestFingerprintFinder<Dim> finder(this->located_fingerprints(), this->finder_mode());
    const RssiFingerprint& query = *this->fingerprint();

    const int min_k = this->min_nearest_fingerprints();
    const int max_k = this->effective_max_nearest_fingerprints();

    bool enough_equations = false;
    int attempts = 0;
    int previous_count = -1;

    for (int k = min_k; k <= max_k; k++) {
        const auto neighbours = finder.find_k_nearest_to(query, k);
        const int count = static_cast<int>(neighbours.size());
        if (count <= previous_count) {
            // No more fingerprints share a source with the query
            break;
        }
        previous_count = count;

        std::vector<Eigen::Matrix<double, 1, Dim>> rows;
        std::vector<double> rhs;
        for (const auto& neighbour : neighbours) {
            append_equations(*neighbour.fingerprint, rows, rhs);
        }

        const int equations = static_cast<int>(rows.size());
        if (equations < Dim) {
            LOG_DEBUG("Linear estimator: k=%d gives %d equations, need %d", k, equations, Dim);
            continue;
        }
        enough_equations = true;
        attempts++;

        Eigen::MatrixXd A(equations, Dim);
        Eigen::VectorXd b(equations);
        for (int i = 0; i < equations; i++) {
            A.row(i) = rows[i];
            b(i) = rhs[i];
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A);
        if (qr.rank() < Dim) {
            LOG_DEBUG("Linear estimator: k=%d rank %d < %d", k, static_cast<int>(qr.rank()), Dim);
            continue;
        }

        const Point<Dim> position = qr.solve(b);
        if (!position.allFinite()) {
            LOG_DEBUG("Linear estimator: k=%d gives a non-finite solution", k);
            continue;
        }

        std::vector<LocatedFingerprint<Dim>> used;
        used.reserve(neighbours.size());
        for (const auto& neighbour : neighbours) {
            used.push_back(*neighbour.fingerprint);
        }

        EstimationDiagnostics diagnostics;
        diagnostics.nearest_fingerprints = count;
        diagnostics.equations = equations;
        diagnostics.attempts = attempts;

        this->store_result(position, std::move(used), diagnostics);
        return;
    }

    if (!enough_equations) {
        throw NotReadyError("not enough readings to build " + std::to_string(Dim) +
                            " linear equations");
    }
    LOG_WARN("Linear estimator: rank-deficient system for every k in [%d, %d]", min_k, max_k);
    throw EstimationFailure("linear system is rank deficient for every number of fingerprints");
}

template class LinearFingerprintEstimator<2>;
template class LinearFingerprintEstimator<3>;

}  // namespace rfloc
