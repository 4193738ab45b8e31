// Weighted k-Nearest-Neighbours Position Solver Implementation
#include "estimator/weighted_knn_solver.hpp"
#include "core/errors.hpp"
#include "utils/lock_guard.hpp"
#include "utils/logger.hpp"

#include <algorithm>

namespace rfloc {

template <int Dim>
WeightedKnnPositionSolver<Dim>::WeightedKnnPositionSolver()
    : listener_(nullptr), epsilon_(DEFAULT_EPSILON), locked_(false) {}

template <int Dim>
WeightedKnnPositionSolver<Dim>::WeightedKnnPositionSolver(
    const std::vector<LocatedFingerprint<Dim>>& fingerprints,
    const std::vector<double>& distances,
    WeightedKnnSolverListener<Dim>* listener)
    : listener_(listener), epsilon_(DEFAULT_EPSILON), locked_(false) {
    set_fingerprints_and_distances(fingerprints, distances);
}

template <int Dim>
WeightedKnnPositionSolver<Dim> WeightedKnnPositionSolver<Dim>::from_neighbours(
    const std::vector<FingerprintNeighbour<Dim>>& neighbours,
    WeightedKnnSolverListener<Dim>* listener) {

    std::vector<LocatedFingerprint<Dim>> fingerprints;
    std::vector<double> distances;
    fingerprints.reserve(neighbours.size());
    distances.reserve(neighbours.size());

    for (const auto& neighbour : neighbours) {
        fingerprints.push_back(*neighbour.fingerprint);
        distances.push_back(neighbour.distance);
    }
    return WeightedKnnPositionSolver(fingerprints, distances, listener);
}

template <int Dim>
void WeightedKnnPositionSolver<Dim>::check_unlocked() const {
    if (locked_) {
        throw LockedError();
    }
}

template <int Dim>
void WeightedKnnPositionSolver<Dim>::set_fingerprints_and_distances(
    const std::vector<LocatedFingerprint<Dim>>& fingerprints,
    const std::vector<double>& distances) {
    check_unlocked();
    if (fingerprints.empty()) {
        throw ConfigurationError("weighted kNN requires at least one fingerprint");
    }
    if (fingerprints.size() != distances.size()) {
        throw ConfigurationError("one distance per fingerprint is required");
    }
    fingerprints_ = fingerprints;
    distances_ = distances;
}

template <int Dim>
void WeightedKnnPositionSolver<Dim>::set_epsilon(double epsilon) {
    check_unlocked();
    if (!(epsilon > 0.0)) {
        throw ConfigurationError("epsilon must be positive");
    }
    epsilon_ = epsilon;
}

template <int Dim>
void WeightedKnnPositionSolver<Dim>::set_listener(WeightedKnnSolverListener<Dim>* listener) {
    check_unlocked();
    listener_ = listener;
}

template <int Dim>
void WeightedKnnPositionSolver<Dim>::solve() {
    check_unlocked();
    if (!is_ready()) {
        throw NotReadyError("weighted kNN solver has no fingerprints");
    }

    LockGuard guard(locked_);
    estimated_position_.reset();

    if (listener_ != nullptr) {
        listener_->on_solve_start(*this);
    }

    if (fingerprints_.size() == 1) {
        estimated_position_ = fingerprints_.front().position();
    } else {
        Point<Dim> weighted_sum = Point<Dim>::Zero();
        double weight_sum = 0.0;
        for (size_t i = 0; i < fingerprints_.size(); i++) {
            const double w = 1.0 / std::max(distances_[i], epsilon_);
            weighted_sum += w * fingerprints_[i].position();
            weight_sum += w;
        }
        estimated_position_ = Point<Dim>(weighted_sum / weight_sum);
    }

    LOG_DEBUG("Weighted kNN: %zu neighbours", fingerprints_.size());

    if (listener_ != nullptr) {
        listener_->on_solve_end(*this);
    }
}

template class WeightedKnnPositionSolver<2>;
template class WeightedKnnPositionSolver<3>;

}  // namespace rfloc
