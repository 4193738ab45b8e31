// Weighted k-Nearest-Neighbours Position Solver
//
// Purpose: Position estimate from the k nearest located fingerprints alone,
// without radio sources: the positions are averaged with weights inversely
// proportional to their signal-space distance.
//
//   x = sum_i (p_i / d_i) / sum_i (1 / d_i)
//
// Distances below epsilon are clamped to epsilon so that an exact signal
// match dominates without dividing by zero.
//
// Sample Usage:
//   NearestFingerprintFinder<2> finder(located, FinderMode::MEAN_REMOVED);
//   auto solver = WeightedKnnPositionSolver<2>::from_neighbours(
//       finder.find_k_nearest_to(query, 4));
//   solver.solve();
//
// Expected Output:
//   - estimated_position() inside the convex hull of the neighbours

#pragma once

#include "core/radio_types.hpp"
#include "finder/nearest_fingerprint_finder.hpp"

#include <optional>
#include <vector>

namespace rfloc {

template <int Dim>
class WeightedKnnPositionSolver;

template <int Dim>
class WeightedKnnSolverListener {
public:
    virtual ~WeightedKnnSolverListener() = default;

    virtual void on_solve_start(WeightedKnnPositionSolver<Dim>& solver) = 0;
    virtual void on_solve_end(WeightedKnnPositionSolver<Dim>& solver) = 0;
};

template <int Dim>
class WeightedKnnPositionSolver {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    static constexpr double DEFAULT_EPSILON = 1e-7;

    WeightedKnnPositionSolver();

    /**
     * @throws ConfigurationError if empty or sizes differ
     */
    WeightedKnnPositionSolver(const std::vector<LocatedFingerprint<Dim>>& fingerprints,
                              const std::vector<double>& distances,
                              WeightedKnnSolverListener<Dim>* listener = nullptr);

    /**
     * @brief Solver over finder output
     * @throws ConfigurationError if neighbours is empty
     */
    static WeightedKnnPositionSolver from_neighbours(
        const std::vector<FingerprintNeighbour<Dim>>& neighbours,
        WeightedKnnSolverListener<Dim>* listener = nullptr);

    const std::vector<LocatedFingerprint<Dim>>& fingerprints() const { return fingerprints_; }
    const std::vector<double>& distances() const { return distances_; }

    /**
     * @throws LockedError, ConfigurationError if empty or sizes differ
     */
    void set_fingerprints_and_distances(const std::vector<LocatedFingerprint<Dim>>& fingerprints,
                                        const std::vector<double>& distances);

    double epsilon() const { return epsilon_; }

    /**
     * @throws LockedError, ConfigurationError if not positive
     */
    void set_epsilon(double epsilon);

    WeightedKnnSolverListener<Dim>* listener() const { return listener_; }
    void set_listener(WeightedKnnSolverListener<Dim>* listener);

    bool is_locked() const { return locked_; }
    bool is_ready() const { return !fingerprints_.empty(); }

    /**
     * @throws LockedError, NotReadyError
     */
    void solve();

    const std::optional<Point<Dim>>& estimated_position() const { return estimated_position_; }

private:
    std::vector<LocatedFingerprint<Dim>> fingerprints_;
    std::vector<double> distances_;
    WeightedKnnSolverListener<Dim>* listener_;
    double epsilon_;
    bool locked_;

    std::optional<Point<Dim>> estimated_position_;

    void check_unlocked() const;
};

using WeightedKnnPositionSolver2d = WeightedKnnPositionSolver<2>;
using WeightedKnnPositionSolver3d = WeightedKnnPositionSolver<3>;

}  // namespace rfloc
