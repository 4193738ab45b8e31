// Nearest Located Fingerprint Finder
//
// Purpose: Rank surveyed fingerprints by signal-space similarity to a query
// fingerprint and return the k closest ones.
//
// Metrics:
//   RAW:           d^2 = sum_a (Pr_qa - Pr_fa)^2
//   MEAN_REMOVED:  d^2 = sum_a ((Pr_qa - mean_q) - (Pr_fa - mean_f))^2
//   where a runs over the sources present in both fingerprints and each mean
//   is taken over all readings of its own fingerprint.
//
// The mean-removed metric is unchanged when a constant offset is added to
// every reading of either fingerprint (uncalibrated receivers).
//
// Sample Usage:
//   NearestFingerprintFinder<2> finder(located, FinderMode::MEAN_REMOVED);
//   auto neighbours = finder.find_k_nearest_to(query, 3);
//   for (const auto& n : neighbours) {
//       use(n.fingerprint->position(), n.distance);
//   }
//
// Expected Output:
//   - Up to k neighbours in ascending distance, ties in input order
//   - Fingerprints sharing no source with the query are never returned

#pragma once

#include "core/radio_types.hpp"

#include <optional>
#include <vector>

namespace rfloc {

/**
 * @brief Signal-space metric used to rank fingerprints
 */
enum class FinderMode {
    RAW,            ///< Euclidean distance of raw RSSI
    MEAN_REMOVED    ///< Euclidean distance after removing each fingerprint's mean
};

const char* to_string(FinderMode mode);

/**
 * @brief One ranked located fingerprint
 */
template <int Dim>
struct FingerprintNeighbour {
    size_t index;                                 ///< Index in the searched collection
    const LocatedFingerprint<Dim>* fingerprint;   ///< Points into the searched collection
    double distance;                              ///< Signal-space distance [dB]
};

template <int Dim>
class NearestFingerprintFinder {
public:
    /**
     * @param fingerprints Searched collection, must outlive the finder
     * @param mode Ranking metric
     * @throws ConfigurationError if fingerprints is empty
     */
    NearestFingerprintFinder(const std::vector<LocatedFingerprint<Dim>>& fingerprints,
                             FinderMode mode);

    // The collection is referenced, not copied: it must outlive the finder
    NearestFingerprintFinder(std::vector<LocatedFingerprint<Dim>>&& fingerprints,
                             FinderMode mode) = delete;

    /**
     * @brief k closest located fingerprints to the query
     *
     * @throws ConfigurationError if k < 1
     */
    std::vector<FingerprintNeighbour<Dim>> find_k_nearest_to(
        const RssiFingerprint& fingerprint, int k) const;

    /**
     * @brief Closest located fingerprint, or nullopt if none shares a source
     */
    std::optional<FingerprintNeighbour<Dim>> find_nearest_to(
        const RssiFingerprint& fingerprint) const;

    /**
     * @brief Distance between two fingerprints under the given metric
     */
    static std::optional<double> distance(const RssiFingerprint& a,
                                          const RssiFingerprint& b,
                                          FinderMode mode);

    FinderMode mode() const { return mode_; }
    const std::vector<LocatedFingerprint<Dim>>& fingerprints() const { return fingerprints_; }

private:
    const std::vector<LocatedFingerprint<Dim>>& fingerprints_;
    FinderMode mode_;
};

using NearestFingerprintFinder2d = NearestFingerprintFinder<2>;
using NearestFingerprintFinder3d = NearestFingerprintFinder<3>;

}  // namespace rfloc
