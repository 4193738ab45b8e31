// Nearest Located Fingerprint Finder Implementation
#include "finder/nearest_fingerprint_finder.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"

#include <algorithm>

namespace rfloc {

const char* to_string(FinderMode mode) {
    switch (mode) {
        case FinderMode::RAW: return "RAW";
        case FinderMode::MEAN_REMOVED: return "MEAN_REMOVED";
    }
    return "UNKNOWN";
}

template <int Dim>
NearestFingerprintFinder<Dim>::NearestFingerprintFinder(
    const std::vector<LocatedFingerprint<Dim>>& fingerprints, FinderMode mode)
    : fingerprints_(fingerprints), mode_(mode) {
    if (fingerprints_.empty()) {
        throw ConfigurationError("finder requires at least one located fingerprint");
    }
}

template <int Dim>
std::optional<double> NearestFingerprintFinder<Dim>::distance(const RssiFingerprint& a,
                                                              const RssiFingerprint& b,
                                                              FinderMode mode) {
    return mode == FinderMode::MEAN_REMOVED ? a.no_mean_distance_to(b) : a.distance_to(b);
}

template <int Dim>
std::vector<FingerprintNeighbour<Dim>> NearestFingerprintFinder<Dim>::find_k_nearest_to(
    const RssiFingerprint& fingerprint, int k) const {

    if (k < 1) {
        throw ConfigurationError("number of nearest fingerprints must be at least 1");
    }

    std::vector<FingerprintNeighbour<Dim>> candidates;
    candidates.reserve(fingerprints_.size());

    for (size_t i = 0; i < fingerprints_.size(); i++) {
        // nullopt when no source is shared
        std::optional<double> d = distance(fingerprint, fingerprints_[i], mode_);
        if (!d) {
            continue;
        }
        candidates.push_back(FingerprintNeighbour<Dim>{i, &fingerprints_[i], *d});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const FingerprintNeighbour<Dim>& a, const FingerprintNeighbour<Dim>& b) {
                         return a.distance < b.distance;
                     });

    if (candidates.size() > static_cast<size_t>(k)) {
        candidates.resize(static_cast<size_t>(k));
    }

    LOG_DEBUG("Finder (%s): %zu of %zu fingerprints ranked for k=%d",
              to_string(mode_), candidates.size(), fingerprints_.size(), k);
    return candidates;
}

template <int Dim>
std::optional<FingerprintNeighbour<Dim>> NearestFingerprintFinder<Dim>::find_nearest_to(
    const RssiFingerprint& fingerprint) const {
    auto neighbours = find_k_nearest_to(fingerprint, 1);
    if (neighbours.empty()) {
        return std::nullopt;
    }
    return neighbours.front();
}

template class NearestFingerprintFinder<2>;
template class NearestFingerprintFinder<3>;

}  // namespace rfloc
