// Fingerprint Position Estimator Base Implementation
#include "estimator/fingerprint_estimator.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace rfloc {

void FingerprintEstimatorConfig::validate() const {
    if (min_nearest_fingerprints < 1) {
        throw ConfigurationError("minimum nearest fingerprints must be at least 1");
    }
    if (max_nearest_fingerprints >= 0 && max_nearest_fingerprints < min_nearest_fingerprints) {
        throw ConfigurationError("maximum nearest fingerprints must not be below minimum");
    }
    if (!(path_loss_exponent > 0.0)) {
        throw ConfigurationError("path-loss exponent must be positive");
    }
}

template <int Dim>
FingerprintEstimator<Dim>::FingerprintEstimator()
    : listener_(nullptr), locked_(false) {}

template <int Dim>
FingerprintEstimator<Dim>::FingerprintEstimator(
    const std::vector<LocatedFingerprint<Dim>>& located_fingerprints,
    const RssiFingerprint& fingerprint,
    const std::vector<LocatedRadioSource<Dim>>& sources,
    FingerprintEstimatorListener<Dim>* listener)
    : listener_(listener), locked_(false) {
    set_located_fingerprints(located_fingerprints);
    set_fingerprint(fingerprint);
    set_sources(sources);
}

template <int Dim>
void FingerprintEstimator<Dim>::check_unlocked() const {
    if (locked_) {
        throw LockedError();
    }
}

template <int Dim>
void FingerprintEstimator<Dim>::set_located_fingerprints(
    const std::vector<LocatedFingerprint<Dim>>& fingerprints) {
    check_unlocked();
    if (fingerprints.empty()) {
        throw ConfigurationError("located fingerprints must not be empty");
    }
    located_fingerprints_ = fingerprints;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_fingerprint(const RssiFingerprint& fingerprint) {
    check_unlocked();
    if (fingerprint.empty()) {
        throw ConfigurationError("fingerprint to locate has no readings");
    }
    fingerprint_ = fingerprint;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_sources(const std::vector<LocatedRadioSource<Dim>>& sources) {
    check_unlocked();
    if (sources.empty()) {
        throw ConfigurationError("radio sources must not be empty");
    }
    for (const auto& source : sources) {
        if (source.path_loss_exponent_std && !(*source.path_loss_exponent_std > 0.0)) {
            throw ConfigurationError("path-loss exponent std of " + source.id +
                                     " must be positive");
        }
    }
    sources_ = sources;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_listener(FingerprintEstimatorListener<Dim>* listener) {
    check_unlocked();
    listener_ = listener;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_config(const FingerprintEstimatorConfig& config) {
    check_unlocked();
    config.validate();
    config_ = config;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_min_max_nearest_fingerprints(int min_nearest,
                                                                 int max_nearest) {
    check_unlocked();
    FingerprintEstimatorConfig config = config_;
    config.min_nearest_fingerprints = min_nearest;
    config.max_nearest_fingerprints = max_nearest;
    config.validate();
    config_ = config;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_path_loss_exponent(double path_loss_exponent) {
    check_unlocked();
    FingerprintEstimatorConfig config = config_;
    config.path_loss_exponent = path_loss_exponent;
    config.validate();
    config_ = config;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_use_sources_path_loss_exponent_when_available(bool use) {
    check_unlocked();
    config_.use_sources_path_loss_exponent_when_available = use;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_finder_mode(FinderMode mode) {
    check_unlocked();
    config_.finder_mode = mode;
}

template <int Dim>
void FingerprintEstimator<Dim>::set_remove_means_from_fingerprint_readings(bool remove) {
    check_unlocked();
    config_.remove_means_from_fingerprint_readings = remove;
}

template <int Dim>
bool FingerprintEstimator<Dim>::is_ready() const {
    if (located_fingerprints_.empty() || !fingerprint_ || sources_.empty()) {
        return false;
    }

    size_t readings = 0;
    for (const auto& fp : located_fingerprints_) {
        readings += fp.size();
    }
    return readings >= static_cast<size_t>(Dim);
}

template <int Dim>
void FingerprintEstimator<Dim>::estimate() {
    check_unlocked();
    if (!is_ready()) {
        throw NotReadyError();
    }

    LockGuard guard(locked_);
    clear_result();

    if (listener_ != nullptr) {
        listener_->on_estimate_start(*this);
    }

    estimate_position();

    if (listener_ != nullptr) {
        listener_->on_estimate_end(*this);
    }
}

template <int Dim>
void FingerprintEstimator<Dim>::clear_result() {
    estimated_position_.reset();
    nearest_fingerprints_.clear();
    diagnostics_ = EstimationDiagnostics();
}

template <int Dim>
void FingerprintEstimator<Dim>::store_result(const Point<Dim>& position,
                                             std::vector<LocatedFingerprint<Dim>> nearest,
                                             const EstimationDiagnostics& diagnostics) {
    estimated_position_ = position;
    nearest_fingerprints_ = std::move(nearest);
    diagnostics_ = diagnostics;
}

template <int Dim>
int FingerprintEstimator<Dim>::effective_max_nearest_fingerprints() const {
    const int size = static_cast<int>(located_fingerprints_.size());
    if (config_.max_nearest_fingerprints < 0) {
        return size;
    }
    return std::min(config_.max_nearest_fingerprints, size);
}

template <int Dim>
const LocatedRadioSource<Dim>* FingerprintEstimator<Dim>::find_source(
    const std::string& source_id) const {
    for (const auto& source : sources_) {
        if (source.id == source_id) {
            return &source;
        }
    }
    return nullptr;
}

template <int Dim>
double FingerprintEstimator<Dim>::path_loss_exponent_for(
    const LocatedRadioSource<Dim>& source) const {
    if (config_.use_sources_path_loss_exponent_when_available && source.path_loss_exponent) {
        return *source.path_loss_exponent;
    }
    return config_.path_loss_exponent;
}

template <int Dim>
std::vector<typename FingerprintEstimator<Dim>::MatchedReading>
FingerprintEstimator<Dim>::match_readings(const LocatedFingerprint<Dim>& located) const {
    const RssiFingerprint& query = *fingerprint_;
    const bool remove_means = config_.remove_means_from_fingerprint_readings;
    const double located_mean = remove_means ? located.mean_rssi() : 0.0;
    const double query_mean = remove_means ? query.mean_rssi() : 0.0;

    std::vector<MatchedReading> matches;
    matches.reserve(located.size());

    for (const auto& reading : located.readings()) {
        const LocatedRadioSource<Dim>* source = find_source(reading.source_id());
        if (source == nullptr) {
            continue;
        }
        const RssiReading* query_reading = query.find(reading.source_id());
        if (query_reading == nullptr) {
            continue;
        }
        if ((located.position() - source->position).squaredNorm() <= 0.0) {
            LOG_WARN("Source %s coincides with a fingerprint position, skipped",
                     source->id.c_str());
            continue;
        }

        MatchedReading match;
        match.source = source;
        match.fingerprint_rssi = reading.rssi_dbm() - located_mean;
        match.query_rssi = query_reading->rssi_dbm() - query_mean;
        match.fingerprint_rssi_std = reading.rssi_std_dbm();
        match.query_rssi_std = query_reading->rssi_std_dbm();
        match.path_loss_exponent = path_loss_exponent_for(*source);
        if (config_.use_sources_path_loss_exponent_when_available && source->path_loss_exponent) {
            match.path_loss_exponent_std = source->path_loss_exponent_std;
        }
        matches.push_back(match);
    }
    return matches;
}

template class FingerprintEstimator<2>;
template class FingerprintEstimator<3>;

}  // namespace rfloc
