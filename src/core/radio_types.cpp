/**
 * @file radio_types.cpp
 * @brief Implementation of reading and fingerprint operations
 */

#include "radio_types.hpp"

#include <cmath>
#include <utility>

namespace rfloc {

RssiReading::RssiReading(std::string source_id, double rssi_dbm,
                         std::optional<double> rssi_std_dbm)
    : source_id_(std::move(source_id)),
      rssi_dbm_(rssi_dbm),
      rssi_std_dbm_(rssi_std_dbm) {
    if (rssi_std_dbm_ && *rssi_std_dbm_ <= 0.0) {
        throw ConfigurationError("RSSI standard deviation must be positive");
    }
}

RssiFingerprint::RssiFingerprint(std::vector<RssiReading> readings) {
    readings_.reserve(readings.size());
    for (auto& reading : readings) {
        add_reading(reading);
    }
}

void RssiFingerprint::add_reading(const RssiReading& reading) {
    if (find(reading.source_id()) != nullptr) {
        throw ConfigurationError("duplicate reading for source " + reading.source_id());
    }
    readings_.push_back(reading);
}

const RssiReading* RssiFingerprint::find(const std::string& source_id) const {
    for (const auto& reading : readings_) {
        if (reading.source_id() == source_id) {
            return &reading;
        }
    }
    return nullptr;
}

double RssiFingerprint::mean_rssi() const {
    if (readings_.empty()) {
        throw ConfigurationError("mean RSSI of an empty fingerprint");
    }

    double sum = 0.0;
    for (const auto& reading : readings_) {
        sum += reading.rssi_dbm();
    }
    return sum / static_cast<double>(readings_.size());
}

int RssiFingerprint::common_sources(const RssiFingerprint& other) const {
    int count = 0;
    for (const auto& reading : readings_) {
        if (other.find(reading.source_id()) != nullptr) {
            count++;
        }
    }
    return count;
}

std::optional<double> RssiFingerprint::sqr_distance_to(const RssiFingerprint& other) const {
    return sqr_distance_with_offsets(other, 0.0, 0.0);
}

std::optional<double> RssiFingerprint::distance_to(const RssiFingerprint& other) const {
    auto sqr = sqr_distance_to(other);
    if (!sqr) {
        return std::nullopt;
    }
    return std::sqrt(*sqr);
}

std::optional<double> RssiFingerprint::no_mean_sqr_distance_to(
    const RssiFingerprint& other) const {
    if (empty() || other.empty()) {
        return std::nullopt;
    }
    return sqr_distance_with_offsets(other, mean_rssi(), other.mean_rssi());
}

std::optional<double> RssiFingerprint::no_mean_distance_to(
    const RssiFingerprint& other) const {
    auto sqr = no_mean_sqr_distance_to(other);
    if (!sqr) {
        return std::nullopt;
    }
    return std::sqrt(*sqr);
}

std::optional<double> RssiFingerprint::sqr_distance_with_offsets(
    const RssiFingerprint& other, double own_offset, double other_offset) const {

    double sqr_dist = 0.0;
    int matches = 0;
    for (const auto& reading : readings_) {
        const RssiReading* other_reading = other.find(reading.source_id());
        if (other_reading == nullptr) {
            continue;
        }

        double diff = (reading.rssi_dbm() - own_offset) -
                      (other_reading->rssi_dbm() - other_offset);
        sqr_dist += diff * diff;
        matches++;
    }

    if (matches == 0) {
        return std::nullopt;
    }
    return sqr_dist;
}

} // namespace rfloc
