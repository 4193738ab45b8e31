/**
 * @file synthetic_radio_map.cpp
 * @brief Implementation of synthetic radio map generator
 */

#include "synthetic_radio_map.hpp"
#include "math/propagation_model.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace rfloc {

template <int Dim>
SyntheticRadioMap<Dim>::SyntheticRadioMap(const SceneParams& params, uint32_t seed)
    : params_(params), normal_dist_(0.0, 1.0), uniform_dist_(0.0, 1.0)
{
    if (!(params_.region_max > params_.region_min)) {
        throw ConfigurationError("synthetic region is empty");
    }
    if (params_.rssi_noise_std < 0.0) {
        throw ConfigurationError("RSSI noise must not be negative");
    }

    if (seed == 0) {
        seed = static_cast<uint32_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    rng_.seed(seed);
}

template <int Dim>
double SyntheticRadioMap<Dim>::sample_normal(double mean, double std_dev) {
    return mean + std_dev * normal_dist_(rng_);
}

template <int Dim>
Point<Dim> SyntheticRadioMap<Dim>::random_position() {
    Point<Dim> p;
    for (int i = 0; i < Dim; i++) {
        p(i) = params_.region_min +
               (params_.region_max - params_.region_min) * uniform_dist_(rng_);
    }
    return p;
}

template <int Dim>
std::vector<LocatedRadioSource<Dim>> SyntheticRadioMap<Dim>::generate_sources(int count) {
    std::vector<LocatedRadioSource<Dim>> sources;
    sources.reserve(count > 0 ? count : 0);

    for (int i = 0; i < count; i++) {
        sources.emplace_back("src-" + std::to_string(i), random_position(),
                             params_.frequency_hz, params_.transmitted_power_dbm,
                             params_.path_loss_exponent);
    }
    return sources;
}

template <int Dim>
RssiFingerprint SyntheticRadioMap<Dim>::measure(
    const std::vector<LocatedRadioSource<Dim>>& sources,
    const Point<Dim>& position, double bias_dbm) {

    RssiFingerprint fingerprint;
    const std::optional<double> std_dbm = params_.rssi_noise_std > 0.0
                                               ? std::optional<double>(params_.rssi_noise_std)
                                               : std::nullopt;

    for (const auto& source : sources) {
        const double pt = source.transmitted_power_dbm.value_or(params_.transmitted_power_dbm);
        const double n = source.path_loss_exponent.value_or(params_.path_loss_exponent);
        const double distance = (position - source.position).norm();

        double rssi = propagation::expected_rssi_dbm(pt, distance, source.frequency_hz, n);
        if (std_dbm) {
            rssi = sample_normal(rssi, *std_dbm);
        }
        fingerprint.add_reading(RssiReading(source.id, rssi + bias_dbm, std_dbm));
    }
    return fingerprint;
}

template <int Dim>
LocatedFingerprint<Dim> SyntheticRadioMap<Dim>::measure_located(
    const std::vector<LocatedRadioSource<Dim>>& sources, const Point<Dim>& position) {
    return LocatedFingerprint<Dim>(measure(sources, position).readings(), position);
}

template <int Dim>
std::vector<LocatedFingerprint<Dim>> SyntheticRadioMap<Dim>::generate_located_fingerprints(
    const std::vector<LocatedRadioSource<Dim>>& sources, int count) {

    std::vector<LocatedFingerprint<Dim>> fingerprints;
    fingerprints.reserve(count > 0 ? count : 0);

    for (int i = 0; i < count; i++) {
        fingerprints.push_back(measure_located(sources, random_position()));
    }
    return fingerprints;
}

template class SyntheticRadioMap<2>;
template class SyntheticRadioMap<3>;

} // namespace rfloc
