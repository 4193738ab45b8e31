/**
 * @file propagation_model.cpp
 * @brief Implementation of the log-distance path-loss model
 */

#include "propagation_model.hpp"
#include "core/errors.hpp"

#include <cmath>

namespace rfloc {
namespace propagation {

double dbm_to_power(double dbm) {
    return std::pow(10.0, dbm / 10.0);
}

double power_to_dbm(double mw) {
    if (mw <= 0.0) {
        throw ConfigurationError("power must be positive to convert to dBm");
    }
    return 10.0 * std::log10(mw);
}

double wavelength_factor(double frequency_hz) {
    return SPEED_OF_LIGHT / (4.0 * M_PI * frequency_hz);
}

double received_power(double transmitted_power_mw, double distance,
                      double frequency_hz, double path_loss_exponent) {
    if (distance <= 0.0) {
        throw ConfigurationError("distance to radio source must be positive");
    }

    const double k = wavelength_factor(frequency_hz);
    return transmitted_power_mw * std::pow(k / distance, path_loss_exponent);
}

double expected_rssi_dbm(double transmitted_power_dbm, double distance,
                         double frequency_hz, double path_loss_exponent) {
    return power_to_dbm(received_power(dbm_to_power(transmitted_power_dbm),
                                       distance, frequency_hz, path_loss_exponent));
}

double distance_from_rssi(double transmitted_power_dbm, double rssi_dbm,
                          double frequency_hz, double path_loss_exponent) {
    // Pr/Pt = (k/d)^n  ->  d = k * (Pt/Pr)^(1/n)
    const double k = wavelength_factor(frequency_hz);
    const double ratio_db = transmitted_power_dbm - rssi_dbm;
    return k * std::pow(10.0, ratio_db / (10.0 * path_loss_exponent));
}

double squared_distance_from_reference(double ref_sqr_distance, double ref_rssi_dbm,
                                       double rssi_dbm, double path_loss_exponent) {
    return ref_sqr_distance *
           std::pow(10.0, (ref_rssi_dbm - rssi_dbm) / (5.0 * path_loss_exponent));
}

template <int Dim>
RssiDerivatives<Dim> rssi_derivatives(const Point<Dim>& receiver,
                                      const Point<Dim>& source,
                                      double frequency_hz,
                                      double path_loss_exponent) {
    const Point<Dim> diff = receiver - source;
    const double sqr_distance = diff.squaredNorm();
    if (sqr_distance <= 0.0) {
        throw ConfigurationError("receiver and radio source positions coincide");
    }

    const double ln10 = std::log(10.0);

    RssiDerivatives<Dim> result;

    // d/dx [-5*n*log10(d^2)] = -10*n*(x - xa) / (ln(10) * d^2)
    result.position = -10.0 * path_loss_exponent / (ln10 * sqr_distance) * diff;
    result.transmitted_power = 1.0;

    // d/dn [10*n*log10(k) - 5*n*log10(d^2)]
    result.path_loss_exponent = 10.0 * std::log10(wavelength_factor(frequency_hz)) -
                                5.0 * std::log10(sqr_distance);

    return result;
}

template RssiDerivatives<2> rssi_derivatives<2>(const Point<2>&, const Point<2>&, double, double);
template RssiDerivatives<3> rssi_derivatives<3>(const Point<3>&, const Point<3>&, double, double);

} // namespace propagation
} // namespace rfloc
