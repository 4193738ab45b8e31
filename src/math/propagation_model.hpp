/**
 * @file propagation_model.hpp
 * @brief Log-distance path-loss model and its derivatives
 *
 * Purpose: Converts transmitted power, distance and path-loss exponent into
 * expected received power, and back. Both estimator families are built on
 * these relations.
 *
 * Model (linear scale):
 *   Pr = Pt * (c / (4*pi*f))^n / d^n
 *
 * Model (dBm):
 *   Pr(dBm) = Pt(dBm) + 10*n*log10(c / (4*pi*f)) - 5*n*log10(d^2)
 *
 * References:
 * - Rappaport, "Wireless Communications", log-distance path loss
 *
 * Sample Input:
 *   Pt = -60 dBm, d = 10 m, f = 2.4 GHz, n = 2
 * Expected Output:
 *   Pr = -60 + 20*log10(0.00994) - 20 = -120.05 dBm
 */

#ifndef RFLOC_MATH_PROPAGATION_MODEL_HPP
#define RFLOC_MATH_PROPAGATION_MODEL_HPP

#include "core/types.hpp"

namespace rfloc {
namespace propagation {

/**
 * @brief Convert power in dBm to milliwatts
 */
double dbm_to_power(double dbm);

/**
 * @brief Convert power in milliwatts to dBm
 * @throws ConfigurationError if mw is not positive
 */
double power_to_dbm(double mw);

/**
 * @brief Wavelength factor k = c / (4*pi*f)
 */
double wavelength_factor(double frequency_hz);

/**
 * @brief Received power in linear scale
 *
 * @param transmitted_power_mw Equivalent transmitted power [mW]
 * @param distance Distance to the source [m], must be positive
 * @param frequency_hz Carrier frequency [Hz]
 * @param path_loss_exponent Path-loss exponent n
 * @return Received power [mW]
 * @throws ConfigurationError if distance <= 0
 */
double received_power(double transmitted_power_mw, double distance,
                      double frequency_hz, double path_loss_exponent);

/**
 * @brief Received power in dBm
 */
double expected_rssi_dbm(double transmitted_power_dbm, double distance,
                         double frequency_hz, double path_loss_exponent);

/**
 * @brief Inverse of expected_rssi_dbm: distance at which rssi_dbm is received
 */
double distance_from_rssi(double transmitted_power_dbm, double rssi_dbm,
                          double frequency_hz, double path_loss_exponent);

/**
 * @brief Squared distance implied by an RSSI relative to a calibration point
 *
 * If a reading ref_rssi_dbm was taken at squared distance ref_sqr_distance
 * from the same source, then a reading rssi_dbm corresponds to
 *
 *   d^2 = ref_sqr_distance * 10^((ref_rssi_dbm - rssi_dbm) / (5*n))
 *
 * Transmitted power and frequency cancel out.
 */
double squared_distance_from_reference(double ref_sqr_distance, double ref_rssi_dbm,
                                       double rssi_dbm, double path_loss_exponent);

/**
 * @brief Partial derivatives of received power [dBm]
 */
template <int Dim>
struct RssiDerivatives {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    Point<Dim> position;          ///< d(Pr)/d(receiver coordinates) [dB/m]
    double transmitted_power;     ///< d(Pr)/d(Pt(dBm)), always 1
    double path_loss_exponent;    ///< d(Pr)/dn [dB]
};

/**
 * @brief Derivatives of expected_rssi_dbm at a receiver position
 *
 * @throws ConfigurationError if receiver and source coincide
 */
template <int Dim>
RssiDerivatives<Dim> rssi_derivatives(const Point<Dim>& receiver,
                                      const Point<Dim>& source,
                                      double frequency_hz,
                                      double path_loss_exponent);

} // namespace propagation
} // namespace rfloc

#endif // RFLOC_MATH_PROPAGATION_MODEL_HPP
