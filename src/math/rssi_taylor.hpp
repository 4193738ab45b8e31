/**
 * @file rssi_taylor.hpp
 * @brief Taylor expansion of received power around a surveyed position
 *
 * Purpose: Predict the RSSI at an unknown position x from a reading Pr(p1)
 * taken at a surveyed position p1, using a truncated Taylor series of the
 * log-distance model. The nonlinear estimator fits x through this
 * prediction; the order selects how much curvature is kept.
 *
 * Model:
 *   Pr(x) = K - 5*n*log10(|x - s|^2)
 *
 * With u = p1 - s, D = |u|^2, h = x - p1, c = 10*n/ln(10):
 *   gradient   g      = -c * u / D
 *   Hessian    H h    = -c * (h / D - 2 u (u.h) / D^2)
 *   third      T[hhh] = -c * (-6 (h.h)(u.h) / D^2 + 8 (u.h)^3 / D^3)
 *
 *   Pr(x) ~ Pr(p1) + g.h + 1/2 h^T H h + 1/6 T[hhh]
 *
 * References:
 * - DESIGN.md: math/rssi_taylor entry
 *
 * Sample Input:
 *   order = SECOND, Pr(p1) = -70 dBm, p1 = (10, 0), s = (0, 0), n = 2, x = (11, 0)
 * Expected Output:
 *   Pr(x) = -70 - 0.8686 + 0.0434 = -70.825 dBm (exact: -70.828)
 */

#ifndef RFLOC_MATH_RSSI_TAYLOR_HPP
#define RFLOC_MATH_RSSI_TAYLOR_HPP

#include "core/types.hpp"

#include <optional>

namespace rfloc {

/**
 * @brief Number of Taylor terms used to approximate the propagation model
 */
enum class TaylorOrder {
    FIRST = 1,
    SECOND = 2,
    THIRD = 3
};

const char* to_string(TaylorOrder order);

/**
 * @brief Predicted RSSI at position from a reading at a surveyed position
 *
 * @param order Expansion order
 * @param fingerprint_rssi RSSI measured at fingerprint_position [dBm]
 * @param fingerprint_position Surveyed position p1 [m]
 * @param source_position Radio source position s [m]
 * @param path_loss_exponent Path-loss exponent n
 * @param position Position x where RSSI is predicted [m]
 * @param gradient If not null, receives d(prediction)/dx at position
 * @return Predicted RSSI [dBm]
 * @throws ConfigurationError if fingerprint and source positions coincide
 */
template <int Dim>
double taylor_expected_rssi(TaylorOrder order,
                            double fingerprint_rssi,
                            const Point<Dim>& fingerprint_position,
                            const Point<Dim>& source_position,
                            double path_loss_exponent,
                            const Point<Dim>& position,
                            Point<Dim>* gradient = nullptr);

/**
 * @brief Partial derivatives of the Taylor prediction
 *
 * With the expansion written in u = p1 - s and h = x - p1:
 *   d/dx  = gradient of the prediction
 *   d/ds  = -d/du
 *   d/dp1 = d/du - d/dx
 *   d/dn  = (prediction - Pr(p1)) / n, since every term scales with n
 */
template <int Dim>
struct RssiTaylorJacobian {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    double fingerprint_rssi;            ///< d/d(Pr(p1)), always 1
    double path_loss_exponent;          ///< d/dn
    Point<Dim> fingerprint_position;    ///< d/dp1
    Point<Dim> source_position;         ///< d/ds
    Point<Dim> position;                ///< d/dx
};

/**
 * @brief Jacobian of taylor_expected_rssi() with respect to all its inputs
 * @throws ConfigurationError if fingerprint and source positions coincide
 */
template <int Dim>
RssiTaylorJacobian<Dim> taylor_rssi_jacobian(TaylorOrder order,
                                             double fingerprint_rssi,
                                             const Point<Dim>& fingerprint_position,
                                             const Point<Dim>& source_position,
                                             double path_loss_exponent,
                                             const Point<Dim>& position);

/**
 * @brief First-order propagation of input uncertainties to the predicted RSSI
 *
 *   var = J_Pr^2 var_Pr + J_n^2 var_n + J_p1^T C_p1 J_p1 + J_s^T C_s J_s
 *
 * Each term is included only when its variance or covariance is given.
 *
 * @param position Point where the Jacobian is evaluated
 * @return Variance of the prediction [dB^2], or nullopt if no input is given
 * @throws ConfigurationError on negative variances or coincident positions
 */
template <int Dim>
std::optional<double> propagate_rssi_variance(
    TaylorOrder order,
    double fingerprint_rssi,
    const Point<Dim>& fingerprint_position,
    const Point<Dim>& source_position,
    double path_loss_exponent,
    const Point<Dim>& position,
    const std::optional<double>& fingerprint_rssi_variance,
    const std::optional<double>& path_loss_exponent_variance,
    const std::optional<PositionCovariance<Dim>>& fingerprint_position_covariance,
    const std::optional<PositionCovariance<Dim>>& source_position_covariance);

} // namespace rfloc

#endif // RFLOC_MATH_RSSI_TAYLOR_HPP
