/**
 * @file types.hpp
 * @brief Core type definitions using Eigen library for fingerprint positioning
 *
 * Purpose: Provides strongly-typed aliases for all mathematical types used
 * throughout the estimators. Positions are fixed-size Eigen vectors whose
 * dimension (2 or 3) is a template parameter, so a collection of positions
 * can never mix dimensionalities.
 *
 * References:
 * - Eigen: https://eigen.tuxfamily.org/dox/group__QuickRefPage.html
 * - DESIGN.md: core/types entry
 *
 * Sample Input: N/A (type definitions only)
 * Expected Output: Compile-time type safety for all mathematical operations
 */

#ifndef RFLOC_CORE_TYPES_HPP
#define RFLOC_CORE_TYPES_HPP

#include <Eigen/Dense>

namespace rfloc {

// ========== Positions ==========

/// Inhomogeneous position in a Dim-dimensional Cartesian frame [m]
template <int Dim>
using Point = Eigen::Matrix<double, Dim, 1>;

using Point2d = Point<2>;
using Point3d = Point<3>;

/// Covariance of a position [m^2]
template <int Dim>
using PositionCovariance = Eigen::Matrix<double, Dim, Dim>;

using VectorXd = Eigen::VectorXd;
using MatrixXd = Eigen::MatrixXd;

// ========== Constants ==========

constexpr double SPEED_OF_LIGHT = 299792458.0;  // m/s

// Typical WiFi carrier
constexpr double DEFAULT_FREQUENCY_HZ = 2.4e9;

// Free-space propagation
constexpr double DEFAULT_PATH_LOSS_EXPONENT = 2.0;

// Smallest accepted RSSI standard deviation [dB]
constexpr double TINY_RSSI_STD = 1e-12;

} // namespace rfloc

#endif // RFLOC_CORE_TYPES_HPP
