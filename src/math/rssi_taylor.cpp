/**
 * @file rssi_taylor.cpp
 * @brief Implementation of the Taylor-expanded propagation model
 */

#include "rssi_taylor.hpp"
#include "core/errors.hpp"

#include <cmath>

namespace rfloc {

const char* to_string(TaylorOrder order) {
    switch (order) {
        case TaylorOrder::FIRST: return "FIRST";
        case TaylorOrder::SECOND: return "SECOND";
        case TaylorOrder::THIRD: return "THIRD";
    }
    return "UNKNOWN";
}

template <int Dim>
double taylor_expected_rssi(TaylorOrder order,
                            double fingerprint_rssi,
                            const Point<Dim>& fingerprint_position,
                            const Point<Dim>& source_position,
                            double path_loss_exponent,
                            const Point<Dim>& position,
                            Point<Dim>* gradient) {

    const Point<Dim> u = fingerprint_position - source_position;
    const double d2 = u.squaredNorm();
    if (d2 <= 0.0) {
        throw ConfigurationError("fingerprint and radio source positions coincide");
    }
    const double d4 = d2 * d2;
    const double d6 = d4 * d2;

    const double c = 10.0 * path_loss_exponent / std::log(10.0);

    const Point<Dim> h = position - fingerprint_position;
    const double uh = u.dot(h);
    const double hh = h.squaredNorm();

    // === 1st order ===
    const Point<Dim> g = -c / d2 * u;
    double result = fingerprint_rssi + g.dot(h);
    Point<Dim> grad = g;

    // === 2nd order ===
    if (order == TaylorOrder::SECOND || order == TaylorOrder::THIRD) {
        const Point<Dim> Hh = -c * (h / d2 - 2.0 * uh / d4 * u);
        result += 0.5 * h.dot(Hh);
        grad += Hh;
    }

    // === 3rd order ===
    if (order == TaylorOrder::THIRD) {
        const double Thhh = -c * (-6.0 * hh * uh / d4 + 8.0 * uh * uh * uh / d6);
        result += Thhh / 6.0;

        // 1/6 * d/dx T[hhh] = 1/2 * T[hh.]
        const Point<Dim> Thh = -c * (-2.0 * hh / d4 * u - 4.0 * uh / d4 * h +
                                     8.0 * uh * uh / d6 * u);
        grad += 0.5 * Thh;
    }

    if (gradient != nullptr) {
        *gradient = grad;
    }
    return result;
}

template <int Dim>
RssiTaylorJacobian<Dim> taylor_rssi_jacobian(TaylorOrder order,
                                             double fingerprint_rssi,
                                             const Point<Dim>& fingerprint_position,
                                             const Point<Dim>& source_position,
                                             double path_loss_exponent,
                                             const Point<Dim>& position) {
    RssiTaylorJacobian<Dim> jacobian;
    const double rssi = taylor_expected_rssi<Dim>(order, fingerprint_rssi, fingerprint_position,
                                                  source_position, path_loss_exponent,
                                                  position, &jacobian.position);

    const Point<Dim> u = fingerprint_position - source_position;
    const double d2 = u.squaredNorm();
    const double d4 = d2 * d2;
    const double d6 = d4 * d2;
    const double d8 = d4 * d4;
    const double c = 10.0 * path_loss_exponent / std::log(10.0);

    const Point<Dim> h = position - fingerprint_position;
    const double uh = u.dot(h);
    const double hh = h.squaredNorm();

    // d/du of each term, h held fixed
    Point<Dim> du = -c * (h / d2 - 2.0 * uh / d4 * u);
    if (order == TaylorOrder::SECOND || order == TaylorOrder::THIRD) {
        du += -0.5 * c * (-2.0 * hh / d4 * u - 4.0 * uh / d4 * h + 8.0 * uh * uh / d6 * u);
    }
    if (order == TaylorOrder::THIRD) {
        du += -c * (-hh / d4 * h + 4.0 * hh * uh / d6 * u + 4.0 * uh * uh / d6 * h -
                    8.0 * uh * uh * uh / d8 * u);
    }

    jacobian.fingerprint_rssi = 1.0;
    jacobian.path_loss_exponent = (rssi - fingerprint_rssi) / path_loss_exponent;
    jacobian.fingerprint_position = du - jacobian.position;
    jacobian.source_position = -du;
    return jacobian;
}

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
    const std::optional<PositionCovariance<Dim>>& source_position_covariance) {

    if (!fingerprint_rssi_variance && !path_loss_exponent_variance &&
        !fingerprint_position_covariance && !source_position_covariance) {
        return std::nullopt;
    }
    if ((fingerprint_rssi_variance && *fingerprint_rssi_variance < 0.0) ||
        (path_loss_exponent_variance && *path_loss_exponent_variance < 0.0)) {
        throw ConfigurationError("variances must not be negative");
    }

    const RssiTaylorJacobian<Dim> j = taylor_rssi_jacobian<Dim>(
        order, fingerprint_rssi, fingerprint_position, source_position,
        path_loss_exponent, position);

    double variance = 0.0;
    if (fingerprint_rssi_variance) {
        variance += j.fingerprint_rssi * j.fingerprint_rssi * (*fingerprint_rssi_variance);
    }
    if (path_loss_exponent_variance) {
        variance += j.path_loss_exponent * j.path_loss_exponent * (*path_loss_exponent_variance);
    }
    if (fingerprint_position_covariance) {
        variance += j.fingerprint_position.dot(
            (*fingerprint_position_covariance) * j.fingerprint_position);
    }
    if (source_position_covariance) {
        variance += j.source_position.dot((*source_position_covariance) * j.source_position);
    }
    return variance;
}

template double taylor_expected_rssi<2>(TaylorOrder, double, const Point<2>&, const Point<2>&,
                                        double, const Point<2>&, Point<2>*);
template double taylor_expected_rssi<3>(TaylorOrder, double, const Point<3>&, const Point<3>&,
                                        double, const Point<3>&, Point<3>*);

template RssiTaylorJacobian<2> taylor_rssi_jacobian<2>(TaylorOrder, double, const Point<2>&,
                                                       const Point<2>&, double, const Point<2>&);
template RssiTaylorJacobian<3> taylor_rssi_jacobian<3>(TaylorOrder, double, const Point<3>&,
                                                       const Point<3>&, double, const Point<3>&);

template std::optional<double> propagate_rssi_variance<2>(
    TaylorOrder, double, const Point<2>&, const Point<2>&, double, const Point<2>&,
    const std::optional<double>&, const std::optional<double>&,
    const std::optional<PositionCovariance<2>>&, const std::optional<PositionCovariance<2>>&);
template std::optional<double> propagate_rssi_variance<3>(
    TaylorOrder, double, const Point<3>&, const Point<3>&, double, const Point<3>&,
    const std::optional<double>&, const std::optional<double>&,
    const std::optional<PositionCovariance<3>>&, const std::optional<PositionCovariance<3>>&);

} // namespace rfloc
