/**
 * @file radio_types.hpp
 * @brief Radio source, reading and fingerprint value types
 *
 * Purpose: Define the immutable data leaves consumed by finders and
 * estimators. Readings refer to their radio source by identity only, so a
 * fingerprint can be compared against any other fingerprint or matched
 * against a list of located sources by id.
 *
 * References:
 * - DESIGN.md: core/radio_types entry
 *
 * Sample Input:
 *   RssiFingerprint fp({RssiReading("ap-1", -62.0), RssiReading("ap-2", -71.5)});
 *   LocatedFingerprint<2> surveyed(fp.readings(), Point2d(3.0, 4.0));
 *
 * Expected Output:
 *   fp.mean_rssi() = -66.75 dBm
 *   fp.sqr_distance_to(surveyed) = 0.0
 */

#ifndef RFLOC_CORE_RADIO_TYPES_HPP
#define RFLOC_CORE_RADIO_TYPES_HPP

#include "types.hpp"
#include "errors.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfloc {

// ========== Radio Source ==========

/**
 * @brief Radio source (access point, beacon) with known position
 *
 * Transmitted power and path-loss exponent are optional: estimators fall
 * back to their configured defaults when absent. The uncertainty fields are
 * only used by estimators that propagate them into the RSSI sigma.
 */
template <int Dim>
struct LocatedRadioSource {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    std::string id;                                ///< Identity used to match readings
    Point<Dim> position;                           ///< Source position [m]
    double frequency_hz;                           ///< Carrier frequency [Hz]
    std::optional<double> transmitted_power_dbm;   ///< Equivalent transmitted power [dBm]
    std::optional<double> path_loss_exponent;      ///< Known path-loss exponent
    std::optional<double> path_loss_exponent_std;  ///< Std of path_loss_exponent, if known
    std::optional<PositionCovariance<Dim>> position_covariance;  ///< [m^2]

    LocatedRadioSource()
        : position(Point<Dim>::Zero()),
          frequency_hz(DEFAULT_FREQUENCY_HZ) {}

    LocatedRadioSource(std::string source_id, const Point<Dim>& source_position,
                       double frequency = DEFAULT_FREQUENCY_HZ,
                       std::optional<double> power_dbm = std::nullopt,
                       std::optional<double> exponent = std::nullopt)
        : id(std::move(source_id)),
          position(source_position),
          frequency_hz(frequency),
          transmitted_power_dbm(power_dbm),
          path_loss_exponent(exponent) {}
};

// ========== RSSI Reading ==========

/**
 * @brief Single RSSI measurement of one radio source
 */
class RssiReading {
public:
    /**
     * @param source_id Identity of the measured source
     * @param rssi_dbm Received signal strength [dBm]
     * @param rssi_std_dbm Standard deviation of the measurement [dB], if known
     * @throws ConfigurationError if rssi_std_dbm is present and not strictly positive
     */
    RssiReading(std::string source_id, double rssi_dbm,
                std::optional<double> rssi_std_dbm = std::nullopt);

    const std::string& source_id() const { return source_id_; }
    double rssi_dbm() const { return rssi_dbm_; }
    const std::optional<double>& rssi_std_dbm() const { return rssi_std_dbm_; }

    bool has_same_source(const RssiReading& other) const {
        return source_id_ == other.source_id_;
    }

private:
    std::string source_id_;
    double rssi_dbm_;
    std::optional<double> rssi_std_dbm_;
};

// ========== Fingerprint ==========

/**
 * @brief Set of RSSI readings to distinct radio sources
 *
 * Insertion order is kept for iteration but carries no meaning.
 */
class RssiFingerprint {
public:
    RssiFingerprint() = default;

    /**
     * @throws ConfigurationError if two readings share a source
     */
    explicit RssiFingerprint(std::vector<RssiReading> readings);

    /**
     * @brief Add a reading
     * @throws ConfigurationError if a reading for the same source already exists
     */
    void add_reading(const RssiReading& reading);

    const std::vector<RssiReading>& readings() const { return readings_; }
    size_t size() const { return readings_.size(); }
    bool empty() const { return readings_.empty(); }

    /**
     * @brief Reading for given source, or nullptr if absent
     */
    const RssiReading* find(const std::string& source_id) const;

    /**
     * @brief Mean RSSI over all readings of this fingerprint [dBm]
     * @throws ConfigurationError if the fingerprint has no readings
     */
    double mean_rssi() const;

    /**
     * @brief Number of sources present in both fingerprints
     */
    int common_sources(const RssiFingerprint& other) const;

    /**
     * @brief Squared Euclidean distance between RSSI vectors
     *
     * Only sources present in both fingerprints contribute.
     *
     * @return std::nullopt if no source is shared
     */
    std::optional<double> sqr_distance_to(const RssiFingerprint& other) const;
    std::optional<double> distance_to(const RssiFingerprint& other) const;

    /**
     * @brief Squared distance between mean-removed RSSI vectors
     *
     * Each fingerprint subtracts its own mean (over all of its readings)
     * before common-source differences are taken, which cancels a constant
     * receiver bias on either side.
     *
     * Note: the means are not restricted to the common sources, so
     * readings outside the overlap still shift the result.
     *
     * @return std::nullopt if no source is shared
     */
    std::optional<double> no_mean_sqr_distance_to(const RssiFingerprint& other) const;
    std::optional<double> no_mean_distance_to(const RssiFingerprint& other) const;

private:
    std::vector<RssiReading> readings_;

    std::optional<double> sqr_distance_with_offsets(const RssiFingerprint& other,
                                                    double own_offset,
                                                    double other_offset) const;
};

// ========== Located Fingerprint ==========

/**
 * @brief Fingerprint recorded at a surveyed position
 */
template <int Dim>
class LocatedFingerprint : public RssiFingerprint {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    /**
     * @param position_covariance Uncertainty of the surveyed position, if known
     */
    LocatedFingerprint(std::vector<RssiReading> readings, const Point<Dim>& position,
                       const std::optional<PositionCovariance<Dim>>& position_covariance =
                           std::nullopt)
        : RssiFingerprint(std::move(readings)),
          position_(position),
          position_covariance_(position_covariance) {}

    const Point<Dim>& position() const { return position_; }

    const std::optional<PositionCovariance<Dim>>& position_covariance() const {
        return position_covariance_;
    }

private:
    Point<Dim> position_;
    std::optional<PositionCovariance<Dim>> position_covariance_;
};

using LocatedFingerprint2d = LocatedFingerprint<2>;
using LocatedFingerprint3d = LocatedFingerprint<3>;
using LocatedRadioSource2d = LocatedRadioSource<2>;
using LocatedRadioSource3d = LocatedRadioSource<3>;

} // namespace rfloc

#endif // RFLOC_CORE_RADIO_TYPES_HPP
