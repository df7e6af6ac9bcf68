#pragma once

#include <stdexcept>

#include <boost/optional.hpp>

#include "core/eigen_types.hpp"
#include "radio/radio_source.hpp"

namespace rfl {
namespace radio {


// Base of all readings: one measurement of one radio source. Readings are matched by the identity
// of their source, never by the measured value.
struct Reading
{
  explicit Reading(const RadioSource& source) : source(source) {}

  Reading() = default;

  RadioSource source;

  bool HasSameSource(const Reading& other) const { return source.IsSame(other.source); }
};


// Distance to a radio source (e.g from round trip time), in meters.
struct RangingReading final : public Reading
{
  // Throws std::invalid_argument for a negative distance or a non-positive standard deviation.
  explicit RangingReading(const RadioSource& source,
                          double distance,
                          const boost::optional<double>& distance_sigma = boost::none)
      : Reading(source), distance(distance), distance_sigma(distance_sigma)
  {
    if (distance < 0) {
      throw std::invalid_argument("RangingReading: distance must be non-negative");
    }
    if (distance_sigma && *distance_sigma <= 0) {
      throw std::invalid_argument("RangingReading: distance standard deviation must be positive");
    }
  }

  RangingReading() = default;

  double distance = 0;
  boost::optional<double> distance_sigma;
};


// Received signal strength of a radio source, in dBm.
struct RssiReading : public Reading
{
  // Throws std::invalid_argument for a non-positive standard deviation.
  explicit RssiReading(const RadioSource& source,
                       double rssi,
                       const boost::optional<double>& rssi_sigma = boost::none)
      : Reading(source), rssi(rssi), rssi_sigma(rssi_sigma)
  {
    if (rssi_sigma && *rssi_sigma <= 0) {
      throw std::invalid_argument("RssiReading: RSSI standard deviation must be positive");
    }
  }

  RssiReading() = default;

  double rssi = 0;                        // dBm
  boost::optional<double> rssi_sigma;     // dB

  // Standard deviation to weight this reading with when it doesn't carry its own.
  double SigmaOr(double default_sigma) const
  {
    return rssi_sigma ? *rssi_sigma : default_sigma;
  }
};


// RSSI reading taken by a receiver at a known position. The position is where the RECEIVER was,
// not where the radio source is.
template <int D>
struct LocatedRssiReading final : public RssiReading
{
  typedef PointNd<D> Point;

  explicit LocatedRssiReading(const RadioSource& source,
                              double rssi,
                              const Point& position,
                              const boost::optional<double>& rssi_sigma = boost::none)
      : RssiReading(source, rssi, rssi_sigma), position(position) {}

  // Throws std::invalid_argument if the covariance is not symmetric.
  explicit LocatedRssiReading(const RadioSource& source,
                              double rssi,
                              const Point& position,
                              const boost::optional<double>& rssi_sigma,
                              const MatrixNd<D>& position_covariance)
      : RssiReading(source, rssi, rssi_sigma),
        position(position),
        position_covariance(position_covariance)
  {
    if (!position_covariance.isApprox(position_covariance.transpose())) {
      throw std::invalid_argument("LocatedRssiReading: position covariance must be symmetric");
    }
  }

  LocatedRssiReading() = default;

  Point position = Point::Zero();
  boost::optional<MatrixNd<D>> position_covariance;
};


typedef LocatedRssiReading<2> LocatedRssiReading2D;
typedef LocatedRssiReading<3> LocatedRssiReading3D;


}
}
