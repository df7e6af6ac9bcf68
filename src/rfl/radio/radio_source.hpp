#pragma once

#include <string>

#include <boost/optional.hpp>

#include "core/macros.hpp"
#include "core/eigen_types.hpp"

namespace rfl {
namespace radio {

using namespace core;


static const double kDefaultPathLossExponent = 2.0;


enum class RadioSourceType : int
{
  WIFI_ACCESS_POINT = 0,
  BEACON = 1
};


// Identity of a radio emitter (e.g a Wi-Fi access point keyed by its BSSID).
struct RadioSource final
{
  RFL_SHARED_POINTER_TYPEDEFS(RadioSource)

  explicit RadioSource(const std::string& id,
                       double frequency,
                       RadioSourceType type = RadioSourceType::WIFI_ACCESS_POINT)
      : id(id), frequency(frequency), type(type) {}

  RadioSource() = default;

  std::string id;
  double frequency = 0;      // Carrier frequency (Hz).
  RadioSourceType type = RadioSourceType::WIFI_ACCESS_POINT;

  // Two sources are the same emitter if they share an id and a type, regardless of frequency.
  bool IsSame(const RadioSource& other) const
  {
    return id == other.id && type == other.type;
  }
};


inline bool operator==(const RadioSource& lhs, const RadioSource& rhs)
{
  return lhs.IsSame(rhs);
}

inline bool operator!=(const RadioSource& lhs, const RadioSource& rhs)
{
  return !(lhs == rhs);
}


// A radio source at a known position. If the equivalent transmitted power of the source is known
// (e.g it was previously estimated), RSSI readings of it can be converted into distances.
template <int D>
struct LocatedRadioSource final
{
  typedef PointNd<D> Point;

  explicit LocatedRadioSource(const RadioSource& source,
                              const Point& position)
      : source(source), position(position) {}

  explicit LocatedRadioSource(const RadioSource& source,
                              const Point& position,
                              double transmitted_power_dbm,
                              double path_loss_exponent = kDefaultPathLossExponent)
      : source(source),
        position(position),
        transmitted_power_dbm(transmitted_power_dbm),
        path_loss_exponent(path_loss_exponent) {}

  LocatedRadioSource() = default;

  RadioSource source;
  Point position = Point::Zero();

  boost::optional<double> transmitted_power_dbm;          // Equivalent transmitted power (dBm).
  boost::optional<double> transmitted_power_sigma;        // Standard deviation of the power (dB).
  boost::optional<MatrixNd<D>> position_covariance;

  double path_loss_exponent = kDefaultPathLossExponent;

  bool HasTransmittedPower() const { return static_cast<bool>(transmitted_power_dbm); }
};


typedef LocatedRadioSource<2> LocatedRadioSource2D;
typedef LocatedRadioSource<3> LocatedRadioSource3D;


}
}
