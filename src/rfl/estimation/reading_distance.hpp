#pragma once

#include "radio/path_loss.hpp"
#include "radio/radio_source.hpp"
#include "radio/reading.hpp"

namespace rfl {
namespace estimation {


// Converts a reading of a located radio source into a distance (m) between the receiver and that
// source. Returns false if the reading can't be converted.

// A ranging reading already is a distance.
template <int D>
inline bool DistanceFromReading(const radio::RangingReading& reading,
                                const radio::LocatedRadioSource<D>& source,
                                double& distance)
{
  (void)source;
  distance = reading.distance;
  return true;
}


// An RSSI reading can only be converted if the transmitted power of the source is known.
template <int D>
inline bool DistanceFromReading(const radio::RssiReading& reading,
                                const radio::LocatedRadioSource<D>& source,
                                double& distance)
{
  if (!source.HasTransmittedPower() || !(source.source.frequency > 0)) {
    return false;
  }
  distance = radio::DistanceFromRssi(*source.transmitted_power_dbm,
                                     reading.rssi,
                                     source.source.frequency,
                                     source.path_loss_exponent);
  return true;
}


}
}
