#pragma once

#include <cmath>
#include <limits>
#include <vector>

#include "core/macros.hpp"
#include "radio/reading.hpp"

namespace rfl {
namespace radio {


// Returned by fingerprint distances when two fingerprints have no radio source in common.
static const double kIncomparableDistance = std::numeric_limits<double>::max();


// Readings of one or more radio sources captured together at a single (possibly unknown) location.
// Readings keep their insertion order.
template <typename ReadingT>
class Fingerprint {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(Fingerprint)

  typedef ReadingT Reading;
  typedef std::vector<ReadingT> Readings;

  Fingerprint() = default;

  explicit Fingerprint(const Readings& readings) : readings_(readings) {}

  const Readings& GetReadings() const { return readings_; }
  void SetReadings(const Readings& readings) { readings_ = readings; }
  void AddReading(const ReadingT& reading) { readings_.emplace_back(reading); }

  size_t Size() const { return readings_.size(); }
  bool Empty() const { return readings_.empty(); }

 protected:
  Readings readings_;
};


// Fingerprint of RSSI readings. ReadingT must derive from RssiReading.
template <typename ReadingT = RssiReading>
class RssiFingerprint final : public Fingerprint<ReadingT> {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(RssiFingerprint)

  typedef typename Fingerprint<ReadingT>::Readings Readings;

  RssiFingerprint() = default;

  explicit RssiFingerprint(const Readings& readings) : Fingerprint<ReadingT>(readings) {}

  // Sum of squared RSSI differences over every pair of readings (one from each fingerprint) that
  // share a radio source. Duplicated sources contribute once per pairing. Returns
  // kIncomparableDistance if the fingerprints have no source in common.
  double SqrDistanceTo(const RssiFingerprint& other) const
  {
    int num_common = 0;
    double result = 0.0;

    for (const ReadingT& reading : this->readings_) {
      for (const ReadingT& other_reading : other.GetReadings()) {
        if (reading.HasSameSource(other_reading)) {
          const double diff = reading.rssi - other_reading.rssi;
          result += diff * diff;
          ++num_common;
        }
      }
    }

    return (num_common == 0) ? kIncomparableDistance : result;
  }

  // A missing fingerprint is infinitely far away.
  double SqrDistanceTo(const ConstPtr& other) const
  {
    return other ? SqrDistanceTo(*other) : kIncomparableDistance;
  }

  // Euclidean distance between the RSSI values of common radio sources.
  double DistanceTo(const RssiFingerprint& other) const
  {
    return SqrtDistance(SqrDistanceTo(other));
  }

  double DistanceTo(const ConstPtr& other) const
  {
    return SqrtDistance(SqrDistanceTo(other));
  }

 private:
  // The incomparable sentinel is passed through as is.
  static double SqrtDistance(double sqr_distance)
  {
    return (sqr_distance == kIncomparableDistance) ? kIncomparableDistance : std::sqrt(sqr_distance);
  }
};


}
}
