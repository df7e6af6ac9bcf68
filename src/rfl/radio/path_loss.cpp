#include <cmath>
#include <stdexcept>

#include "radio/path_loss.hpp"

namespace rfl {
namespace radio {


double DbmToPower(double dbm)
{
  return std::pow(10.0, dbm / 10.0);
}


double PowerToDbm(double mw)
{
  if (mw <= 0) {
    throw std::invalid_argument("PowerToDbm: linear power must be positive");
  }
  return 10.0 * std::log10(mw);
}


double FrequencyToKdB(double frequency)
{
  if (frequency <= 0) {
    throw std::invalid_argument("FrequencyToKdB: frequency must be positive");
  }
  const double k = std::pow(kSpeedOfLight / (4.0 * M_PI * frequency), 2.0);
  return 10.0 * std::log10(k);
}


double ReceivedPowerDbm(double transmitted_power_dbm,
                        double distance,
                        double frequency,
                        double path_loss_exponent)
{
  if (distance <= 0) {
    throw std::invalid_argument("ReceivedPowerDbm: distance must be positive");
  }
  return FrequencyToKdB(frequency) + transmitted_power_dbm
         - 5.0 * path_loss_exponent * std::log10(distance * distance);
}


double DistanceFromRssi(double transmitted_power_dbm,
                        double rssi,
                        double frequency,
                        double path_loss_exponent)
{
  if (path_loss_exponent <= 0) {
    throw std::invalid_argument("DistanceFromRssi: path loss exponent must be positive");
  }

  // 10*n*log10(d) = 10*log10(k) + Pte - Pr
  const double log_distance = (FrequencyToKdB(frequency) + transmitted_power_dbm - rssi)
                              / (10.0 * path_loss_exponent);
  return std::pow(10.0, log_distance);
}


}
}
