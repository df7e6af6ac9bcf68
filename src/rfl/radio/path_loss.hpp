#pragma once

#include "radio/radio_source.hpp"

namespace rfl {
namespace radio {


static const double kSpeedOfLight = 299792458.0;   // m/s


// Converts a power in dBm into milliwatts: mW = 10^(dBm / 10).
double DbmToPower(double dbm);

// Converts a power in milliwatts into dBm. Throws std::invalid_argument if mW <= 0.
double PowerToDbm(double mw);


// Free space constant of the received power formula, in dB:
//    Pr = Pte * k / d^2,   k = (c / (4 * pi * f))^2
// Returns 10 * log10(k). Throws std::invalid_argument if the frequency is not positive.
double FrequencyToKdB(double frequency);


// Log-distance path loss model. With n = 2 this is the free space (inverse square) model:
//    Pr (dBm) = 10*log10(k) + Pte (dBm) - 5 * n * log10(d^2)
double ReceivedPowerDbm(double transmitted_power_dbm,
                        double distance,
                        double frequency,
                        double path_loss_exponent = kDefaultPathLossExponent);


// Inverts ReceivedPowerDbm() to estimate the distance (m) to a source of known power.
double DistanceFromRssi(double transmitted_power_dbm,
                        double rssi,
                        double frequency,
                        double path_loss_exponent = kDefaultPathLossExponent);


}
}
