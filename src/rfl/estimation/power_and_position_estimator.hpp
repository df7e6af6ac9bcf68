#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "core/macros.hpp"
#include "core/eigen_types.hpp"
#include "core/estimator_state.hpp"
#include "params/params_base.hpp"
#include "radio/radio_source.hpp"
#include "radio/reading.hpp"
#include "fitting/levenberg_marquardt_fitter.hpp"
#include "estimation/received_power_model.hpp"

namespace rfl {
namespace estimation {

using namespace core;

template <int D> class PowerAndPositionEstimator;


// Notified synchronously from inside PowerAndPositionEstimator::Estimate(). Errors are not routed
// through the listener; they propagate out of Estimate().
template <int D>
class PowerAndPositionEstimatorListener {
 public:
  virtual ~PowerAndPositionEstimatorListener() = default;

  virtual void OnEstimateStart(const PowerAndPositionEstimator<D>& estimator) = 0;
  virtual void OnEstimateEnd(const PowerAndPositionEstimator<D>& estimator) = 0;
};


// Jointly estimates the position and the equivalent transmitted power of ONE radio source (e.g a
// Wi-Fi access point) from RSSI readings taken at known receiver positions. All readings must be of
// the same source, and at least D+1 readings are needed since there are D+1 unknowns.
//
// Estimate() runs a Levenberg-Marquardt fit of ReceivedPowerModel in the log (dBm) domain. The
// estimator is single-shot and synchronous: configure, Estimate(), then read the results. While a
// fit is running every setter throws a LockedException.
template <int D>
class PowerAndPositionEstimator final {
 public:
  RFL_DELETE_COPY_CONSTRUCTORS(PowerAndPositionEstimator)

  typedef PointNd<D> Point;
  typedef radio::LocatedRssiReading<D> Reading;
  typedef std::vector<Reading> Readings;
  typedef PowerAndPositionEstimatorListener<D> Listener;

  static const int kMinReadings = D + 1;

  struct Params final : public ParamsBase
  {
    RFL_PARAMS_STRUCT_CONSTRUCTORS(Params);

    // Standard deviation (dB) used for readings that don't carry one.
    double default_rssi_sigma = 1.0;

    // Fixed path loss exponent of the model (2 is free space).
    double path_loss_exponent = radio::kDefaultPathLossExponent;

    double min_sqr_distance = kMinSqrDistance;

    fitting::LevenbergMarquardtFitter::Params fitter;

   private:
    void LoadParams(const YamlParser& parser) override;
  };

  // Throws std::invalid_argument if the params are not valid (see ValidateParams()).
  explicit PowerAndPositionEstimator(const Params& params = Params(),
                                     Listener* listener = nullptr);

  // Also throws std::invalid_argument if the readings are not valid (see AreValidReadings()).
  explicit PowerAndPositionEstimator(const Readings& readings,
                                     const Params& params = Params(),
                                     Listener* listener = nullptr);

  // Throws std::invalid_argument unless default_rssi_sigma, path_loss_exponent and
  // min_sqr_distance are all positive.
  static void ValidateParams(const Params& params);

  // Valid readings: at least kMinReadings, all of the same radio source, with a positive frequency.
  static bool AreValidReadings(const Readings& readings);

  // All setters throw LockedException while Estimate() is running.
  // Throws std::invalid_argument if !AreValidReadings(readings).
  void SetReadings(const Readings& readings);

  // If not set, the fit starts at the centroid of the receiver positions.
  void SetInitialPosition(const boost::optional<Point>& initial_position);

  // If not set, the fit starts at the average RSSI.
  void SetInitialTransmittedPowerDbm(const boost::optional<double>& initial_power_dbm);

  // Same as above in mW. Throws std::invalid_argument for a negative power.
  void SetInitialTransmittedPower(const boost::optional<double>& initial_power_mw);

  void SetListener(Listener* listener);

  // Also resets the fitter to a LevenbergMarquardtFitter configured with params.fitter. Throws
  // std::invalid_argument if the params are not valid.
  void SetParams(const Params& params);

  // Replace the nonlinear fitter (a LevenbergMarquardtFitter by default). Throws
  // std::invalid_argument if the fitter is null.
  void SetFitter(const fitting::MultiDimensionFitter::Ptr& fitter);

  const Readings& GetReadings() const { return readings_; }
  const boost::optional<Point>& InitialPosition() const { return initial_position_; }
  const boost::optional<double>& InitialTransmittedPowerDbm() const { return initial_power_dbm_; }
  boost::optional<double> InitialTransmittedPower() const;
  Listener* GetListener() const { return listener_; }
  const Params& GetParams() const { return params_; }

  bool IsLocked() const { return state_.IsRunning(); }
  bool IsReady() const { return AreValidReadings(readings_); }

  // Runs the fit. Throws LockedException if a fit is already running, NotReadyException if there
  // are not enough readings, and EstimationException (nesting the FittingException) if the fit
  // fails numerically. Results of a previous call are cleared first.
  void Estimate();

  // Whether the last call to Estimate() succeeded. Every accessor below throws NotReadyException
  // otherwise.
  bool HasResult() const { return has_result_; }

  Point EstimatedPosition() const;
  VectorXd EstimatedPositionCoordinates() const;
  double EstimatedTransmittedPowerDbm() const;
  double EstimatedTransmittedPower() const;

  // Covariance over [ position (D), Pte ] (D+1 x D+1).
  const MatrixXd& EstimatedCovariance() const;
  MatrixXd EstimatedPositionCovariance() const;
  double EstimatedTransmittedPowerVariance() const;

  double ChiSq() const;

  // The path loss exponent is a fixed model constant, so this is always the configured value.
  double EstimatedPathLossExponent() const;

  // The estimated source with its position, power and uncertainties.
  radio::LocatedRadioSource<D> EstimatedRadioSource() const;

 private:
  VectorXd InitialParams() const;
  double ComputeInitialTransmittedPowerDbm() const;
  void SetupFitter();
  void ClearResults();
  void ThrowIfNoResult() const;

 private:
  Params params_;
  Listener* listener_ = nullptr;
  EstimatorStateMachine state_;

  fitting::MultiDimensionFitter::Ptr fitter_;

  Readings readings_;
  boost::optional<Point> initial_position_;
  boost::optional<double> initial_power_dbm_;

  bool has_result_ = false;
  Point estimated_position_ = Point::Zero();
  double estimated_power_dbm_ = 0;
  MatrixXd estimated_covariance_;
  double chisq_ = 0;
};


typedef PowerAndPositionEstimator<2> PowerAndPositionEstimator2D;
typedef PowerAndPositionEstimator<3> PowerAndPositionEstimator3D;

}
}
