#include <cmath>
#include <exception>
#include <memory>
#include <stdexcept>

#include <glog/logging.h>

#include "core/exceptions.hpp"
#include "radio/path_loss.hpp"
#include "estimation/power_and_position_estimator.hpp"

namespace rfl {
namespace estimation {


template <int D>
const int PowerAndPositionEstimator<D>::kMinReadings;


template <int D>
void PowerAndPositionEstimator<D>::Params::LoadParams(const YamlParser& parser)
{
  parser.GetParam("default_rssi_sigma", &default_rssi_sigma);
  parser.GetParam("path_loss_exponent", &path_loss_exponent);
  parser.GetOptionalParam("min_sqr_distance", &min_sqr_distance);
  fitter = fitting::LevenbergMarquardtFitter::Params(parser.Subtree("fitter"));

  CHECK_GT(default_rssi_sigma, 0) << "default_rssi_sigma must be > 0 (dB)";
  CHECK_GT(path_loss_exponent, 0) << "path_loss_exponent must be > 0";
  CHECK_GT(min_sqr_distance, 0) << "min_sqr_distance must be > 0 (m^2)";
}


template <int D>
PowerAndPositionEstimator<D>::PowerAndPositionEstimator(const Params& params, Listener* listener)
    : params_(params),
      listener_(listener),
      fitter_(std::make_shared<fitting::LevenbergMarquardtFitter>(params.fitter))
{
  ValidateParams(params);
}


template <int D>
PowerAndPositionEstimator<D>::PowerAndPositionEstimator(const Readings& readings,
                                                        const Params& params,
                                                        Listener* listener)
    : PowerAndPositionEstimator(params, listener)
{
  SetReadings(readings);
}


template <int D>
void PowerAndPositionEstimator<D>::ValidateParams(const Params& params)
{
  if (!(params.default_rssi_sigma > 0)) {
    throw std::invalid_argument("PowerAndPositionEstimator: default_rssi_sigma must be > 0");
  }
  if (!(params.path_loss_exponent > 0)) {
    throw std::invalid_argument("PowerAndPositionEstimator: path_loss_exponent must be > 0");
  }
  if (!(params.min_sqr_distance > 0)) {
    throw std::invalid_argument("PowerAndPositionEstimator: min_sqr_distance must be > 0");
  }
}


template <int D>
bool PowerAndPositionEstimator<D>::AreValidReadings(const Readings& readings)
{
  if (static_cast<int>(readings.size()) < kMinReadings) {
    return false;
  }

  // Every reading must observe the same (single) radio source.
  const radio::RadioSource& source = readings.front().source;
  if (!(source.frequency > 0)) {
    return false;
  }
  for (const Reading& reading : readings) {
    if (!reading.source.IsSame(source)) {
      return false;
    }
  }

  return true;
}


template <int D>
void PowerAndPositionEstimator<D>::SetReadings(const Readings& readings)
{
  state_.ThrowIfRunning();
  if (!AreValidReadings(readings)) {
    throw std::invalid_argument("PowerAndPositionEstimator: need at least D+1 readings of the same radio source");
  }
  readings_ = readings;
}


template <int D>
void PowerAndPositionEstimator<D>::SetInitialPosition(const boost::optional<Point>& initial_position)
{
  state_.ThrowIfRunning();
  initial_position_ = initial_position;
}


template <int D>
void PowerAndPositionEstimator<D>::SetInitialTransmittedPowerDbm(const boost::optional<double>& initial_power_dbm)
{
  state_.ThrowIfRunning();
  initial_power_dbm_ = initial_power_dbm;
}


template <int D>
void PowerAndPositionEstimator<D>::SetInitialTransmittedPower(const boost::optional<double>& initial_power_mw)
{
  state_.ThrowIfRunning();
  if (!initial_power_mw) {
    initial_power_dbm_ = boost::none;
    return;
  }
  if (*initial_power_mw < 0) {
    throw std::invalid_argument("PowerAndPositionEstimator: transmitted power can't be negative");
  }
  initial_power_dbm_ = radio::PowerToDbm(*initial_power_mw);
}


template <int D>
boost::optional<double> PowerAndPositionEstimator<D>::InitialTransmittedPower() const
{
  if (!initial_power_dbm_) {
    return boost::none;
  }
  return radio::DbmToPower(*initial_power_dbm_);
}


template <int D>
void PowerAndPositionEstimator<D>::SetListener(Listener* listener)
{
  state_.ThrowIfRunning();
  listener_ = listener;
}


template <int D>
void PowerAndPositionEstimator<D>::SetParams(const Params& params)
{
  state_.ThrowIfRunning();
  ValidateParams(params);
  params_ = params;
  fitter_ = std::make_shared<fitting::LevenbergMarquardtFitter>(params_.fitter);
}


template <int D>
void PowerAndPositionEstimator<D>::SetFitter(const fitting::MultiDimensionFitter::Ptr& fitter)
{
  state_.ThrowIfRunning();
  if (!fitter) {
    throw std::invalid_argument("PowerAndPositionEstimator: fitter can't be null");
  }
  fitter_ = fitter;
}


template <int D>
void PowerAndPositionEstimator<D>::Estimate()
{
  state_.ThrowIfRunning();
  if (!IsReady()) {
    throw NotReadyException("PowerAndPositionEstimator: need at least D+1 readings of the same radio source");
  }

  ScopedRunningState running(state_);
  ClearResults();

  if (listener_) {
    listener_->OnEstimateStart(*this);
  }

  SetupFitter();

  try {
    fitter_->Fit();
  } catch (const FittingException& e) {
    LOG(WARNING) << "Failed to estimate power and position of " << readings_.front().source.id
                 << ": " << e.what();
    std::throw_with_nested(EstimationException("PowerAndPositionEstimator: fit failed"));
  }

  const VectorXd& a = fitter_->Parameters();
  CHECK_EQ(D + 1, a.rows());

  estimated_position_ = a.head<D>();
  estimated_power_dbm_ = a(D);
  estimated_covariance_ = fitter_->Covariance();
  chisq_ = fitter_->ChiSq();
  has_result_ = true;

  VLOG(1) << "Estimated " << readings_.front().source.id
          << " position=" << estimated_position_.transpose()
          << " power=" << estimated_power_dbm_ << " dBm chisq=" << chisq_;

  if (listener_) {
    listener_->OnEstimateEnd(*this);
  }
}


template <int D>
VectorXd PowerAndPositionEstimator<D>::InitialParams() const
{
  VectorXd initial = VectorXd::Zero(D + 1);

  if (initial_position_) {
    initial.head<D>() = *initial_position_;

  // Centroid of the receiver positions.
  } else {
    const double N = static_cast<double>(readings_.size());
    for (const Reading& reading : readings_) {
      initial.head<D>() += reading.position / N;
    }
  }

  initial(D) = ComputeInitialTransmittedPowerDbm();
  return initial;
}


template <int D>
double PowerAndPositionEstimator<D>::ComputeInitialTransmittedPowerDbm() const
{
  if (initial_power_dbm_) {
    return *initial_power_dbm_;
  }

  // Average RSSI.
  const double N = static_cast<double>(readings_.size());
  double result = 0.0;
  for (const Reading& reading : readings_) {
    result += reading.rssi / N;
  }
  return result;
}


template <int D>
void PowerAndPositionEstimator<D>::SetupFitter()
{
  // All readings belong to the same source, so any of them has its frequency.
  const double frequency = readings_.front().source.frequency;
  const ReceivedPowerModel<D> model(frequency, params_.path_loss_exponent, params_.min_sqr_distance);

  fitter_->SetFunctionEvaluator(std::make_shared<ReceivedPowerEvaluator<D>>(model, InitialParams()));

  const int N = static_cast<int>(readings_.size());
  const double initial_power_dbm = ComputeInitialTransmittedPowerDbm();

  MatrixXd x(N, D + 1);
  VectorXd y(N);
  VectorXd sigmas(N);
  for (int i = 0; i < N; ++i) {
    const Reading& reading = readings_.at(i);
    x.block<1, D>(i, 0) = reading.position.transpose();
    x(i, D) = initial_power_dbm;
    y(i) = reading.rssi;
    sigmas(i) = reading.SigmaOr(params_.default_rssi_sigma);
  }

  fitter_->SetInputData(x, y, sigmas);
}


template <int D>
void PowerAndPositionEstimator<D>::ClearResults()
{
  has_result_ = false;
  estimated_position_.setZero();
  estimated_power_dbm_ = 0;
  estimated_covariance_.resize(0, 0);
  chisq_ = 0;
}


template <int D>
void PowerAndPositionEstimator<D>::ThrowIfNoResult() const
{
  if (!has_result_) {
    throw NotReadyException("PowerAndPositionEstimator: no estimate available, call Estimate() first");
  }
}


template <int D>
typename PowerAndPositionEstimator<D>::Point PowerAndPositionEstimator<D>::EstimatedPosition() const
{
  ThrowIfNoResult();
  return estimated_position_;
}


template <int D>
VectorXd PowerAndPositionEstimator<D>::EstimatedPositionCoordinates() const
{
  ThrowIfNoResult();
  return estimated_position_;
}


template <int D>
double PowerAndPositionEstimator<D>::EstimatedTransmittedPowerDbm() const
{
  ThrowIfNoResult();
  return estimated_power_dbm_;
}


template <int D>
double PowerAndPositionEstimator<D>::EstimatedTransmittedPower() const
{
  ThrowIfNoResult();
  return radio::DbmToPower(estimated_power_dbm_);
}


template <int D>
const MatrixXd& PowerAndPositionEstimator<D>::EstimatedCovariance() const
{
  ThrowIfNoResult();
  return estimated_covariance_;
}


template <int D>
MatrixXd PowerAndPositionEstimator<D>::EstimatedPositionCovariance() const
{
  ThrowIfNoResult();
  return estimated_covariance_.topLeftCorner(D, D);
}


template <int D>
double PowerAndPositionEstimator<D>::EstimatedTransmittedPowerVariance() const
{
  ThrowIfNoResult();
  return estimated_covariance_(D, D);
}


template <int D>
double PowerAndPositionEstimator<D>::ChiSq() const
{
  ThrowIfNoResult();
  return chisq_;
}


template <int D>
double PowerAndPositionEstimator<D>::EstimatedPathLossExponent() const
{
  ThrowIfNoResult();
  return params_.path_loss_exponent;
}


template <int D>
radio::LocatedRadioSource<D> PowerAndPositionEstimator<D>::EstimatedRadioSource() const
{
  ThrowIfNoResult();

  radio::LocatedRadioSource<D> out(readings_.front().source,
                                   estimated_position_,
                                   estimated_power_dbm_,
                                   params_.path_loss_exponent);
  out.transmitted_power_sigma = std::sqrt(estimated_covariance_(D, D));
  out.position_covariance = MatrixNd<D>(estimated_covariance_.topLeftCorner(D, D));
  return out;
}


template class PowerAndPositionEstimator<2>;
template class PowerAndPositionEstimator<3>;

}
}
