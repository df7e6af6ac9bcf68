#include <stdexcept>

#include <glog/logging.h>

#include "core/exceptions.hpp"
#include "estimation/reading_distance.hpp"
#include "estimation/linear_position_estimator.hpp"

namespace rfl {
namespace estimation {


template <int D, typename ReadingT>
const int LinearPositionEstimator<D, ReadingT>::kMinRequiredSources;


template <int D, typename ReadingT>
LinearPositionEstimator<D, ReadingT>::LinearPositionEstimator(Listener* listener)
    : listener_(listener),
      solver_listener_(*this),
      solver_(&solver_listener_) {}


template <int D, typename ReadingT>
LinearPositionEstimator<D, ReadingT>::LinearPositionEstimator(const Sources& sources,
                                                              Listener* listener)
    : LinearPositionEstimator(listener)
{
  InternalSetSources(sources);
}


template <int D, typename ReadingT>
LinearPositionEstimator<D, ReadingT>::LinearPositionEstimator(const FingerprintConstPtr& fingerprint,
                                                              Listener* listener)
    : LinearPositionEstimator(listener)
{
  InternalSetFingerprint(fingerprint);
}


template <int D, typename ReadingT>
LinearPositionEstimator<D, ReadingT>::LinearPositionEstimator(const Sources& sources,
                                                              const FingerprintConstPtr& fingerprint,
                                                              Listener* listener)
    : LinearPositionEstimator(listener)
{
  InternalSetSources(sources);
  InternalSetFingerprint(fingerprint);
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SetSources(const Sources& sources)
{
  state_.ThrowIfRunning();
  InternalSetSources(sources);
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SetFingerprint(const FingerprintConstPtr& fingerprint)
{
  state_.ThrowIfRunning();
  InternalSetFingerprint(fingerprint);
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SetListener(Listener* listener)
{
  state_.ThrowIfRunning();
  listener_ = listener;
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SetPositionsAndDistances(const Points& positions,
                                                                    const std::vector<double>& distances)
{
  try {
    solver_.SetPositionsAndDistances(positions, distances);
  } catch (const LockedException& e) {
    throw std::invalid_argument(std::string("SetPositionsAndDistances: solver is locked: ") + e.what());
  }

  positions_ = positions;
  distances_ = distances;
}


template <int D, typename ReadingT>
bool LinearPositionEstimator<D, ReadingT>::IsReady() const
{
  return solver_.IsReady();
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::Estimate()
{
  state_.ThrowIfRunning();
  if (!IsReady()) {
    throw NotReadyException("LinearPositionEstimator: need at least D+1 positions and distances");
  }

  ScopedRunningState running(state_);

  // The listener is notified from inside the solver.
  solver_.Solve();
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::InternalSetSources(const Sources& sources)
{
  if (static_cast<int>(sources.size()) < kMinRequiredSources) {
    throw std::invalid_argument("LinearPositionEstimator: need at least D+1 located sources");
  }
  sources_ = sources;
  BuildPositionsAndDistances();
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::InternalSetFingerprint(const FingerprintConstPtr& fingerprint)
{
  if (!fingerprint) {
    throw std::invalid_argument("LinearPositionEstimator: fingerprint can't be null");
  }
  fingerprint_ = fingerprint;
  BuildPositionsAndDistances();
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::BuildPositionsAndDistances()
{
  Points positions;
  std::vector<double> distances;

  if (sources_.empty() || !fingerprint_) {
    return;
  }

  for (const ReadingT& reading : fingerprint_->GetReadings()) {
    for (const Source& source : sources_) {
      if (!source.source.IsSame(reading.source)) {
        continue;
      }

      double distance = 0;
      if (DistanceFromReading(reading, source, distance)) {
        positions.emplace_back(source.position);
        distances.emplace_back(distance);
      }
    }
  }

  if (static_cast<int>(positions.size()) < kMinRequiredSources) {
    LOG(WARNING) << "Only " << positions.size() << " fingerprint readings could be matched to located sources";
    solver_.Clear();
    positions_ = positions;
    distances_ = distances;
    return;
  }

  SetPositionsAndDistances(positions, distances);
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SolverListener::OnSolveStart(
    const trilateration::LinearTrilaterationSolver<D>& solver)
{
  (void)solver;
  if (estimator_.listener_) {
    estimator_.listener_->OnEstimateStart(estimator_);
  }
}


template <int D, typename ReadingT>
void LinearPositionEstimator<D, ReadingT>::SolverListener::OnSolveEnd(
    const trilateration::LinearTrilaterationSolver<D>& solver)
{
  (void)solver;
  if (estimator_.listener_) {
    estimator_.listener_->OnEstimateEnd(estimator_);
  }
}


template class LinearPositionEstimator<2, radio::RangingReading>;
template class LinearPositionEstimator<3, radio::RangingReading>;
template class LinearPositionEstimator<2, radio::RssiReading>;
template class LinearPositionEstimator<3, radio::RssiReading>;

}
}
