#pragma once

#include <vector>

#include "core/macros.hpp"
#include "core/eigen_types.hpp"
#include "core/estimator_state.hpp"
#include "radio/fingerprint.hpp"
#include "radio/radio_source.hpp"
#include "radio/reading.hpp"
#include "trilateration/linear_trilateration_solver.hpp"

namespace rfl {
namespace estimation {

using namespace core;

template <int D, typename ReadingT> class LinearPositionEstimator;


template <int D, typename ReadingT>
class LinearPositionEstimatorListener {
 public:
  virtual ~LinearPositionEstimatorListener() = default;

  virtual void OnEstimateStart(const LinearPositionEstimator<D, ReadingT>& estimator) = 0;
  virtual void OnEstimateEnd(const LinearPositionEstimator<D, ReadingT>& estimator) = 0;
};


// Estimates the position of a receiver from a fingerprint of readings taken there, given radio
// sources at known positions. Each reading of a known source is converted into a distance (see
// DistanceFromReading()) and the resulting distances are trilaterated with a
// LinearTrilaterationSolver.
//
// ReadingT is RangingReading or RssiReading. RSSI readings are only usable for sources with a
// known transmitted power.
template <int D, typename ReadingT>
class LinearPositionEstimator final {
 public:
  RFL_DELETE_COPY_CONSTRUCTORS(LinearPositionEstimator)

  typedef PointNd<D> Point;
  typedef std::vector<Point> Points;
  typedef radio::LocatedRadioSource<D> Source;
  typedef std::vector<Source> Sources;
  typedef radio::Fingerprint<ReadingT> Fingerprint;
  typedef typename Fingerprint::ConstPtr FingerprintConstPtr;
  typedef LinearPositionEstimatorListener<D, ReadingT> Listener;

  static const int kMinRequiredSources = D + 1;

  // Constructors throw std::invalid_argument if fewer than kMinRequiredSources sources are given
  // or the fingerprint is null.
  explicit LinearPositionEstimator(Listener* listener = nullptr);

  explicit LinearPositionEstimator(const Sources& sources,
                                   Listener* listener = nullptr);

  explicit LinearPositionEstimator(const FingerprintConstPtr& fingerprint,
                                   Listener* listener = nullptr);

  LinearPositionEstimator(const Sources& sources,
                          const FingerprintConstPtr& fingerprint,
                          Listener* listener = nullptr);

  // Setters throw LockedException while Estimate() is running, and std::invalid_argument for the
  // same reasons as the constructors.
  void SetSources(const Sources& sources);
  void SetFingerprint(const FingerprintConstPtr& fingerprint);
  void SetListener(Listener* listener);

  // Replaces the positions and distances to trilaterate, whether or not they came from the
  // fingerprint. Throws std::invalid_argument if the solver rejects them, including when it is busy
  // solving.
  void SetPositionsAndDistances(const Points& positions, const std::vector<double>& distances);

  const Sources& GetSources() const { return sources_; }
  const FingerprintConstPtr& GetFingerprint() const { return fingerprint_; }
  Listener* GetListener() const { return listener_; }

  // Positions and distances last given to the solver, or matched from the fingerprint.
  const Points& Positions() const { return positions_; }
  const std::vector<double>& Distances() const { return distances_; }

  bool IsLocked() const { return state_.IsRunning() || solver_.IsLocked(); }

  // Whether the solver holds at least kMinRequiredSources positions and distances.
  bool IsReady() const;

  // Throws LockedException, NotReadyException, or the TrilaterationException of the solver.
  void Estimate();

  bool HasEstimatedPosition() const { return solver_.HasEstimatedPosition(); }

  // Returns a new point holding the estimate. Throws NotReadyException if there is none.
  Point EstimatedPosition() const { return solver_.EstimatedPosition(); }

 private:
  // Forwards the solver's start/end notifications to the estimator's listener.
  class SolverListener final : public trilateration::TrilaterationSolverListener<D> {
   public:
    explicit SolverListener(LinearPositionEstimator& estimator) : estimator_(estimator) {}

    void OnSolveStart(const trilateration::LinearTrilaterationSolver<D>& solver) override;
    void OnSolveEnd(const trilateration::LinearTrilaterationSolver<D>& solver) override;

   private:
    LinearPositionEstimator& estimator_;
  };

  void InternalSetSources(const Sources& sources);
  void InternalSetFingerprint(const FingerprintConstPtr& fingerprint);

  // Matches fingerprint readings with sources and pushes the result into the solver. Clears the
  // solver if too few readings match.
  void BuildPositionsAndDistances();

 private:
  Listener* listener_ = nullptr;
  EstimatorStateMachine state_;

  Sources sources_;
  FingerprintConstPtr fingerprint_ = nullptr;

  Points positions_;
  std::vector<double> distances_;

  SolverListener solver_listener_;
  trilateration::LinearTrilaterationSolver<D> solver_;
};


typedef LinearPositionEstimator<2, radio::RangingReading> RangingPositionEstimator2D;
typedef LinearPositionEstimator<3, radio::RangingReading> RangingPositionEstimator3D;
typedef LinearPositionEstimator<2, radio::RssiReading> RssiPositionEstimator2D;
typedef LinearPositionEstimator<3, radio::RssiReading> RssiPositionEstimator3D;

}
}
