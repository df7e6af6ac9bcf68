#pragma once

#include <vector>

#include "core/macros.hpp"
#include "core/eigen_types.hpp"
#include "core/estimator_state.hpp"

namespace rfl {
namespace trilateration {

using namespace core;

template <int D> class LinearTrilaterationSolver;


// Notified synchronously from inside LinearTrilaterationSolver::Solve().
template <int D>
class TrilaterationSolverListener {
 public:
  virtual ~TrilaterationSolverListener() = default;

  virtual void OnSolveStart(const LinearTrilaterationSolver<D>& solver) = 0;
  virtual void OnSolveEnd(const LinearTrilaterationSolver<D>& solver) = 0;
};


// Estimates a position from distances to D+1 or more known positions. The sphere equations
//    |x - p_i|^2 = d_i^2
// are linearized by subtracting the first one from the rest:
//    2 (p_i - p_0)^T x = d_0^2 - d_i^2 + |p_i|^2 - |p_0|^2
// and solved in the least squares sense.
template <int D>
class LinearTrilaterationSolver final {
 public:
  RFL_DELETE_COPY_CONSTRUCTORS(LinearTrilaterationSolver)

  typedef PointNd<D> Point;
  typedef std::vector<Point> Points;
  typedef TrilaterationSolverListener<D> Listener;

  static const int kMinRequiredPositions = D + 1;

  explicit LinearTrilaterationSolver(Listener* listener = nullptr) : listener_(listener) {}

  // Throws LockedException while solving, and std::invalid_argument if the number of positions and
  // distances differ, there are fewer than kMinRequiredPositions, or a distance is negative.
  void SetPositionsAndDistances(const Points& positions, const std::vector<double>& distances);

  // Drops all positions, distances and the estimate. Throws LockedException while solving.
  void Clear();

  // Throws LockedException while solving.
  void SetListener(Listener* listener);

  const Points& Positions() const { return positions_; }
  const std::vector<double>& Distances() const { return distances_; }
  Listener* GetListener() const { return listener_; }

  bool IsLocked() const { return state_.IsRunning(); }
  bool IsReady() const;

  // Throws LockedException if already solving, NotReadyException without enough data, and
  // TrilaterationException if the positions are degenerate (e.g all on a line in 2D).
  void Solve();

  bool HasEstimatedPosition() const { return has_estimate_; }

  // Throws NotReadyException if Solve() hasn't succeeded yet.
  Point EstimatedPosition() const;

 private:
  Listener* listener_ = nullptr;
  EstimatorStateMachine state_;

  Points positions_;
  std::vector<double> distances_;

  bool has_estimate_ = false;
  Point estimated_position_ = Point::Zero();
};


typedef LinearTrilaterationSolver<2> LinearTrilaterationSolver2D;
typedef LinearTrilaterationSolver<3> LinearTrilaterationSolver3D;

}
}
