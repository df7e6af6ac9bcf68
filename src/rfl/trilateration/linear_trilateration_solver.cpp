#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "core/exceptions.hpp"
#include "trilateration/linear_trilateration_solver.hpp"

namespace rfl {
namespace trilateration {


template <int D>
const int LinearTrilaterationSolver<D>::kMinRequiredPositions;


template <int D>
void LinearTrilaterationSolver<D>::SetPositionsAndDistances(const Points& positions,
                                                            const std::vector<double>& distances)
{
  state_.ThrowIfRunning();

  if (positions.size() != distances.size()) {
    throw std::invalid_argument("SetPositionsAndDistances: need one distance per position");
  }
  if (static_cast<int>(positions.size()) < kMinRequiredPositions) {
    throw std::invalid_argument("SetPositionsAndDistances: need at least D+1 positions");
  }
  for (const double d : distances) {
    if (d < 0) {
      throw std::invalid_argument("SetPositionsAndDistances: distances must be non-negative");
    }
  }

  positions_ = positions;
  distances_ = distances;
  has_estimate_ = false;
}


template <int D>
void LinearTrilaterationSolver<D>::Clear()
{
  state_.ThrowIfRunning();
  positions_.clear();
  distances_.clear();
  has_estimate_ = false;
}


template <int D>
void LinearTrilaterationSolver<D>::SetListener(Listener* listener)
{
  state_.ThrowIfRunning();
  listener_ = listener;
}


template <int D>
bool LinearTrilaterationSolver<D>::IsReady() const
{
  return static_cast<int>(positions_.size()) >= kMinRequiredPositions &&
         positions_.size() == distances_.size();
}


template <int D>
void LinearTrilaterationSolver<D>::Solve()
{
  state_.ThrowIfRunning();
  if (!IsReady()) {
    throw NotReadyException("LinearTrilaterationSolver: need at least D+1 positions and distances");
  }

  ScopedRunningState running(state_);
  has_estimate_ = false;

  if (listener_) {
    listener_->OnSolveStart(*this);
  }

  const int M = static_cast<int>(positions_.size()) - 1;
  const Point& p0 = positions_.at(0);
  const double d0 = distances_.at(0);

  MatrixXd A(M, D);
  VectorXd b(M);
  for (int i = 0; i < M; ++i) {
    const Point& pi = positions_.at(i + 1);
    const double di = distances_.at(i + 1);
    A.row(i) = 2.0 * (pi - p0).transpose();
    b(i) = d0*d0 - di*di + pi.squaredNorm() - p0.squaredNorm();
  }

  Eigen::ColPivHouseholderQR<MatrixXd> solver(A);
  if (solver.rank() < D) {
    throw TrilaterationException("LinearTrilaterationSolver: positions are degenerate (rank " +
                                 std::to_string(solver.rank()) + ")");
  }

  estimated_position_ = solver.solve(b);
  has_estimate_ = true;

  VLOG(1) << "Trilaterated position: " << estimated_position_.transpose();

  if (listener_) {
    listener_->OnSolveEnd(*this);
  }
}


template <int D>
typename LinearTrilaterationSolver<D>::Point LinearTrilaterationSolver<D>::EstimatedPosition() const
{
  if (!has_estimate_) {
    throw NotReadyException("LinearTrilaterationSolver: no position has been estimated yet");
  }
  return estimated_position_;
}


template class LinearTrilaterationSolver<2>;
template class LinearTrilaterationSolver<3>;

}
}
