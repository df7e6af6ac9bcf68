#pragma once

#include <atomic>

#include "core/macros.hpp"
#include "core/exceptions.hpp"

namespace rfl {
namespace core {


// Every estimator and solver is either waiting for input or running a single solve.
enum class EstimatorState : int
{
  IDLE = 0,
  RUNNING = 1
};


// Holds the Idle/Running state of one estimator instance. Safe to query and transition from any
// thread; a solve never blocks or queues behind another one.
class EstimatorStateMachine final {
 public:
  RFL_DELETE_COPY_CONSTRUCTORS(EstimatorStateMachine)

  EstimatorStateMachine() : state_(EstimatorState::IDLE) {}

  EstimatorState State() const { return state_.load(); }
  bool IsRunning() const { return state_.load() == EstimatorState::RUNNING; }

  // Throws a LockedException if a solve is in progress. Call at the top of every setter.
  void ThrowIfRunning() const
  {
    if (IsRunning()) {
      throw LockedException();
    }
  }

  // Idle -> Running. Throws a LockedException if another solve got there first.
  void Start()
  {
    EstimatorState expected = EstimatorState::IDLE;
    if (!state_.compare_exchange_strong(expected, EstimatorState::RUNNING)) {
      throw LockedException();
    }
  }

  // Running -> Idle.
  void Finish() { state_.store(EstimatorState::IDLE); }

 private:
  std::atomic<EstimatorState> state_;
};


// Moves a state machine into Running on construction and back to Idle when it goes out of scope,
// whether the solve returned or threw.
class ScopedRunningState final {
 public:
  RFL_DELETE_COPY_CONSTRUCTORS(ScopedRunningState)

  explicit ScopedRunningState(EstimatorStateMachine& state) : state_(state)
  {
    state_.Start();
  }

  ~ScopedRunningState() { state_.Finish(); }

 private:
  EstimatorStateMachine& state_;
};


}
}
