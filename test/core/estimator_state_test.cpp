#include <stdexcept>

#include <gtest/gtest.h>
#include <glog/logging.h>

#include "core/estimator_state.hpp"
#include "core/exceptions.hpp"

using namespace rfl;
using namespace core;


TEST(EstimatorStateTest, StartFinish)
{
  EstimatorStateMachine state;
  EXPECT_EQ(EstimatorState::IDLE, state.State());
  EXPECT_FALSE(state.IsRunning());
  EXPECT_NO_THROW(state.ThrowIfRunning());

  state.Start();
  EXPECT_EQ(EstimatorState::RUNNING, state.State());
  EXPECT_THROW(state.ThrowIfRunning(), LockedException);

  // Only one solve can start.
  EXPECT_THROW(state.Start(), LockedException);

  state.Finish();
  EXPECT_FALSE(state.IsRunning());
  EXPECT_NO_THROW(state.Start());
}


TEST(EstimatorStateTest, ScopedGuard)
{
  EstimatorStateMachine state;

  {
    ScopedRunningState running(state);
    EXPECT_TRUE(state.IsRunning());
    EXPECT_THROW(ScopedRunningState nested(state), LockedException);

    // The failed guard must not release the outer one.
    EXPECT_TRUE(state.IsRunning());
  }
  EXPECT_FALSE(state.IsRunning());

  // Released when the solve throws too.
  try {
    ScopedRunningState running(state);
    throw std::runtime_error("solve failed");
  } catch (const std::runtime_error&) {}

  EXPECT_FALSE(state.IsRunning());
}
