#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>
#include <glog/logging.h>

#include "core/exceptions.hpp"
#include "core/random.hpp"
#include "fitting/levenberg_marquardt_fitter.hpp"

using namespace rfl;
using namespace core;
using namespace fitting;


// y = a0 + a1 * x0 + a2 * x1
class PlaneEvaluator final : public MultiDimensionFunctionEvaluator {
 public:
  int NumParams() const override { return 3; }
  VectorXd InitialParams() const override { return VectorXd::Zero(3); }

  double Evaluate(int, const VectorXd& x, const VectorXd& a, VectorXd& derivatives) const override
  {
    derivatives << 1.0, x(0), x(1);
    return a(0) + a(1) * x(0) + a(2) * x(1);
  }
};


// y = a0 * exp(-a1 * x0)
class DecayEvaluator final : public MultiDimensionFunctionEvaluator {
 public:
  explicit DecayEvaluator(const VectorXd& initial) : initial_(initial) {}

  int NumParams() const override { return 2; }
  VectorXd InitialParams() const override { return initial_; }

  double Evaluate(int, const VectorXd& x, const VectorXd& a, VectorXd& derivatives) const override
  {
    const double e = std::exp(-a(1) * x(0));
    derivatives << e, -a(0) * x(0) * e;
    return a(0) * e;
  }

 private:
  VectorXd initial_;
};


// The second parameter has no effect on the output.
class UnobservableEvaluator final : public MultiDimensionFunctionEvaluator {
 public:
  int NumParams() const override { return 2; }
  VectorXd InitialParams() const override { return VectorXd::Zero(2); }

  double Evaluate(int, const VectorXd& x, const VectorXd& a, VectorXd& derivatives) const override
  {
    derivatives << x(0), 0.0;
    return a(0) * x(0);
  }
};


class NanEvaluator final : public MultiDimensionFunctionEvaluator {
 public:
  int NumParams() const override { return 1; }
  VectorXd InitialParams() const override { return VectorXd::Zero(1); }

  double Evaluate(int, const VectorXd&, const VectorXd&, VectorXd& derivatives) const override
  {
    derivatives << 1.0;
    return std::numeric_limits<double>::quiet_NaN();
  }
};


TEST(LevenbergMarquardtFitterTest, NotReady)
{
  LevenbergMarquardtFitter fitter;
  EXPECT_FALSE(fitter.IsReady());
  EXPECT_THROW(fitter.Fit(), FittingException);

  fitter.SetFunctionEvaluator(std::make_shared<PlaneEvaluator>());
  EXPECT_FALSE(fitter.IsReady());
  EXPECT_THROW(fitter.Fit(), FittingException);
  EXPECT_FALSE(fitter.IsResultAvailable());
}


TEST(LevenbergMarquardtFitterTest, BadInput)
{
  LevenbergMarquardtFitter fitter;

  EXPECT_THROW(fitter.SetInputData(MatrixXd::Zero(3, 2), VectorXd::Zero(2), VectorXd::Ones(3)), std::invalid_argument);
  EXPECT_THROW(fitter.SetInputData(MatrixXd::Zero(3, 2), VectorXd::Zero(3), VectorXd::Ones(2)), std::invalid_argument);
  EXPECT_THROW(fitter.SetInputData(MatrixXd::Zero(0, 2), VectorXd::Zero(0), VectorXd::Ones(0)), std::invalid_argument);

  VectorXd sigmas = VectorXd::Ones(3);
  sigmas(1) = 0.0;
  EXPECT_THROW(fitter.SetInputData(MatrixXd::Zero(3, 2), VectorXd::Zero(3), sigmas), std::invalid_argument);
}


TEST(LevenbergMarquardtFitterTest, Plane)
{
  const int N = 20;
  const Vector3d truth(1.5, -2.0, 0.25);

  MatrixXd x(N, 2);
  VectorXd y(N);
  VectorXd sigmas(N);
  SeedRandom(123);
  for (int i = 0; i < N; ++i) {
    x(i, 0) = RandomUniformd(-10, 10);
    x(i, 1) = RandomUniformd(-10, 10);
    y(i) = truth(0) + truth(1) * x(i, 0) + truth(2) * x(i, 1);
    sigmas(i) = (i % 2 == 0) ? 0.5 : 2.0;
  }

  LevenbergMarquardtFitter fitter;
  fitter.SetFunctionEvaluator(std::make_shared<PlaneEvaluator>());
  fitter.SetInputData(x, y, sigmas);
  ASSERT_TRUE(fitter.IsReady());
  fitter.Fit();

  ASSERT_TRUE(fitter.IsResultAvailable());
  EXPECT_TRUE(fitter.Parameters().isApprox(VectorXd(truth), 1e-6));
  EXPECT_NEAR(0.0, fitter.ChiSq(), 1e-9);
  EXPECT_GT(fitter.Iterations(), 0);

  // For a linear model the covariance is (X^T W X)^-1 at any parameters.
  MatrixXd A(N, 3);
  for (int i = 0; i < N; ++i) {
    A.row(i) << 1.0 / sigmas(i), x(i, 0) / sigmas(i), x(i, 1) / sigmas(i);
  }
  const MatrixXd expected_cov = (A.transpose() * A).inverse();
  EXPECT_TRUE(fitter.Covariance().isApprox(expected_cov, 1e-6));
}


TEST(LevenbergMarquardtFitterTest, NoisyDecay)
{
  const int N = 50;
  const double sigma = 0.01;
  const Vector2d truth(3.0, 0.4);

  MatrixXd x(N, 1);
  VectorXd y(N);
  SeedRandom(7);
  for (int i = 0; i < N; ++i) {
    x(i, 0) = 0.2 * i;
    y(i) = truth(0) * std::exp(-truth(1) * x(i, 0)) + RandomNormald(0, sigma);
  }

  LevenbergMarquardtFitter fitter;
  fitter.SetFunctionEvaluator(std::make_shared<DecayEvaluator>(Vector2d(1.0, 1.0)));
  fitter.SetInputData(x, y, VectorXd::Constant(N, sigma));
  fitter.Fit();

  const VectorXd& a = fitter.Parameters();
  EXPECT_NEAR(truth(0), a(0), 0.05);
  EXPECT_NEAR(truth(1), a(1), 0.01);

  // Chi-square of a good fit is about N - M.
  EXPECT_LT(fitter.ChiSq(), 3.0 * N);
  EXPECT_GT(fitter.Covariance()(0, 0), 0.0);
  EXPECT_GT(fitter.Covariance()(1, 1), 0.0);
}


TEST(LevenbergMarquardtFitterTest, Failures)
{
  const int N = 5;
  MatrixXd x(N, 1);
  x << 1, 2, 3, 4, 5;
  const VectorXd y = VectorXd::LinSpaced(N, 1.0, 5.0);
  const VectorXd sigmas = VectorXd::Ones(N);

  {
    LevenbergMarquardtFitter fitter;
    fitter.SetFunctionEvaluator(std::make_shared<UnobservableEvaluator>());
    fitter.SetInputData(x, y, sigmas);
    EXPECT_THROW(fitter.Fit(), FittingException);
    EXPECT_FALSE(fitter.IsResultAvailable());
  }

  {
    LevenbergMarquardtFitter fitter;
    fitter.SetFunctionEvaluator(std::make_shared<NanEvaluator>());
    fitter.SetInputData(x, y, sigmas);
    EXPECT_THROW(fitter.Fit(), FittingException);
  }

  {
    LevenbergMarquardtFitter::Params params;
    params.max_iters = 1;
    LevenbergMarquardtFitter fitter(params);
    fitter.SetFunctionEvaluator(std::make_shared<DecayEvaluator>(Vector2d(1.0, 1.0)));
    fitter.SetInputData(x, y, sigmas);
    EXPECT_THROW(fitter.Fit(), FittingException);
  }
}
