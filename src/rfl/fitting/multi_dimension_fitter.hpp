#pragma once

#include "core/macros.hpp"
#include "core/eigen_types.hpp"

namespace rfl {
namespace fitting {

using namespace core;


// Model y = f(x; a) fit by a MultiDimensionFitter, where each sample x is a row of the input
// matrix and "a" is the vector of parameters being estimated.
class MultiDimensionFunctionEvaluator {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(MultiDimensionFunctionEvaluator)

  virtual ~MultiDimensionFunctionEvaluator() = default;

  // Number of parameters being fit (length of "a").
  virtual int NumParams() const = 0;

  // Starting point of the fit.
  virtual VectorXd InitialParams() const = 0;

  // Returns f(x; a) for the i-th sample, and fills "derivatives" with df/da (length NumParams()).
  virtual double Evaluate(int i,
                          const VectorXd& x,
                          const VectorXd& params,
                          VectorXd& derivatives) const = 0;
};


// Fits the parameters of a MultiDimensionFunctionEvaluator to weighted samples (x, y, sigma) by
// minimizing chi-square = sum_i ((y_i - f(x_i; a)) / sigma_i)^2.
class MultiDimensionFitter {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(MultiDimensionFitter)

  MultiDimensionFitter() = default;
  virtual ~MultiDimensionFitter() = default;

  void SetFunctionEvaluator(const MultiDimensionFunctionEvaluator::ConstPtr& evaluator);

  // Each row of x is one sample with target y(i) and standard deviation sigmas(i). Throws
  // std::invalid_argument if the sizes don't match or a standard deviation is not positive.
  void SetInputData(const MatrixXd& x, const VectorXd& y, const VectorXd& sigmas);

  // Whether an evaluator and input data are available.
  bool IsReady() const;

  // Runs the fit. Throws a FittingException if the fitter is not ready or the fit fails.
  virtual void Fit() = 0;

  bool IsResultAvailable() const { return result_available_; }

  // Fitted parameters "a".
  const VectorXd& Parameters() const { return a_; }

  // Covariance of the fitted parameters.
  const MatrixXd& Covariance() const { return covariance_; }

  // Weighted sum of squared residuals at the solution.
  double ChiSq() const { return chisq_; }

  int NumSamples() const { return static_cast<int>(y_.rows()); }

 protected:
  MultiDimensionFunctionEvaluator::ConstPtr evaluator_ = nullptr;

  MatrixXd x_;
  VectorXd y_;
  VectorXd sigmas_;

  bool result_available_ = false;
  VectorXd a_;
  MatrixXd covariance_;
  double chisq_ = 0;
};


}
}
