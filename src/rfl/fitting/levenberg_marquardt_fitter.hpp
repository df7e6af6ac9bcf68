#pragma once

#include "params/params_base.hpp"
#include "fitting/multi_dimension_fitter.hpp"

namespace rfl {
namespace fitting {


// Levenberg-Marquardt nonlinear least squares with an analytic Jacobian supplied by the evaluator.
// See: http://people.duke.edu/~hpgavin/ce281/lm.pdf
class LevenbergMarquardtFitter final : public MultiDimensionFitter {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(LevenbergMarquardtFitter)

  struct Params final : public ParamsBase
  {
    RFL_PARAMS_STRUCT_CONSTRUCTORS(Params);

    int max_iters = 5000;

    // Converged once this many iterations in a row change chi-square by less than
    // max(abs_tol, rel_tol * chisq).
    int ndone = 4;
    double rel_tol = 1e-9;
    double abs_tol = 1e-12;

    double initial_lambda = 1e-3;
    double lambda_increase = 10.0;    // multiply lambda after a rejected step
    double lambda_decrease = 10.0;    // divide lambda after an accepted step

   private:
    void LoadParams(const YamlParser& parser) override;
  };

  explicit LevenbergMarquardtFitter(const Params& params = Params());

  // Throws a FittingException if the evaluator produces a non-finite value, the normal equations
  // are singular, or the fit doesn't converge within max_iters.
  void Fit() override;

  const Params& GetParams() const { return params_; }

  // Number of iterations used by the last successful fit.
  int Iterations() const { return iters_; }

 private:
  // Fills the whitened Jacobian J(i, :) = df_i/da / sigma_i and residuals r(i) = (y_i - f_i) / sigma_i.
  // Returns false if the model is not finite at "a".
  bool Linearize(const VectorXd& a, MatrixXd& J, VectorXd& r, double& chisq) const;

 private:
  Params params_;
  int iters_ = 0;
};


}
}
