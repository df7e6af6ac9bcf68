#include <algorithm>
#include <cmath>
#include <string>

#include <glog/logging.h>

#include "core/exceptions.hpp"
#include "fitting/levenberg_marquardt_fitter.hpp"

namespace rfl {
namespace fitting {


void LevenbergMarquardtFitter::Params::LoadParams(const YamlParser& parser)
{
  parser.GetParam("max_iters", &max_iters);
  parser.GetParam("ndone", &ndone);
  parser.GetParam("rel_tol", &rel_tol);
  parser.GetParam("abs_tol", &abs_tol);
  parser.GetParam("initial_lambda", &initial_lambda);
  parser.GetParam("lambda_increase", &lambda_increase);
  parser.GetParam("lambda_decrease", &lambda_decrease);

  CHECK_GT(max_iters, 0);
  CHECK_GT(ndone, 0);
  CHECK_GT(lambda_increase, 1.0);
  CHECK_GT(lambda_decrease, 1.0);
}


LevenbergMarquardtFitter::LevenbergMarquardtFitter(const Params& params)
    : params_(params) {}


bool LevenbergMarquardtFitter::Linearize(const VectorXd& a, MatrixXd& J, VectorXd& r, double& chisq) const
{
  const int N = NumSamples();
  const int M = static_cast<int>(a.rows());
  CHECK_EQ(N, J.rows());
  CHECK_EQ(M, J.cols());
  CHECK_EQ(N, r.rows());

  VectorXd derivatives = VectorXd::Zero(M);
  chisq = 0.0;

  for (int i = 0; i < N; ++i) {
    const VectorXd x_i = x_.row(i).transpose();
    const double f = evaluator_->Evaluate(i, x_i, a, derivatives);
    const double inv_sigma = 1.0 / sigmas_(i);

    r(i) = (y_(i) - f) * inv_sigma;
    J.row(i) = derivatives.transpose() * inv_sigma;
    chisq += r(i) * r(i);
  }

  return std::isfinite(chisq) && J.allFinite();
}


void LevenbergMarquardtFitter::Fit()
{
  if (!IsReady()) {
    throw FittingException("LevenbergMarquardtFitter: needs a function evaluator and input data");
  }

  result_available_ = false;
  iters_ = 0;

  const int N = NumSamples();
  const int M = evaluator_->NumParams();
  if (M <= 0) {
    throw FittingException("LevenbergMarquardtFitter: evaluator must have at least one parameter");
  }

  VectorXd a = evaluator_->InitialParams();
  if (a.rows() != M) {
    throw FittingException("LevenbergMarquardtFitter: initial parameters don't match NumParams()");
  }

  MatrixXd J = MatrixXd::Zero(N, M);
  VectorXd r = VectorXd::Zero(N);
  double chisq = 0;
  if (!Linearize(a, J, r, chisq)) {
    throw FittingException("LevenbergMarquardtFitter: model is not finite at the initial parameters");
  }

  MatrixXd J_test = MatrixXd::Zero(N, M);
  VectorXd r_test = VectorXd::Zero(N);
  double chisq_test = 0;

  double lambda = params_.initial_lambda;
  int done = 0;
  bool converged = false;

  for (int iter = 0; iter < params_.max_iters; ++iter) {
    iters_ = iter + 1;

    // Levenberg-Marquardt diagonal damping.
    // Equation (13): http://people.duke.edu/~hpgavin/ce281/lm.pdf
    MatrixXd H = J.transpose() * J;
    const VectorXd g = J.transpose() * r;
    H.diagonal() *= (1.0 + lambda);

    Eigen::ColPivHouseholderQR<MatrixXd> solver(H);
    if (solver.rank() < M) {
      throw FittingException("LevenbergMarquardtFitter: singular normal equations at iteration " +
                             std::to_string(iter));
    }

    const VectorXd da = solver.solve(g);
    const VectorXd a_test = a + da;

    // A step into a region where the model blows up is treated like any other rejected step.
    if (!Linearize(a_test, J_test, r_test, chisq_test)) {
      lambda *= params_.lambda_increase;
      VLOG(1) << "iter=" << iter << " non-finite step, lambda=" << lambda;
      continue;
    }

    if (std::fabs(chisq_test - chisq) < std::max(params_.abs_tol, params_.rel_tol * chisq)) {
      ++done;
    }

    // If error improves, decrease the damping factor (more like Gauss-Newton).
    if (chisq_test < chisq) {
      lambda /= params_.lambda_decrease;
      a = a_test;
      J.swap(J_test);
      r.swap(r_test);
      chisq = chisq_test;

    // If error gets worse, increase the damping factor (more like gradient descent).
    } else {
      lambda *= params_.lambda_increase;
    }

    VLOG(1) << "iter=" << iter << " chisq=" << chisq << " lambda=" << lambda << " done=" << done;

    if (done >= params_.ndone) {
      converged = true;
      break;
    }
  }

  if (!converged) {
    throw FittingException("LevenbergMarquardtFitter: did not converge after " +
                           std::to_string(params_.max_iters) + " iterations");
  }

  // Undamped covariance at the solution.
  // Equation (21): http://people.duke.edu/~hpgavin/ce281/lm.pdf
  const MatrixXd H = J.transpose() * J;
  Eigen::FullPivLU<MatrixXd> lu(H);
  if (!lu.isInvertible()) {
    throw FittingException("LevenbergMarquardtFitter: covariance is singular at the solution");
  }

  a_ = a;
  covariance_ = lu.inverse();
  chisq_ = chisq;
  result_available_ = true;
}


}
}
