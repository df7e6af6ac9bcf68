#include <stdexcept>

#include "fitting/multi_dimension_fitter.hpp"

namespace rfl {
namespace fitting {


void MultiDimensionFitter::SetFunctionEvaluator(const MultiDimensionFunctionEvaluator::ConstPtr& evaluator)
{
  evaluator_ = evaluator;
  result_available_ = false;
}


void MultiDimensionFitter::SetInputData(const MatrixXd& x, const VectorXd& y, const VectorXd& sigmas)
{
  if (x.rows() != y.rows() || y.rows() != sigmas.rows()) {
    throw std::invalid_argument("SetInputData: x, y and sigmas must have one row per sample");
  }
  if (y.rows() == 0) {
    throw std::invalid_argument("SetInputData: need at least one sample");
  }
  for (int i = 0; i < sigmas.rows(); ++i) {
    if (!(sigmas(i) > 0)) {
      throw std::invalid_argument("SetInputData: standard deviations must be positive");
    }
  }

  x_ = x;
  y_ = y;
  sigmas_ = sigmas;
  result_available_ = false;
}


bool MultiDimensionFitter::IsReady() const
{
  return evaluator_ != nullptr && y_.rows() > 0;
}


}
}
