#pragma once

#include <cmath>

#include "core/macros.hpp"
#include "core/eigen_types.hpp"
#include "fitting/multi_dimension_fitter.hpp"
#include "radio/path_loss.hpp"

namespace rfl {
namespace estimation {

using namespace core;


// Floor (m^2) applied to the squared distance between the estimated source position and a receiver
// position. Keeps the model and its Jacobian finite when the estimate lands exactly on a receiver.
// Inside the floor the model doesn't depend on the position.
static const double kMinSqrDistance = 1e-6;


// Received power model of a single radio source with unknown position and equivalent transmitted
// power. The parameter vector is [ position (D), Pte (dBm) ] and the model, in dBm, is:
//
//    Pr = 10*log10(k) + Pte - 5 * n * log10(d^2),    k = (c / (4*pi*f))^2
//
// where d is the distance from the source to the receiver and n is a FIXED path loss exponent
// (n = 2 is the inverse square law). Its partial derivatives are:
//
//    dPr/dpos_j = -10 * n * (pos_j - receiver_j) / (ln(10) * d^2)
//    dPr/dPte   = 1
template <int D>
struct ReceivedPowerModel final
{
  static const int kNumParams = D + 1;
  static const int kPowerIndex = D;

  explicit ReceivedPowerModel(double frequency,
                              double path_loss_exponent = radio::kDefaultPathLossExponent,
                              double min_sqr_distance = kMinSqrDistance)
      : k_db(radio::FrequencyToKdB(frequency)),
        path_loss_exponent(path_loss_exponent),
        min_sqr_distance(min_sqr_distance) {}

  double k_db;
  double path_loss_exponent;
  double min_sqr_distance;

  // Returns the predicted received power (dBm) at "receiver" and fills "jacobian" (kNumParams)
  // with its derivatives w.r.t. the parameters.
  template <typename ParamsT, typename ReceiverT, typename JacobianT>
  double Predict(const Eigen::MatrixBase<ParamsT>& params,
                 const Eigen::MatrixBase<ReceiverT>& receiver,
                 Eigen::MatrixBase<JacobianT>& jacobian) const
  {
    double sqr_distance = 0.0;
    for (int j = 0; j < D; ++j) {
      const double diff = params(j) - receiver(j);
      sqr_distance += diff * diff;
      jacobian(j) = -10.0 * path_loss_exponent * diff;
    }

    // The prediction is flat inside the floor, so its position derivatives are zero there.
    if (sqr_distance < min_sqr_distance) {
      sqr_distance = min_sqr_distance;
      for (int j = 0; j < D; ++j) {
        jacobian(j) = 0.0;
      }
    } else {
      const double ln10_sqr_distance = std::log(10.0) * sqr_distance;
      for (int j = 0; j < D; ++j) {
        jacobian(j) /= ln10_sqr_distance;
      }
    }
    jacobian(kPowerIndex) = 1.0;

    return k_db + params(kPowerIndex) - 5.0 * path_loss_exponent * std::log10(sqr_distance);
  }
};


// Adapts a ReceivedPowerModel to a MultiDimensionFitter. Each input sample row holds the receiver
// position followed by the initial transmitted power.
template <int D>
class ReceivedPowerEvaluator final : public fitting::MultiDimensionFunctionEvaluator {
 public:
  RFL_SHARED_POINTER_TYPEDEFS(ReceivedPowerEvaluator)

  ReceivedPowerEvaluator(const ReceivedPowerModel<D>& model, const VectorXd& initial_params)
      : model_(model), initial_params_(initial_params) {}

  int NumParams() const override { return ReceivedPowerModel<D>::kNumParams; }

  VectorXd InitialParams() const override { return initial_params_; }

  double Evaluate(int i,
                  const VectorXd& x,
                  const VectorXd& params,
                  VectorXd& derivatives) const override
  {
    (void)i;
    return model_.Predict(params, x.head<D>(), derivatives);
  }

  const ReceivedPowerModel<D>& Model() const { return model_; }

 private:
  ReceivedPowerModel<D> model_;
  VectorXd initial_params_;
};


}
}
