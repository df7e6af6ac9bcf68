#include <glog/logging.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/eigen_types.hpp"
#include "core/macros.hpp"
#include "core/exceptions.hpp"
#include "core/file_utils.hpp"
#include "core/path_util.hpp"
#include "core/random.hpp"
#include "params/params_base.hpp"
#include "radio/path_loss.hpp"
#include "estimation/power_and_position_estimator.hpp"

using namespace rfl;
using namespace core;
using namespace estimation;


// Readings are either listed in the config or simulated around a ground truth emitter.
template <int D>
struct LocateEmitterProblem final : public ParamsBase
{
  RFL_PARAMS_STRUCT_CONSTRUCTORS(LocateEmitterProblem);

  typedef typename PowerAndPositionEstimator<D>::Readings Readings;

  radio::RadioSource source;
  Readings readings;
  typename PowerAndPositionEstimator<D>::Params estimator;

  bool simulate = false;
  PointNd<D> true_position = PointNd<D>::Zero();
  double true_power_dbm = 0;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    source = YamlToRadioSource(parser.GetNode("source"));
    estimator = typename PowerAndPositionEstimator<D>::Params(parser.Subtree("estimator"));

    parser.GetOptionalParam("simulate", &simulate);
    if (!simulate) {
      readings = YamlToLocatedRssiReadings<D>(parser.GetNode("readings"), source);
      return;
    }

    const YamlParser sim = parser.Subtree("simulation");

    int seed = 0;
    int num_readings = 0;
    double rssi_sigma = 1.0;
    PointNd<D> area_min, area_max;
    sim.GetParam("seed", &seed);
    sim.GetParam("num_readings", &num_readings);
    sim.GetParam("rssi_sigma", &rssi_sigma);
    sim.GetParam("true_power_dbm", &true_power_dbm);
    YamlToVector<PointNd<D>>(sim.GetNode("true_position"), true_position);
    YamlToVector<PointNd<D>>(sim.GetNode("area_min"), area_min);
    YamlToVector<PointNd<D>>(sim.GetNode("area_max"), area_max);
    CHECK_GT(rssi_sigma, 0);

    SeedRandom(static_cast<unsigned int>(seed));
    for (int i = 0; i < num_readings; ++i) {
      const PointNd<D> receiver = RandomUniformPoint<D>(area_min, area_max);
      const double rssi = radio::ReceivedPowerDbm(true_power_dbm,
                                                  (receiver - true_position).norm(),
                                                  source.frequency,
                                                  estimator.path_loss_exponent);
      readings.emplace_back(source, RandomNormald(rssi, rssi_sigma), receiver, rssi_sigma);
    }
  }
};


struct LocateEmitterParams final : public ParamsBase
{
  RFL_PARAMS_STRUCT_CONSTRUCTORS(LocateEmitterParams);

  int dimension = 2;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    parser.GetParam("dimension", &dimension);
    CHECK(dimension == 2 || dimension == 3) << "dimension must be 2 or 3" << std::endl;
  }
};


template <int D>
int Run(const std::string& config_file)
{
  LocateEmitterProblem<D> problem;
  PowerAndPositionEstimator<D> estimator;

  try {
    problem.Parse(config_file);
    LOG(INFO) << "Locating " << problem.source.id << " from " << problem.readings.size() << " readings";

    estimator.SetParams(problem.estimator);
    estimator.SetReadings(problem.readings);
    estimator.Estimate();
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << "Invalid configuration: " << e.what();
    return 1;
  } catch (const EstimationException& e) {
    LOG(ERROR) << e.what();
    try {
      std::rethrow_if_nested(e);
    } catch (const FittingException& cause) {
      LOG(ERROR) << "  caused by: " << cause.what();
    }
    return 1;
  }

  LOG(INFO) << "Position: " << estimator.EstimatedPosition().transpose();
  LOG(INFO) << "Transmitted power: " << estimator.EstimatedTransmittedPowerDbm() << " dBm ("
            << estimator.EstimatedTransmittedPower() << " mW)";
  LOG(INFO) << "Position covariance:\n" << estimator.EstimatedPositionCovariance();
  LOG(INFO) << "Power variance: " << estimator.EstimatedTransmittedPowerVariance();
  LOG(INFO) << "Chi-square: " << estimator.ChiSq();

  if (problem.simulate) {
    LOG(INFO) << "Position error: " << (estimator.EstimatedPosition() - problem.true_position).norm() << " m";
    LOG(INFO) << "Power error: " << estimator.EstimatedTransmittedPowerDbm() - problem.true_power_dbm << " dB";
  }

  return 0;
}


int main(int argc, char const *argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::string config_file;
  if (argc == 2) {
    config_file = std::string(argv[1]);
  } else {
    LOG(WARNING) << "Using default config, should specify a path" << std::endl;
    config_file = tools_path("locate_emitter/config/LocateEmitter.yaml");
  }

  CHECK(Exists(config_file)) << "Config file not found: " << config_file << std::endl;

  const LocateEmitterParams params(config_file);
  return (params.dimension == 2) ? Run<2>(config_file) : Run<3>(config_file);
}
