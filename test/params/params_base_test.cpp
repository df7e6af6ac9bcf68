#include <gtest/gtest.h>
#include <glog/logging.h>

#include <stdexcept>

#include "core/macros.hpp"
#include "params/params_base.hpp"
#include "fitting/levenberg_marquardt_fitter.hpp"
#include "estimation/power_and_position_estimator.hpp"

using namespace rfl;
using namespace core;


struct SubtreeStruct final : public ParamsBase
{
  RFL_PARAMS_STRUCT_CONSTRUCTORS(SubtreeStruct);

  double key1;
  double KEY2;
  bool c;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    parser.GetParam("key1", &key1);
    parser.GetParam("KEY2", &KEY2);
    parser.GetParam("subsubtree/c", &c);
  }
};

inline bool operator==(const SubtreeStruct& lhs, const SubtreeStruct& rhs)
{
  return (lhs.key1 == rhs.key1 && lhs.KEY2 == rhs.KEY2 && lhs.c == rhs.c);
}


struct TestStruct final : public ParamsBase
{
  RFL_PARAMS_STRUCT_CONSTRUCTORS(TestStruct);

  int a;
  int b;
  Vector3d v;
  double missing = -1.0;

  SubtreeStruct subtree;

 private:
  void LoadParams(const YamlParser& parser) override
  {
    parser.GetParam("a", &a);
    parser.GetParam("b", &b);
    parser.GetOptionalParam("missing", &missing);

    YamlToVector<Vector3d>(parser.GetNode("v"), v);

    subtree = SubtreeStruct(parser.GetNode("SubtreeStruct"));
  }
};


inline bool operator==(const TestStruct& lhs, const TestStruct& rhs)
{
  return (lhs.a == rhs.a && lhs.b == rhs.b && lhs.v == rhs.v && lhs.subtree == rhs.subtree);
}


TEST(ParamsBaseTest, Test_01)
{
  const std::string filepath = "./resources/test_struct_params.yaml";

  TestStruct actual;
  actual.a = 456;
  actual.b = 789;
  actual.v = Vector3d(1, 2, 3);
  actual.subtree.key1 = 3.14159;
  actual.subtree.KEY2 = 2.0;
  actual.subtree.c = false;

  // Default construct with parse afterwards.
  TestStruct params1;
  params1.Parse(filepath);
  ASSERT_EQ(actual, params1);

  TestStruct params2(filepath);
  ASSERT_EQ(actual, params2);

  // Optional params keep their default.
  EXPECT_EQ(-1.0, params2.missing);
}


TEST(YamlParserTest, HasParamAndShared)
{
  const YamlParser parser("./resources/test_struct_params.yaml", "./resources/shared_params.yaml");

  EXPECT_TRUE(parser.HasParam("a"));
  EXPECT_TRUE(parser.HasParam("SubtreeStruct/subsubtree/c"));
  EXPECT_FALSE(parser.HasParam("SubtreeStruct/nope"));
  EXPECT_FALSE(parser.HasParam("a/b"));
  EXPECT_TRUE(parser.HasParam("/shared/frequency"));

  EXPECT_DOUBLE_EQ(5.0e9, parser.GetParam<double>("/shared/frequency"));
  EXPECT_DOUBLE_EQ(2.0, parser.Subtree("SubtreeStruct").GetParam<double>("KEY2"));
}


TEST(YamlParserTest, RadioSourceAndReadings)
{
  const YamlParser parser("./resources/test_struct_params.yaml");

  const radio::RadioSource source = YamlToRadioSource(parser.GetNode("source"));
  EXPECT_EQ("ap-kitchen", source.id);
  EXPECT_DOUBLE_EQ(2.4e9, source.frequency);
  EXPECT_EQ(radio::RadioSourceType::BEACON, source.type);

  const std::vector<radio::LocatedRssiReading2D> readings =
      YamlToLocatedRssiReadings<2>(parser.GetNode("readings"), source);

  ASSERT_EQ(3ul, readings.size());
  EXPECT_TRUE(readings.at(0).source.IsSame(source));
  EXPECT_EQ(Point2d(1.0, 2.0), readings.at(1).position);
  EXPECT_DOUBLE_EQ(-65.5, readings.at(1).rssi);
  ASSERT_TRUE(static_cast<bool>(readings.at(1).rssi_sigma));
  EXPECT_DOUBLE_EQ(2.0, *readings.at(1).rssi_sigma);
  EXPECT_FALSE(static_cast<bool>(readings.at(2).rssi_sigma));
  EXPECT_DOUBLE_EQ(-70.25, readings.at(2).rssi);
}


TEST(ParamsBaseTest, EstimatorParams)
{
  const estimation::PowerAndPositionEstimator2D::Params params("./resources/power_and_position_estimator.yaml");

  EXPECT_DOUBLE_EQ(2.5, params.default_rssi_sigma);
  EXPECT_DOUBLE_EQ(2.0, params.path_loss_exponent);
  EXPECT_DOUBLE_EQ(estimation::kMinSqrDistance, params.min_sqr_distance);

  EXPECT_EQ(100, params.fitter.max_iters);
  EXPECT_EQ(3, params.fitter.ndone);
  EXPECT_DOUBLE_EQ(1e-8, params.fitter.rel_tol);
  EXPECT_DOUBLE_EQ(1e-10, params.fitter.abs_tol);
  EXPECT_DOUBLE_EQ(1e-2, params.fitter.initial_lambda);
  EXPECT_DOUBLE_EQ(5.0, params.fitter.lambda_increase);
  EXPECT_DOUBLE_EQ(3.0, params.fitter.lambda_decrease);
}


TEST(ParamsBaseTest, DefaultConfigs)
{
  const fitting::LevenbergMarquardtFitter::Params defaults;
  const fitting::LevenbergMarquardtFitter::Params fitter("../config/LevenbergMarquardtFitter.yaml");
  EXPECT_EQ(defaults.max_iters, fitter.max_iters);
  EXPECT_EQ(defaults.ndone, fitter.ndone);
  EXPECT_DOUBLE_EQ(defaults.initial_lambda, fitter.initial_lambda);

  const estimation::PowerAndPositionEstimator3D::Params estimator("../config/PowerAndPositionEstimator.yaml");
  EXPECT_DOUBLE_EQ(1.0, estimator.default_rssi_sigma);
  EXPECT_DOUBLE_EQ(estimation::kMinSqrDistance, estimator.min_sqr_distance);
  EXPECT_EQ(defaults.max_iters, estimator.fitter.max_iters);
}


TEST(YamlParserTest, InvalidReadingSigma)
{
  const YamlParser parser("./resources/bad_readings.yaml");
  const radio::RadioSource source = YamlToRadioSource(parser.GetNode("source"));

  EXPECT_THROW(YamlToLocatedRssiReadings<2>(parser.GetNode("readings"), source), std::invalid_argument);
}
