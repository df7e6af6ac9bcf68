#include <stdexcept>

#include <gtest/gtest.h>
#include <glog/logging.h>

#include "radio/reading.hpp"
#include "radio/radio_source.hpp"

using namespace rfl;
using namespace radio;


TEST(RadioSourceTest, Identity)
{
  const RadioSource a("aa:bb", 2.4e9);
  EXPECT_EQ(RadioSourceType::WIFI_ACCESS_POINT, a.type);

  EXPECT_TRUE(a == RadioSource("aa:bb", 5.0e9));
  EXPECT_TRUE(a != RadioSource("aa:bc", 2.4e9));
  EXPECT_TRUE(a != RadioSource("aa:bb", 2.4e9, RadioSourceType::BEACON));

  const LocatedRadioSource2D located(a, Point2d(1, 2));
  EXPECT_FALSE(located.HasTransmittedPower());
  EXPECT_EQ(kDefaultPathLossExponent, located.path_loss_exponent);

  const LocatedRadioSource3D powered(a, Point3d(1, 2, 3), -20.0, 2.5);
  EXPECT_TRUE(powered.HasTransmittedPower());
  EXPECT_EQ(-20.0, *powered.transmitted_power_dbm);
  EXPECT_EQ(2.5, powered.path_loss_exponent);
}


TEST(ReadingTest, Validation)
{
  const RadioSource a("a", 2.4e9);

  EXPECT_NO_THROW(RangingReading(a, 0.0));
  EXPECT_THROW(RangingReading(a, -1.0), std::invalid_argument);
  EXPECT_THROW(RangingReading(a, 1.0, 0.0), std::invalid_argument);

  EXPECT_THROW(RssiReading(a, -50, 0.0), std::invalid_argument);
  EXPECT_THROW(RssiReading(a, -50, -1.0), std::invalid_argument);

  const RssiReading r1(a, -50);
  const RssiReading r2(a, -50, 3.0);
  EXPECT_EQ(1.5, r1.SigmaOr(1.5));
  EXPECT_EQ(3.0, r2.SigmaOr(1.5));

  Matrix2d asymmetric;
  asymmetric << 1, 0.5,
                0, 1;
  EXPECT_THROW(LocatedRssiReading2D(a, -50, Point2d(0, 0), boost::none, asymmetric), std::invalid_argument);
  EXPECT_NO_THROW(LocatedRssiReading2D(a, -50, Point2d(0, 0), boost::none, Matrix2d::Identity()));
}


TEST(ReadingTest, SameSource)
{
  const RadioSource a("a", 2.4e9), b("b", 2.4e9);

  EXPECT_TRUE(RssiReading(a, -50).HasSameSource(RssiReading(a, -80)));
  EXPECT_FALSE(RssiReading(a, -50).HasSameSource(RssiReading(b, -50)));

  // Different reading kinds of the same source still match.
  EXPECT_TRUE(RangingReading(a, 3.0).HasSameSource(LocatedRssiReading2D(a, -50, Point2d(1, 1))));
}
