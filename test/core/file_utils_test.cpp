#include <cstdlib>

#include <gtest/gtest.h>
#include <glog/logging.h>

#include "core/file_utils.hpp"
#include "core/path_util.hpp"

using namespace rfl;
using namespace core;


TEST(FileUtilsTest, Join)
{
  EXPECT_EQ("a/b", Join("a", "b"));
  EXPECT_EQ("/root/config/x.yaml", Join("/root/config", "x.yaml"));
}


TEST(FileUtilsTest, Exists)
{
  EXPECT_TRUE(Exists("./resources/test_struct_params.yaml"));
  EXPECT_FALSE(Exists("./resources/does_not_exist.yaml"));
}


TEST(PathUtilTest, RflDir)
{
  setenv("RFL_DIR", "/opt/rfl", 1);
  EXPECT_EQ("/opt/rfl/config/PowerAndPositionEstimator.yaml", config_path("PowerAndPositionEstimator.yaml"));
  EXPECT_EQ("/opt/rfl/src/tools/locate_emitter/config/LocateEmitter.yaml",
            tools_path("locate_emitter/config/LocateEmitter.yaml"));

  unsetenv("RFL_DIR");
  EXPECT_THROW(rfl_path(), std::runtime_error);
}
