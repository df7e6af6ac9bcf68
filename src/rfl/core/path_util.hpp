#pragma once

#include <cstdlib>
#include <stdexcept>

#include "core/file_utils.hpp"

namespace rfl {
namespace core {


// Root of the repository, taken from $RFL_DIR.
inline std::string rfl_path(const std::string& subdir = "")
{
  const char* path = std::getenv("RFL_DIR");

  if (path == nullptr) {
    throw std::runtime_error("Environment does not contain $RFL_DIR. Set it to the repository root.");
  }

  return Join(std::string(path), subdir);
}


inline std::string config_path(const std::string& subdir)
{
  return rfl_path(Join("config", subdir));
}


inline std::string tools_path(const std::string& subdir)
{
  return rfl_path(Join("src/tools", subdir));
}


}
}
