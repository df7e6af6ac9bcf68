#include <boost/filesystem.hpp>

#include "core/file_utils.hpp"

namespace rfl {
namespace core {

namespace fs = boost::filesystem;


std::string Join(const std::string& a, const std::string& b)
{
  return (fs::path(a) / fs::path(b)).string();
}


bool Exists(const std::string& fname)
{
  return fs::exists(fname);
}


}
}
