#pragma once

#include <string>

namespace rfl {
namespace core {


// Joins two path components with the platform separator.
std::string Join(const std::string& a, const std::string& b);


bool Exists(const std::string& fname);


}
}
