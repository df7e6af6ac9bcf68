#pragma once

#include <string>
#include <vector>

#include <glog/logging.h>

#include <opencv2/core/core.hpp>
#include <opencv2/core/persistence.hpp>

#include "core/eigen_types.hpp"
#include "radio/radio_source.hpp"
#include "radio/reading.hpp"

namespace rfl {
namespace core {


// Returns whether an id is requesting a "shared" parameter (prefixed by /shared/).
// If so, returns the suffix of the id after /shared/.
static inline bool CheckIfSharedId(const std::string& id, std::string& suffix)
{
  const bool is_shared = id.substr(0, 8) == "/shared/";
  suffix = is_shared ? id.substr(8, std::string::npos) : "";
  return is_shared;
}


// Class for parsing a YAML file, using OpenCV's FileStorage module.
class YamlParser {
 public:
  YamlParser() = default;

  // Construct with a path to a .yaml file. Optionally provide a shared_filepath, which points to
  // a shared_params.yaml file.
  YamlParser(const std::string& filepath,
             const std::string& shared_filepath = "");

  // Close OpenCV Filestorage IO on destruct.
  ~YamlParser();

  // Construct from a YAML node.
  YamlParser(const cv::FileNode& root_node,
             const cv::FileNode& shared_node,
             const std::string& filepath = "",
             const std::string& shared_filepath = "");

  // Retrieve a param from the YAML hierarchy and pass it to output parameter.
  template <class ParamType>
  void GetParam(const std::string& id, ParamType* output) const
  {
    CHECK_NOTNULL(output);
    GetNode(id) >> *output;
  }

  // Retrieve a YAML param and return it.
  template <class ParamType>
  ParamType GetParam(const std::string& id) const
  {
    ParamType output;
    GetParam<ParamType>(id, &output);
    return output;
  }

  // Only overwrite the output if the id exists (the output keeps its default otherwise).
  template <class ParamType>
  bool GetOptionalParam(const std::string& id, ParamType* output) const
  {
    if (!HasParam(id)) {
      return false;
    }
    GetParam<ParamType>(id, output);
    return true;
  }

  bool HasParam(const std::string& id) const;

  // Get a YAML node relative to the root. This is used for constructing params that are a subtree.
  cv::FileNode GetNode(const std::string& id) const;

  YamlParser Subtree(const std::string& id) const;

 private:
  // Recursively finds a node with "id", starting from the "root_node".
  cv::FileNode GetNodeHelper(const cv::FileNode& root_node, const std::string& id) const;

  // Returns a string with information about the YAML filepaths, node names, etc. to debug parsing errors.
  std::string HelpfulError(const std::string& id) const;

 private:
  cv::FileStorage fs_, fs_shared_;
  cv::FileNode root_node_;
  cv::FileNode shared_node_;
  std::string filepath_, shared_filepath_;
};


// Convert a YAML list to an Eigen vector type.
template <typename VectorType>
void YamlToVector(const cv::FileNode& node, VectorType& vout)
{
  CHECK(node.isSeq()) << "Trying to parse a Vector from a YAML non-sequence" << std::endl;
  CHECK((int)node.size() == vout.rows())
      << "YamlToVector: expected " << vout.rows() << " values but found " << node.size() << std::endl;
  for (int i = 0; i < vout.rows(); ++i) {
    vout(i) = (double)node[i];
  }
}


// Parse and return a string.
std::string YamlToString(const cv::FileNode& node);


// Parse and return an enum (cast from an int to enum type).
template <typename EnumT>
inline EnumT YamlToEnum(const cv::FileNode& node)
{
  CHECK(node.type() != cv::FileNode::NONE);
  int val;
  node >> val;
  return static_cast<EnumT>(val);
}


// Parse a radio source from a map with the keys: id, frequency, type (optional, default Wi-Fi).
radio::RadioSource YamlToRadioSource(const cv::FileNode& node);


// Parse a sequence of RSSI readings of a single radio source. Each item is a map with the keys:
// position (list of D values), rssi (dBm), rssi_sigma (dB, optional).
template <int D>
std::vector<radio::LocatedRssiReading<D>> YamlToLocatedRssiReadings(const cv::FileNode& node,
                                                                    const radio::RadioSource& source)
{
  CHECK(node.isSeq()) << "YamlToLocatedRssiReadings: readings must be a sequence" << std::endl;

  std::vector<radio::LocatedRssiReading<D>> out;
  for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
    const cv::FileNode& item = *it;

    PointNd<D> position;
    YamlToVector<PointNd<D>>(item["position"], position);

    CHECK(item["rssi"].type() != cv::FileNode::NONE) << "Reading is missing 'rssi'" << std::endl;
    const double rssi = (double)item["rssi"];

    boost::optional<double> rssi_sigma;
    if (item["rssi_sigma"].type() != cv::FileNode::NONE) {
      rssi_sigma = (double)item["rssi_sigma"];
    }

    out.emplace_back(source, rssi, position, rssi_sigma);
  }

  return out;
}


}
}
