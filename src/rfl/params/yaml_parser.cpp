#include <sstream>

#include "params/yaml_parser.hpp"

namespace rfl {
namespace core {


YamlParser::YamlParser(const std::string& filepath,
                       const std::string& shared_filepath)
    : filepath_(filepath),
      shared_filepath_(shared_filepath)
{
  CHECK(!filepath.empty()) << "Empty filepath given to YamlParser!" << std::endl;
  fs_.open(filepath, cv::FileStorage::READ);
  CHECK(fs_.isOpened())
      << "Cannot open file in YamlParser: " << filepath
      << " (remember that the first line should be: %YAML:1.0)";
  root_node_ = fs_.root();

  if (!shared_filepath.empty()) {
    fs_shared_.open(shared_filepath, cv::FileStorage::READ);
    CHECK(fs_shared_.isOpened())
        << "Cannot open file in YamlParser: " << shared_filepath
        << " (remember that the first line should be: %YAML:1.0)";
    shared_node_ = fs_shared_.root();
  }
}


YamlParser::~YamlParser()
{
  fs_.release();
  fs_shared_.release();
}


YamlParser::YamlParser(const cv::FileNode& root_node,
                       const cv::FileNode& shared_node,
                       const std::string& filepath,
                       const std::string& shared_filepath)
    : root_node_(root_node),
      shared_node_(shared_node),
      filepath_(filepath),
      shared_filepath_(shared_filepath) {}


bool YamlParser::HasParam(const std::string& id) const
{
  std::string maybe_suffix;
  const bool is_shared = CheckIfSharedId(id, maybe_suffix);
  cv::FileNode node = is_shared ? shared_node_ : root_node_;
  if (node.empty()) {
    return false;
  }

  std::stringstream ss(is_shared ? maybe_suffix : id);
  std::string key;
  while (std::getline(ss, key, '/')) {
    if (!node.isMap()) {
      return false;
    }
    node = node[key];
    if (node.type() == cv::FileNode::NONE) {
      return false;
    }
  }

  return true;
}


cv::FileNode YamlParser::GetNode(const std::string& id) const
{
  std::string maybe_suffix;
  if (CheckIfSharedId(id, maybe_suffix)) {
    CHECK(!shared_node_.empty()) << HelpfulError(id) << " Was the parser constructed with a shared node?";
    return GetNodeHelper(shared_node_, maybe_suffix);
  } else {
    CHECK(!root_node_.empty()) << HelpfulError(id) << " GetNode: root_node_ is empty. Was the parser constructed?";
    return GetNodeHelper(root_node_, id);
  }
}


YamlParser YamlParser::Subtree(const std::string& id) const
{
  // Pass in the filepath and shared_filepath for debugging purposes.
  return YamlParser(GetNode(id), shared_node_, filepath_, shared_filepath_);
}


cv::FileNode YamlParser::GetNodeHelper(const cv::FileNode& root_node, const std::string& id) const
{
  CHECK(!id.empty()) << HelpfulError(id) << " GetNode: empty id given" << std::endl;
  CHECK_NE(id[0], '/') << HelpfulError(id) << " Don't use leading slash!" << std::endl;

  const size_t slash_idx = id.find_first_of("/");

  // BASE CASE: id is a leaf in the param tree.
  if (slash_idx == std::string::npos) {
    const cv::FileNode& file_handle = root_node[id];
    CHECK_NE(file_handle.type(), cv::FileNode::NONE) << HelpfulError(id) << " GetNode: Missing id: " << id << std::endl;
    return file_handle;
  }

  // RECURSIVE CASE: id is a map (subtree) with params nested.
  CHECK_GE(slash_idx, 1ul) << HelpfulError(id) << " GetNode: should have nonzero substr before /" << std::endl;
  const std::string subtree_root_str = id.substr(0, slash_idx);
  const cv::FileNode& subtree_root = root_node[subtree_root_str];
  CHECK_NE(subtree_root.type(), cv::FileNode::NONE) << HelpfulError(id)
      << " GetNode: Missing (subtree) id: " << subtree_root_str << std::endl;
  const std::string subtree_relative_id = id.substr(slash_idx + 1, std::string::npos);
  CHECK(!subtree_relative_id.empty()) << HelpfulError(id)
      << " GetNode: no recursive id within subtree: " << subtree_root_str
      << " Make sure id doesn't have a trailing slash." << std::endl;
  return GetNodeHelper(subtree_root, subtree_relative_id);
}


std::string YamlParser::HelpfulError(const std::string& id) const
{
  std::stringstream ss;
  ss << "\n" << "** YAML PARSING ERROR **" << std::endl;
  ss << " Error while trying to parse id: " << id << std::endl;
  ss << " Params file:    " << filepath_ << std::endl;
  ss << " Shared file:    " << shared_filepath_ << std::endl;
  ss << " Root node:      " << root_node_.name() << std::endl;
  ss << " Shared node:    " << shared_node_.name() << std::endl;
  return ss.str();
}


std::string YamlToString(const cv::FileNode& node)
{
  CHECK(node.type() != cv::FileNode::NONE);
  std::string out;
  node >> out;
  return out;
}


radio::RadioSource YamlToRadioSource(const cv::FileNode& node)
{
  CHECK(node.isMap()) << "YamlToRadioSource: source must be a map" << std::endl;
  CHECK(node["id"].type() != cv::FileNode::NONE) << "Radio source is missing 'id'" << std::endl;
  CHECK(node["frequency"].type() != cv::FileNode::NONE) << "Radio source is missing 'frequency'" << std::endl;

  const std::string id = YamlToString(node["id"]);
  const double frequency = (double)node["frequency"];
  CHECK_GT(frequency, 0) << "Radio source frequency must be > 0 (Hz)" << std::endl;

  radio::RadioSourceType type = radio::RadioSourceType::WIFI_ACCESS_POINT;
  if (node["type"].type() != cv::FileNode::NONE) {
    type = YamlToEnum<radio::RadioSourceType>(node["type"]);
  }

  return radio::RadioSource(id, frequency, type);
}


}
}
