#include "params/params_base.hpp"

namespace rfl {
namespace core {


void ParamsBase::Parse(const cv::FileNode& root_node,
                       const cv::FileNode& shared_node)
{
  LoadParams(YamlParser(root_node, shared_node));
}


void ParamsBase::Parse(const std::string& filepath,
                       const std::string& shared_filepath)
{
  LoadParams(YamlParser(filepath, shared_filepath));
}


void ParamsBase::Parse(const YamlParser& parser)
{
  LoadParams(parser);
}


}
}
