#ifndef AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
#define AGENTGRAPH_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentgraph {

// 将 YAML::Node 转换为 nlohmann::json（标量按 bool/null/整数/浮点/字符串 推断）
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML document into JSON; throws YAML::Exception on malformed input.
nlohmann::json parse_yaml(const std::string& text);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
