#include "polywatch/config/config.hpp"

#include "polywatch/config/yaml_utils.hpp"
#include "polywatch/util/duration.hpp"
#include "polywatch/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace polywatch {

namespace {

// Rule lists may be written as a YAML sequence or as "a,b,c".
auto decode_rules(const YAML::Node& node) -> std::vector<std::string> {
  if (node.IsSequence()) {
    std::vector<std::string> rules;
    for (const auto& item : node) {
      auto rule = item.as<std::string>();
      if (!rule.empty()) {
        rules.push_back(std::move(rule));
      }
    }
    return rules;
  }
  return split_rules(node.as<std::string>());
}

}  // namespace

auto split_rules(std::string_view csv) -> std::vector<std::string> {
  std::vector<std::string> rules;
  while (!csv.empty()) {
    auto comma = csv.find(',');
    auto part = csv.substr(0, comma);
    if (!part.empty()) {
      rules.emplace_back(part);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    csv.remove_prefix(comma + 1);
  }
  return rules;
}

}  // namespace polywatch

namespace YAML {

template <>
struct convert<polywatch::WatcherConfig> {
  static bool decode(const Node& node, polywatch::WatcherConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.root = polywatch::yaml_get_or<std::string>(node, "root",
                                                 c.root.string());
    if (auto interval = node["interval"]) {
      auto parsed = polywatch::util::parse_duration(interval.as<std::string>());
      if (!parsed) {
        return false;
      }
      c.interval = *parsed;
    }
    c.build_command =
        polywatch::yaml_get_or<std::string>(node, "build", c.build_command);
    c.run_command =
        polywatch::yaml_get_or<std::string>(node, "run", c.run_command);
    c.dep_file =
        polywatch::yaml_get_or<std::string>(node, "dep_file", c.dep_file);
    c.dep_command =
        polywatch::yaml_get_or<std::string>(node, "dep_command", c.dep_command);
    if (auto includes = node["include"]) {
      c.includes = polywatch::decode_rules(includes);
    }
    if (auto excludes = node["exclude"]) {
      c.excludes = polywatch::decode_rules(excludes);
    }
    c.work_dir =
        polywatch::yaml_get_or<std::string>(node, "work_dir", c.work_dir);
    c.log_level =
        polywatch::yaml_get_or<std::string>(node, "log_level", c.log_level);
    return true;
  }
};

}  // namespace YAML

namespace polywatch {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<WatcherConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<WatcherConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    return ok(root.as<WatcherConfig>());
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace polywatch
