#include "cronfire/config/config.hpp"

#include "cronfire/config/yaml_utils.hpp"
#include "cronfire/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<cronfire::OutputConfig> {
  static bool decode(const Node& node, cronfire::OutputConfig& o) {
    if (!node.IsMap()) {
      return false;
    }
    o.count = cronfire::yaml_get_or(node, "count", 9);
    o.utc = cronfire::yaml_get_or(node, "utc", false);
    return true;
  }
};

template <>
struct convert<cronfire::ScheduleEntry> {
  static bool decode(const Node& node, cronfire::ScheduleEntry& s) {
    if (!node.IsMap() || !node["expression"]) {
      return false;
    }
    s.expression = node["expression"].as<std::string>();
    s.name = cronfire::yaml_get_or<std::string>(node, "name", s.expression);
    s.until = cronfire::yaml_get_or<std::string>(node, "until", "");
    return true;
  }
};

template <>
struct convert<cronfire::AppConfig> {
  static bool decode(const Node& node, cronfire::AppConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.log_level = cronfire::yaml_get_or<std::string>(node, "log_level", "warn");
    if (auto output = node["output"]) {
      c.output = output.as<cronfire::OutputConfig>();
    }
    if (auto schedules = node["schedules"]) {
      c.schedules = schedules.as<std::vector<cronfire::ScheduleEntry>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace cronfire {

auto ConfigLoader::load_from_file(std::string_view path) -> Result<AppConfig> {
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
    -> Result<AppConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    AppConfig config = root.as<AppConfig>();
    if (config.output.count < 1) {
      log::error("output.count must be positive, got {}", config.output.count);
      return fail(Error::ParseError);
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace cronfire
