// chill/project/project_config.cpp - Project configuration implementation
//
#include "chill/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include "chill/basic/text.hpp"

namespace chill
{

namespace
{

/// Read an optional boolean key of a map section.
bool read_bool(
  const YAML::Node & section, const char * key, const std::string & path, bool & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::Exception &) {
    error = path + "." + key + " must be a boolean";
    return false;
  }
  return true;
}

ConfigLoadResult build_config(const YAML::Node & root, std::filesystem::path project_root)
{
  ProjectConfig config;
  config.project_root = std::move(project_root);

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of chill.yaml must be a map");
  }

  std::string error;

  // 'completion' section
  if (const YAML::Node comp = root["completion"]) {
    if (!comp.IsMap()) {
      return ConfigLoadResult::fail("completion must be a map");
    }
    if (
      !read_bool(comp, "keywords", "completion", config.completion.keywords, error) ||
      !read_bool(comp, "predefined", "completion", config.completion.predefined, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // 'diagnostics' section
  if (const YAML::Node diag = root["diagnostics"]) {
    if (!diag.IsMap()) {
      return ConfigLoadResult::fail("diagnostics must be a map");
    }
    if (!read_bool(diag, "enabled", "diagnostics", config.diagnostics.enabled, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // 'server' section
  if (const YAML::Node server = root["server"]) {
    if (!server.IsMap()) {
      return ConfigLoadResult::fail("server must be a map");
    }
    if (server["log_level"]) {
      std::string text;
      try {
        text = server["log_level"].as<std::string>();
      } catch (const YAML::Exception &) {
        return ConfigLoadResult::fail("server.log_level must be a string");
      }
      const auto level = parse_log_level(text);
      if (!level) {
        return ConfigLoadResult::fail(
          "invalid server.log_level: '" + text + "' (must be 'error', 'info' or 'debug')");
      }
      config.server.log_level = *level;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::string_view to_string(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Error:
      return "error";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
  }
  return "error";
}

std::optional<LogLevel> parse_log_level(std::string_view text)
{
  if (text::iequals(text, "error")) return LogLevel::Error;
  if (text::iequals(text, "info")) return LogLevel::Info;
  if (text::iequals(text, "debug")) return LogLevel::Debug;
  return std::nullopt;
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return build_config(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return build_config(root, fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace chill
