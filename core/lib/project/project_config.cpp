// gdparse/project/project_config.cpp - Project configuration implementation
//
#include "gdparse/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <system_error>
#include <utility>

namespace gdparse
{

namespace
{

/// Read a scalar as T, reporting the key on a type mismatch
template <typename T>
bool read_scalar(const YAML::Node & node, const char * key, T & out, std::string & error)
{
  if (!node.IsScalar()) {
    error = std::string(key) + " must be a scalar";
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::Exception &) {
    error = std::string("invalid value for ") + key + ": '" + node.Scalar() + "'";
    return false;
  }
  return true;
}

bool parse_parser_section(const YAML::Node & node, ParserConfig & cfg, std::string & error)
{
  if (!node.IsMap()) {
    error = "parser must be a map";
    return false;
  }

  if (node["extension"]) {
    if (!read_scalar(node["extension"], "parser.extension", cfg.extension, error)) {
      return false;
    }
    if (cfg.extension.size() < 2 || cfg.extension.front() != '.') {
      error = "parser.extension must start with '.' (got '" + cfg.extension + "')";
      return false;
    }
  }

  if (node["max_nesting_depth"]) {
    int64_t depth = 0;
    if (!read_scalar(node["max_nesting_depth"], "parser.max_nesting_depth", depth, error)) {
      return false;
    }
    if (depth <= 0 || depth > UINT32_MAX) {
      error = "parser.max_nesting_depth must be a positive integer";
      return false;
    }
    cfg.max_nesting_depth = static_cast<uint32_t>(depth);
  }

  if (node["exclude"]) {
    if (!node["exclude"].IsSequence()) {
      error = "parser.exclude must be a list";
      return false;
    }
    for (const auto & item : node["exclude"]) {
      std::string part;
      if (!read_scalar(item, "parser.exclude", part, error)) {
        return false;
      }
      cfg.exclude.push_back(std::move(part));
    }
  }
  return true;
}

bool parse_output_section(const YAML::Node & node, OutputConfig & cfg, std::string & error)
{
  if (!node.IsMap()) {
    error = "output must be a map";
    return false;
  }

  if (node["format"]) {
    if (!read_scalar(node["format"], "output.format", cfg.format, error)) {
      return false;
    }
    if (cfg.format != "tree" && cfg.format != "json") {
      error = "invalid output.format: '" + cfg.format + "' (must be 'tree' or 'json')";
      return false;
    }
  }

  if (node["color"]) {
    std::string color;
    if (!read_scalar(node["color"], "output.color", color, error)) {
      return false;
    }
    if (color == "auto") {
      cfg.color = ColorMode::Auto;
    } else if (color == "always") {
      cfg.color = ColorMode::Always;
    } else if (color == "never") {
      cfg.color = ColorMode::Never;
    } else {
      error = "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')";
      return false;
    }
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty document is a valid, all-defaults configuration
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  if (root["parser"] && !parse_parser_section(root["parser"], config.parser, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (root["output"] && !parse_output_section(root["output"], config.output, error)) {
    return ConfigLoadResult::fail(error);
  }
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, fs::absolute(config_path, ec).parent_path());
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

}  // namespace gdparse
