// gdparse/project/project_config.hpp - Project configuration (gdparse.yaml)
//
// Parses and validates gdparse.yaml. Command-line flags are applied on top
// of the loaded values by the CLI.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gdparse
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode : uint8_t {
  Auto,    ///< Colour when stderr is a terminal
  Always,
  Never,
};

/**
 * Parser section.
 */
struct ParserConfig
{
  /// Extension of the scripts selected in directory mode
  std::string extension = ".gd";

  /// Deepest nesting of expressions and blocks before parsing gives up
  uint32_t max_nesting_depth = 256;

  /// Path components skipped in directory mode
  std::vector<std::string> exclude;
};

/**
 * Output section.
 */
struct OutputConfig
{
  /// "tree" or "json"
  std::string format = "tree";

  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (gdparse.yaml).
 */
struct ProjectConfig
{
  ParserConfig parser;
  OutputConfig output;

  /// Directory containing gdparse.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a gdparse.yaml file.
 *
 * Missing keys keep their defaults; a key of the wrong type or with an
 * invalid value fails the load with a message naming the key.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for in-memory YAML text.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find gdparse.yaml by searching upward from a directory.
 *
 * @return Path to gdparse.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "gdparse.yaml";

}  // namespace gdparse
