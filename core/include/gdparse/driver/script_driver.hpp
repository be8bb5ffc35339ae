// gdparse/driver/script_driver.hpp - Path-based entry points
//
// Single entry point for parsing a script or a directory of scripts.
// Used by the CLI and by tests with an in-memory FileEnumerator.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gdparse/driver/file_enumerator.hpp"
#include "gdparse/driver/parser_error.hpp"
#include "gdparse/syntax/parser.hpp"

namespace gdparse
{

// ============================================================================
// Driver Options
// ============================================================================

enum class OutputFormat : uint8_t {
  Tree,  ///< AstDumper rendering
  Json,  ///< to_json() rendering
};

struct DriverOptions
{
  /// File extension selected in directory mode
  std::string extension = ".gd";

  /// Path components skipped in directory mode (e.g. "addons")
  std::vector<std::string> exclude;

  syntax::ParseOptions parse;

  OutputFormat format = OutputFormat::Tree;

  /// Colour diagnostics written to the error stream
  bool color = false;

  /// Log progress to the error stream
  bool verbose = false;
};

// ============================================================================
// Driver Result
// ============================================================================

/// Outcome of one file in directory mode.
struct FileStatus
{
  std::filesystem::path path;
  bool ok = false;
  std::string detail;  ///< Failure summary when !ok

  /// "path:OK" or "path:ERROR: detail"
  [[nodiscard]] std::string to_line() const;
};

struct DriverResult
{
  /// Set when the entry point itself failed
  std::optional<ParserError> error;

  /// Directory mode only, in enumeration order
  std::vector<FileStatus> statuses;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  [[nodiscard]] size_t failed_count() const noexcept;

  static DriverResult success()
  {
    return {};
  }

  static DriverResult fail(ParserError err)
  {
    DriverResult r;
    r.error = std::move(err);
    return r;
  }
};

// ============================================================================
// ScriptDriver
// ============================================================================

/**
 * Runs the parser over paths obtained through a FileEnumerator.
 *
 * Single-file mode prints the tree to `out` and diagnostics to `err`.
 * Directory mode prints one status line per file to `out` and keeps going
 * after a failure.
 */
class ScriptDriver
{
public:
  ScriptDriver(
    const FileEnumerator & files, DriverOptions options, std::ostream & out, std::ostream & err);

  /// Dispatch on the kind of `path`: directory mode or single-file mode.
  [[nodiscard]] DriverResult parse_path(const std::filesystem::path & path);

  [[nodiscard]] DriverResult parse_dir(const std::filesystem::path & root);

  [[nodiscard]] DriverResult parse_file(const std::filesystem::path & file);

private:
  [[nodiscard]] bool is_excluded(
    const std::filesystem::path & root, const std::filesystem::path & file) const;

  void log(const std::string & message) const;

  const FileEnumerator & files_;
  DriverOptions options_;
  std::ostream & out_;
  std::ostream & err_;
};

}  // namespace gdparse
