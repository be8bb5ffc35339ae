// gdparse/driver/parser_error.hpp - Errors surfaced by the script driver
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace gdparse
{

/**
 * Failure of a driver entry point.
 *
 * Grammar failures inside directory mode are not ParserErrors; they become
 * per-file ERROR lines instead.
 */
struct ParserError
{
  enum class Kind : uint8_t {
    MissingPath,  ///< Neither a regular file nor a directory
    Custom,       ///< I/O trouble or an internal invariant violation
    ParseError,   ///< Grammar failure in single-file mode
  };

  Kind kind = Kind::Custom;
  std::filesystem::path path;
  std::string message;  ///< Custom text, or the rendered failure for ParseError

  [[nodiscard]] static ParserError missing_path(std::filesystem::path p);
  [[nodiscard]] static ParserError custom(std::string msg);
  [[nodiscard]] static ParserError parse_error(std::filesystem::path p, std::string detail);

  /// "Path does not exist: <path>", "Error: <message>" or
  /// "Parse error on file <path>: <detail>"
  [[nodiscard]] std::string to_string() const;
};

}  // namespace gdparse
