// gdparse/driver/parser_error.cpp - ParserError factories and display text
#include "gdparse/driver/parser_error.hpp"

#include <fmt/core.h>

#include <utility>

namespace gdparse
{

ParserError ParserError::missing_path(std::filesystem::path p)
{
  ParserError e;
  e.kind = Kind::MissingPath;
  e.path = std::move(p);
  return e;
}

ParserError ParserError::custom(std::string msg)
{
  ParserError e;
  e.kind = Kind::Custom;
  e.message = std::move(msg);
  return e;
}

ParserError ParserError::parse_error(std::filesystem::path p, std::string detail)
{
  ParserError e;
  e.kind = Kind::ParseError;
  e.path = std::move(p);
  e.message = std::move(detail);
  return e;
}

std::string ParserError::to_string() const
{
  switch (kind) {
    case Kind::MissingPath:
      return fmt::format("Path does not exist: {}", path.string());
    case Kind::Custom:
      return fmt::format("Error: {}", message);
    case Kind::ParseError:
      return fmt::format("Parse error on file {}: {}", path.string(), message);
  }
  return message;
}

}  // namespace gdparse
