// gdparse/driver/script_driver.cpp - Single-file and directory parsing
#include "gdparse/driver/script_driver.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

#include "gdparse/ast/ast_dumper.hpp"
#include "gdparse/ast/json_visitor.hpp"
#include "gdparse/basic/diagnostic_printer.hpp"
#include "gdparse/syntax/frontend.hpp"

namespace gdparse
{

namespace fs = std::filesystem;

namespace
{

/// Indentation used for --json output
constexpr int k_json_indent = 2;

}  // namespace

std::string FileStatus::to_line() const
{
  if (ok) {
    return path.string() + ":OK";
  }
  return path.string() + ":ERROR: " + detail;
}

size_t DriverResult::failed_count() const noexcept
{
  return static_cast<size_t>(std::count_if(
    statuses.begin(), statuses.end(), [](const FileStatus & s) { return !s.ok; }));
}

ScriptDriver::ScriptDriver(
  const FileEnumerator & files, DriverOptions options, std::ostream & out, std::ostream & err)
: files_(files), options_(std::move(options)), out_(out), err_(err)
{
}

void ScriptDriver::log(const std::string & message) const
{
  if (options_.verbose) {
    err_ << message << "\n";
  }
}

DriverResult ScriptDriver::parse_path(const fs::path & path)
{
  switch (files_.kind(path)) {
    case PathKind::Directory:
      return parse_dir(path);
    case PathKind::File:
      return parse_file(path);
    case PathKind::Missing:
      break;
  }
  return DriverResult::fail(ParserError::missing_path(path));
}

bool ScriptDriver::is_excluded(const fs::path & root, const fs::path & file) const
{
  if (options_.exclude.empty()) {
    return false;
  }
  const fs::path relative = file.lexically_relative(root);
  for (const auto & part : relative) {
    const std::string name = part.string();
    if (std::find(options_.exclude.begin(), options_.exclude.end(), name) !=
        options_.exclude.end()) {
      return true;
    }
  }
  return false;
}

DriverResult ScriptDriver::parse_dir(const fs::path & root)
{
  const auto found = files_.find_files_in_dir(root, options_.extension);
  if (!found) {
    return DriverResult::fail(ParserError::custom("cannot read directory " + root.string()));
  }
  log("Found " + std::to_string(found->size()) + " '" + options_.extension + "' files under " +
      root.string());

  DriverResult result;
  for (const auto & path : *found) {
    if (is_excluded(root, path)) {
      log("Skipping: " + path.string());
      continue;
    }
    log("Parsing: " + path.string());

    FileStatus status;
    status.path = path;

    auto text = files_.read_file(path);
    if (!text) {
      status.detail = "cannot read file";
    } else {
      // Each file gets its own arena; only the status line outlives it
      SourceBuffers sources;
      AstContext ast;
      DiagnosticBag diags;
      const ParseOutput parsed =
        parse_source(sources, path, std::move(*text), ast, diags, options_.parse);
      status.ok = parsed.ok();
      if (parsed.failure) {
        status.detail = parsed.failure->summary();
      }
    }

    out_ << status.to_line() << "\n";
    result.statuses.push_back(std::move(status));
  }
  return result;
}

DriverResult ScriptDriver::parse_file(const fs::path & file)
{
  log("Parsing: " + file.string());

  auto text = files_.read_file(file);
  if (!text) {
    return DriverResult::fail(ParserError::custom("cannot read file " + file.string()));
  }

  SourceBuffers sources;
  AstContext ast;
  DiagnosticBag diags;
  const ParseOutput parsed =
    parse_source(sources, file, std::move(*text), ast, diags, options_.parse);

  if (!diags.empty()) {
    DiagnosticPrinter printer(err_, options_.color);
    printer.print_all(diags, sources);
  }

  if (!parsed.ok()) {
    const std::string detail = parsed.failure ? parsed.failure->render() : "unknown failure";
    return DriverResult::fail(ParserError::parse_error(file, detail));
  }

  if (options_.format == OutputFormat::Json) {
    out_ << to_json(parsed.file).dump(k_json_indent) << "\n";
  } else {
    dump(parsed.file, out_);
  }
  return DriverResult::success();
}

}  // namespace gdparse
