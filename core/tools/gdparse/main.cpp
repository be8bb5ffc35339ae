// gdparse - GDScript parser command line interface
//
// Usage:
//   gdparse [options] <file.gd>    Print the syntax tree of one script
//   gdparse [options] <directory>  Print path:OK / path:ERROR for every script
//
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "gdparse/driver/file_enumerator.hpp"
#include "gdparse/driver/script_driver.hpp"
#include "gdparse/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "GDScript parser v0.1.0\n\n"
            << "Usage: " << program_name << " [options] <path>\n\n"
            << "  <path> is a script (prints its syntax tree) or a directory\n"
            << "  (prints one path:OK or path:ERROR line per script).\n\n"
            << "Options:\n"
            << "  --json                   Print the tree as JSON\n"
            << "  --ext <.ext>             Script extension in directory mode (default .gd)\n"
            << "  --max-depth <n>          Maximum nesting depth (default 256)\n"
            << "  --config <file>          Use this gdparse.yaml instead of searching for one\n"
            << "  --color, --no-color      Force coloured diagnostics on or off\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string input_path;
  std::string config_path;
  std::optional<std::string> extension;
  std::optional<uint32_t> max_depth;
  std::optional<bool> color;
  bool json = false;
  bool verbose = false;
  bool show_help = false;

  /// Set when the command line is malformed
  std::string error;
};

std::optional<uint32_t> parse_depth(const std::string & text)
{
  if (text.empty() || text[0] == '-') {
    return std::nullopt;
  }
  errno = 0;
  char * end = nullptr;
  const unsigned long value = std::strtoul(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || value == 0 || value > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--json") {
      args.json = true;
    } else if (arg == "--ext" || arg == "--max-depth" || arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      const std::string value = argv[++i];
      if (arg == "--ext") {
        if (value.size() < 2 || value[0] != '.') {
          args.error = "--ext must start with '.' (got '" + value + "')";
          return args;
        }
        args.extension = value;
      } else if (arg == "--max-depth") {
        args.max_depth = parse_depth(value);
        if (!args.max_depth) {
          args.error = "--max-depth must be a positive integer (got '" + value + "')";
          return args;
        }
      } else {
        args.config_path = value;
      }
    } else if (arg == "--color") {
      args.color = true;
    } else if (arg == "--no-color") {
      args.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      return args;
    } else if (args.input_path.empty()) {
      args.input_path = arg;
    } else {
      args.error = "unexpected argument: " + arg;
      return args;
    }
  }

  if (!args.show_help && args.input_path.empty()) {
    args.error = "no input path given";
  }
  return args;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<gdparse::ProjectConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
      config_path = gdparse::find_project_config(cwd);
    }
  }

  if (!config_path) {
    return gdparse::ProjectConfig{};
  }

  const auto loaded = gdparse::load_project_config(*config_path);
  if (!loaded.success) {
    std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return loaded.config;
}

gdparse::DriverOptions make_options(const CommandArgs & args, const gdparse::ProjectConfig & cfg)
{
  gdparse::DriverOptions options;
  options.extension = args.extension.value_or(cfg.parser.extension);
  options.exclude = cfg.parser.exclude;
  options.parse.max_nesting_depth = args.max_depth.value_or(cfg.parser.max_nesting_depth);
  options.format = (args.json || cfg.output.format == "json") ? gdparse::OutputFormat::Json
                                                              : gdparse::OutputFormat::Tree;
  options.verbose = args.verbose;

  if (args.color) {
    options.color = *args.color;
  } else if (cfg.output.color == gdparse::ColorMode::Always) {
    options.color = true;
  } else if (cfg.output.color == gdparse::ColorMode::Never) {
    options.color = false;
  } else {
    // Detect if terminal supports colors (simple check for TTY)
    options.color = isatty(fileno(stderr)) != 0;
  }
  return options;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }
  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  const auto config = load_config(args);
  if (!config) {
    return k_exit_usage;
  }

  const gdparse::FilesystemEnumerator files;
  gdparse::ScriptDriver driver(files, make_options(args, *config), std::cout, std::cerr);
  const gdparse::DriverResult result = driver.parse_path(args.input_path);

  if (!result.ok()) {
    std::cerr << "error: " << result.error->to_string() << "\n";
    return k_exit_failure;
  }

  const size_t failed = result.failed_count();
  if (args.verbose && !result.statuses.empty()) {
    std::cerr << result.statuses.size() << " scripts, " << failed << " failed\n";
  }
  return failed == 0 ? k_exit_ok : k_exit_failure;
}
