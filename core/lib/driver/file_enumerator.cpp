// gdparse/driver/file_enumerator.cpp - std::filesystem backed enumerator
#include "gdparse/driver/file_enumerator.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace gdparse
{

namespace fs = std::filesystem;

PathKind FilesystemEnumerator::kind(const fs::path & path) const
{
  std::error_code ec;
  const fs::file_status st = fs::status(path, ec);
  if (ec) {
    return PathKind::Missing;
  }
  if (fs::is_directory(st)) {
    return PathKind::Directory;
  }
  if (fs::is_regular_file(st)) {
    return PathKind::File;
  }
  return PathKind::Missing;
}

std::optional<std::vector<fs::path>> FilesystemEnumerator::find_files_in_dir(
  const fs::path & root, std::string_view extension) const
{
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return std::nullopt;
  }

  std::vector<fs::path> out;
  const auto end = fs::recursive_directory_iterator();
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return std::nullopt;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) continue;

    const std::string name = it->path().filename().string();
    if (
      name.size() >= extension.size() &&
      name.compare(name.size() - extension.size(), extension.size(), extension) == 0) {
      out.push_back(it->path());
    }
  }
  if (ec) {
    return std::nullopt;
  }

  std::sort(out.begin(), out.end());
  return out;
}

std::optional<std::string> FilesystemEnumerator::read_file(const fs::path & path) const
{
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

}  // namespace gdparse
