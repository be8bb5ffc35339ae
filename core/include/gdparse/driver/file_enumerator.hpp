// gdparse/driver/file_enumerator.hpp - File-system access used by the driver
//
// The driver never touches std::filesystem directly so tests can hand it an
// in-memory tree.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdparse
{

enum class PathKind : uint8_t {
  Missing,
  File,
  Directory,
};

class FileEnumerator
{
public:
  virtual ~FileEnumerator() = default;

  [[nodiscard]] virtual PathKind kind(const std::filesystem::path & path) const = 0;

  /**
   * Every regular file below `root` (recursively) whose name ends with
   * `extension`, in a stable order.
   *
   * @return std::nullopt when the directory cannot be walked
   */
  [[nodiscard]] virtual std::optional<std::vector<std::filesystem::path>> find_files_in_dir(
    const std::filesystem::path & root, std::string_view extension) const = 0;

  /// Whole file content, or std::nullopt when it cannot be read.
  [[nodiscard]] virtual std::optional<std::string> read_file(
    const std::filesystem::path & path) const = 0;
};

/// FileEnumerator over the real file system. Results are sorted by path.
class FilesystemEnumerator final : public FileEnumerator
{
public:
  [[nodiscard]] PathKind kind(const std::filesystem::path & path) const override;

  [[nodiscard]] std::optional<std::vector<std::filesystem::path>> find_files_in_dir(
    const std::filesystem::path & root, std::string_view extension) const override;

  [[nodiscard]] std::optional<std::string> read_file(
    const std::filesystem::path & path) const override;
};

}  // namespace gdparse
