// gdparse/basic/source_buffer.cpp - Script buffers and line lookup
#include "gdparse/basic/source_buffer.hpp"

#include <algorithm>
#include <utility>

namespace gdparse
{

ScriptBuffer::ScriptBuffer(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

TextPosition ScriptBuffer::position(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));
  // The first line starts at 0, so the bound is never begin()
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  return {line_index + 1, offset - line_starts_[line_index] + 1};
}

std::string_view ScriptBuffer::line(uint32_t number) const noexcept
{
  if (number == 0 || number > line_starts_.size()) {
    return {};
  }
  const std::string_view all = text_;
  const uint32_t begin = line_starts_[number - 1];
  const uint32_t end =
    number < line_starts_.size() ? line_starts_[number] : static_cast<uint32_t>(all.size());

  std::string_view out = all.substr(begin, end - begin);
  if (!out.empty() && out.back() == '\n') out.remove_suffix(1);
  if (!out.empty() && out.back() == '\r') out.remove_suffix(1);
  return out;
}

std::string_view ScriptBuffer::slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const std::string_view all = text_;
  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(all.size()));
  if (begin > end) {
    return {};
  }
  return all.substr(begin, end - begin);
}

FileId SourceBuffers::add(std::filesystem::path path, std::string text)
{
  if (buffers_.size() >= FileId::invalid().value) {
    return FileId::invalid();
  }
  const FileId id{static_cast<uint16_t>(buffers_.size())};
  buffers_.push_back(std::make_unique<ScriptBuffer>(std::move(path), std::move(text)));
  return id;
}

const ScriptBuffer * SourceBuffers::get(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= buffers_.size()) {
    return nullptr;
  }
  return buffers_[id.value].get();
}

TextPosition SourceBuffers::position(SourceLocation loc) const noexcept
{
  const ScriptBuffer * buffer = get(loc.file_id());
  if (buffer == nullptr || !loc.is_valid()) {
    return {};
  }
  return buffer->position(loc.offset());
}

std::string_view SourceBuffers::slice(SourceRange range) const noexcept
{
  const ScriptBuffer * buffer = get(range.file_id());
  return buffer != nullptr ? buffer->slice(range) : std::string_view{};
}

}  // namespace gdparse
