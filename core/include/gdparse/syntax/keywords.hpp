#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace gdparse::syntax
{

/// Words that open a declaration or a statement, or spell a literal or an
/// operator. None of them is accepted as a bare identifier expression.
inline constexpr std::array<std::string_view, 31> k_reserved_words = {
  "if",     "elif",       "else",   "while",  "for",     "match",  "return", "pass",
  "func",   "class",      "var",    "const",  "extends", "class_name", "signal", "enum",
  "static", "onready",    "export", "setget", "and",     "or",     "not",    "in",
  "is",     "as",         "true",   "false",  "null",    "True",   "False",
};

/// Function modifiers, longest spelling first so `remotesync` is never
/// read as `remote`.
inline constexpr std::array<std::string_view, 7> k_function_modifiers = {
  "static", "remotesync", "mastersync", "puppetsync", "remote", "master", "puppet",
};

[[nodiscard]] inline bool is_reserved_word(std::string_view word) noexcept
{
  return std::find(k_reserved_words.begin(), k_reserved_words.end(), word) !=
         k_reserved_words.end();
}

}  // namespace gdparse::syntax
