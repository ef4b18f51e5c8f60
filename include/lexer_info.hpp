#pragma once

#include <array>
#include <string_view>

namespace fuselex {

// Descriptive fields a host registry uses to offer this lexer.
struct LexerInfo {
  std::string_view title;
  std::string_view description;
  std::string_view tag;
  std::array<std::string_view, 2> filenames;
  std::array<std::string_view, 2> mimetypes;
};

inline constexpr LexerInfo kLexerInfo = {
    "Fuse",
    "Fuse (https://fuse-lang.github.io)",
    "fuse",
    {"*.fuse", "*.fu"},
    {"text/x-fuse", "application/x-fuse"},
};

// True when the first line of `text` is a shebang running fuse, e.g.
// "#!/usr/bin/fuse" or "#!/usr/bin/env fuse -x".
bool detect(std::string_view text);

// True when the file name of `path` matches one of kLexerInfo.filenames.
bool matches_filename(std::string_view path);

} // namespace fuselex
