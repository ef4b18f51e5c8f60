#include "lexer_info.hpp"

#include <cctype>
#include <string_view>
#include <vector>

namespace fuselex {
namespace {

std::vector<std::string_view> split_words(std::string_view line) {
  std::vector<std::string_view> words;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() &&
           std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    std::size_t start = i;
    while (i < line.size() &&
           !std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    if (i > start) {
      words.push_back(line.substr(start, i - start));
    }
  }
  return words;
}

std::string_view basename(std::string_view path) {
  auto slash = path.find_last_of("/\\");
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.substr(text.size() - suffix.size()) == suffix;
}

} // namespace

bool detect(std::string_view text) {
  if (text.substr(0, 2) != "#!") {
    return false;
  }

  std::string_view line = text.substr(2, text.find('\n') - 2);
  auto words = split_words(line);
  if (words.empty()) {
    return false;
  }

  std::string_view program = basename(words[0]);
  if (program == "env") {
    // Skip env's own flags: #!/usr/bin/env -S fuse --flag
    program = {};
    for (std::size_t i = 1; i < words.size(); ++i) {
      if (words[i].front() != '-') {
        program = basename(words[i]);
        break;
      }
    }
  }
  return program == kLexerInfo.tag;
}

bool matches_filename(std::string_view path) {
  std::string_view name = basename(path);
  for (std::string_view pattern : kLexerInfo.filenames) {
    // Patterns are all of the form "*.ext".
    std::string_view suffix = pattern.substr(1);
    if (name.size() > suffix.size() && ends_with(name, suffix)) {
      return true;
    }
  }
  return false;
}

} // namespace fuselex
