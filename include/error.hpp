#pragma once

#include <cstddef>
#include <string>

namespace fuselex {

// Input no rule matched. Recovery is always local, so an Error never stops
// tokenization; the offending character also appears as a TokenKind::Error
// token at the same position.
struct Error {
  std::string text; // one UTF-8 character
  std::size_t line{1};
  std::size_t column{1};
  std::size_t offset{0}; // byte offset into the source

  std::string message() const { return "unrecognized input '" + text + "'"; }
};

} // namespace fuselex
