#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fuselex {

// Opening prefix and delimiter of one open quoted string.
struct StringContext {
  std::string prefix; // lower-cased, e.g. "" or "u"
  char delimiter{'"'};
};

// Records which delimiter opened each currently open string, innermost last.
class StringRegister {
public:
  void open(std::string prefix, char delimiter);

  // Pop the innermost entry; no-op when empty.
  void close();

  // True when `delimiter` closes the innermost open string.
  bool closes(char delimiter) const;

  bool empty() const { return entries_.empty(); }
  std::size_t depth() const { return entries_.size(); }
  const StringContext &top() const { return entries_.back(); }

  void clear() { entries_.clear(); }

private:
  std::vector<StringContext> entries_;
};

} // namespace fuselex
