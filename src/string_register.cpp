#include "string_register.hpp"

#include <utility>

namespace fuselex {

void StringRegister::open(std::string prefix, char delimiter) {
  entries_.push_back(StringContext{std::move(prefix), delimiter});
}

void StringRegister::close() {
  if (!entries_.empty()) {
    entries_.pop_back();
  }
}

bool StringRegister::closes(char delimiter) const {
  return !entries_.empty() && entries_.back().delimiter == delimiter;
}

} // namespace fuselex
