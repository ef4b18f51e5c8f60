#pragma once

#include "rule.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace fuselex {

// The two known variants of the Fuse rule table.
enum class Dialect {
  Modern, // impl/pub/static, binary literals, C-style bitwise operators
  Legacy, // Lua-style ~= and .., global, no binary literals
};

const char *to_string(Dialect dialect);
std::optional<Dialect> parse_dialect(std::string_view name);

struct Grammar {
  Dialect dialect{Dialect::Modern};
  std::array<State, kStateCount> states{};

  const State &state(StateId id) const {
    return states[static_cast<std::size_t>(id)];
  }
};

// Immutable rule tables, built once per process on first use.
const Grammar &grammar_for(Dialect dialect);

} // namespace fuselex
