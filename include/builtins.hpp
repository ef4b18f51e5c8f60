#pragma once

#include "grammar.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace fuselex {

using BuiltinSet = std::unordered_set<std::string>;

// One built-in name and the module it belongs to.
struct BuiltinInfo {
  std::string_view name;
  std::string_view module;
  bool modern_only; // absent from the legacy dialect
};

// Every known built-in, grouped by module ("types", "lang", "base",
// "string").
const std::vector<BuiltinInfo> &builtin_table();

// Module owning `name`, or an empty view if `name` is not a built-in.
std::string_view module_of(std::string_view name);

bool is_builtin_module(std::string_view module);

// The unfiltered built-in set of a dialect. Built once per process.
std::shared_ptr<const BuiltinSet> default_builtins(Dialect dialect);

// Applies the two user-facing options. With `function_highlighting` off the
// result is empty. Each entry of `disabled` removes either a whole module or
// a single built-in of that name; unknown entries are ignored.
std::shared_ptr<const BuiltinSet>
make_builtin_set(Dialect dialect, bool function_highlighting,
                 const std::vector<std::string> &disabled);

} // namespace fuselex
