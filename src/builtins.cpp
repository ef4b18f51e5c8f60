#include "builtins.hpp"

#include <algorithm>

namespace fuselex {
namespace {

BuiltinSet collect(Dialect dialect, const std::vector<std::string> &disabled) {
  auto is_disabled = [&](const BuiltinInfo &info) {
    return std::any_of(disabled.begin(), disabled.end(),
                       [&](const std::string &entry) {
                         return entry == info.module || entry == info.name;
                       });
  };

  BuiltinSet set;
  for (const auto &info : builtin_table()) {
    if (info.modern_only && dialect != Dialect::Modern) {
      continue;
    }
    if (is_disabled(info)) {
      continue;
    }
    set.emplace(info.name);
  }
  return set;
}

} // namespace

const std::vector<BuiltinInfo> &builtin_table() {
  static const std::vector<BuiltinInfo> table = {
      // Primitive and special types
      {"number", "types", false},
      {"string", "types", false},
      {"ustring", "types", false},
      {"any", "types", false},
      {"unknown", "types", false},
      {"never", "types", false},

      // Contextual words
      {"unsafe", "lang", true},
      {"default", "lang", false},
      {"namespace", "lang", false},

      // Global functions and values
      {"_G", "base", false},
      {"_VERSION", "base", false},
      {"assert", "base", false},
      {"assert_eq", "base", false},
      {"collectgarbage", "base", false},
      {"dofile", "base", false},
      {"error", "base", false},
      {"getmetatable", "base", false},
      {"ipairs", "base", false},
      {"load", "base", false},
      {"loadfile", "base", false},
      {"next", "base", false},
      {"pairs", "base", false},
      {"pcall", "base", false},
      {"print", "base", false},
      {"rawequal", "base", false},
      {"rawget", "base", false},
      {"rawlen", "base", false},
      {"rawset", "base", false},
      {"select", "base", false},
      {"setmetatable", "base", false},
      {"tonumber", "base", false},
      {"tostring", "base", false},
      {"xpcall", "base", false},
      {"typeof", "base", false},

      // Pattern substitution; its string argument is lexed as a regex
      {"gsub", "string", false},
  };
  return table;
}

std::string_view module_of(std::string_view name) {
  for (const auto &info : builtin_table()) {
    if (info.name == name) {
      return info.module;
    }
  }
  return {};
}

bool is_builtin_module(std::string_view module) {
  const auto &table = builtin_table();
  return std::any_of(table.begin(), table.end(), [&](const BuiltinInfo &info) {
    return info.module == module;
  });
}

std::shared_ptr<const BuiltinSet> default_builtins(Dialect dialect) {
  static const auto modern =
      std::make_shared<const BuiltinSet>(collect(Dialect::Modern, {}));
  static const auto legacy =
      std::make_shared<const BuiltinSet>(collect(Dialect::Legacy, {}));
  return dialect == Dialect::Modern ? modern : legacy;
}

std::shared_ptr<const BuiltinSet>
make_builtin_set(Dialect dialect, bool function_highlighting,
                 const std::vector<std::string> &disabled) {
  if (!function_highlighting) {
    return std::make_shared<const BuiltinSet>();
  }
  if (disabled.empty()) {
    return default_builtins(dialect);
  }
  return std::make_shared<const BuiltinSet>(collect(dialect, disabled));
}

} // namespace fuselex
