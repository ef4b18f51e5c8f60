#pragma once

#include "token.hpp"

#include <regex>
#include <string>
#include <vector>

namespace fuselex {

class LexerContext;

// Lexer states. Indexes into Grammar::states.
enum class StateId {
  Root,
  Base,
  FunctionName,
  Gsub,
  Regex,
  RegexEnd,
  RegexGroup,
  GenericString,
  GenericInterpolation,
};

constexpr std::size_t kStateCount = 9;

const char *to_string(StateId state);

using RuleMatch = std::smatch;

// Inspects the match, emits tokens and applies transitions through the
// context. Emitted text must be contiguous from the start of the match and
// may run past its end (see LexerContext::rest). Returning false declines
// the match before anything was emitted; the next rule is tried instead.
using ComputedAction = bool (*)(LexerContext &ctx, const RuleMatch &match);

enum class ActionKind {
  Emit,       // whole match as one token of `kind`
  EmitGroups, // capture group i as a token of `groups[i - 1]`
  Recurse,    // re-tokenize the match with the base grammar
  Computed,   // delegate to `computed`
};

enum class TransitionKind {
  None,
  Push,
  Pop,
  Goto, // replace the top of the stack
};

struct Transition {
  TransitionKind kind{TransitionKind::None};
  StateId target{StateId::Base};
};

inline Transition push(StateId target) {
  return {TransitionKind::Push, target};
}
inline Transition pop() { return {TransitionKind::Pop, StateId::Base}; }
inline Transition go(StateId target) { return {TransitionKind::Goto, target}; }

struct Rule {
  std::regex pattern;
  ActionKind action{ActionKind::Emit};
  TokenKind kind{TokenKind::Text};
  std::vector<TokenKind> groups{};
  ComputedAction computed{nullptr};
  Transition transition{};
};

struct State {
  StateId id{StateId::Root};
  std::vector<Rule> rules{};
};

} // namespace fuselex
