#pragma once

#include "builtins.hpp"
#include "error.hpp"
#include "grammar.hpp"
#include "state_stack.hpp"
#include "string_register.hpp"
#include "token.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fuselex {

struct LexerOptions {
  Dialect dialect{Dialect::Modern};

  // Effective built-in set after upstream filtering (see make_builtin_set).
  // Null selects the dialect's default set.
  std::shared_ptr<const BuiltinSet> builtins{};

  // State the stack is seeded with. Interpolated expressions start in Base.
  StateId initial_state{StateId::Root};
};

// Runtime state of one tokenization run, as seen by rule actions.
class LexerContext {
public:
  LexerContext(StateId initial_state,
               std::shared_ptr<const BuiltinSet> builtins);

  // Append a token for the next `text.size()` characters of input.
  // Empty text is dropped.
  void emit(TokenKind kind, std::string_view text);

  void push(StateId state);
  void pop();
  void go(StateId state);

  StringRegister &strings() { return strings_; }
  const StringRegister &strings() const { return strings_; }
  const StateStack &states() const { return states_; }

  bool is_builtin(const std::string &name) const;

  // Unconsumed input, starting at the current offset.
  std::string_view rest() const { return input_.substr(offset_); }

  // Length of the span from the current offset through the first
  // `delimiter` found at least `skip` bytes ahead, or npos. A delimiter that
  // was missing once is never searched for again further on, so repeated
  // unterminated openers stay linear.
  std::size_t find_closing(const std::string &delimiter, std::size_t skip);

private:
  friend class Lexer;

  void reset(std::string_view input, StateId initial_state);

  std::string_view input_{};
  StateStack states_;
  StringRegister strings_;
  std::shared_ptr<const BuiltinSet> builtins_;

  std::deque<Token> pending_{};
  std::vector<Error> errors_{};
  // Delimiter -> earliest offset from which it does not occur.
  std::unordered_map<std::string, std::size_t> unclosed_{};

  std::size_t offset_{0};
  std::size_t line_{1};
  std::size_t column_{1};
  std::size_t transitions_{0}; // bumped on every stack change
};

class Lexer {
public:
  explicit Lexer(std::string_view source, LexerOptions options = {});

  // The context views into source_.
  Lexer(const Lexer &) = delete;
  Lexer &operator=(const Lexer &) = delete;

  // Produce the next token; returns TokenKind::EndOfFile when input is
  // exhausted.
  Token next_token();

  // Reset the lexer with new source content.
  void reset(std::string_view source);

  // Convenience: tokenize entire input.
  std::vector<Token> tokenize_all();

  StateId current_state() const { return ctx_.states().top(); }
  std::size_t state_depth() const { return ctx_.states().depth(); }
  std::size_t string_depth() const { return ctx_.strings().depth(); }
  const std::vector<StateId> &state_frames() const {
    return ctx_.states().frames();
  }

  bool has_errors() const { return !ctx_.errors_.empty(); }
  const std::vector<Error> &errors() const { return ctx_.errors_; }

private:
  // Consecutive zero-length steps tolerated at one offset before the driver
  // forces progress.
  static constexpr std::size_t kMaxZeroWidthSteps = 32;

  // A single regex match never looks further ahead than this. std::regex
  // recurses once per repeated character, so runs longer than the window
  // come out as several tokens of the same kind.
  static constexpr std::size_t kMaxMatchLength = 4096;

  void step();
  bool try_rule(const Rule &rule);
  bool apply(const Rule &rule, const RuleMatch &match);
  void emit_groups(const Rule &rule, const RuleMatch &match);
  void recurse(std::string_view text);
  void recover();

  bool at_end() const;

  std::string source_{};
  LexerOptions options_;
  const Grammar *grammar_;
  LexerContext ctx_;
  std::size_t zero_width_steps_{0};
};

} // namespace fuselex
