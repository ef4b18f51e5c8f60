#include "lexer.hpp"

#include <algorithm>
#include <regex>
#include <utility>

namespace fuselex {
namespace {

// Byte length of the UTF-8 sequence starting at `view[0]`, so one
// unrecognized character never splits a multi-byte sequence. Malformed
// sequences count as one byte.
std::size_t utf8_length(std::string_view view) {
  auto lead = static_cast<unsigned char>(view[0]);
  std::size_t length = 1;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
  }
  if (length > view.size()) {
    return 1;
  }
  for (std::size_t i = 1; i < length; ++i) {
    if ((static_cast<unsigned char>(view[i]) & 0xC0) != 0x80) {
      return 1;
    }
  }
  return length;
}

} // namespace

LexerContext::LexerContext(StateId initial_state,
                           std::shared_ptr<const BuiltinSet> builtins)
    : states_(initial_state), builtins_(std::move(builtins)) {}

void LexerContext::reset(std::string_view input, StateId initial_state) {
  input_ = input;
  states_.reset(initial_state);
  strings_.clear();
  pending_.clear();
  errors_.clear();
  unclosed_.clear();
  offset_ = 0;
  line_ = 1;
  column_ = 1;
  transitions_ = 0;
}

void LexerContext::emit(TokenKind kind, std::string_view text) {
  if (text.empty()) {
    return;
  }

  Token tok;
  tok.kind = kind;
  tok.lexeme = std::string(text);
  tok.line = line_;
  tok.column = column_;
  tok.offset = offset_;

  for (char c : text) {
    if (c == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
  }
  offset_ += text.size();
  tok.end_column = column_;

  if (kind == TokenKind::Error) {
    errors_.push_back(Error{tok.lexeme, tok.line, tok.column, tok.offset});
  }
  pending_.push_back(std::move(tok));
}

void LexerContext::push(StateId state) {
  states_.push(state);
  ++transitions_;
}

void LexerContext::pop() {
  if (states_.pop()) {
    ++transitions_;
  }
}

void LexerContext::go(StateId state) {
  states_.go(state);
  ++transitions_;
}

std::size_t LexerContext::find_closing(const std::string &delimiter,
                                       std::size_t skip) {
  std::size_t from = offset_ + skip;
  auto known = unclosed_.find(delimiter);
  if (known != unclosed_.end() && from >= known->second) {
    return std::string_view::npos;
  }

  std::size_t found = input_.find(delimiter, from);
  if (found == std::string_view::npos) {
    unclosed_[delimiter] = from;
    return std::string_view::npos;
  }
  return found + delimiter.size() - offset_;
}

bool LexerContext::is_builtin(const std::string &name) const {
  return builtins_ && builtins_->count(name) > 0;
}

Lexer::Lexer(std::string_view source, LexerOptions options)
    : options_(std::move(options)), grammar_(&grammar_for(options_.dialect)),
      ctx_(options_.initial_state,
           options_.builtins ? options_.builtins
                             : default_builtins(options_.dialect)) {
  reset(source);
}

void Lexer::reset(std::string_view source) {
  source_ = std::string(source);
  ctx_.reset(source_, options_.initial_state);
  zero_width_steps_ = 0;
}

Token Lexer::next_token() {
  while (ctx_.pending_.empty() && !at_end()) {
    step();
  }

  if (!ctx_.pending_.empty()) {
    Token tok = std::move(ctx_.pending_.front());
    ctx_.pending_.pop_front();
    return tok;
  }

  Token eof;
  eof.kind = TokenKind::EndOfFile;
  eof.line = ctx_.line_;
  eof.column = ctx_.column_;
  eof.end_column = ctx_.column_;
  eof.offset = ctx_.offset_;
  return eof;
}

std::vector<Token> Lexer::tokenize_all() {
  std::vector<Token> tokens;
  for (;;) {
    Token tok = next_token();
    tokens.push_back(tok);
    if (tok.kind == TokenKind::EndOfFile) {
      break;
    }
  }
  return tokens;
}

void Lexer::step() {
  const State &state = grammar_->state(ctx_.states_.top());
  for (const auto &rule : state.rules) {
    if (try_rule(rule)) {
      return;
    }
  }
  recover();
}

bool Lexer::try_rule(const Rule &rule) {
  auto flags = std::regex_constants::match_continuous;
  if (ctx_.offset_ > 0) {
    flags |= std::regex_constants::match_prev_avail;
  }
  std::size_t limit = std::min(source_.size(), ctx_.offset_ + kMaxMatchLength);
  if (limit < source_.size()) {
    // The window edge is not the end of the input.
    flags |= std::regex_constants::match_not_eol |
             std::regex_constants::match_not_eow;
  }

  RuleMatch match;
  if (!std::regex_search(source_.cbegin() + ctx_.offset_,
                         source_.cbegin() + limit, match, rule.pattern,
                         flags)) {
    return false;
  }

  std::size_t length = static_cast<std::size_t>(match.length(0));
  if (length == 0) {
    // A zero-length match must change state or it makes no progress.
    if (rule.transition.kind == TransitionKind::None &&
        rule.action != ActionKind::Computed) {
      return false;
    }
    if (++zero_width_steps_ > kMaxZeroWidthSteps) {
      return false;
    }
  }

  std::size_t end = ctx_.offset_ + length;
  if (!apply(rule, match)) {
    return false;
  }

  // Whatever the action left unclaimed is still part of the input.
  if (ctx_.offset_ < end) {
    ctx_.emit(TokenKind::Text, std::string_view(source_).substr(
                                   ctx_.offset_, end - ctx_.offset_));
  }
  if (length > 0) {
    zero_width_steps_ = 0;
  }
  return true;
}

bool Lexer::apply(const Rule &rule, const RuleMatch &match) {
  std::string_view text =
      std::string_view(source_).substr(ctx_.offset_, match.length(0));

  switch (rule.action) {
  case ActionKind::Emit:
    ctx_.emit(rule.kind, text);
    break;
  case ActionKind::EmitGroups:
    emit_groups(rule, match);
    break;
  case ActionKind::Recurse:
    recurse(text);
    break;
  case ActionKind::Computed:
    if (!rule.computed(ctx_, match)) {
      return false;
    }
    break;
  }

  switch (rule.transition.kind) {
  case TransitionKind::None:
    break;
  case TransitionKind::Push:
    ctx_.push(rule.transition.target);
    break;
  case TransitionKind::Pop:
    ctx_.pop();
    break;
  case TransitionKind::Goto:
    ctx_.go(rule.transition.target);
    break;
  }
  return true;
}

void Lexer::emit_groups(const Rule &rule, const RuleMatch &match) {
  for (std::size_t i = 1; i < match.size() && i <= rule.groups.size(); ++i) {
    const auto &group = match[i];
    if (!group.matched || group.length() == 0) {
      continue;
    }

    auto start = static_cast<std::size_t>(group.first - source_.cbegin());
    if (start < ctx_.offset_) {
      continue; // nested inside an already emitted group
    }
    std::string_view view(source_);
    if (start > ctx_.offset_) {
      ctx_.emit(TokenKind::Text,
                view.substr(ctx_.offset_, start - ctx_.offset_));
    }
    ctx_.emit(rule.groups[i - 1], view.substr(start, group.length()));
  }
}

void Lexer::recurse(std::string_view text) {
  LexerOptions child_options = options_;
  child_options.initial_state = StateId::Base;
  child_options.builtins = ctx_.builtins_;

  Lexer child(text, child_options);
  for (Token tok = child.next_token(); tok.kind != TokenKind::EndOfFile;
       tok = child.next_token()) {
    ctx_.emit(tok.kind, tok.lexeme);
  }
}

void Lexer::recover() {
  std::string_view rest = std::string_view(source_).substr(ctx_.offset_);
  ctx_.emit(TokenKind::Error, rest.substr(0, utf8_length(rest)));
  zero_width_steps_ = 0;
}

bool Lexer::at_end() const { return ctx_.offset_ >= source_.size(); }

} // namespace fuselex
