#include "grammar.hpp"
#include "lexer.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fuselex {
namespace {

constexpr auto kSyntax = std::regex::ECMAScript | std::regex::optimize;

// Zero-length match at any remaining character.
constexpr const char *kLookahead = R"((?=[\s\S]))";

std::regex compile(const char *pattern, bool icase = false) {
  return icase ? std::regex(pattern, kSyntax | std::regex::icase)
               : std::regex(pattern, kSyntax);
}

Rule rule(const char *pattern, TokenKind kind, Transition transition = {},
          bool icase = false) {
  Rule r;
  r.pattern = compile(pattern, icase);
  r.action = ActionKind::Emit;
  r.kind = kind;
  r.transition = transition;
  return r;
}

// Case-insensitive literal forms.
Rule rule_i(const char *pattern, TokenKind kind) {
  return rule(pattern, kind, {}, true);
}

Rule groups(const char *pattern, std::vector<TokenKind> kinds,
            Transition transition = {}) {
  Rule r;
  r.pattern = compile(pattern);
  r.action = ActionKind::EmitGroups;
  r.groups = std::move(kinds);
  r.transition = transition;
  return r;
}

Rule computed(const char *pattern, ComputedAction action, bool icase = false) {
  Rule r;
  r.pattern = compile(pattern, icase);
  r.action = ActionKind::Computed;
  r.computed = action;
  return r;
}

Rule recurse(const char *pattern) {
  Rule r;
  r.pattern = compile(pattern);
  r.action = ActionKind::Recurse;
  return r;
}

void mixin(std::vector<Rule> &rules, const std::vector<Rule> &shared) {
  rules.insert(rules.end(), shared.begin(), shared.end());
}

// The rest of the current line, newline excluded.
bool rest_of_line(LexerContext &ctx, TokenKind kind) {
  std::string_view rest = ctx.rest();
  ctx.emit(kind, rest.substr(0, rest.find('\n')));
  return true;
}

bool shebang(LexerContext &ctx, const RuleMatch &) {
  return rest_of_line(ctx, TokenKind::CommentPreproc);
}

bool line_comment(LexerContext &ctx, const RuleMatch &) {
  return rest_of_line(ctx, TokenKind::CommentSingle);
}

// --[==[ ... ]==]. Without a close of the same level the opener is left to
// the line comment rule.
bool long_comment(LexerContext &ctx, const RuleMatch &match) {
  std::size_t length =
      ctx.find_closing("]" + match[1].str() + "]", match.length(0));
  if (length == std::string_view::npos) {
    return false;
  }
  ctx.emit(TokenKind::CommentMultiline, ctx.rest().substr(0, length));
  return true;
}

// r"...", ur'...', r#"..."#: verbatim up to the same quote and fence.
bool raw_string(LexerContext &ctx, const RuleMatch &match) {
  std::size_t length =
      ctx.find_closing(match[3].str() + match[2].str(), match.length(0));
  if (length == std::string_view::npos) {
    return false;
  }
  ctx.emit(TokenKind::String, ctx.rest().substr(0, length));
  return true;
}

// u"..." or '...': remember which quote opened the string.
bool open_string(LexerContext &ctx, const RuleMatch &match) {
  std::string prefix = match[1].str();
  for (char &c : prefix) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  ctx.emit(TokenKind::String, match[0].str());
  ctx.strings().open(std::move(prefix), match[2].str()[0]);
  ctx.push(StateId::GenericString);
  return true;
}

// Only the delimiter that opened the innermost string closes it.
bool string_quote(LexerContext &ctx, const RuleMatch &match) {
  ctx.emit(TokenKind::String, match[0].str());
  if (ctx.strings().closes(match[0].str()[0])) {
    ctx.strings().close();
    ctx.pop();
  }
  return true;
}

bool identifier(LexerContext &ctx, const RuleMatch &match) {
  std::string name = match[0].str();

  if (name == "gsub" && ctx.is_builtin(name)) {
    ctx.emit(TokenKind::NameBuiltin, name);
    ctx.push(StateId::Gsub);
    return true;
  }
  if (ctx.is_builtin(name)) {
    ctx.emit(TokenKind::NameBuiltin, name);
    return true;
  }

  auto dot = name.find('.');
  if (dot != std::string::npos) {
    std::string_view view(name);
    ctx.emit(TokenKind::Name, view.substr(0, dot));
    ctx.emit(TokenKind::Punctuation, view.substr(dot, 1));
    ctx.emit(TokenKind::Name, view.substr(dot + 1));
    return true;
  }

  ctx.emit(TokenKind::Name, name);
  return true;
}

std::vector<Rule> escape_rules() {
  return {
      rule(R"(\\(?:\d{1,3}|[nrt\\"'0\s]|x[0-9a-fA-F]{2}|u[0-9a-fA-F]{4}|U[0-9a-fA-F]{8}))",
           TokenKind::StringEscape),
  };
}

std::vector<Rule> base_rules(Dialect dialect) {
  const bool modern = dialect == Dialect::Modern;
  std::vector<Rule> rules;

  rules.push_back(computed(R"(--\[(=*)\[)", long_comment));
  rules.push_back(computed(R"(--)", line_comment));

  // Most specific literal forms first so integers never shadow them.
  rules.push_back(rule_i(R"((?:\d[0-9_]*\.\d[0-9_]*|\.\d[0-9_]*)(?:e[+-]?\d+)?)",
                         TokenKind::NumberFloat));
  rules.push_back(rule_i(R"(\d[0-9_]*e[+-]?\d+)", TokenKind::NumberFloat));
  rules.push_back(rule_i(R"(0x[0-9a-f_]*)", TokenKind::NumberHex));
  if (modern) {
    rules.push_back(rule_i(R"(0b[01_]*)", TokenKind::NumberBin));
  }
  rules.push_back(rule(R"(\d[0-9_]*)", TokenKind::NumberInteger));

  rules.push_back(rule(R"(\n)", TokenKind::Text));
  rules.push_back(rule(R"([ \t\r\f\v]+)", TokenKind::Text));

  // Longest operators first.
  if (modern) {
    rules.push_back(rule(R"(==|!=|<=|>=|<<|>>|\.\.\.|[?&|!=+\-*/%^<>#])",
                         TokenKind::Operator));
  } else {
    rules.push_back(rule(R"(==|~=|<=|>=|\.\.\.|\.\.|[=+\-*/%^<>#])",
                         TokenKind::Operator));
  }
  rules.push_back(rule(R"([\[\]{}().,:;])", TokenKind::Punctuation));
  rules.push_back(rule(R"((?:and|or|not)\b)", TokenKind::OperatorWord));

  rules.push_back(rule(
      R"((?:break|do|else|elseif|end|for|if|in|repeat|return|then|until|while)\b)",
      TokenKind::Keyword));
  if (modern) {
    rules.push_back(rule(
        R"((?:as|enum|struct|type|trait|impl|union|import|from|export|match|when|is|try|catch|finally|pub)\b)",
        TokenKind::Keyword));
    rules.push_back(
        rule(R"((?:const|let|static)\b)", TokenKind::KeywordDeclaration));
  } else {
    rules.push_back(rule(
        R"((?:as|enum|struct|type|trait|union|import|from|export|match|when|is|try|catch|finally)\b)",
        TokenKind::Keyword));
    rules.push_back(
        rule(R"((?:const|let|global)\b)", TokenKind::KeywordDeclaration));
  }
  rules.push_back(rule(R"((?:true|false|nil)\b)", TokenKind::KeywordConstant));
  rules.push_back(rule(R"((?:function|fn)\b)", TokenKind::Keyword,
                       push(StateId::FunctionName)));

  rules.push_back(computed(R"((u?)(['"]))", open_string, true));
  rules.push_back(computed(R"((u?r)(#*)(["']))", raw_string));

  rules.push_back(
      computed(R"([A-Za-z_]\w*(?:\.[A-Za-z_]\w*)?)", identifier));
  return rules;
}

Grammar build(Dialect dialect) {
  Grammar g;
  g.dialect = dialect;
  auto state = [&g](StateId id) -> std::vector<Rule> & {
    State &s = g.states[static_cast<std::size_t>(id)];
    s.id = id;
    return s.rules;
  };

  state(StateId::Root) = {
      computed(R"(#!)", shebang),
      rule(kLookahead, TokenKind::Text, push(StateId::Base)),
  };

  state(StateId::Base) = base_rules(dialect);

  state(StateId::FunctionName) = {
      rule(R"(\s+)", TokenKind::Text),
      groups(R"((?:([A-Za-z_]\w*)(\.))?([A-Za-z_]\w*))",
             {TokenKind::NameClass, TokenKind::Punctuation,
              TokenKind::NameFunction},
             pop()),
      // Anonymous function: leave the parenthesis to base.
      rule(R"((?=\())", TokenKind::Text, pop()),
      rule(kLookahead, TokenKind::Text, pop()),
  };

  state(StateId::Gsub) = {
      rule(R"(\s+)", TokenKind::Text),
      rule(R"([(,])", TokenKind::Punctuation),
      rule(R"(\))", TokenKind::Punctuation, pop()),
      rule(R"(")", TokenKind::StringRegex, go(StateId::Regex)),
      rule(R"([A-Za-z_]\w*)", TokenKind::Name),
      rule(kLookahead, TokenKind::Text, pop()),
  };

  state(StateId::Regex) = {
      rule(R"(")", TokenKind::StringRegex, go(StateId::RegexEnd)),
      rule(R"(\[\^?)", TokenKind::StringEscape, push(StateId::RegexGroup)),
      rule(R"(\\[\s\S])", TokenKind::StringEscape),
      rule(R"(\(\?[:=<!])", TokenKind::StringEscape),
      rule(R"(\{[\d,]+\})", TokenKind::StringEscape),
      rule(R"([()?^$*+.|])", TokenKind::StringEscape),
      rule(R"([\s\S])", TokenKind::StringRegex),
  };

  state(StateId::RegexEnd) = {
      rule(R"(\$+)", TokenKind::StringRegex, pop()),
      rule(kLookahead, TokenKind::Text, pop()),
  };

  state(StateId::RegexGroup) = {
      rule(R"(\])", TokenKind::StringEscape, pop()),
      groups(R"((\\)([\s\S]))",
             {TokenKind::StringEscape, TokenKind::StringRegex}),
      // Unterminated class: the quote still ends the pattern.
      rule(R"((?="))", TokenKind::Text, pop()),
      rule(R"([\s\S])", TokenKind::StringRegex),
  };

  auto &string_rules = state(StateId::GenericString);
  mixin(string_rules, escape_rules());
  string_rules.push_back(computed(R"(['"])", string_quote));
  string_rules.push_back(rule(R"(\$\{)", TokenKind::StringInterpol,
                              push(StateId::GenericInterpolation)));
  string_rules.push_back(rule(R"(\$)", TokenKind::String));
  string_rules.push_back(rule(R"([^'"\\$]+)", TokenKind::String));

  state(StateId::GenericInterpolation) = {
      recurse(R"([^${}]+)"),
      rule(R"(\$\{)", TokenKind::StringInterpol,
           push(StateId::GenericInterpolation)),
      rule(R"(\})", TokenKind::StringInterpol, pop()),
  };

  return g;
}

} // namespace

const char *to_string(StateId state) {
  switch (state) {
  case StateId::Root:
    return "root";
  case StateId::Base:
    return "base";
  case StateId::FunctionName:
    return "function_name";
  case StateId::Gsub:
    return "gsub";
  case StateId::Regex:
    return "regex";
  case StateId::RegexEnd:
    return "regex_end";
  case StateId::RegexGroup:
    return "regex_group";
  case StateId::GenericString:
    return "generic_string";
  case StateId::GenericInterpolation:
    return "generic_interpolation";
  }
  return "unknown";
}

const char *to_string(Dialect dialect) {
  switch (dialect) {
  case Dialect::Modern:
    return "modern";
  case Dialect::Legacy:
    return "legacy";
  }
  return "unknown";
}

std::optional<Dialect> parse_dialect(std::string_view name) {
  if (name == "modern") {
    return Dialect::Modern;
  }
  if (name == "legacy") {
    return Dialect::Legacy;
  }
  return std::nullopt;
}

const Grammar &grammar_for(Dialect dialect) {
  static const Grammar modern = build(Dialect::Modern);
  static const Grammar legacy = build(Dialect::Legacy);
  return dialect == Dialect::Modern ? modern : legacy;
}

} // namespace fuselex
