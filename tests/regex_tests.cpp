#include "lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace fuselex;

namespace {

using Expected = std::vector<std::pair<TokenKind, std::string>>;

// Tokens without whitespace and without the trailing EndOfFile.
Expected significant(std::string_view source, LexerOptions options = {}) {
  Lexer lexer(source, std::move(options));
  Expected out;
  for (const auto &tok : lexer.tokenize_all()) {
    if (tok.kind != TokenKind::Text && tok.kind != TokenKind::EndOfFile) {
      out.emplace_back(tok.kind, tok.lexeme);
    }
  }
  return out;
}

TEST(RegexTest, PatternArgumentIsLexedAsRegex) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringRegex, "a"},
      {TokenKind::StringEscape, "+"},   {TokenKind::StringRegex, "b"},
      {TokenKind::StringRegex, "\""},   {TokenKind::Punctuation, ","},
      {TokenKind::String, "\""},        {TokenKind::String, "x"},
      {TokenKind::String, "\""},        {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub("a+b", "x"))"), expected);
}

TEST(RegexTest, SubjectArgumentBeforePattern) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::Name, "s"},           {TokenKind::Punctuation, ","},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringRegex, "x"},
      {TokenKind::StringRegex, "\""},   {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub(s, "x"))"), expected);
}

TEST(RegexTest, MethodCallSyntax) {
  Expected expected = {
      {TokenKind::Name, "s"},           {TokenKind::Punctuation, ":"},
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringRegex, "%"},
      {TokenKind::StringRegex, "d"},    {TokenKind::StringRegex, "\""},
      {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(s:gsub("%d"))"), expected);
}

TEST(RegexTest, CharacterClass) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringEscape, "[^"},
      {TokenKind::StringRegex, "a"},    {TokenKind::StringEscape, "\\"},
      {TokenKind::StringRegex, "]"},    {TokenKind::StringRegex, "b"},
      {TokenKind::StringEscape, "]"},   {TokenKind::StringRegex, "\""},
      {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub("[^a\]b]"))"), expected);
}

TEST(RegexTest, GroupsQuantifiersAndAnchors) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringEscape, "^"},
      {TokenKind::StringEscape, "(?:"}, {TokenKind::StringRegex, "a"},
      {TokenKind::StringRegex, "b"},    {TokenKind::StringEscape, ")"},
      {TokenKind::StringEscape, "{2,3}"}, {TokenKind::StringEscape, "\\d"},
      {TokenKind::StringEscape, "$"},   {TokenKind::StringRegex, "\""},
      {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub("^(?:ab){2,3}\d$"))"), expected);
}

TEST(RegexTest, TrailingFlagsAfterClosingQuote) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringRegex, "x"},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringRegex, "$$"},
      {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub("x"$$))"), expected);
}

TEST(RegexTest, UnterminatedClassStillClosesAtQuote) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"}, {TokenKind::Punctuation, "("},
      {TokenKind::StringRegex, "\""},   {TokenKind::StringEscape, "["},
      {TokenKind::StringRegex, "a"},    {TokenKind::StringRegex, "b"},
      {TokenKind::StringRegex, "\""},   {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(gsub("[ab"))"), expected);
}

TEST(RegexTest, ReturnsToBaseAfterPattern) {
  Lexer lexer(R"(gsub("a") x)");
  auto tokens = lexer.tokenize_all();
  EXPECT_EQ(lexer.current_state(), StateId::Base);
  EXPECT_EQ(lexer.state_depth(), 2u);
  EXPECT_EQ(tokens[tokens.size() - 2].kind, TokenKind::Name);
}

TEST(RegexTest, GsubWithoutCallIsJustABuiltin) {
  Expected expected = {
      {TokenKind::NameBuiltin, "gsub"},
      {TokenKind::Operator, "="},
      {TokenKind::NumberInteger, "1"},
  };
  EXPECT_EQ(significant("gsub = 1"), expected);
}

TEST(RegexTest, DisabledBuiltinsLexPatternAsPlainString) {
  Expected expected = {
      {TokenKind::Name, "gsub"},  {TokenKind::Punctuation, "("},
      {TokenKind::String, "\""},  {TokenKind::String, "a+"},
      {TokenKind::String, "\""},  {TokenKind::Punctuation, ")"},
  };

  LexerOptions no_highlighting;
  no_highlighting.builtins = make_builtin_set(Dialect::Modern, false, {});
  EXPECT_EQ(significant(R"(gsub("a+"))", no_highlighting), expected);

  LexerOptions no_string_module;
  no_string_module.builtins =
      make_builtin_set(Dialect::Modern, true, {"string"});
  EXPECT_EQ(significant(R"(gsub("a+"))", no_string_module), expected);
}

TEST(RegexTest, DottedGsubIsMemberAccess) {
  Expected expected = {
      {TokenKind::Name, "string"},     {TokenKind::Punctuation, "."},
      {TokenKind::Name, "gsub"},       {TokenKind::Punctuation, "("},
      {TokenKind::String, "\""},       {TokenKind::String, "a"},
      {TokenKind::String, "\""},       {TokenKind::Punctuation, ")"},
  };
  EXPECT_EQ(significant(R"(string.gsub("a"))"), expected);
}

} // namespace
