#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fuselex {

enum class TokenKind {
  EndOfFile,
  Text,
  Error,
  Comment,
  CommentPreproc,
  CommentSingle,
  CommentMultiline,
  Keyword,
  KeywordDeclaration,
  KeywordConstant,
  Operator,
  OperatorWord,
  Punctuation,
  NumberInteger,
  NumberFloat,
  NumberHex,
  NumberBin,
  String,
  StringEscape,
  StringInterpol,
  StringRegex,
  Name,
  NameBuiltin,
  NameClass,
  NameFunction,
};

struct Token {
  TokenKind kind{TokenKind::EndOfFile};
  std::string lexeme{};      // Exact source text covered by the token.
  std::size_t line{1};       // 1-based line number.
  std::size_t column{1};     // 1-based column number (start of token).
  std::size_t end_column{1}; // 1-based column number (end of token, exclusive).
  std::size_t offset{0};     // 0-based byte offset into the input.
};

// Dotted category name, e.g. "Keyword.Declaration".
const char *to_string(TokenKind kind);

// Merge runs of adjacent tokens of the same kind into one token.
// EndOfFile tokens are kept as they are.
std::vector<Token> coalesce(const std::vector<Token> &tokens);

} // namespace fuselex
