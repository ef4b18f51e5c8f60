#include "token.hpp"

namespace fuselex {

const char *to_string(TokenKind kind) {
  switch (kind) {
  case TokenKind::EndOfFile:
    return "EndOfFile";
  case TokenKind::Text:
    return "Text";
  case TokenKind::Error:
    return "Error";
  case TokenKind::Comment:
    return "Comment";
  case TokenKind::CommentPreproc:
    return "Comment.Preproc";
  case TokenKind::CommentSingle:
    return "Comment.Single";
  case TokenKind::CommentMultiline:
    return "Comment.Multiline";
  case TokenKind::Keyword:
    return "Keyword";
  case TokenKind::KeywordDeclaration:
    return "Keyword.Declaration";
  case TokenKind::KeywordConstant:
    return "Keyword.Constant";
  case TokenKind::Operator:
    return "Operator";
  case TokenKind::OperatorWord:
    return "Operator.Word";
  case TokenKind::Punctuation:
    return "Punctuation";
  case TokenKind::NumberInteger:
    return "Number.Integer";
  case TokenKind::NumberFloat:
    return "Number.Float";
  case TokenKind::NumberHex:
    return "Number.Hex";
  case TokenKind::NumberBin:
    return "Number.Bin";
  case TokenKind::String:
    return "String";
  case TokenKind::StringEscape:
    return "String.Escape";
  case TokenKind::StringInterpol:
    return "String.Interpol";
  case TokenKind::StringRegex:
    return "String.Regex";
  case TokenKind::Name:
    return "Name";
  case TokenKind::NameBuiltin:
    return "Name.Builtin";
  case TokenKind::NameClass:
    return "Name.Class";
  case TokenKind::NameFunction:
    return "Name.Function";
  }
  return "Unknown";
}

std::vector<Token> coalesce(const std::vector<Token> &tokens) {
  std::vector<Token> merged;
  merged.reserve(tokens.size());
  for (const auto &tok : tokens) {
    if (!merged.empty() && tok.kind != TokenKind::EndOfFile &&
        merged.back().kind == tok.kind) {
      merged.back().lexeme += tok.lexeme;
      merged.back().end_column = tok.end_column;
      continue;
    }
    merged.push_back(tok);
  }
  return merged;
}

} // namespace fuselex
