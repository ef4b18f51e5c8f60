#include "builtins.hpp"
#include "lexer.hpp"
#include "lexer_info.hpp"

#include <gtest/gtest.h>

using namespace fuselex;

namespace {

TokenKind first_kind(std::string_view source, LexerOptions options = {}) {
  Lexer lexer(source, std::move(options));
  return lexer.next_token().kind;
}

TEST(BuiltinsTest, DefaultSetsPerDialect) {
  auto modern = default_builtins(Dialect::Modern);
  auto legacy = default_builtins(Dialect::Legacy);

  EXPECT_EQ(modern->count("print"), 1u);
  EXPECT_EQ(modern->count("gsub"), 1u);
  EXPECT_EQ(modern->count("unsafe"), 1u);
  EXPECT_EQ(legacy->count("print"), 1u);
  EXPECT_EQ(legacy->count("unsafe"), 0u);
  EXPECT_EQ(modern->size(), builtin_table().size());
}

TEST(BuiltinsTest, DefaultSetIsShared) {
  EXPECT_EQ(default_builtins(Dialect::Modern).get(),
            default_builtins(Dialect::Modern).get());
  EXPECT_EQ(make_builtin_set(Dialect::Modern, true, {}).get(),
            default_builtins(Dialect::Modern).get());
}

TEST(BuiltinsTest, FunctionHighlightingOffClearsSet) {
  auto set = make_builtin_set(Dialect::Modern, false, {});
  EXPECT_TRUE(set->empty());
}

TEST(BuiltinsTest, DisableWholeModule) {
  auto set = make_builtin_set(Dialect::Modern, true, {"base"});
  EXPECT_EQ(set->count("print"), 0u);
  EXPECT_EQ(set->count("pairs"), 0u);
  EXPECT_EQ(set->count("number"), 1u);
  EXPECT_EQ(set->count("gsub"), 1u);
}

TEST(BuiltinsTest, DisableSingleName) {
  auto set = make_builtin_set(Dialect::Modern, true, {"print", "nonsense"});
  EXPECT_EQ(set->count("print"), 0u);
  EXPECT_EQ(set->count("pairs"), 1u);
  EXPECT_EQ(set->size(), builtin_table().size() - 1);
}

TEST(BuiltinsTest, ModuleLookup) {
  EXPECT_EQ(module_of("ipairs"), "base");
  EXPECT_EQ(module_of("ustring"), "types");
  EXPECT_EQ(module_of("gsub"), "string");
  EXPECT_TRUE(module_of("foo").empty());
  EXPECT_TRUE(is_builtin_module("lang"));
  EXPECT_FALSE(is_builtin_module("print"));
}

TEST(BuiltinsTest, LexerHonorsEffectiveSet) {
  EXPECT_EQ(first_kind("print"), TokenKind::NameBuiltin);
  EXPECT_EQ(first_kind("unsafe"), TokenKind::NameBuiltin);

  LexerOptions legacy;
  legacy.dialect = Dialect::Legacy;
  EXPECT_EQ(first_kind("unsafe", legacy), TokenKind::Name);

  LexerOptions filtered;
  filtered.builtins = make_builtin_set(Dialect::Modern, true, {"base"});
  EXPECT_EQ(first_kind("print", filtered), TokenKind::Name);
  EXPECT_EQ(first_kind("number", filtered), TokenKind::NameBuiltin);

  LexerOptions plain;
  plain.builtins = make_builtin_set(Dialect::Modern, false, {});
  EXPECT_EQ(first_kind("number", plain), TokenKind::Name);
}

TEST(BuiltinsTest, InterpolationUsesTheSameSet) {
  LexerOptions plain;
  plain.builtins = make_builtin_set(Dialect::Modern, false, {});
  Lexer lexer("\"${print}\"", plain);
  auto tokens = lexer.tokenize_all();
  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_EQ(tokens[2].lexeme, "print");
  EXPECT_EQ(tokens[2].kind, TokenKind::Name);
}

TEST(LexerInfoTest, Metadata) {
  EXPECT_EQ(kLexerInfo.title, "Fuse");
  EXPECT_EQ(kLexerInfo.tag, "fuse");
  EXPECT_EQ(kLexerInfo.filenames[0], "*.fuse");
  EXPECT_EQ(kLexerInfo.mimetypes[1], "application/x-fuse");
}

TEST(LexerInfoTest, DetectShebang) {
  EXPECT_TRUE(detect("#!/usr/bin/fuse\nprint(1)"));
  EXPECT_TRUE(detect("#!/usr/bin/env fuse"));
  EXPECT_TRUE(detect("#! /usr/local/bin/fuse --strict\n"));
  EXPECT_TRUE(detect("#!/usr/bin/env -S fuse -x\n"));
  EXPECT_FALSE(detect("#!/usr/bin/python\n"));
  EXPECT_FALSE(detect("#!/usr/bin/fusebox\n"));
  EXPECT_FALSE(detect("#!\n"));
  EXPECT_FALSE(detect("print('#!/usr/bin/fuse')"));
  EXPECT_FALSE(detect(""));
}

TEST(LexerInfoTest, MatchesFilename) {
  EXPECT_TRUE(matches_filename("src/main.fuse"));
  EXPECT_TRUE(matches_filename("lib.fu"));
  EXPECT_FALSE(matches_filename("lib.fun"));
  EXPECT_FALSE(matches_filename("dir.fu/readme"));
  EXPECT_FALSE(matches_filename(".fu"));
}

} // namespace
