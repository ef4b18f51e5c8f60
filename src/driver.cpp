#include "builtins.hpp"
#include "lexer.hpp"
#include "lexer_info.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <system_error>
#include <vector>

using namespace llvm;

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("<input file>"),
                                          cl::init("-"));

static cl::opt<fuselex::Dialect> GrammarDialect(
    "dialect", cl::desc("Grammar variant to tokenize with"),
    cl::values(clEnumValN(fuselex::Dialect::Modern, "modern",
                          "impl/pub/static, binary literals, bitwise "
                          "operators (default)"),
               clEnumValN(fuselex::Dialect::Legacy, "legacy",
                          "Lua-style ~= and .., global, no binary literals")),
    cl::init(fuselex::Dialect::Modern));

static cl::opt<bool>
    NoBuiltins("no-builtins",
               cl::desc("Do not highlight built-in names specially"));

static cl::list<std::string>
    DisabledModules("disable-module",
                    cl::desc("Built-in module (or name) to exclude"),
                    cl::CommaSeparated);

static cl::opt<bool>
    Coalesce("coalesce", cl::desc("Merge adjacent tokens of the same kind"));

static cl::opt<bool>
    TraceStates("trace-states",
                cl::desc("Print the lexer state stack after each token "
                         "(as left by the rule that produced it)"));

static cl::opt<bool>
    DetectMode("detect",
               cl::desc("Report whether the input looks like Fuse and exit"));

static cl::opt<bool> InfoMode("info", cl::desc("Print lexer metadata and exit"));

static void printToken(const fuselex::Token &tok, raw_ostream &os) {
  os << "[" << fuselex::to_string(tok.kind) << "] ";
  if (!tok.lexeme.empty() && tok.kind != fuselex::TokenKind::EndOfFile) {
    os << "'";
    os.write_escaped(tok.lexeme);
    os << "'";
  }
  os << " (line " << tok.line << ", col " << tok.column << ")\n";
}

static void printStates(const fuselex::Lexer &lexer, raw_ostream &os) {
  WithColor(os, raw_ostream::CYAN) << "  states:";
  for (auto state : lexer.state_frames()) {
    os << " " << fuselex::to_string(state);
  }
  if (lexer.string_depth() > 0) {
    os << " (open strings: " << lexer.string_depth() << ")";
  }
  os << "\n";
}

static void printSourceLine(StringRef source, size_t line, size_t column,
                            raw_ostream &os) {
  SmallVector<StringRef, 32> lines;
  source.split(lines, '\n');

  if (line < 1 || line > lines.size()) {
    return;
  }

  StringRef lineContent = lines[line - 1];
  os << "  " << line << " | " << lineContent << "\n";
  os << "    | ";
  for (size_t i = 1; i < column; ++i) {
    os << " ";
  }
  WithColor(os, raw_ostream::RED, true) << "^";
  os << "\n";
}

static int printInfo() {
  const auto &info = fuselex::kLexerInfo;
  outs() << "title:       " << info.title << "\n";
  outs() << "description: " << info.description << "\n";
  outs() << "tag:         " << info.tag << "\n";
  outs() << "filenames:  ";
  for (auto name : info.filenames) {
    outs() << " " << name;
  }
  outs() << "\nmimetypes:  ";
  for (auto mime : info.mimetypes) {
    outs() << " " << mime;
  }
  outs() << "\n";
  return 0;
}

static fuselex::LexerOptions makeOptions() {
  std::vector<std::string> disabled(DisabledModules.begin(),
                                    DisabledModules.end());
  for (const auto &name : disabled) {
    if (!fuselex::is_builtin_module(name) &&
        fuselex::module_of(name).empty()) {
      WithColor::warning(errs(), "fuselex")
          << "unknown built-in module or name '" << name << "'\n";
    }
  }

  fuselex::LexerOptions options;
  options.dialect = GrammarDialect;
  options.builtins =
      fuselex::make_builtin_set(GrammarDialect, !NoBuiltins, disabled);
  return options;
}

static int runLexer(StringRef filename) {
  auto bufferOrErr = MemoryBuffer::getFileOrSTDIN(filename);
  if (std::error_code ec = bufferOrErr.getError()) {
    WithColor::error(errs(), "fuselex")
        << "cannot open file '" << filename << "': " << ec.message() << "\n";
    return 1;
  }

  std::unique_ptr<MemoryBuffer> buffer = std::move(*bufferOrErr);
  StringRef source = buffer->getBuffer();

  if (DetectMode) {
    bool detected = fuselex::detect(source);
    outs() << (detected ? "fuse" : "unknown") << "\n";
    return detected ? 0 : 1;
  }

  fuselex::Lexer lexer(source, makeOptions());

  if (TraceStates) {
    // Pull lazily so each token is paired with the stack its rule left
    // behind. Tokens of one multi-token rule (foo.bar) share that stack.
    for (;;) {
      fuselex::Token tok = lexer.next_token();
      printToken(tok, outs());
      printStates(lexer, errs());
      if (tok.kind == fuselex::TokenKind::EndOfFile) {
        break;
      }
    }
  } else {
    auto tokens = lexer.tokenize_all();
    if (Coalesce) {
      tokens = fuselex::coalesce(tokens);
    }
    for (const auto &tok : tokens) {
      printToken(tok, outs());
    }
  }

  for (const auto &err : lexer.errors()) {
    WithColor::error(errs(), "fuselex")
        << filename << ":" << err.line << ":" << err.column << ": "
        << err.message() << "\n";
    printSourceLine(source, err.line, err.column, errs());
  }

  return lexer.has_errors() ? 1 : 0;
}

int main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv, "Fuse syntax lexer\n");

  if (InfoMode) {
    return printInfo();
  }

  if (TraceStates && Coalesce) {
    WithColor::error(errs(), "fuselex")
        << "--coalesce cannot be combined with --trace-states\n";
    return 1;
  }

  return runLexer(InputFilename);
}
