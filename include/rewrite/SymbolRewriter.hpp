#pragma once
#include "rewrite/Language.hpp"
#include "support/EngineConfig.hpp"
#include "support/Logger.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace refsafe {

enum class Backend { Ast, Regex, PlainText };

llvm::StringRef backendName(Backend backend);

struct RenameRequest {
  std::string oldName;
  std::string newName;
  SymbolKind  kind = SymbolKind::Auto;
  Language    language = Language::Unknown;
  std::string fileHint;  // on-disk path of the content, if any; used to resolve includes
};

struct RewriteResult {
  std::string content;
  unsigned    changes = 0;  // number of spans replaced
  Backend     backend = Backend::PlainText;
};

// The content could not be parsed; callers fall back to a text backend.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
  static char ID;
  explicit ParseError(std::string detail) : detail_(std::move(detail)) {}
  void log(llvm::raw_ostream& os) const override { os << "parse failed: " << detail_; }
  std::error_code convertToErrorCode() const override { return llvm::inconvertibleErrorCode(); }

private:
  std::string detail_;
};

class SymbolRewriter {
public:
  virtual ~SymbolRewriter() = default;

  virtual Backend backend() const = 0;
  virtual bool supports(Language lang) const = 0;

  virtual llvm::Expected<RewriteResult>
  rewrite(llvm::StringRef content, const RenameRequest& req) = 0;
};

// Declaration/reference-precise rename over a Clang AST (C family only).
std::unique_ptr<SymbolRewriter> makeClangRewriter(const EngineConfig& cfg);

// Kind-aware rename over a tree-sitter syntax tree for Java and Python. The
// grammars are loaded at runtime from cfg.grammarDirs or the default library
// path; a language whose grammar is missing is not supported. Only available
// when built with REFSAFE_WITH_TREE_SITTER.
std::unique_ptr<SymbolRewriter> makeTreeSitterRewriter(const EngineConfig& cfg, Logger& log);

// Word-boundary substitution that skips comment lines and string literals.
std::unique_ptr<SymbolRewriter> makeSafeTextRewriter();

// Raw substring substitution for files in no known language.
std::unique_ptr<SymbolRewriter> makePlainTextRewriter();

// Picks the most precise backend for a request and falls back to the safe
// text backend when the AST backend cannot parse the content. The first AST
// backend that supports the language is the one tried.
class RewritePipeline {
public:
  RewritePipeline(const EngineConfig& cfg, Logger& log);
  RewritePipeline(Logger& log, std::unique_ptr<SymbolRewriter> ast,
                  std::unique_ptr<SymbolRewriter> text, std::unique_ptr<SymbolRewriter> plain);
  RewritePipeline(Logger& log, std::vector<std::unique_ptr<SymbolRewriter>> ast,
                  std::unique_ptr<SymbolRewriter> text, std::unique_ptr<SymbolRewriter> plain);

  RewriteResult rewrite(llvm::StringRef content, const RenameRequest& req);

private:
  Logger& log_;
  std::vector<std::unique_ptr<SymbolRewriter>> ast_;
  std::unique_ptr<SymbolRewriter> text_;
  std::unique_ptr<SymbolRewriter> plain_;
};

} // namespace refsafe
