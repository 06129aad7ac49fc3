#include "rewrite/SymbolRewriter.hpp"

namespace refsafe {

char ParseError::ID = 0;

llvm::StringRef backendName(Backend backend) {
  switch (backend) {
  case Backend::Ast:       return "ast";
  case Backend::Regex:     return "regex";
  case Backend::PlainText: return "plain-text";
  }
  return "plain-text";
}

static std::vector<std::unique_ptr<SymbolRewriter>> astBackends(const EngineConfig& cfg, Logger& log) {
  std::vector<std::unique_ptr<SymbolRewriter>> backends;
  backends.push_back(makeClangRewriter(cfg));
#ifdef REFSAFE_WITH_TREE_SITTER
  backends.push_back(makeTreeSitterRewriter(cfg, log));
#else
  (void)log;
#endif
  return backends;
}

RewritePipeline::RewritePipeline(const EngineConfig& cfg, Logger& log)
  : RewritePipeline(log, astBackends(cfg, log), makeSafeTextRewriter(), makePlainTextRewriter()) {}

RewritePipeline::RewritePipeline(Logger& log, std::unique_ptr<SymbolRewriter> ast,
                                 std::unique_ptr<SymbolRewriter> text,
                                 std::unique_ptr<SymbolRewriter> plain)
  : log_(log), text_(std::move(text)), plain_(std::move(plain)) {
  if (ast) ast_.push_back(std::move(ast));
}

RewritePipeline::RewritePipeline(Logger& log, std::vector<std::unique_ptr<SymbolRewriter>> ast,
                                 std::unique_ptr<SymbolRewriter> text,
                                 std::unique_ptr<SymbolRewriter> plain)
  : log_(log), ast_(std::move(ast)), text_(std::move(text)), plain_(std::move(plain)) {}

RewriteResult RewritePipeline::rewrite(llvm::StringRef content, const RenameRequest& req) {
  // candidates from most to least precise
  std::vector<SymbolRewriter*> chain;
  if (isProgrammingLanguage(req.language)) {
    for (const auto& ast : ast_) {
      if (ast && ast->supports(req.language)) {
        chain.push_back(ast.get());
        break;
      }
    }
    if (text_) chain.push_back(text_.get());
  }
  if (plain_) chain.push_back(plain_.get());

  for (SymbolRewriter* rw : chain) {
    auto res = rw->rewrite(content, req);
    if (res) return std::move(*res);
    log_.warning(llvm::Twine(backendName(rw->backend())) + " rewrite of " +
                 (req.fileHint.empty() ? std::string("<content>") : req.fileHint) +
                 " failed, falling back: " + llvm::toString(res.takeError()));
  }

  return RewriteResult{content.str(), 0, Backend::PlainText};
}

} // namespace refsafe
