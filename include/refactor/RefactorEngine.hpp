#pragma once
#include "fileops/AtomicFileWriter.hpp"
#include "fileops/AtomicMover.hpp"
#include "fileops/FileSystemHooks.hpp"
#include "refactor/Operation.hpp"
#include "rewrite/SymbolRewriter.hpp"
#include "support/EngineConfig.hpp"
#include "support/Logger.hpp"
#include "verify/CompileVerifier.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace refsafe {

// Runs rename/replace operations file by file: rewrite the content, commit it
// atomically, verify it, and move the file. Each file's failure is recorded
// in the operation log and the next file is processed. In dry-run mode the
// same decisions are made and logged as previews; nothing on disk changes.
class RefactorEngine {
public:
  RefactorEngine(const EngineConfig& cfg, Logger& log, FileSystemHooks hooks = {});
  // Uses `pipeline` instead of the configured rewriter backends.
  RefactorEngine(const EngineConfig& cfg, Logger& log, std::unique_ptr<RewritePipeline> pipeline,
                 FileSystemHooks hooks = {});

  void setDryRun(bool dryRun) { dryRun_ = dryRun; }
  bool dryRun() const { return dryRun_; }

  OperationLog& operations() { return ops_; }
  const OperationLog& operations() const { return ops_; }

  // Stops batch operations before their next file.
  void cancel() { cancelled_ = true; }
  bool cancelled() const { return cancelled_; }

  // Rewrites occurrences of `oldName` in one file. `kind` defaults to class
  // for code and is ignored for files in no known language.
  RenameResult renameFileContent(llvm::StringRef file, llvm::StringRef oldName,
                                 llvm::StringRef newName,
                                 SymbolKind kind = SymbolKind::Class);

  // Renames <dir>/<stem><ext> to <dir>/<newName><ext>, first renaming the stem
  // symbol inside it when `updateContent` is set. A failed content write
  // leaves the file where it is.
  RenameResult renameFile(llvm::StringRef file, llvm::StringRef newName, bool updateContent = true);

  // renameFile on `file` and on every related file (FooTest.java, IFoo.h, ...)
  // found below its directory.
  std::vector<RenameResult> renameWithRelated(llvm::StringRef file, llvm::StringRef newName);
  std::vector<std::string> findRelatedFiles(llvm::StringRef file, llvm::StringRef oldName) const;

  // Renames every file in `dir` matching `fileGlob` whose stem contains
  // `pattern`, replacing it with `replacement`. Fails only if the directory
  // or glob is invalid.
  llvm::Expected<std::vector<RenameResult>>
  batchRename(llvm::StringRef pattern, llvm::StringRef replacement, llvm::StringRef dir,
              llvm::StringRef fileGlob, bool recursive);

  // Renames `oldSymbol` in every file matched by the comma-separated globs.
  llvm::Expected<std::vector<RenameResult>>
  codeAwareReplace(llvm::StringRef oldSymbol, llvm::StringRef newSymbol,
                   llvm::StringRef targetGlobs, SymbolKind kind = SymbolKind::Auto);

private:
  RenameResult updateContent(llvm::StringRef file, const RenameRequest& req, bool verify);
  std::optional<CompileStatus> verify(llvm::StringRef file);
  std::vector<RenameResult> forEachFile(const std::vector<std::string>& files,
                                        const std::function<RenameResult(const std::string&)>& fn);

  const EngineConfig& cfg_;
  Logger& log_;
  std::unique_ptr<RewritePipeline> pipeline_;
  AtomicFileWriter writer_;
  AtomicMover mover_;
  CompileVerifier verifier_;
  OperationLog ops_;
  bool dryRun_ = false;
  std::atomic<bool> cancelled_{false};
};

} // namespace refsafe
