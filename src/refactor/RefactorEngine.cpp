#include "refactor/RefactorEngine.hpp"
#include "fileops/FileReader.hpp"
#include "refactor/FileSet.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"

#include <algorithm>
#include <mutex>
#include <set>

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace refsafe {

namespace {

std::string replaceAll(llvm::StringRef text, llvm::StringRef from, llvm::StringRef to) {
  if (from.empty()) return text.str();
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t hit = text.find(from, pos);
    if (hit == llvm::StringRef::npos) break;
    out += text.slice(pos, hit);
    out += to;
    pos = hit + from.size();
  }
  out += text.substr(pos);
  return out;
}

std::string fileName(llvm::StringRef p) { return path::filename(p).str(); }

} // namespace

RefactorEngine::RefactorEngine(const EngineConfig& cfg, Logger& log, FileSystemHooks hooks)
  : RefactorEngine(cfg, log, std::make_unique<RewritePipeline>(cfg, log), std::move(hooks)) {}

RefactorEngine::RefactorEngine(const EngineConfig& cfg, Logger& log,
                               std::unique_ptr<RewritePipeline> pipeline, FileSystemHooks hooks)
  : cfg_(cfg), log_(log), pipeline_(std::move(pipeline)), writer_(log, hooks),
    mover_(log, std::move(hooks)), verifier_(cfg, log) {}

std::optional<CompileStatus> RefactorEngine::verify(llvm::StringRef file) {
  if (!cfg_.checkCompile || dryRun_) return std::nullopt;
  CompileStatus st = verifier_.check(file);
  const std::string detail = (st.ok ? "passed: " : "failed: ") + st.message;
  log_.info("compile check of " + fileName(file) + ": " + st.message);
  ops_.append(OperationKind::CompileCheck, file.str(), detail, false);
  return st;
}

RenameResult RefactorEngine::updateContent(llvm::StringRef file, const RenameRequest& req,
                                           bool verifyAfter) {
  RenameResult res;
  res.path = file.str();

  auto content = readFileWithRetry(file, cfg_.readPolicy(), log_);
  if (!content) {
    ErrorInfo info = toErrorInfo(content.takeError());
    log_.error("cannot read " + file + ": " + info.message);
    ops_.append(OperationKind::WriteError, res.path, "cannot read: " + info.message, dryRun_);
    res.error = std::move(info);
    return res;
  }

  RewriteResult rw = pipeline_->rewrite(*content, req);
  res.backendUsed = rw.backend;
  if (rw.changes == 0 || rw.content == *content) {
    ops_.append(OperationKind::NoChanges, res.path, "no matching symbols found", dryRun_);
    res.success = true;
    return res;
  }

  if (!dryRun_) {
    if (llvm::Error err = writer_.writeAtomic(file, rw.content, cfg_.writePolicy())) {
      ErrorInfo info = toErrorInfo(std::move(err));
      log_.error("failed to write " + file + ": " + info.message);
      ops_.append(OperationKind::WriteError, res.path, info.message, false);
      res.error = std::move(info);
      return res;
    }
  }

  res.changesApplied = rw.changes;
  res.success = true;
  ops_.append(OperationKind::ContentUpdated, res.path,
              (llvm::Twine(rw.changes) + " change(s) via " + backendName(rw.backend)).str(), dryRun_);
  if (verifyAfter) res.compile = verify(file);
  return res;
}

RenameResult RefactorEngine::renameFileContent(llvm::StringRef file, llvm::StringRef oldName,
                                               llvm::StringRef newName, SymbolKind kind) {
  RenameRequest req;
  req.oldName = oldName.str();
  req.newName = newName.str();
  req.kind = kind;
  req.language = detectLanguage(file);
  req.fileHint = file.str();
  return updateContent(file, req, /*verifyAfter=*/true);
}

RenameResult RefactorEngine::renameFile(llvm::StringRef file, llvm::StringRef newName,
                                        bool updateContentFirst) {
  RenameResult res;
  res.path = file.str();

  auto fail = [&](std::string message, unsigned attempts = 0,
                  std::optional<std::error_code> cause = std::nullopt) {
    log_.error(message);
    ops_.append(OperationKind::RenameError, res.path, message, dryRun_);
    res.error = ErrorInfo{std::move(message), attempts, cause};
    return res;
  };

  if (!fs::is_regular_file(file))
    return fail("file '" + file.str() + "' does not exist",
                0, std::make_error_code(std::errc::no_such_file_or_directory));

  const std::string oldStem = path::stem(file).str();
  const std::string newStem = path::stem(newName).str();
  if (newStem.empty())
    return fail("invalid new name '" + newName.str() + "'");

  llvm::SmallString<256> dst(path::parent_path(file));
  path::append(dst, newStem + path::extension(file).str());

  if (fs::exists(dst))
    return fail("destination '" + dst.str().str() + "' already exists",
                0, std::make_error_code(std::errc::file_exists));

  if (updateContentFirst) {
    RenameRequest req;
    req.oldName = oldStem;
    req.newName = newStem;
    req.kind = SymbolKind::Class;
    req.language = detectLanguage(file);
    req.fileHint = file.str();
    RenameResult content = updateContent(file, req, /*verifyAfter=*/false);
    res.changesApplied = content.changesApplied;
    res.backendUsed = content.backendUsed;
    if (content.error) {
      // the file keeps its name when its new content could not be committed
      res.error = std::move(content.error);
      return res;
    }
  }

  const std::string detail = fileName(file) + " -> " + fileName(dst);
  if (!dryRun_) {
    if (llvm::Error err = mover_.moveAtomic(file, dst, cfg_.writePolicy())) {
      ErrorInfo info = toErrorInfo(std::move(err));
      return fail("failed to rename " + file.str() + " to " + dst.str().str() + ": " + info.message,
                  info.attempts, info.cause);
    }
  }

  ops_.append(OperationKind::Renamed, res.path, detail, dryRun_);
  res.newPath = dst.str().str();
  res.success = true;
  res.compile = verify(dst);
  return res;
}

std::vector<std::string> RefactorEngine::findRelatedFiles(llvm::StringRef file,
                                                          llvm::StringRef oldName) const {
  const std::string texts[] = {
    oldName.str() + "Test.*",      oldName.str() + "Impl.*", oldName.str() + "Interface.*",
    oldName.str() + "Base.*",      oldName.str() + "Abstract.*",
    "Test" + oldName.str() + ".*", "I" + oldName.str() + ".*",
  };
  std::vector<llvm::GlobPattern> globs;
  for (const std::string& t : texts) {
    auto g = llvm::GlobPattern::create(t);
    if (!g) {
      log_.debug("skipping related-file pattern " + t + ": " + llvm::toString(g.takeError()));
      continue;
    }
    globs.push_back(std::move(*g));
  }

  llvm::StringRef dir = path::parent_path(file);
  auto all = listFiles(dir.empty() ? "." : dir, "*", /*recursive=*/true);
  if (!all) {
    log_.warning("cannot search for related files: " + llvm::toString(all.takeError()));
    return {};
  }

  std::set<std::string> related;
  for (const std::string& candidate : *all) {
    if (fs::equivalent(candidate, file)) continue;
    llvm::StringRef name = path::filename(candidate);
    for (const auto& g : globs) {
      if (g.match(name)) {
        related.insert(candidate);
        break;
      }
    }
  }
  return std::vector<std::string>(related.begin(), related.end());
}

std::vector<RenameResult> RefactorEngine::renameWithRelated(llvm::StringRef file,
                                                            llvm::StringRef newName) {
  const std::string oldStem = path::stem(file).str();
  const std::string newStem = path::stem(newName).str();

  std::vector<std::string> related = findRelatedFiles(file, oldStem);
  if (!related.empty()) {
    log_.info("found " + llvm::Twine(related.size()) + " related file(s)");
    for (const auto& r : related) log_.debug("  related: " + r);
  }

  std::vector<RenameResult> results;
  results.push_back(renameFile(file, newName));

  for (const std::string& r : related) {
    if (cancelled_) break;
    const std::string relStem = path::stem(r).str();
    const std::string relNew = replaceAll(relStem, oldStem, newStem);
    if (relNew != relStem) results.push_back(renameFile(r, relNew));
  }
  return results;
}

std::vector<RenameResult>
RefactorEngine::forEachFile(const std::vector<std::string>& files,
                            const std::function<RenameResult(const std::string&)>& fn) {
  std::vector<RenameResult> results;
  std::mutex resultsMutex;

  auto runOne = [&](const std::string& f) {
    if (cancelled_) return;
    RenameResult r = fn(f);
    std::lock_guard<std::mutex> lock(resultsMutex);
    results.push_back(std::move(r));
  };

  if (cfg_.jobs <= 1 || files.size() < 2) {
    for (const auto& f : files) runOne(f);
  } else {
    llvm::ThreadPool pool(llvm::hardware_concurrency(cfg_.jobs));
    for (const auto& f : files) pool.async([&runOne, &f] { runOne(f); });
    pool.wait();
  }

  std::sort(results.begin(), results.end(),
            [](const RenameResult& a, const RenameResult& b) { return a.path < b.path; });
  return results;
}

llvm::Expected<std::vector<RenameResult>>
RefactorEngine::batchRename(llvm::StringRef pattern, llvm::StringRef replacement,
                            llvm::StringRef dir, llvm::StringRef fileGlob, bool recursive) {
  if (pattern.empty())
    return llvm::createStringError(std::errc::invalid_argument, "batch pattern must not be empty");

  auto files = listFiles(dir, fileGlob, recursive);
  if (!files) return files.takeError();

  std::vector<std::string> selected;
  for (const std::string& f : *files)
    if (path::stem(f).contains(pattern)) selected.push_back(f);

  log_.info("found " + llvm::Twine(selected.size()) + " file(s) matching '" + pattern + "' in '" +
            dir + "'");

  return forEachFile(selected, [&](const std::string& f) {
    const std::string stem = path::stem(f).str();
    const std::string newStem = replaceAll(stem, pattern, replacement);
    if (newStem == stem) {
      ops_.append(OperationKind::NoChanges, f, "name unchanged", dryRun_);
      RenameResult same;
      same.path = f;
      same.success = true;
      return same;
    }
    return renameFile(f, newStem);
  });
}

llvm::Expected<std::vector<RenameResult>>
RefactorEngine::codeAwareReplace(llvm::StringRef oldSymbol, llvm::StringRef newSymbol,
                                 llvm::StringRef targetGlobs, SymbolKind kind) {
  if (oldSymbol.empty())
    return llvm::createStringError(std::errc::invalid_argument, "symbol to replace must not be empty");

  auto files = expandGlobs(targetGlobs);
  if (!files) return files.takeError();

  if (files->empty()) {
    log_.warning("no files found matching " + targetGlobs);
    return std::vector<RenameResult>();
  }
  log_.info("processing " + llvm::Twine(files->size()) + " file(s) for symbol replacement");

  return forEachFile(*files, [&](const std::string& f) {
    RenameRequest req;
    req.oldName = oldSymbol.str();
    req.newName = newSymbol.str();
    req.kind = kind;
    req.language = detectLanguage(f);
    req.fileHint = f;
    return updateContent(f, req, /*verifyAfter=*/true);
  });
}

} // namespace refsafe
