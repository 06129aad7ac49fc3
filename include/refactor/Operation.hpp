#pragma once
#include "fileops/FileErrors.hpp"
#include "rewrite/SymbolRewriter.hpp"
#include "verify/CompileVerifier.hpp"

#include "llvm/ADT/StringRef.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace refsafe {

enum class OperationKind { Renamed, ContentUpdated, CompileCheck, WriteError, RenameError, NoChanges };

// Label used in summaries, e.g. "RENAMED" or, for a preview, "WOULD RENAME".
llvm::StringRef operationLabel(OperationKind kind, bool preview = false);

struct OperationRecord {
  OperationKind kind = OperationKind::NoChanges;
  std::string subject;  // path the record is about
  std::string detail;
  std::chrono::system_clock::time_point timestamp;
  bool preview = false; // produced by a dry-run pass

  llvm::StringRef label() const { return operationLabel(kind, preview); }
};

// Append-only record of one orchestrator pass. Shared by batch workers.
class OperationLog {
public:
  void append(OperationKind kind, std::string subject, std::string detail, bool preview);
  std::vector<OperationRecord> records() const;
  void clear();
  size_t size() const;

  std::map<OperationKind, unsigned> countsByKind() const;
  bool hasFailures() const;   // any WriteError / RenameError
  bool hasActionable() const; // any Renamed / ContentUpdated

private:
  mutable std::mutex mutex_;
  std::vector<OperationRecord> records_;
};

struct RenameResult {
  bool success = false;
  std::string path;
  std::optional<std::string> newPath;
  unsigned changesApplied = 0;
  Backend backendUsed = Backend::PlainText;
  std::optional<ErrorInfo> error;
  std::optional<CompileStatus> compile;
};

} // namespace refsafe
