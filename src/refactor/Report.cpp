#include "refactor/Report.hpp"

#include "llvm/Support/FormatVariadic.h"

#include <map>

namespace refsafe {

unsigned processedCount(const std::vector<RenameResult>& results) {
  unsigned n = 0;
  for (const auto& r : results)
    if (r.success && (r.newPath || r.changesApplied > 0)) ++n;
  return n;
}

bool anyFailed(const std::vector<RenameResult>& results) {
  for (const auto& r : results)
    if (!r.success) return true;
  return false;
}

void printOperations(llvm::raw_ostream& os, const std::vector<OperationRecord>& records) {
  for (const auto& r : records) {
    os << "  " << r.label() << ": " << r.subject;
    if (!r.detail.empty()) os << " (" << r.detail << ")";
    os << '\n';
  }
}

void printSummary(llvm::raw_ostream& os, const std::vector<OperationRecord>& records) {
  // preview and real records of the same kind are never mixed in one pass,
  // so the label of the first one names the group
  std::map<OperationKind, std::pair<llvm::StringRef, unsigned>> counts;
  for (const auto& r : records) {
    auto& slot = counts[r.kind];
    if (slot.second == 0) slot.first = r.label();
    ++slot.second;
  }

  os << "\nSummary:\n";
  os << "----------------------------------------\n";
  for (const auto& entry : counts)
    os << "  " << entry.second.first << ": " << entry.second.second << '\n';
  os << "\nTotal operations: " << records.size() << '\n';
}

llvm::json::Value toJson(const std::vector<RenameResult>& results,
                         const std::vector<OperationRecord>& records, bool success) {
  llvm::json::Array ops;
  for (const auto& r : records) {
    ops.push_back(llvm::json::Object{
      {"kind", r.label()},
      {"subject", r.subject},
      {"detail", r.detail},
    });
  }

  llvm::json::Array files;
  for (const auto& r : results) {
    llvm::json::Object file{
      {"path", r.path},
      {"new_path", r.newPath ? llvm::json::Value(*r.newPath) : llvm::json::Value(nullptr)},
      {"backend", backendName(r.backendUsed)},
      {"changes", int64_t(r.changesApplied)},
      {"error", r.error ? llvm::json::Value(r.error->message) : llvm::json::Value(nullptr)},
    };
    if (r.compile)
      file["compile"] = llvm::json::Object{{"ok", r.compile->ok}, {"message", r.compile->message}};
    files.push_back(std::move(file));
  }

  return llvm::json::Object{
    {"processed", int64_t(processedCount(results))},
    {"success", success},
    {"operations", std::move(ops)},
    {"files", std::move(files)},
  };
}

void printJson(llvm::raw_ostream& os, const std::vector<RenameResult>& results,
               const std::vector<OperationRecord>& records, bool success) {
  os << llvm::formatv("{0:2}", toJson(results, records, success)) << '\n';
}

} // namespace refsafe
