#include "refactor/Operation.hpp"

namespace refsafe {

llvm::StringRef operationLabel(OperationKind kind, bool preview) {
  switch (kind) {
  case OperationKind::Renamed:        return preview ? "WOULD RENAME" : "RENAMED";
  case OperationKind::ContentUpdated: return preview ? "WOULD UPDATE" : "CONTENT UPDATED";
  case OperationKind::CompileCheck:   return "COMPILE CHECK";
  case OperationKind::WriteError:     return "WRITE ERROR";
  case OperationKind::RenameError:    return "RENAME ERROR";
  case OperationKind::NoChanges:      return "NO CHANGES";
  }
  return "UNKNOWN";
}

void OperationLog::append(OperationKind kind, std::string subject, std::string detail, bool preview) {
  OperationRecord rec;
  rec.kind = kind;
  rec.subject = std::move(subject);
  rec.detail = std::move(detail);
  rec.timestamp = std::chrono::system_clock::now();
  rec.preview = preview;

  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(std::move(rec));
}

std::vector<OperationRecord> OperationLog::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

void OperationLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
}

size_t OperationLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::map<OperationKind, unsigned> OperationLog::countsByKind() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<OperationKind, unsigned> counts;
  for (const auto& r : records_) ++counts[r.kind];
  return counts;
}

bool OperationLog::hasFailures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& r : records_)
    if (r.kind == OperationKind::WriteError || r.kind == OperationKind::RenameError) return true;
  return false;
}

bool OperationLog::hasActionable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& r : records_)
    if (r.kind == OperationKind::Renamed || r.kind == OperationKind::ContentUpdated) return true;
  return false;
}

} // namespace refsafe
