#pragma once
#include "fileops/FileErrors.hpp"
#include "fileops/FileSystemHooks.hpp"
#include "fileops/RetryPolicy.hpp"
#include "support/Logger.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace refsafe {

// Moves a file with one rename syscall, retrying while either endpoint is
// locked. Unlike AtomicFileWriter it refuses to replace an existing
// destination, including one that appears while the move is in flight. All
// failures are FileOperationError.
class AtomicMover {
public:
  explicit AtomicMover(Logger& log, FileSystemHooks hooks = {})
    : log_(log), hooks_(std::move(hooks)) {}

  llvm::Error moveAtomic(llvm::StringRef src, llvm::StringRef dst, const RetryPolicy& policy);

private:
  Logger& log_;
  FileSystemHooks hooks_;
};

} // namespace refsafe
