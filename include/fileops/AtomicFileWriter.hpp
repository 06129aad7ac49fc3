#pragma once
#include "fileops/FileErrors.hpp"
#include "fileops/FileSystemHooks.hpp"
#include "fileops/RetryPolicy.hpp"
#include "support/Logger.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace refsafe {

// Replaces a file's content so that readers only ever see the old bytes or the
// new bytes. Content goes to a hidden sibling temp file, is fsync'ed, and is
// renamed over the target; the target's permission bits are carried over.
//
// Errors:
//   AtomicWriteError    temp file could not be written, or the swap failed
//                       with a non-transient error
//   FileOperationError  the target stayed locked for every attempt
class AtomicFileWriter {
public:
  explicit AtomicFileWriter(Logger& log, FileSystemHooks hooks = {})
    : log_(log), hooks_(std::move(hooks)) {}

  llvm::Error writeAtomic(llvm::StringRef path, llvm::StringRef content,
                          const RetryPolicy& policy);

private:
  Logger& log_;
  FileSystemHooks hooks_;
};

} // namespace refsafe
