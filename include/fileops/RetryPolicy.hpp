#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"

#include <chrono>

namespace refsafe {

// Bounded fixed-delay retry budget for a single file operation.
// maxRetries = N allows N+1 attempts in total.
struct RetryPolicy {
  unsigned maxRetries = 3;
  std::chrono::milliseconds retryDelay{100};

  unsigned maxAttempts() const { return maxRetries + 1; }
};

// Existence, permission bits and effective write access of a path, captured
// before it is replaced.
struct FileState {
  bool exists = false;
  llvm::sys::fs::perms permissions = llvm::sys::fs::perms_not_known;
  // access(2) for this process, not just the mode bits
  bool canWrite = false;
  bool parentWritable = false;

  bool writable() const {
    if (!parentWritable) return false;
    return !exists || (canWrite && (permissions & llvm::sys::fs::owner_write) != 0);
  }
};

FileState captureFileState(llvm::StringRef path);

// True when this process may create and remove entries in `dir`.
bool directoryWritable(llvm::StringRef dir);

} // namespace refsafe
