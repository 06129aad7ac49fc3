#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <system_error>

namespace refsafe {

// Seams into the two syscalls whose failure modes matter for atomicity.
// Empty members fall back to the real filesystem.
struct FileSystemHooks {
  // Replaces the rename syscall: llvm::sys::fs::rename for the writer's swap,
  // renameNoReplace for the mover.
  std::function<std::error_code(llvm::StringRef from, llvm::StringRef to)> rename;

  // Runs after the temp file is durable and before it is swapped in. An error
  // aborts the write the way a crash at that point would, minus the stray temp.
  std::function<llvm::Error(llvm::StringRef tempPath, llvm::StringRef target)> beforeRename;
};

std::error_code renameWith(const FileSystemHooks& hooks, llvm::StringRef from, llvm::StringRef to);

// Renames `from` to `to` in one step that fails with file_exists instead of
// replacing an existing `to`.
std::error_code renameNoReplace(llvm::StringRef from, llvm::StringRef to);

std::error_code moveWith(const FileSystemHooks& hooks, llvm::StringRef from, llvm::StringRef to);

} // namespace refsafe
