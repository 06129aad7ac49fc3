#include "fileops/RetryPolicy.hpp"

#include "llvm/Support/Path.h"

namespace fs = llvm::sys::fs;

namespace refsafe {

bool directoryWritable(llvm::StringRef dir) {
  return !fs::access(dir.empty() ? llvm::StringRef(".") : dir, fs::AccessMode::Write);
}

FileState captureFileState(llvm::StringRef path) {
  FileState state;
  state.parentWritable = directoryWritable(llvm::sys::path::parent_path(path));

  fs::file_status st;
  if (fs::status(path, st)) return state;
  state.exists = fs::exists(st);
  if (state.exists) {
    state.permissions = st.permissions();
    state.canWrite = !fs::access(path, fs::AccessMode::Write);
  }
  return state;
}

} // namespace refsafe
