#include "fileops/AtomicMover.hpp"
#include "fileops/LockClassifier.hpp"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <thread>

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace refsafe {

llvm::Error AtomicMover::moveAtomic(llvm::StringRef src, llvm::StringRef dst,
                                    const RetryPolicy& policy) {
  if (!fs::exists(src))
    return llvm::make_error<FileOperationError>(("source file " + src + " does not exist").str(), 0,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
  if (fs::exists(dst))
    return llvm::make_error<FileOperationError>(("destination file " + dst + " already exists").str(), 0,
                                                std::make_error_code(std::errc::file_exists));

  const unsigned maxAttempts = policy.maxAttempts();
  for (unsigned attempt = 1; attempt <= maxAttempts; ++attempt) {
    const bool dirsWritable = directoryWritable(path::parent_path(src)) &&
                              directoryWritable(path::parent_path(dst));
    std::error_code ec = moveWith(hooks_, src, dst);
    if (!ec) {
      log_.debug("moved " + src + " to " + dst + " after " + llvm::Twine(attempt) + " attempt(s)");
      return llvm::Error::success();
    }

    // dst appeared after the check above; the rename itself refused to replace it
    if (ec == std::errc::file_exists)
      return llvm::make_error<FileOperationError>(
        ("destination file " + dst + " already exists").str(), attempt, ec);

    const bool locked = isLocked(ec, dirsWritable);
    if (!locked || attempt == maxAttempts) {
      const char* why = locked ? "due to file locking " : "";
      return llvm::make_error<FileOperationError>(
        ("moving " + src + " to " + dst + " failed " + why + "after " + llvm::Twine(attempt) +
         " attempt(s): " + ec.message()).str(),
        attempt, ec);
    }

    log_.warning("attempt " + llvm::Twine(attempt) + "/" + llvm::Twine(maxAttempts) + ": " + src +
                 " appears locked (" + ec.message() + "), retrying");
    std::this_thread::sleep_for(policy.retryDelay);
  }

  llvm_unreachable("retry loop always returns");
}

} // namespace refsafe
