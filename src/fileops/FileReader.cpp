#include "fileops/FileReader.hpp"
#include "fileops/LockClassifier.hpp"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/MemoryBuffer.h"

#include <thread>

namespace refsafe {

llvm::Expected<std::string> readFileWithRetry(llvm::StringRef path, const RetryPolicy& policy,
                                              Logger& log) {
  const unsigned maxAttempts = policy.maxAttempts();
  for (unsigned attempt = 1; attempt <= maxAttempts; ++attempt) {
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                              /*RequiresNullTerminator=*/false);
    if (buffer) return (*buffer)->getBuffer().str();

    std::error_code ec = buffer.getError();
    if (!isLocked(ec, captureFileState(path).writable()) || attempt == maxAttempts)
      return llvm::make_error<FileOperationError>(
        ("failed to read " + path + " after " + llvm::Twine(attempt) + " attempt(s): " + ec.message()).str(),
        attempt, ec);

    log.warning(path + " is locked, retrying in " + llvm::Twine(policy.retryDelay.count()) +
                "ms (attempt " + llvm::Twine(attempt) + "/" + llvm::Twine(maxAttempts) + ")");
    std::this_thread::sleep_for(policy.retryDelay);
  }

  llvm_unreachable("retry loop always returns");
}

} // namespace refsafe
