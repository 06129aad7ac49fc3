#pragma once
#include "fileops/FileErrors.hpp"
#include "fileops/RetryPolicy.hpp"
#include "support/Logger.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace refsafe {

// Reads a whole file, retrying under `policy` while the file appears locked.
// Fails with FileOperationError.
llvm::Expected<std::string> readFileWithRetry(llvm::StringRef path, const RetryPolicy& policy,
                                              Logger& log);

} // namespace refsafe
