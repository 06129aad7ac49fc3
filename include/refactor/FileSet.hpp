#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace refsafe {

// Expands comma-separated path globs into a sorted, de-duplicated list of
// regular files. Within a pattern `*`, `?` and `[...]` match inside a single
// path component and a `**` component matches any number of directories,
// including none. Fails on a malformed pattern.
llvm::Expected<std::vector<std::string>> expandGlobs(llvm::StringRef patterns);

// Regular files directly in `dir` (or below it when `recursive`) whose file
// name matches `nameGlob`. Sorted.
llvm::Expected<std::vector<std::string>> listFiles(llvm::StringRef dir, llvm::StringRef nameGlob,
                                                   bool recursive);

} // namespace refsafe
