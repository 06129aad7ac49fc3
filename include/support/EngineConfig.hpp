#pragma once
#include "fileops/RetryPolicy.hpp"
#include "support/Logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace refsafe {

// Everything the engine reads from the environment, resolved once at startup
// and handed to each component. Command-line options override fields after
// fromEnvironment() returns.
struct EngineConfig {
  unsigned maxRetries = 3;
  std::chrono::milliseconds retryDelay{100};
  unsigned readMaxRetries = 3;
  std::chrono::milliseconds readRetryDelay{100};
  LogLevel logLevel = LogLevel::Info;

  bool checkCompile = true;
  unsigned compileTimeoutSeconds = 30;
  uint64_t maxCheckBytes = 10 * 1024 * 1024;

  unsigned jobs = 1;                 // worker threads for batch operations
  std::string clangResourceDir;      // passed to the AST backend as -resource-dir
  std::vector<std::string> extraArgs; // extra compiler args for the AST backend
  std::vector<std::string> grammarDirs; // searched for tree-sitter grammar libraries

  RetryPolicy writePolicy() const { return RetryPolicy{maxRetries, retryDelay}; }
  RetryPolicy readPolicy() const { return RetryPolicy{readMaxRetries, readRetryDelay}; }

  // Reads REFACTOR_* / LOG_LEVEL / CLANG_RESOURCE_DIR. Malformed values are
  // reported in `warnings` and the default is kept.
  static EngineConfig fromEnvironment(std::vector<std::string>* warnings = nullptr);
};

bool parseSeconds(const std::string& text, std::chrono::milliseconds& out);

} // namespace refsafe
