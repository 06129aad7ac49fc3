#include "support/EngineConfig.hpp"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/Program.h"

#include <cmath>

namespace refsafe {

bool parseSeconds(const std::string& text, std::chrono::milliseconds& out) {
  double seconds = 0;
  if (llvm::StringRef(text).trim().getAsDouble(seconds) || seconds < 0 || !std::isfinite(seconds))
    return false;
  out = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
  return true;
}

namespace {

struct EnvReader {
  std::vector<std::string>* warnings;

  void unsignedValue(const char* name, unsigned& field) {
    auto value = llvm::sys::Process::GetEnv(name);
    if (!value) return;
    unsigned parsed = 0;
    if (llvm::StringRef(*value).trim().getAsInteger(10, parsed)) {
      warn(name, *value);
      return;
    }
    field = parsed;
  }

  void secondsValue(const char* name, std::chrono::milliseconds& field) {
    auto value = llvm::sys::Process::GetEnv(name);
    if (!value) return;
    if (!parseSeconds(*value, field)) warn(name, *value);
  }

  void warn(const char* name, const std::string& value) {
    if (warnings)
      warnings->push_back(std::string("ignoring invalid ") + name + "='" + value + "'");
  }
};

} // namespace

EngineConfig EngineConfig::fromEnvironment(std::vector<std::string>* warnings) {
  EngineConfig cfg;
  EnvReader env{warnings};

  env.unsignedValue("REFACTOR_MAX_RETRIES", cfg.maxRetries);
  env.secondsValue("REFACTOR_RETRY_DELAY", cfg.retryDelay);

  // read-path retries default to whatever the write path resolved to
  cfg.readMaxRetries = cfg.maxRetries;
  cfg.readRetryDelay = cfg.retryDelay;
  env.unsignedValue("REFACTOR_READ_MAX_RETRIES", cfg.readMaxRetries);
  env.secondsValue("REFACTOR_READ_RETRY_DELAY", cfg.readRetryDelay);

  env.unsignedValue("REFACTOR_COMPILE_TIMEOUT", cfg.compileTimeoutSeconds);
  env.unsignedValue("REFACTOR_JOBS", cfg.jobs);
  if (cfg.jobs == 0) cfg.jobs = 1;

  if (auto level = llvm::sys::Process::GetEnv("LOG_LEVEL")) {
    if (auto parsed = parseLogLevel(*level))
      cfg.logLevel = *parsed;
    else
      env.warn("LOG_LEVEL", *level);
  }

  if (auto rd = llvm::sys::Process::GetEnv("CLANG_RESOURCE_DIR"))
    cfg.clangResourceDir = *rd;

  if (auto dirs = llvm::sys::Process::GetEnv("REFACTOR_GRAMMAR_PATH")) {
    llvm::SmallVector<llvm::StringRef, 4> parts;
    llvm::StringRef(*dirs).split(parts, llvm::sys::EnvPathSeparator, -1, /*KeepEmpty=*/false);
    for (llvm::StringRef dir : parts) cfg.grammarDirs.push_back(dir.str());
  }

  return cfg;
}

} // namespace refsafe
