#include "support/Logger.hpp"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/WithColor.h"

namespace refsafe {

static const char* const kToolName = "refsafe";

std::optional<LogLevel> parseLogLevel(llvm::StringRef name) {
  auto level = llvm::StringSwitch<std::optional<LogLevel>>(name.lower())
    .Case("debug", LogLevel::Debug)
    .Case("info", LogLevel::Info)
    .Cases("warn", "warning", LogLevel::Warning)
    .Case("error", LogLevel::Error)
    .Cases("off", "none", "quiet", LogLevel::Off)
    .Default(std::nullopt);
  return level;
}

llvm::StringRef logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:   return "debug";
  case LogLevel::Info:    return "info";
  case LogLevel::Warning: return "warning";
  case LogLevel::Error:   return "error";
  case LogLevel::Off:     return "off";
  }
  return "info";
}

void Logger::emit(LogLevel level, const llvm::Twine& msg) {
  if (!enabled(level)) return;
  std::lock_guard<std::mutex> lock(mutex_);
  switch (level) {
  case LogLevel::Debug:
    llvm::WithColor::remark(os_, kToolName) << msg << '\n';
    break;
  case LogLevel::Info:
    llvm::WithColor::note(os_, kToolName) << msg << '\n';
    break;
  case LogLevel::Warning:
    llvm::WithColor::warning(os_, kToolName) << msg << '\n';
    break;
  case LogLevel::Error:
  case LogLevel::Off:
    llvm::WithColor::error(os_, kToolName) << msg << '\n';
    break;
  }
  os_.flush();
}

} // namespace refsafe
