#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>
#include <optional>

namespace refsafe {

enum class LogLevel { Debug, Info, Warning, Error, Off };

std::optional<LogLevel> parseLogLevel(llvm::StringRef name);
llvm::StringRef logLevelName(LogLevel level);

// Leveled diagnostics on a raw_ostream (llvm::errs() by default). One instance
// is created per run and passed by reference; writes are serialized so worker
// threads can share it.
class Logger {
public:
  explicit Logger(LogLevel level = LogLevel::Info, llvm::raw_ostream& os = llvm::errs())
    : level_(level), os_(os) {}

  LogLevel level() const { return level_; }
  void setLevel(LogLevel level) { level_ = level; }
  bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::Off; }

  void debug(const llvm::Twine& msg)   { emit(LogLevel::Debug, msg); }
  void info(const llvm::Twine& msg)    { emit(LogLevel::Info, msg); }
  void warning(const llvm::Twine& msg) { emit(LogLevel::Warning, msg); }
  void error(const llvm::Twine& msg)   { emit(LogLevel::Error, msg); }

private:
  void emit(LogLevel level, const llvm::Twine& msg);

  LogLevel level_;
  llvm::raw_ostream& os_;
  std::mutex mutex_;
};

} // namespace refsafe
