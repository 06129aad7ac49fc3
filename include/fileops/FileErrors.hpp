#pragma once
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>
#include <string>
#include <system_error>

namespace refsafe {

// Plain record of a failure, detached from llvm::Error so it can be stored in
// results and reports. `cause` is the OS error, when there was one.
struct ErrorInfo {
  std::string message;
  unsigned attempts = 0;
  std::optional<std::error_code> cause;
};

// The write itself could not be completed durably: the temp file could not be
// produced, or the swap failed with a non-transient error.
class AtomicWriteError : public llvm::ErrorInfo<AtomicWriteError> {
public:
  static char ID;

  AtomicWriteError(std::string path, std::string message, unsigned attempts,
                   std::error_code cause = {})
    : path_(std::move(path)), message_(std::move(message)), attempts_(attempts), cause_(cause) {}

  void log(llvm::raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;

  const std::string& path() const { return path_; }
  const std::string& reason() const { return message_; }
  unsigned attempts() const { return attempts_; }
  std::error_code cause() const { return cause_; }

private:
  std::string path_;
  std::string message_;
  unsigned attempts_;
  std::error_code cause_;
};

// Higher-level operation failure: a move, or a write that kept hitting a lock
// until the retry budget ran out.
class FileOperationError : public llvm::ErrorInfo<FileOperationError> {
public:
  static char ID;

  FileOperationError(std::string message, unsigned attempts = 0, std::error_code cause = {})
    : message_(std::move(message)), attempts_(attempts), cause_(cause) {}

  void log(llvm::raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;

  const std::string& reason() const { return message_; }
  unsigned attempts() const { return attempts_; }
  std::error_code cause() const { return cause_; }

private:
  std::string message_;
  unsigned attempts_;
  std::error_code cause_;
};

// Consumes `err` and flattens it into an ErrorInfo. Unknown error kinds keep
// their message with attempts = 0.
ErrorInfo toErrorInfo(llvm::Error err);

} // namespace refsafe
