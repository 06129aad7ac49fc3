#include "fileops/FileErrors.hpp"

namespace refsafe {

char AtomicWriteError::ID = 0;
char FileOperationError::ID = 0;

void AtomicWriteError::log(llvm::raw_ostream& os) const {
  os << "atomic write of '" << path_ << "' failed: " << message_;
  if (attempts_ > 1) os << " (after " << attempts_ << " attempts)";
}

std::error_code AtomicWriteError::convertToErrorCode() const {
  return cause_ ? cause_ : std::make_error_code(std::errc::io_error);
}

void FileOperationError::log(llvm::raw_ostream& os) const {
  os << message_;
  if (attempts_ > 1) os << " (attempted " << attempts_ << " times)";
}

std::error_code FileOperationError::convertToErrorCode() const {
  return cause_ ? cause_ : llvm::inconvertibleErrorCode();
}

ErrorInfo toErrorInfo(llvm::Error err) {
  ErrorInfo info;
  llvm::handleAllErrors(
    std::move(err),
    [&](const AtomicWriteError& e) {
      info.message = e.message();
      info.attempts = e.attempts();
      if (e.cause()) info.cause = e.cause();
    },
    [&](const FileOperationError& e) {
      info.message = e.message();
      info.attempts = e.attempts();
      if (e.cause()) info.cause = e.cause();
    },
    [&](const llvm::ErrorInfoBase& e) {
      info.message = e.message();
      std::error_code ec = e.convertToErrorCode();
      if (ec && ec != llvm::inconvertibleErrorCode()) info.cause = ec;
    });
  return info;
}

} // namespace refsafe
