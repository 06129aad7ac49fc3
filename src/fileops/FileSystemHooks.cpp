#include "fileops/FileSystemHooks.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"

#include <cerrno>

#ifdef _WIN32
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/WindowsError.h"
#include <windows.h>
#else
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <linux/fs.h>
#include <sys/syscall.h>
#endif
#endif

namespace refsafe {

std::error_code renameWith(const FileSystemHooks& hooks, llvm::StringRef from, llvm::StringRef to) {
  if (hooks.rename) return hooks.rename(from, to);
  return llvm::sys::fs::rename(from, to);
}

#ifdef _WIN32

std::error_code renameNoReplace(llvm::StringRef from, llvm::StringRef to) {
  llvm::SmallVector<llvm::UTF16, 128> wideFrom, wideTo;
  if (!llvm::convertUTF8ToUTF16String(from, wideFrom) || !llvm::convertUTF8ToUTF16String(to, wideTo))
    return std::make_error_code(std::errc::invalid_argument);
  // no MOVEFILE_REPLACE_EXISTING: an existing destination fails the call
  if (::MoveFileExW(reinterpret_cast<LPCWSTR>(wideFrom.data()), reinterpret_cast<LPCWSTR>(wideTo.data()),
                    MOVEFILE_WRITE_THROUGH))
    return {};
  return llvm::mapWindowsError(::GetLastError());
}

#else

static std::error_code lastError() { return std::error_code(errno, std::generic_category()); }

// link(2) never replaces, so link-then-unlink keeps the no-clobber guarantee on
// filesystems without a native exclusive rename.
static std::error_code linkThenUnlink(const char* from, const char* to) {
  if (::link(from, to) != 0) return lastError();
  if (::unlink(from) != 0) {
    std::error_code ec = lastError();
    ::unlink(to);
    return ec;
  }
  return {};
}

std::error_code renameNoReplace(llvm::StringRef from, llvm::StringRef to) {
  llvm::SmallString<256> src(from), dst(to);

#if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
  if (::syscall(SYS_renameat2, AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0)
    return {};
  if (errno != ENOSYS && errno != EINVAL) return lastError();
#elif defined(__APPLE__) && defined(RENAME_EXCL)
  if (::renamex_np(src.c_str(), dst.c_str(), RENAME_EXCL) == 0) return {};
  if (errno != ENOTSUP) return lastError();
#endif

  return linkThenUnlink(src.c_str(), dst.c_str());
}

#endif

std::error_code moveWith(const FileSystemHooks& hooks, llvm::StringRef from, llvm::StringRef to) {
  if (hooks.rename) return hooks.rename(from, to);
  return renameNoReplace(from, to);
}

} // namespace refsafe
