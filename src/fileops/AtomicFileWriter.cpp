#include "fileops/AtomicFileWriter.hpp"
#include "fileops/LockClassifier.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <thread>

#ifdef _WIN32
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace refsafe {

namespace {

std::error_code syncDescriptor(int fd) {
#ifdef _WIN32
  // _commit flushes file data; directory metadata is not covered
  if (::_commit(fd) != 0) return std::error_code(errno, std::generic_category());
  return {};
#else
  while (::fsync(fd) != 0) {
    if (errno == EINTR) continue;
    return std::error_code(errno, std::generic_category());
  }
  return {};
#endif
}

std::error_code syncDirectory(llvm::StringRef dir) {
#ifdef _WIN32
  (void)dir;
  return {};
#else
  llvm::SmallString<256> nativeDir(dir);
  int fd = ::open(nativeDir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return std::error_code(errno, std::generic_category());
  std::error_code ec = syncDescriptor(fd);
  ::close(fd);
  return ec;
#endif
}

// Writes `content` to a fresh `.<name>.XXXXXX.tmp` beside `target` and makes
// it durable. On success `tempPath` names the file and the caller owns it.
llvm::Error writeTempFile(llvm::StringRef target, llvm::StringRef content,
                          llvm::SmallVectorImpl<char>& tempPath) {
  llvm::SmallString<256> model(path::parent_path(target));
  path::append(model, "." + path::filename(target) + ".%%%%%%.tmp");

  int fd = -1;
  if (std::error_code ec = fs::createUniqueFile(model, fd, tempPath))
    return llvm::make_error<AtomicWriteError>(target.str(),
                                              "cannot create temporary file: " + ec.message(), 1, ec);

  llvm::FileRemover remover(llvm::StringRef(tempPath.data(), tempPath.size()));
  llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);

  auto fail = [&](const char* stage, std::error_code ec) -> llvm::Error {
    os.clear_error();
    return llvm::make_error<AtomicWriteError>(
      target.str(), std::string("failed to ") + stage + " temporary file: " + ec.message(), 1, ec);
  };

  os << content;
  os.flush();
  if (os.has_error()) return fail("write", os.error());

  if (std::error_code ec = syncDescriptor(fd)) return fail("sync", ec);

  os.close();
  if (os.has_error()) return fail("close", os.error());

  remover.releaseFile();
  return llvm::Error::success();
}

} // namespace

llvm::Error AtomicFileWriter::writeAtomic(llvm::StringRef filePath, llvm::StringRef content,
                                          const RetryPolicy& policy) {
  llvm::SmallString<256> absolute(filePath);
  if (std::error_code ec = fs::make_absolute(absolute))
    return llvm::make_error<AtomicWriteError>(filePath.str(), "cannot resolve path: " + ec.message(), 0, ec);

  const llvm::StringRef target = absolute;
  const llvm::StringRef dir = path::parent_path(target);
  if (std::error_code ec = fs::create_directories(dir))
    return llvm::make_error<AtomicWriteError>(target.str(),
                                              "cannot create parent directory: " + ec.message(), 0, ec);

  const unsigned maxAttempts = policy.maxAttempts();
  for (unsigned attempt = 1; attempt <= maxAttempts; ++attempt) {
    std::error_code ec;
    FileState state;
    {
      // a stale temp from an earlier attempt is never reused
      llvm::SmallString<256> tempPath;
      if (llvm::Error err = writeTempFile(target, content, tempPath)) return err;
      llvm::FileRemover remover(tempPath);

      state = captureFileState(target);

      if (hooks_.beforeRename) {
        if (llvm::Error err = hooks_.beforeRename(tempPath, target))
          return llvm::make_error<AtomicWriteError>(target.str(),
                                                    "aborted before swap: " + llvm::toString(std::move(err)),
                                                    attempt);
      }

#ifdef _WIN32
      // replacing an existing file by rename is not guaranteed here
      if (state.exists) ec = fs::remove(target);
#endif
      if (!ec) ec = renameWith(hooks_, tempPath, target);

      if (!ec) {
        remover.releaseFile();
        if (state.exists && state.permissions != fs::perms_not_known) {
          if (std::error_code permEc = fs::setPermissions(target, state.permissions))
            log_.debug("could not restore permissions on " + target + ": " + permEc.message());
        }
        if (std::error_code syncEc = syncDirectory(dir))
          log_.debug("directory sync of " + dir + " failed: " + syncEc.message());
        log_.debug("wrote " + target + " after " + llvm::Twine(attempt) + " attempt(s)");
        return llvm::Error::success();
      }
    }

    if (classify(ec, state.writable()) == LockStatus::Fatal)
      return llvm::make_error<AtomicWriteError>(target.str(),
                                                "rename into place failed: " + ec.message(), attempt, ec);

    if (attempt == maxAttempts)
      return llvm::make_error<FileOperationError>(
        ("file " + target + " is locked and cannot be written after " + llvm::Twine(attempt) +
         " attempts: " + ec.message()).str(),
        attempt, ec);

    log_.warning("attempt " + llvm::Twine(attempt) + "/" + llvm::Twine(maxAttempts) + ": " + target +
                 " appears locked (" + ec.message() + "), retrying");
    std::this_thread::sleep_for(policy.retryDelay);
  }

  llvm_unreachable("retry loop always returns");
}

} // namespace refsafe
