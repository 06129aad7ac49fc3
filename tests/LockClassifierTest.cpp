#include "fileops/LockClassifier.hpp"
#include "fileops/RetryPolicy.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <cerrno>

using namespace refsafe;

static std::error_code generic(int value) {
  return std::error_code(value, std::generic_category());
}

TEST(LockClassifier, BusyAndWouldBlockAreLocked) {
  EXPECT_EQ(classify(generic(EBUSY)), LockStatus::Locked);
  EXPECT_EQ(classify(generic(EAGAIN)), LockStatus::Locked);
  EXPECT_EQ(classify(generic(EWOULDBLOCK)), LockStatus::Locked);
#ifdef ETXTBSY
  EXPECT_EQ(classify(generic(ETXTBSY)), LockStatus::Locked);
#endif
}

TEST(LockClassifier, PermissionDeniedDependsOnWritability) {
  EXPECT_EQ(classify(generic(EACCES), /*targetWritable=*/true), LockStatus::Locked);
  EXPECT_EQ(classify(generic(EPERM), /*targetWritable=*/true), LockStatus::Locked);
  EXPECT_EQ(classify(generic(EACCES), /*targetWritable=*/false), LockStatus::Fatal);
  EXPECT_EQ(classify(generic(EPERM), /*targetWritable=*/false), LockStatus::Fatal);
}

TEST(LockClassifier, EverythingElseIsFatal) {
  EXPECT_EQ(classify(generic(ENOENT)), LockStatus::Fatal);
  EXPECT_EQ(classify(generic(EXDEV)), LockStatus::Fatal);
  EXPECT_EQ(classify(generic(EROFS)), LockStatus::Fatal);
  EXPECT_EQ(classify(generic(ENOSPC)), LockStatus::Fatal);
  EXPECT_EQ(classify(generic(EISDIR)), LockStatus::Fatal);
  EXPECT_EQ(classify(std::error_code()), LockStatus::Fatal);
}

TEST(LockClassifier, ErrorsFromOtherCategoriesAreFatal) {
  EXPECT_EQ(classify(std::make_error_code(std::io_errc::stream)), LockStatus::Fatal);
}

#ifndef _WIN32
TEST(LockClassifier, SystemCategoryErrnoMapsLikeGeneric) {
  EXPECT_EQ(classify(std::error_code(EBUSY, std::system_category())), LockStatus::Locked);
  EXPECT_EQ(classify(std::error_code(ENOENT, std::system_category())), LockStatus::Fatal);
  EXPECT_TRUE(isLocked(std::make_error_code(std::errc::device_or_resource_busy)));
}
#else
TEST(LockClassifier, SharingAndLockViolationsAreLocked) {
  EXPECT_EQ(classify(std::error_code(32, std::system_category())), LockStatus::Locked);
  EXPECT_EQ(classify(std::error_code(33, std::system_category())), LockStatus::Locked);
}
#endif

TEST(FileStateCapture, WritableFileInWritableDirectory) {
  test::TempDir dir;
  const std::string file = dir.write("a.txt", "x");

  FileState state = captureFileState(file);
  EXPECT_TRUE(state.exists);
  EXPECT_TRUE(state.canWrite);
  EXPECT_TRUE(state.parentWritable);
  EXPECT_TRUE(state.writable());

  FileState missing = captureFileState(dir.path("new.txt"));
  EXPECT_FALSE(missing.exists);
  EXPECT_TRUE(missing.writable());
}

TEST(FileStateCapture, ClearedOwnerWriteBitIsNotWritable) {
  test::TempDir dir;
  const std::string file = dir.write("ro.txt", "x");
  ASSERT_FALSE(llvm::sys::fs::setPermissions(file, llvm::sys::fs::owner_read));

  EXPECT_FALSE(captureFileState(file).writable());
}

TEST(FileStateCapture, UnwritableDirectoryMakesEntriesUnwritable) {
  namespace fs = llvm::sys::fs;
  test::TempDir dir;
  const std::string file = dir.write("sealed/a.txt", "x");
  const std::string sealed = dir.path("sealed");
  ASSERT_FALSE(fs::setPermissions(sealed, fs::owner_read | fs::owner_exe));
  if (directoryWritable(sealed)) {
    fs::setPermissions(sealed, fs::all_all);
    GTEST_SKIP() << "running with permission override";
  }

  FileState state = captureFileState(file);
  fs::setPermissions(sealed, fs::all_all);

  EXPECT_TRUE(state.exists);
  EXPECT_FALSE(state.parentWritable);
  EXPECT_FALSE(state.writable());
  EXPECT_EQ(classify(generic(EACCES), state.writable()), LockStatus::Fatal);
}
