#include "TestUtil.hpp"

#include "llvm/ADT/Optional.h"
#include "llvm/Support/Program.h"

#include <gtest/gtest.h>

using namespace refsafe::test;

namespace {

// Runs the refsafe binary with stdout captured into `out`; returns the exit code.
int runCli(const TempDir& dir, std::vector<std::string> args, std::string& out) {
  const std::string outFile = dir.path("stdout.txt");
  std::vector<llvm::StringRef> argv{REFSAFE_CLI_PATH};
  for (const auto& a : args) argv.push_back(a);

  llvm::Optional<llvm::StringRef> redirects[] = {llvm::StringRef(""), llvm::StringRef(outFile),
                                                 llvm::StringRef("")};
  std::string errMsg;
  int rc = llvm::sys::ExecuteAndWait(REFSAFE_CLI_PATH, argv, llvm::None, redirects, 60, 0, &errMsg);
  EXPECT_GE(rc, 0) << errMsg;
  out = readAll(outFile);
  return rc;
}

} // namespace

TEST(Cli, ShortRecursiveFlagDescendsIntoSubdirectories) {
  TempDir dir;
  dir.write("tree/top/fooA.txt", "x");
  dir.write("tree/top/nested/barA.txt", "y");

  std::string out;
  ASSERT_EQ(runCli(dir, {"batch", "A", "B", dir.path("tree"), "*.txt", "-r", "--dry-run", "--json"}, out), 0);
  EXPECT_NE(out.find("fooB.txt"), std::string::npos) << out;
  EXPECT_NE(out.find("barB.txt"), std::string::npos) << out;
  EXPECT_TRUE(exists(dir.path("tree/top/nested/barA.txt")));
}

TEST(Cli, WithoutRecursiveOnlyTheTopDirectoryIsScanned) {
  TempDir dir;
  dir.write("tree/fooA.txt", "x");
  dir.write("tree/nested/barA.txt", "y");

  std::string out;
  ASSERT_EQ(runCli(dir, {"batch", "A", "B", dir.path("tree"), "*.txt", "--dry-run", "--json"}, out), 0);
  EXPECT_NE(out.find("fooB.txt"), std::string::npos) << out;
  EXPECT_EQ(out.find("barB.txt"), std::string::npos) << out;
}
