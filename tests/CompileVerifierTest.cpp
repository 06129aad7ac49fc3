#include "verify/CompileVerifier.hpp"
#include "TestUtil.hpp"

#include "llvm/Support/Program.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <set>

using namespace refsafe;
using namespace refsafe::test;

namespace {

class CompileVerifierTest : public ::testing::Test {
protected:
  EngineConfig cfg;
  Logger log{LogLevel::Off};
  TempDir dir;
};

bool haveProgram(llvm::StringRef name) {
  return bool(llvm::sys::findProgramByName(name));
}

#ifndef _WIN32
// Puts a shell script named `name` first on PATH for the lifetime of the object.
class ScriptOnPath {
public:
  ScriptOnPath(const TempDir& dir, llvm::StringRef name, llvm::StringRef body) {
    const std::string script = dir.write(("bin/" + name).str(), ("#!/bin/sh\n" + body + "\n").str());
    llvm::sys::fs::setPermissions(script, llvm::sys::fs::all_read | llvm::sys::fs::all_exe |
                                              llvm::sys::fs::owner_write);
    if (const char* old = std::getenv("PATH")) saved_ = old;
    ::setenv("PATH", (dir.path("bin") + ":" + saved_).c_str(), 1);
  }
  ~ScriptOnPath() { ::setenv("PATH", saved_.c_str(), 1); }

private:
  std::string saved_;
};
#endif

// Leftover javac scratch directories in the system temp dir.
std::set<std::string> javacScratchDirs() {
  llvm::SmallString<128> tmp;
  llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, tmp);
  std::set<std::string> found;
  for (const std::string& name : listDir(tmp))
    if (llvm::StringRef(name).startswith("refsafe-javac")) found.insert(name);
  return found;
}

} // namespace

TEST_F(CompileVerifierTest, MissingFileCannotBeChecked) {
  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.path("Gone.java"));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - file not found");
}

TEST_F(CompileVerifierTest, EmptyFileCannotBeChecked) {
  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("empty.py", ""));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - empty file");
}

TEST_F(CompileVerifierTest, FilesOverTheCeilingAreSkipped) {
  cfg.maxCheckBytes = 16;
  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("big.py", std::string(64, '#')));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - file too large");
}

TEST_F(CompileVerifierTest, UnknownLanguageCannotBeChecked) {
  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("notes.txt", "hello"));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - unsupported language");
}

TEST_F(CompileVerifierTest, PythonSyntaxIsChecked) {
  if (!haveProgram("python3") && !haveProgram("python")) GTEST_SKIP() << "no python on PATH";

  CompileVerifier verifier(cfg, log);
  CompileStatus good = verifier.check(dir.write("good.py", "def f(x):\n    return x // 2\n"));
  EXPECT_TRUE(good.ok) << good.message;
  EXPECT_EQ(good.message, "Compiles");

  CompileStatus bad = verifier.check(dir.write("bad.py", "def f(x)\n    return x\n"));
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.message, "Syntax Error");
}

TEST_F(CompileVerifierTest, LanguageOverrideBeatsExtension) {
  if (!haveProgram("python3") && !haveProgram("python")) GTEST_SKIP() << "no python on PATH";

  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("snippet.txt", "x = 1\n"), Language::Python);
  EXPECT_TRUE(st.ok) << st.message;
}

TEST_F(CompileVerifierTest, CppSyntaxIsChecked) {
  if (!haveProgram("clang++") && !haveProgram("g++") && !haveProgram("c++"))
    GTEST_SKIP() << "no C++ compiler on PATH";

  CompileVerifier verifier(cfg, log);
  CompileStatus good = verifier.check(dir.write("ok.cpp", "int main() { return 0; }\n"));
  EXPECT_TRUE(good.ok) << good.message;

  CompileStatus bad = verifier.check(dir.write("broken.cpp", "int main() { return 0 }\n"));
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.message, "Compile Error");
}

TEST_F(CompileVerifierTest, MissingToolchainIsReportedNotRaised) {
  if (haveProgram("tsc")) GTEST_SKIP() << "tsc is installed";

  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("app.ts", "let x: number = 1;\n"));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - tsc not found");
}

#ifndef _WIN32
TEST_F(CompileVerifierTest, SlowToolchainHitsTimeout) {
  ScriptOnPath tsc(dir, "tsc", "exec sleep 10");
  cfg.compileTimeoutSeconds = 1;

  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("app.ts", "let x: number = 1;\n"));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - compile timeout");
}

TEST_F(CompileVerifierTest, CrashingToolchainIsNotReportedAsTimeout) {
  ScriptOnPath tsc(dir, "tsc", "kill -SEGV $$");

  CompileVerifier verifier(cfg, log);
  CompileStatus st = verifier.check(dir.write("app.ts", "let x: number = 1;\n"));
  EXPECT_FALSE(st.ok);
  EXPECT_EQ(st.message, "Cannot check - tsc crashed");
}
#endif

TEST_F(CompileVerifierTest, JavacLeavesNoArtifacts) {
  if (!haveProgram("javac")) GTEST_SKIP() << "no javac on PATH";
  const std::set<std::string> before = javacScratchDirs();

  CompileVerifier verifier(cfg, log);
  CompileStatus good = verifier.check(dir.write("src/Good.java", "class Good { int x = 1; }\n"));
  EXPECT_TRUE(good.ok) << good.message;
  CompileStatus bad = verifier.check(dir.write("src/Bad.java", "class Bad { int x = ; }\n"));
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.message, "Compile Error");

  EXPECT_EQ(listDir(dir.path("src")), (std::vector<std::string>{"Bad.java", "Good.java"}));
  EXPECT_FALSE(exists(dir.path("Good.class")));
  for (const std::string& name : javacScratchDirs())
    EXPECT_TRUE(before.count(name)) << "left behind " << name;
}
