#include "verify/CompileVerifier.hpp"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <exception>
#include <vector>

namespace fs = llvm::sys::fs;

namespace refsafe {

namespace {

struct ToolSpec {
  std::vector<llvm::StringRef> candidates;  // first one found on PATH wins
  std::vector<std::string> args;            // arguments before the file
  const char* failureMessage;               // status text for a non-zero exit
};

ToolSpec toolFor(Language lang) {
  switch (lang) {
  case Language::C:
    return {{"clang", "gcc", "cc"}, {"-fsyntax-only", "-w"}, "Compile Error"};
  case Language::Cpp:
    return {{"clang++", "g++", "c++"}, {"-fsyntax-only", "-w", "-std=c++17"}, "Compile Error"};
  case Language::ObjC:
  case Language::ObjCpp:
    return {{"clang"}, {"-fsyntax-only", "-w"}, "Compile Error"};
  case Language::Java:
    // -d <dir> is added per run so class files never land beside the source
    return {{"javac"}, {"-cp", "."}, "Compile Error"};
  case Language::Python:
    return {{"python3", "python"},
            {"-c", "import ast,sys; ast.parse(open(sys.argv[1], encoding='utf-8').read(), sys.argv[1])"},
            "Syntax Error"};
  case Language::JavaScript:
    return {{"node"}, {"--check"}, "Syntax Error"};
  case Language::TypeScript:
    return {{"tsc"}, {"--noEmit"}, "Syntax Error"};
  case Language::Unknown:
    break;
  }
  return {{}, {}, ""};
}

llvm::Optional<std::string> findTool(llvm::ArrayRef<llvm::StringRef> names) {
  for (llvm::StringRef name : names) {
    if (auto found = llvm::sys::findProgramByName(name)) return *found;
  }
  return llvm::None;
}

} // namespace

CompileStatus CompileVerifier::check(llvm::StringRef path, std::optional<Language> lang) const {
  try {
    return checkImpl(path, lang);
  } catch (const std::exception& e) {
    log_.debug("compile check of " + path + " threw: " + e.what());
    return {false, "Cannot check - internal error"};
  }
}

CompileStatus CompileVerifier::checkImpl(llvm::StringRef path, std::optional<Language> lang) const {
  fs::file_status st;
  if (fs::status(path, st) || !fs::exists(st))
    return {false, "Cannot check - file not found"};
  if (st.getSize() > cfg_.maxCheckBytes)
    return {false, "Cannot check - file too large"};
  if (st.getSize() == 0)
    return {false, "Cannot check - empty file"};

  const Language language = lang ? *lang : detectLanguage(path);
  if (language == Language::Unknown)
    return {false, "Cannot check - unsupported language"};

  ToolSpec spec = toolFor(language);
  llvm::Optional<std::string> program = findTool(spec.candidates);
  if (!program)
    return {false, ("Cannot check - " + spec.candidates.front() + " not found").str()};

  llvm::SmallString<128> outDir;
  if (language == Language::Java) {
    if (std::error_code ec = fs::createUniqueDirectory("refsafe-javac", outDir))
      return {false, "Cannot check - no scratch directory: " + ec.message()};
    spec.args.push_back("-d");
    spec.args.push_back(outDir.str().str());
  }

  std::vector<llvm::StringRef> argv;
  argv.push_back(*program);
  for (const auto& a : spec.args) argv.push_back(a);
  argv.push_back(path);

  llvm::Optional<llvm::StringRef> redirects[] = {llvm::StringRef(""), llvm::StringRef(""),
                                                 llvm::StringRef("")};
  std::string errMsg;
  bool launchFailed = false;
  int rc = llvm::sys::ExecuteAndWait(*program, argv, llvm::None, redirects,
                                     cfg_.compileTimeoutSeconds, 0, &errMsg, &launchFailed);

  // build artifacts go regardless of the outcome
  if (!outDir.empty()) {
    if (std::error_code ec = fs::remove_directories(outDir))
      log_.debug("could not remove " + outDir.str() + ": " + ec.message());
  }

  if (launchFailed)
    return {false, "Cannot check - " + llvm::sys::path::filename(*program).str() + " failed to start"};
  // -2 covers both the timeout and a child killed by a signal
  if (rc == -2 && errMsg == "Child timed out")
    return {false, "Cannot check - compile timeout"};
  if (rc == -2) {
    log_.debug("compile check of " + path + " crashed: " + errMsg);
    return {false, "Cannot check - " + llvm::sys::path::filename(*program).str() + " crashed"};
  }
  if (rc != 0) {
    log_.debug("compile check of " + path + " exited with " + llvm::Twine(rc) +
               (errMsg.empty() ? std::string() : ": " + errMsg));
    return {false, spec.failureMessage};
  }
  return {true, "Compiles"};
}

} // namespace refsafe
