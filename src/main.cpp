#include "refactor/RefactorEngine.hpp"
#include "refactor/RefactorSession.hpp"
#include "support/EngineConfig.hpp"
#include "support/Logger.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <vector>

using namespace refsafe;
namespace cl = llvm::cl;

static cl::OptionCategory ToolCat("refsafe options");

static cl::SubCommand RenameCmd("rename", "Rename a file and the symbol it is named after");
static cl::SubCommand BatchCmd("batch", "Rename every file whose name contains a pattern");
static cl::SubCommand ReplaceCmd("replace", "Rename a symbol across a set of files");

// rename
static cl::opt<std::string> RenameFile(cl::Positional, cl::desc("<file>"), cl::Required,
                                       cl::sub(RenameCmd), cl::cat(ToolCat));
static cl::opt<std::string> RenameTo(cl::Positional, cl::desc("<new_name>"), cl::Required,
                                     cl::sub(RenameCmd), cl::cat(ToolCat));
static cl::opt<bool> ContentOnly(
  "content-only", cl::desc("Only rename the symbol inside the file; keep the file name"),
  cl::sub(RenameCmd), cl::cat(ToolCat));
static cl::opt<bool> NoContent(
  "no-content", cl::desc("Only rename the file; leave its content alone"),
  cl::sub(RenameCmd), cl::cat(ToolCat));
static cl::opt<bool> Related(
  "related", cl::desc("Also rename related files (FooTest, FooImpl, IFoo, ...)"),
  cl::sub(RenameCmd), cl::cat(ToolCat));

// batch
static cl::opt<std::string> BatchPattern(cl::Positional, cl::desc("<pattern>"), cl::Required,
                                         cl::sub(BatchCmd), cl::cat(ToolCat));
static cl::opt<std::string> BatchReplacement(cl::Positional, cl::desc("<replacement>"),
                                             cl::Required, cl::sub(BatchCmd), cl::cat(ToolCat));
static cl::opt<std::string> BatchDir(cl::Positional, cl::desc("<directory>"), cl::Required,
                                     cl::sub(BatchCmd), cl::cat(ToolCat));
static cl::opt<std::string> BatchGlob(cl::Positional, cl::desc("<file_glob>"), cl::Required,
                                      cl::sub(BatchCmd), cl::cat(ToolCat));
static cl::opt<bool> Recursive("recursive", cl::desc("Descend into subdirectories"),
                               cl::sub(BatchCmd), cl::cat(ToolCat));
static cl::alias RecursiveShort("r", cl::desc("Alias for --recursive"), cl::aliasopt(Recursive));

// replace
static cl::opt<std::string> ReplaceOld(cl::Positional, cl::desc("<old_symbol>"), cl::Required,
                                       cl::sub(ReplaceCmd), cl::cat(ToolCat));
static cl::opt<std::string> ReplaceNew(cl::Positional, cl::desc("<new_symbol>"), cl::Required,
                                       cl::sub(ReplaceCmd), cl::cat(ToolCat));
static cl::opt<std::string> TargetGlobs(
  "in", cl::desc("Files to process: glob[,glob...]; ** matches any directories"),
  cl::value_desc("globs"), cl::Required, cl::sub(ReplaceCmd), cl::cat(ToolCat));
static cl::opt<SymbolKind> SymbolType(
  "symbol-type", cl::desc("Kind of symbol to rename"),
  cl::values(clEnumValN(SymbolKind::Function, "function", "Functions and methods"),
             clEnumValN(SymbolKind::Function, "method", "Same as function"),
             clEnumValN(SymbolKind::Class, "class", "Classes, structs, enums, typedefs"),
             clEnumValN(SymbolKind::Variable, "variable", "Variables and fields"),
             clEnumValN(SymbolKind::Auto, "auto", "Any of the above")),
  cl::init(SymbolKind::Auto), cl::sub(ReplaceCmd), cl::cat(ToolCat));

// shared
static cl::opt<bool> DryRun("dry-run", cl::desc("Show what would change without touching files"),
                            cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<bool> AssumeYes("yes", cl::desc("Do not ask for confirmation"),
                               cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::alias AssumeYesShort("y", cl::desc("Alias for --yes"), cl::aliasopt(AssumeYes));
static cl::opt<bool> Json("json", cl::desc("Print the report as JSON"),
                          cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<bool> Verbose("verbose", cl::desc("List affected files and log debug output"),
                             cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::alias VerboseShort("v", cl::desc("Alias for --verbose"), cl::aliasopt(Verbose));
static cl::opt<bool> NoCheckCompile("no-check-compile",
                                    cl::desc("Skip the compile check after each write"),
                                    cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<unsigned> MaxRetries(
  "max-retries", cl::desc("Retries for a locked file (default: $REFACTOR_MAX_RETRIES or 3)"),
  cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<std::string> RetryDelay(
  "retry-delay", cl::desc("Seconds between retries (default: $REFACTOR_RETRY_DELAY or 0.1)"),
  cl::value_desc("seconds"), cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<unsigned> Jobs(
  "jobs", cl::desc("Files processed in parallel by batch operations (default: $REFACTOR_JOBS or 1)"),
  cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));
static cl::opt<std::string> LogLevelName(
  "log-level", cl::desc("debug, info, warning or error (default: $LOG_LEVEL or info)"),
  cl::sub(*cl::AllSubCommands), cl::cat(ToolCat));

static int usageError(const llvm::Twine& msg) {
  llvm::WithColor::error(llvm::errs(), "refsafe") << msg << '\n';
  return 2;
}

static int validationError(const llvm::Twine& msg) {
  llvm::WithColor::error(llvm::errs(), "refsafe") << msg << '\n';
  return 1;
}

int main(int argc, const char** argv) {
  cl::HideUnrelatedOptions(ToolCat);
  for (cl::SubCommand* sub : {&RenameCmd, &BatchCmd, &ReplaceCmd})
    cl::HideUnrelatedOptions(ToolCat, *sub);

  if (!cl::ParseCommandLineOptions(argc, argv, "crash-safe file rename and symbol replace\n",
                                   &llvm::errs()))
    return 2;
  if (!RenameCmd && !BatchCmd && !ReplaceCmd)
    return usageError("no command given; expected rename, batch or replace (see --help)");

  std::vector<std::string> envWarnings;
  EngineConfig cfg = EngineConfig::fromEnvironment(&envWarnings);

  if (Verbose) cfg.logLevel = LogLevel::Debug;
  if (LogLevelName.getNumOccurrences()) {
    auto level = parseLogLevel(LogLevelName);
    if (!level) return usageError("invalid --log-level '" + LogLevelName + "'");
    cfg.logLevel = *level;
  }
  if (MaxRetries.getNumOccurrences()) cfg.maxRetries = MaxRetries;
  if (RetryDelay.getNumOccurrences() && !parseSeconds(RetryDelay, cfg.retryDelay))
    return usageError("invalid --retry-delay '" + RetryDelay + "'");
  if (Jobs.getNumOccurrences()) cfg.jobs = Jobs == 0 ? 1 : unsigned(Jobs);
  if (NoCheckCompile) cfg.checkCompile = false;

  Logger log(cfg.logLevel);
  for (const auto& w : envWarnings) log.warning(w);
  if (cfg.maxRetries != 3 || cfg.retryDelay != std::chrono::milliseconds(100))
    log.info("using retry configuration: max_retries=" + llvm::Twine(cfg.maxRetries) +
             ", retry_delay=" + llvm::Twine(cfg.retryDelay.count()) + "ms");

  OperationFn op;
  if (RenameCmd) {
    if (ContentOnly && NoContent)
      return validationError("--content-only and --no-content cannot be combined");
    if (!llvm::sys::fs::is_regular_file(RenameFile))
      return validationError("file '" + RenameFile + "' does not exist");

    const std::string file = RenameFile;
    const std::string newName = RenameTo;
    if (ContentOnly) {
      op = [file, newName](RefactorEngine& e) -> llvm::Expected<std::vector<RenameResult>> {
        const std::string oldStem = llvm::sys::path::stem(file).str();
        const std::string newStem = llvm::sys::path::stem(newName).str();
        return std::vector<RenameResult>{e.renameFileContent(file, oldStem, newStem)};
      };
    } else if (Related) {
      op = [file, newName](RefactorEngine& e) -> llvm::Expected<std::vector<RenameResult>> {
        return e.renameWithRelated(file, newName);
      };
    } else {
      const bool updateContent = !NoContent;
      op = [file, newName, updateContent](RefactorEngine& e) -> llvm::Expected<std::vector<RenameResult>> {
        return std::vector<RenameResult>{e.renameFile(file, newName, updateContent)};
      };
    }
  } else if (BatchCmd) {
    const std::string pattern = BatchPattern, replacement = BatchReplacement;
    const std::string dir = BatchDir, glob = BatchGlob;
    const bool recursive = Recursive;
    if (!llvm::sys::fs::is_directory(dir))
      return validationError("directory '" + dir + "' does not exist");
    op = [=](RefactorEngine& e) { return e.batchRename(pattern, replacement, dir, glob, recursive); };
  } else {
    const std::string oldSymbol = ReplaceOld, newSymbol = ReplaceNew, globs = TargetGlobs;
    const SymbolKind kind = SymbolType;
    op = [=](RefactorEngine& e) { return e.codeAwareReplace(oldSymbol, newSymbol, globs, kind); };
  }

  SessionOptions opts;
  opts.dryRun = DryRun;
  opts.assumeYes = AssumeYes;
  opts.json = Json;
  opts.verbose = Verbose;

  RefactorEngine engine(cfg, log);
  RefactorSession session(engine, opts);
  return session.run(op).exitCode;
}
