#include "refactor/RefactorSession.hpp"
#include "refactor/Report.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/WithColor.h"

#include <iostream>
#include <string>

namespace refsafe {

llvm::StringRef sessionStateName(SessionState state) {
  switch (state) {
  case SessionState::Analyzing:  return "analyzing";
  case SessionState::Previewing: return "previewing";
  case SessionState::Confirming: return "confirming";
  case SessionState::Executing:  return "executing";
  case SessionState::Reporting:  return "reporting";
  case SessionState::Done:       return "done";
  case SessionState::Aborted:    return "aborted";
  }
  return "unknown";
}

bool confirmAction(llvm::StringRef prompt, bool assumeYes, llvm::raw_ostream& out) {
  if (assumeYes) {
    out << prompt << " [y/N]: y (auto-confirmed)\n";
    return true;
  }
  if (!llvm::sys::Process::StandardInIsUserInput()) {
    out << prompt << " [y/N]: y (auto-confirmed in non-interactive mode)\n";
    return true;
  }

  out << prompt << " [y/N]: ";
  out.flush();
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    out << '\n';
    return false;
  }
  llvm::StringRef a = llvm::StringRef(answer).trim();
  return a.equals_insensitive("y") || a.equals_insensitive("yes");
}

RefactorSession::RefactorSession(RefactorEngine& engine, SessionOptions opts,
                                 llvm::raw_ostream& out, ConfirmFn confirm)
  : engine_(engine), opts_(opts), out_(out), confirm_(std::move(confirm)) {
  if (!confirm_) {
    const bool yes = opts_.assumeYes;
    // keep machine-readable stdout clean
    llvm::raw_ostream* os = opts_.json ? &llvm::errs() : &out_;
    confirm_ = [yes, os](llvm::StringRef prompt) { return confirmAction(prompt, yes, *os); };
  }
}

void RefactorSession::enter(SessionState next) {
  state_ = next;
}

void RefactorSession::finish(SessionOutcome& outcome, SessionState terminal, int exitCode) {
  enter(terminal);
  outcome.state = terminal;
  outcome.exitCode = exitCode;
}

SessionOutcome RefactorSession::run(const OperationFn& op) {
  SessionOutcome outcome;
  OperationLog& log = engine_.operations();

  // Analyzing
  enter(SessionState::Analyzing);
  engine_.setDryRun(true);
  log.clear();
  auto preview = op(engine_);
  if (!preview) {
    llvm::WithColor::error(llvm::errs(), "refsafe") << llvm::toString(preview.takeError()) << '\n';
    finish(outcome, SessionState::Aborted, 1);
    return outcome;
  }
  outcome.preview = log.records();
  const bool previewFailed = log.hasFailures() || anyFailed(*preview);

  // Previewing
  enter(SessionState::Previewing);
  if (opts_.dryRun) {
    outcome.results = std::move(*preview);
    if (opts_.json) {
      printJson(out_, outcome.results, outcome.preview, !previewFailed);
    } else {
      out_ << "DRY RUN - no files will be changed\n";
      printOperations(out_, outcome.preview);
      printSummary(out_, outcome.preview);
    }
    finish(outcome, SessionState::Done, previewFailed ? 1 : 0);
    return outcome;
  }

  if (!log.hasActionable()) {
    if (opts_.json) {
      printJson(out_, *preview, outcome.preview, !previewFailed);
    } else {
      printOperations(out_, outcome.preview);
      out_ << "\nNo applicable files or symbols found to rename.\n";
    }
    outcome.results = std::move(*preview);
    finish(outcome, SessionState::Done, previewFailed ? 1 : 0);
    return outcome;
  }

  if (!opts_.json) {
    printOperations(out_, outcome.preview);
    printSummary(out_, outcome.preview);
  }

  // Confirming
  enter(SessionState::Confirming);
  if (!confirm_("\nProceed with these changes?")) {
    out_ << "Aborted by user.\n";
    finish(outcome, SessionState::Aborted, 1);
    return outcome;
  }

  // Executing
  enter(SessionState::Executing);
  if (!opts_.json) out_ << "\nExecuting changes...\n";
  log.clear();
  engine_.setDryRun(false);
  auto executed = op(engine_);
  if (!executed) {
    llvm::WithColor::error(llvm::errs(), "refsafe") << llvm::toString(executed.takeError()) << '\n';
    outcome.executed = log.records();
    finish(outcome, SessionState::Aborted, 1);
    return outcome;
  }
  outcome.results = std::move(*executed);
  outcome.executed = log.records();

  // Reporting
  enter(SessionState::Reporting);
  const bool failed = log.hasFailures() || anyFailed(outcome.results);
  if (opts_.json) {
    printJson(out_, outcome.results, outcome.executed, !failed);
  } else {
    printOperations(out_, outcome.executed);
    printSummary(out_, outcome.executed);
    const unsigned processed = processedCount(outcome.results);
    if (processed > 0) {
      out_ << "Successfully processed " << processed << " file(s)\n";
      if (opts_.verbose) {
        for (const auto& r : outcome.results) {
          if (!r.success || (!r.newPath && r.changesApplied == 0)) continue;
          out_ << "  - " << (r.newPath ? *r.newPath : r.path) << '\n';
        }
      }
    } else {
      out_ << "No files were processed\n";
    }
  }

  finish(outcome, SessionState::Done, failed ? 1 : 0);
  return outcome;
}

} // namespace refsafe
