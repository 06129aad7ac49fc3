#pragma once
#include "refactor/Operation.hpp"
#include "refactor/RefactorEngine.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <functional>
#include <vector>

namespace refsafe {

enum class SessionState { Analyzing, Previewing, Confirming, Executing, Reporting, Done, Aborted };

llvm::StringRef sessionStateName(SessionState state);

struct SessionOptions {
  bool dryRun = false;    // stop after the preview
  bool assumeYes = false; // skip the confirmation prompt
  bool json = false;
  bool verbose = false;   // list affected paths in the human summary
};

struct SessionOutcome {
  SessionState state = SessionState::Analyzing;
  int exitCode = 0;
  std::vector<OperationRecord> preview;
  std::vector<OperationRecord> executed;
  std::vector<RenameResult> results;
};

// The operation to run; called once in dry-run and, if confirmed, once for
// real. An error means the request itself was invalid.
using OperationFn = std::function<llvm::Expected<std::vector<RenameResult>>(RefactorEngine&)>;

// Returns true to go ahead.
using ConfirmFn = std::function<bool(llvm::StringRef prompt)>;

// Drives one invocation through
//   Analyzing -> Previewing -> Confirming -> Executing -> Reporting
// ending in Done or Aborted. Analyzing always runs the operation in dry-run
// mode; Executing clears the log and recomputes the operation against the
// real filesystem instead of replaying the preview.
class RefactorSession {
public:
  RefactorSession(RefactorEngine& engine, SessionOptions opts, llvm::raw_ostream& out = llvm::outs(),
                  ConfirmFn confirm = {});

  SessionOutcome run(const OperationFn& op);
  SessionState state() const { return state_; }

private:
  void enter(SessionState next);
  void finish(SessionOutcome& outcome, SessionState terminal, int exitCode);

  RefactorEngine& engine_;
  SessionOptions opts_;
  llvm::raw_ostream& out_;
  ConfirmFn confirm_;
  SessionState state_ = SessionState::Analyzing;
};

// Interactive yes/no gate on stdin. Approves without asking when `assumeYes`
// is set or stdin is not a terminal.
bool confirmAction(llvm::StringRef prompt, bool assumeYes, llvm::raw_ostream& out = llvm::outs());

} // namespace refsafe
