#pragma once
#include "rewrite/Language.hpp"
#include "support/EngineConfig.hpp"
#include "support/Logger.hpp"

#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>

namespace refsafe {

struct CompileStatus {
  bool ok = false;
  std::string message;  // "Compiles", "Syntax Error", "Cannot check - ..."
};

// Advisory syntax/compile check after a write. Never fails the surrounding
// operation: every problem, including a missing toolchain, comes back as a
// negative CompileStatus.
class CompileVerifier {
public:
  CompileVerifier(const EngineConfig& cfg, Logger& log) : cfg_(cfg), log_(log) {}

  // `lang` defaults to detection from the extension.
  CompileStatus check(llvm::StringRef path, std::optional<Language> lang = std::nullopt) const;

private:
  CompileStatus checkImpl(llvm::StringRef path, std::optional<Language> lang) const;

  const EngineConfig& cfg_;
  Logger& log_;
};

} // namespace refsafe
