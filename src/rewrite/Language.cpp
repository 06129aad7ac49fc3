#include "rewrite/Language.hpp"

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Path.h"

namespace refsafe {

Language detectLanguage(llvm::StringRef path) {
  std::string ext = llvm::sys::path::extension(path).lower();
  return llvm::StringSwitch<Language>(ext)
    .Case(".c", Language::C)
    .Cases(".cpp", ".cc", ".cxx", ".c++", Language::Cpp)
    .Cases(".hpp", ".hh", ".hxx", ".h", Language::Cpp)
    .Case(".m", Language::ObjC)
    .Case(".mm", Language::ObjCpp)
    .Case(".java", Language::Java)
    .Cases(".py", ".pyw", Language::Python)
    .Cases(".js", ".jsx", ".mjs", ".cjs", Language::JavaScript)
    .Cases(".ts", ".tsx", Language::TypeScript)
    .Default(Language::Unknown);
}

std::optional<Language> parseLanguage(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<Language>>(name.lower())
    .Case("c", Language::C)
    .Cases("c++", "cpp", "cxx", Language::Cpp)
    .Cases("objc", "objective-c", Language::ObjC)
    .Cases("objc++", "objective-c++", Language::ObjCpp)
    .Case("java", Language::Java)
    .Case("python", Language::Python)
    .Cases("javascript", "js", Language::JavaScript)
    .Cases("typescript", "ts", Language::TypeScript)
    .Cases("text", "unknown", Language::Unknown)
    .Default(std::nullopt);
}

llvm::StringRef languageName(Language lang) {
  switch (lang) {
  case Language::C:          return "c";
  case Language::Cpp:        return "c++";
  case Language::ObjC:       return "objective-c";
  case Language::ObjCpp:     return "objective-c++";
  case Language::Java:       return "java";
  case Language::Python:     return "python";
  case Language::JavaScript: return "javascript";
  case Language::TypeScript: return "typescript";
  case Language::Unknown:    return "unknown";
  }
  return "unknown";
}

bool isCFamily(Language lang) {
  return lang == Language::C || lang == Language::Cpp ||
         lang == Language::ObjC || lang == Language::ObjCpp;
}

bool usesHashComments(Language lang) {
  return lang == Language::Python;
}

std::optional<SymbolKind> parseSymbolKind(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<SymbolKind>>(name.lower())
    .Cases("function", "method", SymbolKind::Function)
    .Case("class", SymbolKind::Class)
    .Case("variable", SymbolKind::Variable)
    .Case("auto", SymbolKind::Auto)
    .Default(std::nullopt);
}

llvm::StringRef symbolKindName(SymbolKind kind) {
  switch (kind) {
  case SymbolKind::Function: return "function";
  case SymbolKind::Class:    return "class";
  case SymbolKind::Variable: return "variable";
  case SymbolKind::Auto:     return "auto";
  }
  return "auto";
}

} // namespace refsafe
