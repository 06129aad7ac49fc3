#pragma once
#include "llvm/ADT/StringRef.h"

#include <optional>

namespace refsafe {

enum class Language { C, Cpp, ObjC, ObjCpp, Java, Python, JavaScript, TypeScript, Unknown };

// Guess from the file extension. Headers (.h) are treated as C++.
Language detectLanguage(llvm::StringRef path);
std::optional<Language> parseLanguage(llvm::StringRef name);
llvm::StringRef languageName(Language lang);

bool isCFamily(Language lang);
bool usesHashComments(Language lang);
inline bool isProgrammingLanguage(Language lang) { return lang != Language::Unknown; }

enum class SymbolKind { Function, Class, Variable, Auto };

std::optional<SymbolKind> parseSymbolKind(llvm::StringRef name); // "method" == "function"
llvm::StringRef symbolKindName(SymbolKind kind);

} // namespace refsafe
