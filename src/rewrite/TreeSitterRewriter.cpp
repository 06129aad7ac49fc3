#include "rewrite/Edit.hpp"
#include "rewrite/SymbolRewriter.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/DynamicLibrary.h"
#include "llvm/Support/Path.h"

#include <tree_sitter/api.h>

#include <cctype>
#include <cstring>
#include <map>
#include <mutex>
#include <set>

namespace refsafe {

namespace {

#if defined(_WIN32)
constexpr const char* kLibPrefix = "tree-sitter-";
constexpr const char* kLibSuffix = ".dll";
#elif defined(__APPLE__)
constexpr const char* kLibPrefix = "libtree-sitter-";
constexpr const char* kLibSuffix = ".dylib";
#else
constexpr const char* kLibPrefix = "libtree-sitter-";
constexpr const char* kLibSuffix = ".so";
#endif

using LanguageFn = const TSLanguage* (*)();

// Grammars ship as separate shared libraries exporting tree_sitter_<lang>().
// Each one is opened once and kept for the life of the process.
class GrammarLoader {
public:
  GrammarLoader(std::vector<std::string> dirs, Logger& log) : dirs_(std::move(dirs)), log_(log) {}

  const TSLanguage* get(llvm::StringRef lang) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = cache_.find(lang.str());
    if (it != cache_.end()) return it->second;
    const TSLanguage* found = load(lang);
    cache_.emplace(lang.str(), found);
    return found;
  }

private:
  const TSLanguage* load(llvm::StringRef lang) {
    const std::string fileName = kLibPrefix + lang.str() + kLibSuffix;
    const std::string symbol = "tree_sitter_" + lang.str();

    std::vector<std::string> candidates;
    for (const std::string& dir : dirs_) {
      llvm::SmallString<256> p(dir);
      llvm::sys::path::append(p, fileName);
      candidates.push_back(p.str().str());
    }
    candidates.push_back(fileName);  // default loader search path

    for (const std::string& candidate : candidates) {
      std::string err;
      auto lib = llvm::sys::DynamicLibrary::getPermanentLibrary(candidate.c_str(), &err);
      if (!lib.isValid()) continue;
      auto fn = reinterpret_cast<LanguageFn>(lib.getAddressOfSymbol(symbol.c_str()));
      if (!fn) {
        log_.debug(candidate + " has no " + symbol);
        continue;
      }
      const TSLanguage* language = fn();
      const uint32_t version = ts_language_version(language);
      if (version < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION || version > TREE_SITTER_LANGUAGE_VERSION) {
        log_.debug(candidate + " has incompatible grammar ABI " + llvm::Twine(version));
        continue;
      }
      log_.debug("loaded " + lang + " grammar from " + candidate);
      return language;
    }
    log_.debug("no tree-sitter grammar for " + lang + "; using the text backend");
    return nullptr;
  }

  std::vector<std::string> dirs_;
  Logger& log_;
  std::mutex mu_;
  std::map<std::string, const TSLanguage*> cache_;
};

enum class Role { ClassDecl, FunctionDecl, VariableDecl, ClassRef, FunctionRef, VariableRef, CallRef, Name };

bool isDeclaration(Role R) {
  return R == Role::ClassDecl || R == Role::FunctionDecl || R == Role::VariableDecl;
}

SymbolKind declaredKind(Role R) {
  switch (R) {
  case Role::ClassDecl:    return SymbolKind::Class;
  case Role::FunctionDecl: return SymbolKind::Function;
  default:                 return SymbolKind::Variable;
  }
}

bool isField(TSNode Parent, const char* Field, TSNode N) {
  TSNode F = ts_node_child_by_field_name(Parent, Field, std::strlen(Field));
  return !ts_node_is_null(F) && ts_node_eq(F, N);
}

bool parentIs(llvm::StringRef ParentType, std::initializer_list<llvm::StringRef> Types) {
  for (llvm::StringRef T : Types)
    if (ParentType == T) return true;
  return false;
}

Role javaRole(TSNode N, llvm::StringRef Type) {
  if (Type == "type_identifier") return Role::ClassRef;

  TSNode P = ts_node_parent(N);
  if (ts_node_is_null(P)) return Role::Name;
  llvm::StringRef PT = ts_node_type(P);

  if (parentIs(PT, {"class_declaration", "interface_declaration", "enum_declaration",
                    "record_declaration", "annotation_type_declaration", "constructor_declaration"}) &&
      isField(P, "name", N))
    return Role::ClassDecl;
  if (PT == "method_declaration" && isField(P, "name", N)) return Role::FunctionDecl;
  if (PT == "method_invocation" && isField(P, "name", N)) return Role::FunctionRef;
  if (PT == "method_reference") {
    // Type::name, the target is the last named child
    const uint32_t Count = ts_node_named_child_count(P);
    if (Count > 1 && ts_node_eq(ts_node_named_child(P, Count - 1), N)) return Role::FunctionRef;
  }
  if (parentIs(PT, {"variable_declarator", "formal_parameter", "catch_formal_parameter",
                    "enum_constant", "resource"}) &&
      isField(P, "name", N))
    return Role::VariableDecl;
  if (PT == "inferred_parameters" || (PT == "lambda_expression" && isField(P, "parameters", N)))
    return Role::VariableDecl;
  if (PT == "field_access" && isField(P, "field", N)) return Role::VariableRef;
  return Role::Name;
}

Role pythonRole(TSNode N) {
  TSNode P = ts_node_parent(N);
  if (ts_node_is_null(P)) return Role::Name;
  llvm::StringRef PT = ts_node_type(P);

  if (PT == "class_definition" && isField(P, "name", N)) return Role::ClassDecl;
  if (PT == "function_definition" && isField(P, "name", N)) return Role::FunctionDecl;
  if (parentIs(PT, {"parameters", "lambda_parameters", "typed_parameter", "list_splat_pattern",
                    "dictionary_splat_pattern"}))
    return Role::VariableDecl;
  if (parentIs(PT, {"default_parameter", "typed_default_parameter"}) && isField(P, "name", N))
    return Role::VariableDecl;
  if (PT == "keyword_argument" && isField(P, "name", N)) return Role::VariableRef;
  if (parentIs(PT, {"assignment", "augmented_assignment", "for_statement"}) && isField(P, "left", N))
    return Role::VariableDecl;
  if (parentIs(PT, {"pattern_list", "tuple_pattern"})) return Role::VariableDecl;
  if (PT == "attribute" && isField(P, "attribute", N)) {
    TSNode GP = ts_node_parent(P);
    if (!ts_node_is_null(GP) && llvm::StringRef(ts_node_type(GP)) == "call" && isField(GP, "function", P))
      return Role::FunctionRef;
    return Role::VariableRef;
  }
  if (PT == "call" && isField(P, "function", N)) return Role::CallRef;
  return Role::Name;
}

struct Occurrence {
  unsigned Offset;
  Role R;
};

class TreeSitterRewriter final : public SymbolRewriter {
  mutable GrammarLoader Grammars;
public:
  TreeSitterRewriter(const EngineConfig& Cfg, Logger& Log) : Grammars(Cfg.grammarDirs, Log) {}

  Backend backend() const override { return Backend::Ast; }

  bool supports(Language Lang) const override {
    llvm::StringRef Name = grammarName(Lang);
    return !Name.empty() && Grammars.get(Name) != nullptr;
  }

  llvm::Expected<RewriteResult>
  rewrite(llvm::StringRef Content, const RenameRequest& Req) override {
    const TSLanguage* Lang = Grammars.get(grammarName(Req.language));
    if (!Lang)
      return llvm::make_error<ParseError>("no grammar for " + languageName(Req.language).str());

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> Parser(ts_parser_new(), ts_parser_delete);
    if (!ts_parser_set_language(Parser.get(), Lang))
      return llvm::make_error<ParseError>("grammar rejected by the parser");
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> Tree(
      ts_parser_parse_string(Parser.get(), nullptr, Content.data(), uint32_t(Content.size())),
      ts_tree_delete);
    if (!Tree) return llvm::make_error<ParseError>("parser gave up");

    TSNode Root = ts_tree_root_node(Tree.get());
    if (ts_node_has_error(Root))
      return llvm::make_error<ParseError>("syntax error near byte " + std::to_string(firstErrorByte(Root)));

    RewriteResult Res{Content.str(), 0, Backend::Ast};
    if (Req.oldName.empty() || Req.oldName == Req.newName) return Res;

    std::vector<Occurrence> Found;
    collect(Root, Content, Req, Found);

    std::set<SymbolKind> Declared;
    for (const Occurrence& O : Found)
      if (isDeclaration(O.R)) Declared.insert(declaredKind(O.R));

    std::vector<Edit> Edits;
    for (const Occurrence& O : Found)
      if (matches(O.R, Req, Declared))
        Edits.push_back(Edit{O.Offset, unsigned(Req.oldName.size()), Req.newName});

    std::string Err;
    if (!applyEdits(Res.content, Edits, &Err))
      return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), Err);
    Res.changes = unsigned(Edits.size());
    return Res;
  }

private:
  static llvm::StringRef grammarName(Language Lang) {
    switch (Lang) {
    case Language::Java:   return "java";
    case Language::Python: return "python";
    default:               return "";
    }
  }

  static uint32_t firstErrorByte(TSNode N) {
    if (llvm::StringRef(ts_node_type(N)) == "ERROR" || ts_node_is_missing(N)) return ts_node_start_byte(N);
    for (uint32_t I = 0, E = ts_node_child_count(N); I < E; ++I) {
      TSNode C = ts_node_child(N, I);
      if (ts_node_has_error(C)) return firstErrorByte(C);
    }
    return ts_node_start_byte(N);
  }

  // Every identifier spelled exactly as the old name, with its syntactic role.
  static void collect(TSNode Root, llvm::StringRef Content, const RenameRequest& Req,
                      std::vector<Occurrence>& Out) {
    TSTreeCursor Cursor = ts_tree_cursor_new(Root);
    bool Done = false;
    while (!Done) {
      TSNode N = ts_tree_cursor_current_node(&Cursor);
      llvm::StringRef Type = ts_node_type(N);
      if (Type == "identifier" || Type == "type_identifier") {
        unsigned Begin = ts_node_start_byte(N), End = ts_node_end_byte(N);
        if (Content.slice(Begin, End) == Req.oldName) {
          Role R = Req.language == Language::Java ? javaRole(N, Type) : pythonRole(N);
          Out.push_back(Occurrence{Begin, R});
        }
      }

      if (ts_tree_cursor_goto_first_child(&Cursor)) continue;
      while (!ts_tree_cursor_goto_next_sibling(&Cursor)) {
        if (!ts_tree_cursor_goto_parent(&Cursor)) {
          Done = true;
          break;
        }
      }
    }
    ts_tree_cursor_delete(&Cursor);
  }

  // Bare names are resolved against what the file itself declares. A name the
  // file never declares is imported: Python accepts it for any kind, Java
  // goes by capitalisation.
  static bool matches(Role R, const RenameRequest& Req, const std::set<SymbolKind>& Declared) {
    const SymbolKind K = Req.kind;
    if (K == SymbolKind::Auto) return true;

    switch (R) {
    case Role::ClassDecl:
    case Role::ClassRef:
      return K == SymbolKind::Class;
    case Role::FunctionDecl:
    case Role::FunctionRef:
      return K == SymbolKind::Function;
    case Role::VariableDecl:
    case Role::VariableRef:
      return K == SymbolKind::Variable;
    case Role::CallRef:
      // a call target is a function or, when instantiating, a class
      return K != SymbolKind::Variable && (Declared.empty() || Declared.count(K));
    case Role::Name:
      break;
    }

    // a bare Java name is never a method; those only appear as invocations
    if (Req.language == Language::Java && K == SymbolKind::Function) return false;
    if (Declared.count(K)) return true;
    if (!Declared.empty()) return false;
    if (Req.language == Language::Python) return true;
    const bool Capitalised = std::isupper((unsigned char)Req.oldName.front());
    return K == (Capitalised ? SymbolKind::Class : SymbolKind::Variable);
  }
};

} // namespace

std::unique_ptr<SymbolRewriter> makeTreeSitterRewriter(const EngineConfig& cfg, Logger& log) {
  return std::make_unique<TreeSitterRewriter>(cfg, log);
}

} // namespace refsafe
