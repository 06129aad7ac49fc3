#include "rewrite/Edit.hpp"
#include "rewrite/SymbolRewriter.hpp"

#include "clang/AST/ASTContext.h"
#include "clang/AST/DeclCXX.h"
#include "clang/AST/DeclTemplate.h"
#include "clang/AST/TypeLoc.h"
#include "clang/ASTMatchers/ASTMatchFinder.h"
#include "clang/ASTMatchers/ASTMatchers.h"
#include "clang/Basic/Diagnostic.h"
#include "clang/Basic/SourceManager.h"
#include "clang/Frontend/ASTUnit.h"
#include "clang/Tooling/ArgumentsAdjusters.h"
#include "clang/Tooling/Tooling.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"

#include <cctype>
#include <set>

using namespace clang;
using namespace clang::tooling;
using namespace clang::ast_matchers;

namespace refsafe {

namespace {

bool isWordChar(char c) {
  return std::isalnum((unsigned char)c) || c == '_';
}

bool kindMatches(const Decl* D, SymbolKind K) {
  const bool IsFunction = isa<FunctionDecl>(D) && !isa<CXXConstructorDecl>(D) &&
                          !isa<CXXDestructorDecl>(D);
  const bool IsFunctionTemplate = isa<FunctionTemplateDecl>(D);
  const bool IsClass = isa<TagDecl>(D) || isa<TypedefNameDecl>(D) ||
                       isa<ClassTemplateDecl>(D) || isa<CXXConstructorDecl>(D);
  const bool IsVariable = isa<VarDecl>(D) || isa<FieldDecl>(D) || isa<EnumConstantDecl>(D);

  switch (K) {
  case SymbolKind::Function: return IsFunction || IsFunctionTemplate;
  case SymbolKind::Class:    return IsClass;
  case SymbolKind::Variable: return IsVariable;
  case SymbolKind::Auto:     return IsFunction || IsFunctionTemplate || IsClass || IsVariable;
  }
  return false;
}

struct Context {
  const RenameRequest* Req = nullptr;
  StringRef Code;
  std::set<unsigned> Offsets;

  // Records the identifier at Loc if it is spelled in the main file and
  // really reads as the old name.
  void record(SourceLocation Loc, const SourceManager& SM) {
    if (Loc.isInvalid()) return;
    Loc = SM.getSpellingLoc(Loc);
    if (!SM.isWrittenInMainFile(Loc)) return;

    unsigned Off = SM.getFileOffset(Loc);
    if (Off < Code.size() && Code[Off] == '~') {
      ++Off;
      while (Off < Code.size() && std::isspace((unsigned char)Code[Off])) ++Off;
    }
    StringRef Old = Req->oldName;
    if (!Code.substr(Off).startswith(Old)) return;
    size_t End = Off + Old.size();
    if (End < Code.size() && isWordChar(Code[End])) return;
    Offsets.insert(Off);
  }
};

class DeclNameCB : public MatchFinder::MatchCallback {
  Context& Ctx;
public:
  explicit DeclNameCB(Context& c) : Ctx(c) {}
  void run(const MatchFinder::MatchResult& Result) override {
    const auto* ND = Result.Nodes.getNodeAs<NamedDecl>("decl");
    if (!ND || ND->isImplicit() || !kindMatches(ND, Ctx.Req->kind)) return;
    Ctx.record(ND->getLocation(), *Result.SourceManager);
  }
};

class DestructorCB : public MatchFinder::MatchCallback {
  Context& Ctx;
public:
  explicit DestructorCB(Context& c) : Ctx(c) {}
  void run(const MatchFinder::MatchResult& Result) override {
    const auto* DD = Result.Nodes.getNodeAs<CXXDestructorDecl>("dtor");
    if (!DD || DD->isImplicit()) return;
    // location points at '~'; record() steps over it
    Ctx.record(DD->getLocation(), *Result.SourceManager);
  }
};

class ReferenceCB : public MatchFinder::MatchCallback {
  Context& Ctx;
public:
  explicit ReferenceCB(Context& c) : Ctx(c) {}
  void run(const MatchFinder::MatchResult& Result) override {
    const auto& SM = *Result.SourceManager;
    if (const auto* DRE = Result.Nodes.getNodeAs<DeclRefExpr>("ref")) {
      if (kindMatches(DRE->getDecl(), Ctx.Req->kind)) Ctx.record(DRE->getLocation(), SM);
    } else if (const auto* ME = Result.Nodes.getNodeAs<MemberExpr>("member")) {
      if (kindMatches(ME->getMemberDecl(), Ctx.Req->kind)) Ctx.record(ME->getMemberLoc(), SM);
    } else if (const auto* Init = Result.Nodes.getNodeAs<CXXCtorInitializer>("init")) {
      if (Init->isWritten()) Ctx.record(Init->getMemberLocation(), SM);
    }
  }
};

class TypeRefCB : public MatchFinder::MatchCallback {
  Context& Ctx;
public:
  explicit TypeRefCB(Context& c) : Ctx(c) {}
  void run(const MatchFinder::MatchResult& Result) override {
    const auto* TL = Result.Nodes.getNodeAs<TypeLoc>("type");
    if (!TL) return;
    SourceLocation NameLoc;
    if (auto Tag = TL->getAs<TagTypeLoc>())
      NameLoc = Tag.getNameLoc();
    else if (auto Typedef = TL->getAs<TypedefTypeLoc>())
      NameLoc = Typedef.getNameLoc();
    else if (auto Spec = TL->getAs<TemplateSpecializationTypeLoc>())
      NameLoc = Spec.getTemplateNameLoc();
    else if (auto Injected = TL->getAs<InjectedClassNameTypeLoc>())
      NameLoc = Injected.getNameLoc();
    Ctx.record(NameLoc, *Result.SourceManager);
  }
};

std::vector<std::string> frontendArgs(Language Lang, const EngineConfig& Cfg) {
  std::vector<std::string> Args;
  switch (Lang) {
  case Language::C:      Args = {"-xc", "-std=c11"}; break;
  case Language::ObjC:   Args = {"-xobjective-c"}; break;
  case Language::ObjCpp: Args = {"-xobjective-c++", "-std=c++17"}; break;
  default:               Args = {"-xc++", "-std=c++17"}; break;
  }
  Args.push_back("-w");
  Args.insert(Args.end(), Cfg.extraArgs.begin(), Cfg.extraArgs.end());
  return Args;
}

std::string virtualFileName(const RenameRequest& Req) {
  if (!Req.fileHint.empty()) {
    llvm::SmallString<256> Abs(Req.fileHint);
    if (!llvm::sys::fs::make_absolute(Abs)) return Abs.str().str();
  }
  switch (Req.language) {
  case Language::C:      return "input.c";
  case Language::ObjC:   return "input.m";
  case Language::ObjCpp: return "input.mm";
  default:               return "input.cpp";
  }
}

class ClangRewriter final : public SymbolRewriter {
  const EngineConfig& Cfg;
public:
  explicit ClangRewriter(const EngineConfig& c) : Cfg(c) {}

  Backend backend() const override { return Backend::Ast; }
  bool supports(Language Lang) const override { return isCFamily(Lang); }

  llvm::Expected<RewriteResult>
  rewrite(llvm::StringRef Content, const RenameRequest& Req) override {
    ArgumentsAdjuster Adjuster = getClangStripDependencyFileAdjuster();
    if (!Cfg.clangResourceDir.empty()) {
      Adjuster = combineAdjusters(
        Adjuster,
        getInsertArgumentAdjuster({"-resource-dir", Cfg.clangResourceDir},
                                  ArgumentInsertPosition::BEGIN));
    }

    DiagnosticConsumer Diags; // counts errors, prints nothing
    std::unique_ptr<ASTUnit> AST = buildASTFromCodeWithArgs(
      Content, frontendArgs(Req.language, Cfg), virtualFileName(Req), "refsafe",
      std::make_shared<PCHContainerOperations>(), Adjuster, FileContentMappings(), &Diags);

    if (!AST)
      return llvm::make_error<ParseError>("compiler invocation failed");
    if (Diags.getNumErrors() > 0 || AST->getDiagnostics().hasErrorOccurred())
      return llvm::make_error<ParseError>(std::to_string(Diags.getNumErrors()) + " error(s)");

    RewriteResult Res{Content.str(), 0, Backend::Ast};
    if (Req.oldName.empty() || Req.oldName == Req.newName) return Res;

    Context Ctx;
    Ctx.Req = &Req;
    Ctx.Code = AST->getSourceManager().getBufferData(AST->getSourceManager().getMainFileID());

    MatchFinder Finder;
    DeclNameCB declCB(Ctx);
    DestructorCB dtorCB(Ctx);
    ReferenceCB refCB(Ctx);
    TypeRefCB typeCB(Ctx);

    const std::string& Old = Req.oldName;
    Finder.addMatcher(namedDecl(hasName(Old), isExpansionInMainFile()).bind("decl"), &declCB);
    Finder.addMatcher(declRefExpr(to(namedDecl(hasName(Old)))).bind("ref"), &refCB);
    Finder.addMatcher(memberExpr(member(hasName(Old))).bind("member"), &refCB);

    if (Req.kind == SymbolKind::Variable || Req.kind == SymbolKind::Auto)
      Finder.addMatcher(cxxCtorInitializer(forField(hasName(Old))).bind("init"), &refCB);

    if (Req.kind == SymbolKind::Class || Req.kind == SymbolKind::Auto) {
      Finder.addMatcher(cxxDestructorDecl(ofClass(hasName(Old))).bind("dtor"), &dtorCB);
      Finder.addMatcher(typeLoc(loc(qualType(hasDeclaration(namedDecl(hasName(Old)))))).bind("type"),
                        &typeCB);
    }

    Finder.matchAST(AST->getASTContext());

    std::vector<Edit> Edits;
    for (unsigned Off : Ctx.Offsets)
      Edits.push_back(Edit{Off, unsigned(Old.size()), Req.newName});

    std::string Err;
    if (!applyEdits(Res.content, Edits, &Err))
      return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), Err);
    Res.changes = unsigned(Edits.size());
    return Res;
  }
};

} // namespace

std::unique_ptr<SymbolRewriter> makeClangRewriter(const EngineConfig& cfg) {
  return std::make_unique<ClangRewriter>(cfg);
}

} // namespace refsafe
