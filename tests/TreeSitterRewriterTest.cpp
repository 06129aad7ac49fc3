#include "rewrite/SymbolRewriter.hpp"

#include <gtest/gtest.h>

using namespace refsafe;

namespace {

class TreeSitterRewriterTest : public ::testing::Test {
protected:
  void SetUp() override { rw = makeTreeSitterRewriter(cfg, log); }

  RewriteResult rename(llvm::StringRef content, llvm::StringRef oldName, llvm::StringRef newName,
                       Language lang, SymbolKind kind) {
    RenameRequest req;
    req.oldName = oldName.str();
    req.newName = newName.str();
    req.language = lang;
    req.kind = kind;
    auto res = rw->rewrite(content, req);
    if (!res) {
      ADD_FAILURE() << llvm::toString(res.takeError());
      return RewriteResult{};
    }
    return std::move(*res);
  }

  // REFACTOR_GRAMMAR_PATH points the loader at grammar libraries
  EngineConfig cfg = EngineConfig::fromEnvironment();
  Logger log{LogLevel::Off};
  std::unique_ptr<SymbolRewriter> rw;
};

#define REQUIRE_GRAMMAR(lang)                                                  \
  if (!rw->supports(lang)) GTEST_SKIP() << "no tree-sitter grammar for " << languageName(lang).str()

} // namespace

TEST_F(TreeSitterRewriterTest, JavaClassRenameTouchesTypesNotTextOrMembers) {
  REQUIRE_GRAMMAR(Language::Java);
  const char* src =
    "public class Old extends Base {\n"
    "  private Old next;\n"
    "  Old() {}\n"
    "  static Old create() { return new Old(); }\n"
    "  // Old in a comment\n"
    "  String label = \"Old\";\n"
    "  void old() {}\n"
    "}\n";

  RewriteResult res = rename(src, "Old", "Fresh", Language::Java, SymbolKind::Class);
  EXPECT_EQ(res.backend, Backend::Ast);
  EXPECT_EQ(res.changes, 5u);
  EXPECT_EQ(res.content,
            "public class Fresh extends Base {\n"
            "  private Fresh next;\n"
            "  Fresh() {}\n"
            "  static Fresh create() { return new Fresh(); }\n"
            "  // Old in a comment\n"
            "  String label = \"Old\";\n"
            "  void old() {}\n"
            "}\n");
}

TEST_F(TreeSitterRewriterTest, JavaKindSeparatesMethodFromField) {
  REQUIRE_GRAMMAR(Language::Java);
  const char* src =
    "class Cart {\n"
    "  int total;\n"
    "  int total() { return this.total + total; }\n"
    "  void show() { System.out.println(total()); }\n"
    "}\n";

  RewriteResult fn = rename(src, "total", "sum", Language::Java, SymbolKind::Function);
  EXPECT_EQ(fn.changes, 2u);
  EXPECT_EQ(fn.content,
            "class Cart {\n"
            "  int total;\n"
            "  int sum() { return this.total + total; }\n"
            "  void show() { System.out.println(sum()); }\n"
            "}\n");

  RewriteResult var = rename(src, "total", "sum", Language::Java, SymbolKind::Variable);
  EXPECT_EQ(var.changes, 3u);
  EXPECT_EQ(var.content,
            "class Cart {\n"
            "  int sum;\n"
            "  int total() { return this.sum + sum; }\n"
            "  void show() { System.out.println(total()); }\n"
            "}\n");

  RewriteResult any = rename(src, "total", "sum", Language::Java, SymbolKind::Auto);
  EXPECT_EQ(any.changes, 5u);
}

TEST_F(TreeSitterRewriterTest, PythonClassRenameFollowsReferences) {
  REQUIRE_GRAMMAR(Language::Python);
  const char* src =
    "class Old:\n"
    "    def make(self):\n"
    "        return Old()\n"
    "\n"
    "def use(x: Old) -> \"Old\":\n"
    "    # Old here\n"
    "    return Old.create(x)\n";

  RewriteResult cls = rename(src, "Old", "Fresh", Language::Python, SymbolKind::Class);
  EXPECT_EQ(cls.changes, 4u);
  EXPECT_EQ(cls.content,
            "class Fresh:\n"
            "    def make(self):\n"
            "        return Fresh()\n"
            "\n"
            "def use(x: Fresh) -> \"Old\":\n"
            "    # Old here\n"
            "    return Fresh.create(x)\n");

  RewriteResult fn = rename(src, "Old", "Fresh", Language::Python, SymbolKind::Function);
  EXPECT_EQ(fn.changes, 0u);
  EXPECT_EQ(fn.content, src);
}

TEST_F(TreeSitterRewriterTest, PythonFunctionRenameIncludesMethodCalls) {
  REQUIRE_GRAMMAR(Language::Python);
  const char* src =
    "def old(a):\n"
    "    return a\n"
    "\n"
    "result = old(1)\n"
    "obj.old(2)\n"
    "old_value = 3\n";

  RewriteResult res = rename(src, "old", "fresh", Language::Python, SymbolKind::Function);
  EXPECT_EQ(res.changes, 3u);
  EXPECT_EQ(res.content,
            "def fresh(a):\n"
            "    return a\n"
            "\n"
            "result = fresh(1)\n"
            "obj.fresh(2)\n"
            "old_value = 3\n");
}

TEST_F(TreeSitterRewriterTest, SyntaxErrorIsAParseError) {
  REQUIRE_GRAMMAR(Language::Java);
  RenameRequest req;
  req.oldName = "Old";
  req.newName = "Fresh";
  req.language = Language::Java;

  auto res = rw->rewrite("class Old { void f( { }", req);
  ASSERT_FALSE(bool(res));
  llvm::Error err = res.takeError();
  EXPECT_TRUE(err.isA<ParseError>());
  llvm::consumeError(std::move(err));
}

TEST_F(TreeSitterRewriterTest, OnlyJavaAndPythonAreClaimed) {
  EXPECT_FALSE(rw->supports(Language::Cpp));
  EXPECT_FALSE(rw->supports(Language::JavaScript));
  EXPECT_FALSE(rw->supports(Language::Unknown));
}

TEST_F(TreeSitterRewriterTest, PipelineFallsBackToTextOnBrokenJava) {
  REQUIRE_GRAMMAR(Language::Java);
  std::string logged;
  llvm::raw_string_ostream os(logged);
  Logger warnLog(LogLevel::Warning, os);
  RewritePipeline pipeline(warnLog, makeTreeSitterRewriter(cfg, warnLog), makeSafeTextRewriter(),
                           makePlainTextRewriter());

  RenameRequest req;
  req.oldName = "Old";
  req.newName = "Fresh";
  req.language = Language::Java;
  RewriteResult res = pipeline.rewrite("class Old { Old( }", req);

  EXPECT_EQ(res.backend, Backend::Regex);
  EXPECT_EQ(res.content, "class Fresh { Fresh( }");
  EXPECT_NE(os.str().find("falling back"), std::string::npos) << logged;
}
