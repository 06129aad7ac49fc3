#include "refactor/RefactorSession.hpp"
#include "TestUtil.hpp"

#include "llvm/Support/JSON.h"

#include <gtest/gtest.h>

using namespace refsafe;
using namespace refsafe::test;

namespace {

class RefactorSessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg.checkCompile = false;
    cfg.retryDelay = std::chrono::milliseconds(1);
  }

  SessionOutcome run(const OperationFn& op, SessionOptions opts, bool answer = true) {
    RefactorEngine engine(cfg, log);
    llvm::raw_string_ostream os(output);
    RefactorSession session(engine, opts, os, [&](llvm::StringRef) {
      ++prompts;
      return answer;
    });
    SessionOutcome outcome = session.run(op);
    EXPECT_EQ(session.state(), outcome.state);
    os.flush();
    return outcome;
  }

  static OperationFn renameTo(std::string file, std::string newName) {
    return [file, newName](RefactorEngine& e) -> llvm::Expected<std::vector<RenameResult>> {
      return std::vector<RenameResult>{e.renameFile(file, newName)};
    };
  }

  EngineConfig cfg;
  Logger log{LogLevel::Off};
  TempDir dir;
  std::string output;
  unsigned prompts = 0;
};

} // namespace

TEST_F(RefactorSessionTest, NothingToDoSucceedsWithoutAsking) {
  const std::string src = dir.write("Foo.java", "class Bar {}");
  OperationFn op = [src](RefactorEngine& e) -> llvm::Expected<std::vector<RenameResult>> {
    return std::vector<RenameResult>{e.renameFileContent(src, "Foo", "Baz")};
  };

  SessionOutcome out = run(op, SessionOptions{});

  EXPECT_EQ(out.state, SessionState::Done);
  EXPECT_EQ(out.exitCode, 0);
  EXPECT_EQ(prompts, 0u);
  EXPECT_TRUE(out.executed.empty());
  EXPECT_NE(output.find("No applicable files"), std::string::npos) << output;
}

TEST_F(RefactorSessionTest, DeclinedConfirmationAborts) {
  const std::string src = dir.write("Foo.java", "class Foo {}");

  SessionOutcome out = run(renameTo(src, "Bar"), SessionOptions{}, /*answer=*/false);

  EXPECT_EQ(out.state, SessionState::Aborted);
  EXPECT_EQ(out.exitCode, 1);
  EXPECT_EQ(prompts, 1u);
  EXPECT_EQ(readAll(src), "class Foo {}");
  EXPECT_FALSE(exists(dir.path("Bar.java")));
}

TEST_F(RefactorSessionTest, ConfirmedRunRecomputesWithAFreshLog) {
  const std::string src = dir.write("Foo.java", "class Foo {}");

  SessionOutcome out = run(renameTo(src, "Bar"), SessionOptions{});

  EXPECT_EQ(out.state, SessionState::Done);
  EXPECT_EQ(out.exitCode, 0);
  EXPECT_EQ(prompts, 1u);
  EXPECT_EQ(readAll(dir.path("Bar.java")), "class Bar {}");

  ASSERT_EQ(out.preview.size(), 2u);
  for (const auto& r : out.preview) EXPECT_TRUE(r.preview);
  ASSERT_EQ(out.executed.size(), 2u);
  for (const auto& r : out.executed) EXPECT_FALSE(r.preview);
  EXPECT_EQ(out.executed[0].kind, OperationKind::ContentUpdated);
  EXPECT_EQ(out.executed[1].kind, OperationKind::Renamed);
  EXPECT_NE(output.find("WOULD RENAME"), std::string::npos) << output;
  EXPECT_NE(output.find("RENAMED"), std::string::npos) << output;
}

TEST_F(RefactorSessionTest, DryRunOnlyPreviews) {
  const std::string src = dir.write("Foo.java", "class Foo {}");
  SessionOptions opts;
  opts.dryRun = true;

  SessionOutcome out = run(renameTo(src, "Bar"), opts);

  EXPECT_EQ(out.state, SessionState::Done);
  EXPECT_EQ(out.exitCode, 0);
  EXPECT_EQ(prompts, 0u);
  EXPECT_EQ(readAll(src), "class Foo {}");
  EXPECT_FALSE(exists(dir.path("Bar.java")));
  EXPECT_NE(output.find("DRY RUN"), std::string::npos) << output;
}

TEST_F(RefactorSessionTest, AnyFileFailureMakesTheExitCodeNonZero) {
  for (int i = 1; i <= 5; ++i)
    dir.write("batch/item" + std::to_string(i) + ".txt", "payload\n");

  FileSystemHooks hooks;
  hooks.rename = [](llvm::StringRef from, llvm::StringRef to) -> std::error_code {
    if (llvm::sys::path::filename(from) == "item3.txt")
      return std::make_error_code(std::errc::read_only_file_system);
    return llvm::sys::fs::rename(from, to);
  };
  RefactorEngine engine(cfg, log, hooks);
  llvm::raw_string_ostream os(output);
  SessionOptions opts;
  opts.assumeYes = true;
  RefactorSession session(engine, opts, os, [](llvm::StringRef) { return true; });

  const std::string batchDir = dir.path("batch");
  SessionOutcome out = session.run([&](RefactorEngine& e) {
    return e.batchRename("item", "entry", batchDir, "*.txt", false);
  });

  EXPECT_EQ(out.exitCode, 1);
  ASSERT_EQ(out.results.size(), 5u);
  unsigned ok = 0;
  for (const auto& r : out.results) ok += r.success ? 1 : 0;
  EXPECT_EQ(ok, 4u);
  EXPECT_TRUE(exists(dir.path("batch/item3.txt")));
  EXPECT_TRUE(exists(dir.path("batch/entry5.txt")));
}

TEST_F(RefactorSessionTest, InvalidRequestAborts) {
  const std::string missing = dir.path("missing");
  SessionOutcome out = run(
    [&](RefactorEngine& e) { return e.batchRename("a", "b", missing, "*", false); },
    SessionOptions{});

  EXPECT_EQ(out.state, SessionState::Aborted);
  EXPECT_EQ(out.exitCode, 1);
  EXPECT_EQ(prompts, 0u);
}

TEST_F(RefactorSessionTest, JsonReportDescribesTheRun) {
  const std::string src = dir.write("Foo.java", "class Foo {}");
  SessionOptions opts;
  opts.json = true;

  SessionOutcome out = run(renameTo(src, "Bar"), opts);
  ASSERT_EQ(out.exitCode, 0);

  auto parsed = llvm::json::parse(output);
  ASSERT_TRUE(bool(parsed)) << llvm::toString(parsed.takeError()) << "\n" << output;
  const llvm::json::Object* root = parsed->getAsObject();
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->getInteger("processed"), int64_t(1));
  EXPECT_EQ(root->getBoolean("success"), true);

  const llvm::json::Array* files = root->getArray("files");
  ASSERT_NE(files, nullptr);
  ASSERT_EQ(files->size(), 1u);
  const llvm::json::Object* file = (*files)[0].getAsObject();
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->getString("new_path"), llvm::StringRef(dir.path("Bar.java")));
  auto backend = file->getString("backend");
  ASSERT_TRUE(backend.hasValue());
  EXPECT_TRUE(*backend == "regex" || *backend == "ast") << backend->str();
  EXPECT_EQ(file->getInteger("changes"), int64_t(1));

  const llvm::json::Array* ops = root->getArray("operations");
  ASSERT_NE(ops, nullptr);
  EXPECT_EQ(ops->size(), 2u);
}

TEST(ConfirmAction, AssumeYesApprovesWithoutReading) {
  std::string text;
  llvm::raw_string_ostream os(text);
  EXPECT_TRUE(confirmAction("Proceed?", /*assumeYes=*/true, os));
  EXPECT_NE(os.str().find("auto-confirmed"), std::string::npos);
}
