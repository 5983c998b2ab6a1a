#include <gtest/gtest.h>

#include "FakeCommandRunner.hpp"
#include "TestHelpers.hpp"
#include "core/ledger/InitDb.hpp"
#include "core/ledger/RunLedger.hpp"
#include "core/verify/Verifier.hpp"

namespace dts_test {

class VerifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    dbPath = (tmp / "ledger.db").string();
    initDatabase(dbPath);
    ledger = std::make_unique<RunLedger>(dbPath);
    ledger->createProcessing("run1", "/src/run1", tmp.str(), "l", "m");
    source = {entry("a.txt"), entry("b/c.txt")};
    targetRunDir = tmp / "dst" / "run1";
  }

  static FileEntry entry(const std::string& rel) {
    FileEntry e;
    e.relative_path = rel;
    e.absolute_path = "/src/run1/" + rel;
    return e;
  }

  TempDir tmp;
  std::string dbPath;
  std::unique_ptr<RunLedger> ledger;
  FakeCommandRunner runner;
  std::vector<FileEntry> source;
  std::filesystem::path targetRunDir;
};

TEST_F(VerifierTest, CompleteWhenEverySourceFileIsPresent) {
  write_file(targetRunDir / "a.txt", "a");
  write_file(targetRunDir / "b" / "c.txt", "c");
  write_file(targetRunDir / "stray.txt", "left over from an earlier job");

  Verifier v(*ledger, runner, null_logger());
  auto res = v.reconcile("run1", source, targetRunDir.string(), false);

  EXPECT_TRUE(res.complete);
  EXPECT_TRUE(res.missing.empty());
  EXPECT_EQ(res.recorded, 2);

  auto files = ledger->listFiles("run1");
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].file_name, "a.txt");
  EXPECT_EQ(files[1].file_name, "b/c.txt");
  EXPECT_EQ(files[1].full_path_at_target, (targetRunDir / "b" / "c.txt").string());
}

TEST_F(VerifierTest, MissingFilesKeepRunIncompleteAndRecordsAccumulate) {
  write_file(targetRunDir / "a.txt", "a");

  Verifier v(*ledger, runner, null_logger());
  auto first = v.reconcile("run1", source, targetRunDir.string(), false);
  EXPECT_FALSE(first.complete);
  EXPECT_EQ(first.missing, (std::set<std::string>{"b/c.txt"}));
  EXPECT_EQ(first.recorded, 1);

  write_file(targetRunDir / "b" / "c.txt", "c");
  auto second = v.reconcile("run1", source, targetRunDir.string(), false);
  EXPECT_TRUE(second.complete);
  EXPECT_EQ(second.recorded, 1);

  auto third = v.reconcile("run1", source, targetRunDir.string(), false);
  EXPECT_TRUE(third.complete);
  EXPECT_EQ(third.recorded, 0);
  EXPECT_EQ(ledger->countFiles("run1"), 2);
}

TEST_F(VerifierTest, AbsentTargetMeansEverythingMissing) {
  Verifier v(*ledger, runner, null_logger());
  auto res = v.reconcile("run1", source, targetRunDir.string(), false);
  EXPECT_FALSE(res.complete);
  EXPECT_EQ(res.missing.size(), 2u);
  EXPECT_TRUE(res.listingError.empty());
}

TEST_F(VerifierTest, EmptySourceIsTriviallyComplete) {
  Verifier v(*ledger, runner, null_logger());
  auto res = v.reconcile("run1", {}, targetRunDir.string(), false);
  EXPECT_TRUE(res.complete);
}

TEST_F(VerifierTest, RemoteListingGoesOverTheRemoteShell) {
  runner.listingOutput =
      "./a.txt\n"
      "./b/c.txt\n"
      "./unrelated.dat\n";

  Verifier v(*ledger, runner, null_logger(), "ssh");
  auto res = v.reconcile("run1", source, "ops@archive:/srv/in/run1", true);

  EXPECT_TRUE(res.complete);
  ASSERT_EQ(runner.listingCalls(), 1);
  const auto& call = runner.calls.front();
  ASSERT_EQ(call.size(), 3u);
  EXPECT_EQ(call[0], "ssh");
  EXPECT_EQ(call[1], "ops@archive");
  EXPECT_EQ(call[2], "cd '/srv/in/run1' && find . -type f");

  auto files = ledger->listFiles("run1");
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].full_path_at_target, "ops@archive:/srv/in/run1/a.txt");
}

TEST_F(VerifierTest, FailedRemoteListingIsReportedNotThrown) {
  runner.listingExit = 255;
  Verifier v(*ledger, runner, null_logger());
  auto res = v.reconcile("run1", source, "ops@archive:/srv/in/run1", true);
  EXPECT_FALSE(res.complete);
  EXPECT_FALSE(res.listingError.empty());
  EXPECT_EQ(res.missing.size(), 2u);
}

TEST_F(VerifierTest, HomeRelativeRemoteDirectoryIsExpandedByTheRemoteShell) {
  runner.listingOutput = "./a.txt\n./b/c.txt\n";

  Verifier v(*ledger, runner, null_logger());
  auto res = v.reconcile("run1", source, "ops@archive:~/backups/run1", true);

  EXPECT_TRUE(res.complete);
  ASSERT_EQ(runner.listingCalls(), 1);
  EXPECT_EQ(runner.calls.front()[2], "cd ~/'backups/run1' && find . -type f");
  auto files = ledger->listFiles("run1");
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[1].full_path_at_target, "ops@archive:~/backups/run1/b/c.txt");
}

TEST(ShellQuoteTest, TildePrefixStaysUnquoted) {
  EXPECT_EQ(shell_quote_path("/srv/in"), "'/srv/in'");
  EXPECT_EQ(shell_quote_path("~/backups/run1"), "~/'backups/run1'");
  EXPECT_EQ(shell_quote_path("~ops/run1"), "~ops/'run1'");
  EXPECT_EQ(shell_quote_path("~"), "~");
  EXPECT_EQ(shell_quote_path("~$(rm)/x"), "'~$(rm)/x'");
}

TEST(ShellQuoteTest, EscapesSingleQuotes) {
  EXPECT_EQ(shell_quote("/plain/path"), "'/plain/path'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

} // namespace dts_test
