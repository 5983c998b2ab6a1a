#include <gtest/gtest.h>
#include <sqlite3.h>

#include "TestHelpers.hpp"
#include "core/Errors.hpp"
#include "core/ledger/InitDb.hpp"
#include "core/ledger/RunLedger.hpp"

namespace dts_test {

class RunLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dbPath = (tmp / "db" / "ledger.db").string();
    initDatabase(dbPath);
  }

  // Forces updated_at so recency ordering is deterministic.
  void setUpdatedAt(const std::string& run_id, int64_t at) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath.c_str(), &db), SQLITE_OK);
    const std::string sql = "UPDATE run SET updated_at = " + std::to_string(at) +
                            " WHERE run_id = '" + run_id + "'";
    ASSERT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
  }

  TempDir tmp;
  std::string dbPath;
};

TEST_F(RunLedgerTest, UnknownRunHasNoStatus) {
  RunLedger ledger(dbPath);
  EXPECT_FALSE(ledger.getStatus("nope").has_value());
  EXPECT_FALSE(ledger.get("nope").has_value());
}

TEST_F(RunLedgerTest, CreateProcessingRecordsAllFields) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/src/run1", "/dst", "/logs/run1.log", "/logs/run1.tsv");

  auto rec = ledger.get("run1");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, RunStatus::Processing);
  EXPECT_EQ(rec->source_dir, "/src/run1");
  EXPECT_EQ(rec->target_dir, "/dst");
  EXPECT_EQ(rec->log_path, "/logs/run1.log");
  EXPECT_EQ(rec->manifest_path, "/logs/run1.tsv");
  EXPECT_GT(rec->created_at, 0);
  EXPECT_EQ(rec->created_at, rec->updated_at);
  EXPECT_EQ(ledger.getStatus("run1"), RunStatus::Processing);
}

TEST_F(RunLedgerTest, CreateProcessingRejectsExistingRun) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "l", "m");
  EXPECT_THROW(ledger.createProcessing("run1", "/a", "/b", "l2", "m2"), LedgerError);
  EXPECT_EQ(ledger.get("run1")->log_path, "l");
}

TEST_F(RunLedgerTest, SetStatusRequiresExistingRun) {
  RunLedger ledger(dbPath);
  EXPECT_THROW(ledger.setStatus("ghost", RunStatus::Success), LedgerError);
}

TEST_F(RunLedgerTest, UpdateChangesOnlyRequestedFields) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "/local/run1.log", "/local/run1.tsv");

  RunUpdate u;
  u.manifest_path = "/b/run1/run1.tsv";
  ledger.update("run1", u);

  auto rec = ledger.get("run1");
  ASSERT_TRUE(rec);
  EXPECT_EQ(rec->manifest_path, "/b/run1/run1.tsv");
  EXPECT_EQ(rec->log_path, "/local/run1.log");
  EXPECT_EQ(rec->status, RunStatus::Processing);
}

TEST_F(RunLedgerTest, EmptyUpdateIsNoOp) {
  RunLedger ledger(dbPath);
  EXPECT_NO_THROW(ledger.update("ghost", RunUpdate{}));
}

TEST_F(RunLedgerTest, ReopenMovesFailedBackToProcessing) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "first.log", "first.tsv");
  ledger.setStatus("run1", RunStatus::Failed);
  const int64_t created = ledger.get("run1")->created_at;

  ledger.reopenProcessing("run1", "/elsewhere", "/other", "second.log", "second.tsv");

  auto rec = ledger.get("run1");
  ASSERT_TRUE(rec);
  EXPECT_EQ(rec->status, RunStatus::Processing);
  EXPECT_EQ(rec->log_path, "second.log");
  EXPECT_EQ(rec->manifest_path, "second.tsv");
  // creation fields are immutable
  EXPECT_EQ(rec->source_dir, "/a");
  EXPECT_EQ(rec->target_dir, "/b");
  EXPECT_EQ(rec->created_at, created);
}

TEST_F(RunLedgerTest, ReopenInsertsWhenRecordIsGone) {
  RunLedger ledger(dbPath);
  ledger.reopenProcessing("run1", "/a", "/b", "l", "m");
  EXPECT_EQ(ledger.getStatus("run1"), RunStatus::Processing);
}

TEST_F(RunLedgerTest, QueryFiltersAndOrdersByRecency) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("old", "/a", "/b", "l", "m");
  ledger.createProcessing("new", "/a", "/b", "l", "m");
  ledger.createProcessing("mid", "/a", "/b", "l", "m");
  ledger.setStatus("old", RunStatus::Success);
  ledger.setStatus("new", RunStatus::Success);
  ledger.setStatus("mid", RunStatus::Failed);
  setUpdatedAt("old", 100);
  setUpdatedAt("mid", 200);
  setUpdatedAt("new", 300);

  auto all = ledger.query({});
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].run_id, "new");
  EXPECT_EQ(all[1].run_id, "mid");
  EXPECT_EQ(all[2].run_id, "old");

  RunFilter ok;
  ok.status = RunStatus::Success;
  auto successes = ledger.query(ok);
  ASSERT_EQ(successes.size(), 2u);
  EXPECT_EQ(successes[0].run_id, "new");
  EXPECT_EQ(successes[1].run_id, "old");

  RunFilter both;
  both.run_id = "mid";
  both.status = RunStatus::Success;
  EXPECT_TRUE(ledger.query(both).empty());

  RunFilter limited;
  limited.limit = 1;
  auto one = ledger.query(limited);
  ASSERT_EQ(one.size(), 1u);
  EXPECT_EQ(one[0].run_id, "new");
}

TEST_F(RunLedgerTest, QueryBreaksTiesByRunId) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("zeta", "/a", "/b", "l", "m");
  ledger.createProcessing("alpha", "/a", "/b", "l", "m");
  ledger.createProcessing("mid", "/a", "/b", "l", "m");
  setUpdatedAt("zeta", 500);
  setUpdatedAt("alpha", 500);
  setUpdatedAt("mid", 100);

  auto all = ledger.query({});
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].run_id, "alpha");
  EXPECT_EQ(all[1].run_id, "zeta");
  EXPECT_EQ(all[2].run_id, "mid");
}

TEST_F(RunLedgerTest, FileRecordsAccumulatePerRun) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "l", "m");
  ledger.createProcessing("run2", "/a", "/b", "l", "m");
  ledger.addFileRecord({"run1", "b/c.txt", "/b/run1/b/c.txt"});
  ledger.addFileRecord({"run1", "a.txt", "/b/run1/a.txt"});
  ledger.addFileRecord({"run2", "a.txt", "/b/run2/a.txt"});

  auto files = ledger.listFiles("run1");
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].file_name, "a.txt");
  EXPECT_EQ(files[1].file_name, "b/c.txt");
  EXPECT_EQ(files[1].full_path_at_target, "/b/run1/b/c.txt");
  EXPECT_EQ(ledger.countFiles("run1"), 2);
  EXPECT_EQ(ledger.countFiles("run2"), 1);
}

TEST_F(RunLedgerTest, FileRecordNeedsExistingRun) {
  RunLedger ledger(dbPath);
  EXPECT_THROW(ledger.addFileRecord({"ghost", "a.txt", "/x"}), LedgerError);
}

TEST_F(RunLedgerTest, RemoveRunDropsItsFiles) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "l", "m");
  ledger.addFileRecord({"run1", "a.txt", "/b/run1/a.txt"});

  EXPECT_TRUE(ledger.removeRun("run1"));
  EXPECT_FALSE(ledger.getStatus("run1"));
  EXPECT_EQ(ledger.countFiles("run1"), 0);
  EXPECT_FALSE(ledger.removeRun("run1"));
}

TEST_F(RunLedgerTest, ImportRunsMarksThemSuccessful) {
  const auto csv = tmp / "legacy.csv";
  write_file(csv, "run_id,notes\nrunA,first\n\nrunB,second\n");
  RunLedger ledger(dbPath);
  ledger.createProcessing("runB", "/a", "/b", "l", "m");
  ledger.setStatus("runB", RunStatus::Failed);

  EXPECT_EQ(ledger.importRuns(csv.string()), 2);
  EXPECT_EQ(ledger.getStatus("runA"), RunStatus::Success);
  EXPECT_EQ(ledger.get("runA")->target_dir, "NA");
  EXPECT_EQ(ledger.getStatus("runB"), RunStatus::Success);
  EXPECT_EQ(ledger.get("runB")->target_dir, "/b");
}

TEST_F(RunLedgerTest, ImportRejectsCsvWithoutRunIdColumn) {
  const auto csv = tmp / "bad.csv";
  write_file(csv, "name\nx\n");
  RunLedger ledger(dbPath);
  EXPECT_THROW(ledger.importRuns(csv.string()), LedgerError);
}

TEST_F(RunLedgerTest, InitDatabaseIsIdempotent) {
  RunLedger ledger(dbPath);
  ledger.createProcessing("run1", "/a", "/b", "l", "m");
  EXPECT_TRUE(initDatabase(dbPath));
  EXPECT_EQ(ledger.getStatus("run1"), RunStatus::Processing);
}

TEST_F(RunLedgerTest, OpeningMissingDatabaseFails) {
  RunLedger ledger((tmp / "absent.db").string());
  EXPECT_THROW(ledger.getStatus("x"), LedgerError);
}

TEST_F(RunLedgerTest, CorruptDatabaseFileIsALedgerError) {
  const auto bogus = tmp / "bogus.db";
  write_file(bogus, std::string(4096, 'x'));
  RunLedger ledger(bogus.string());
  EXPECT_THROW(ledger.getStatus("x"), LedgerError);
  EXPECT_THROW(ledger.createProcessing("x", "/a", "/b", "l", "m"), LedgerError);
}

TEST(RunStatusTest, RoundTripsNames) {
  EXPECT_STREQ(toString(RunStatus::Processing), "PROCESSING");
  EXPECT_EQ(parseRunStatus("FAILED"), RunStatus::Failed);
  EXPECT_FALSE(parseRunStatus("failed").has_value());
  EXPECT_FALSE(parseRunStatus("PENDING").has_value());
}

} // namespace dts_test
