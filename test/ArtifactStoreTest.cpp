#include <gtest/gtest.h>

#include "FakeCommandRunner.hpp"
#include "TestHelpers.hpp"
#include "core/sync/RemoteTarget.hpp"
#include "core/transfer/ArtifactStore.hpp"

namespace fs = std::filesystem;

namespace dts_test {

TEST(ArtifactStoreTest, MovesIntoLocalRunDirectory) {
  TempDir tmp;
  const auto local = tmp / "logs" / "run1_20240101_000000.log";
  write_file(local, "log body");
  FakeCommandRunner runner;
  ArtifactStore store(runner);

  const auto r = store.relocate(local.string(), (tmp / "dst" / "run1").string());

  EXPECT_TRUE(r.moved);
  EXPECT_TRUE(r.warning.empty());
  EXPECT_FALSE(fs::exists(local));
  EXPECT_EQ(fs::path(r.finalPath).filename(), "run1_20240101_000000.log");
  EXPECT_EQ(read_file(r.finalPath), "log body");
  EXPECT_TRUE(runner.calls.empty());
}

TEST(ArtifactStoreTest, RemoteCopyRemovesLocalOnlyAfterSuccess) {
  TempDir tmp;
  const auto local = tmp / "run1.log";
  write_file(local, "x");
  FakeCommandRunner runner;
  ArtifactStore store(runner, "rsync");

  const auto r = store.relocate(local.string(), "u@h:/srv/in/run1");

  EXPECT_TRUE(r.moved);
  EXPECT_EQ(r.finalPath, "u@h:/srv/in/run1/run1.log");
  EXPECT_FALSE(fs::exists(local));
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0], (std::vector<std::string>{"rsync", "-a", local.string(), "u@h:/srv/in/run1/run1.log"}));
}

TEST(ArtifactStoreTest, FailedRemoteCopyKeepsLocalArtifact) {
  TempDir tmp;
  const auto local = tmp / "run1.log";
  write_file(local, "evidence");
  FakeCommandRunner runner;
  runner.artifactCopyExit = 12;
  ArtifactStore store(runner);

  const auto r = store.relocate(local.string(), "u@h:/srv/in/run1");

  EXPECT_FALSE(r.moved);
  EXPECT_FALSE(r.warning.empty());
  EXPECT_EQ(r.finalPath, local.string());
  EXPECT_EQ(read_file(local), "evidence");
}

TEST(ArtifactStoreTest, MissingArtifactIsAWarning) {
  TempDir tmp;
  FakeCommandRunner runner;
  ArtifactStore store(runner);
  const auto r = store.relocate((tmp / "gone.log").string(), (tmp / "dst").string());
  EXPECT_FALSE(r.moved);
  EXPECT_FALSE(r.warning.empty());
}

} // namespace dts_test

namespace dts_test {

TEST(ArtifactStoreTest, DoesNotOverwriteEarlierArtifact) {
  TempDir tmp;
  const auto runDir = tmp / "dst" / "run1";
  write_file(runDir / "run1.log", "first");
  write_file(tmp / "logs" / "run1.log", "second");
  FakeCommandRunner runner;
  ArtifactStore store(runner);

  const auto r = store.relocate((tmp / "logs" / "run1.log").string(), runDir.string());

  EXPECT_TRUE(r.moved);
  EXPECT_EQ(fs::path(r.finalPath).filename(), "run1_1.log");
  EXPECT_EQ(read_file(runDir / "run1.log"), "first");
  EXPECT_EQ(read_file(r.finalPath), "second");
}

} // namespace dts_test

namespace dts_test {

TEST(ArtifactStoreTest, RemoteArtifactLandsInRunDirectoryNotDestinationRoot) {
  TempDir tmp;
  const auto local = tmp / "logs" / "run7_20240101_000000.log";
  write_file(local, "x");
  FakeCommandRunner runner;
  ArtifactStore store(runner);
  const auto root = RemoteTarget::parse("ops@archive:/srv/in/");
  const std::string runDir = root->child("run7").spec();

  const auto r = store.relocate(local.string(), runDir);

  EXPECT_TRUE(r.moved);
  EXPECT_EQ(r.finalPath, "ops@archive:/srv/in/run7/run7_20240101_000000.log");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].back(), r.finalPath);
}

TEST(ArtifactStoreTest, MalformedRemoteRunDirectoryKeepsArtifactLocal) {
  TempDir tmp;
  const auto local = tmp / "run1.log";
  write_file(local, "x");
  FakeCommandRunner runner;
  ArtifactStore store(runner);

  const auto r = store.relocate(local.string(), "ops@archive/srv/in/run1");

  EXPECT_FALSE(r.moved);
  EXPECT_FALSE(r.warning.empty());
  EXPECT_EQ(r.finalPath, local.string());
  EXPECT_TRUE(runner.calls.empty());
}

} // namespace dts_test
