#include "FakeModpackApi.hpp"
#include "UploadReconciler.hpp"
#include <gtest/gtest.h>

using namespace modsync;
using namespace modsync::test;

class UploadReconcilerTest : public ::testing::Test {
protected:
  fs::path serverDir;
  fs::path syncDir;
  std::shared_ptr<DatabaseManager> db;
  std::unique_ptr<FakeModpackApi> api;
  std::unique_ptr<LocalStateStore> state;
  UploadConfig config;

  void SetUp() override {
    serverDir = makeTempDir("modsync_upload_server");
    syncDir = makeTempDir("modsync_upload_src");
    db = std::make_shared<DatabaseManager>((serverDir / "server.db").string());
    db->initializeSchema();
    api = std::make_unique<FakeModpackApi>(db, serverDir / "uploads");

    config.modpack_id = api->createModpack(
        ModpackCreateBody{"Pack", "minecraft", "1.20.1", "forge", "47"});
    config.server_url = "http://localhost:7040";
    config.api_key = "key";
    config.include_globs = {"mods/**", "config/**"};
    config.excludes = {"*.bak"};

    state = std::make_unique<LocalStateStore>(
        (syncDir / "modsync.state.db").string());
    state->open();
  }

  void TearDown() override {
    state.reset();
    api.reset();
    db.reset();
    fs::remove_all(serverDir);
    fs::remove_all(syncDir);
  }

  UploadReport runOnce(const UploadOptions &options = {}) {
    UploadReconciler reconciler(*api, *state, config, syncDir.string());
    return reconciler.run(options);
  }

  void resetCounters() {
    api->fileSyncCalls = 0;
    api->uploadCalls = 0;
  }
};

TEST_F(UploadReconcilerTest, FirstRunSyncsAndUploadsEveryTrackedFile) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  writeFile(syncDir / "config" / "b.toml", "b");
  writeFile(syncDir / "mods" / "a.jar.bak", "old");
  writeFile(syncDir / "saves" / "w.dat", "w");

  auto report = runOnce();
  EXPECT_EQ(report.created, 2u);
  EXPECT_EQ(api->fileSyncCalls, 2);
  EXPECT_EQ(api->uploadCalls, 2);

  auto files = api->getModpack(config.modpack_id).files;
  ASSERT_EQ(files.size(), 2u);
  for (const auto &f : files) {
    EXPECT_TRUE(f.uploaded);
    EXPECT_EQ(f.state, FileState::Exists);
  }

  auto persisted = state->loadSyncState();
  ASSERT_EQ(persisted.size(), 2u);
  for (const auto &[path, f] : persisted)
    EXPECT_EQ(f.dirty, FileDirtyness::Clean) << path;
}

TEST_F(UploadReconcilerTest, SecondRunWithoutChangesIsIdle) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  runOnce();
  resetCounters();

  auto report = runOnce();
  EXPECT_EQ(report.synced, 0u);
  EXPECT_EQ(api->fileSyncCalls, 0);
  EXPECT_EQ(api->uploadCalls, 0);
}

TEST_F(UploadReconcilerTest, ChangedFileIsReuploaded) {
  writeFile(syncDir / "mods" / "a.jar", "v1");
  runOnce();
  resetCounters();

  writeFile(syncDir / "mods" / "a.jar", "v2");
  auto report = runOnce();
  EXPECT_EQ(report.updated, 1u);
  EXPECT_EQ(api->fileSyncCalls, 1);
  EXPECT_EQ(api->uploadCalls, 1);

  auto files = api->getModpack(config.modpack_id).files;
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].hash, BlobStore::digestOf("v2"));
  EXPECT_EQ(files[0].sync_version, 2);
}

TEST_F(UploadReconcilerTest, DeletedFileSendsOneTombstone) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  writeFile(syncDir / "mods" / "b.jar", "b");
  runOnce();
  resetCounters();

  fs::remove(syncDir / "mods" / "b.jar");
  auto report = runOnce();
  EXPECT_EQ(report.deleted, 1u);
  EXPECT_EQ(api->fileSyncCalls, 1);
  EXPECT_EQ(api->uploadCalls, 0);

  auto record = db->getFileByPath(config.modpack_id, "mods/b.jar");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, FileState::Deleted);

  // The tombstone is not resent
  resetCounters();
  runOnce();
  EXPECT_EQ(api->fileSyncCalls, 0);
}

TEST_F(UploadReconcilerTest, RecreatedFileComesBackAsUpdate) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  runOnce();
  fs::remove(syncDir / "mods" / "a.jar");
  runOnce();
  resetCounters();

  writeFile(syncDir / "mods" / "a.jar", "a");
  auto report = runOnce();
  EXPECT_EQ(report.updated, 1u);
  EXPECT_EQ(api->uploadCalls, 1);
  EXPECT_EQ(report.deduplicated, 1u);
  EXPECT_EQ(db->getFileByPath(config.modpack_id, "mods/a.jar")->state,
            FileState::Exists);
}

TEST_F(UploadReconcilerTest, DuplicateContentIsStoredOnce) {
  writeFile(syncDir / "mods" / "a.jar", "same");
  writeFile(syncDir / "mods" / "b.jar", "same");

  auto report = runOnce();
  EXPECT_EQ(report.uploaded, 1u);
  EXPECT_EQ(report.deduplicated, 1u);
}

TEST_F(UploadReconcilerTest, ForceSyncResendsMetadataOnly) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  runOnce();
  resetCounters();

  UploadOptions options;
  options.forceSync = true;
  runOnce(options);
  EXPECT_EQ(api->fileSyncCalls, 1);
  EXPECT_EQ(api->uploadCalls, 0);

  resetCounters();
  options.forceUpload = true;
  runOnce(options);
  EXPECT_EQ(api->fileSyncCalls, 1);
  EXPECT_EQ(api->uploadCalls, 1);
}

TEST_F(UploadReconcilerTest, SeedFromServerRebuildsLostState) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  writeFile(syncDir / "mods" / "b.jar", "b");
  runOnce();
  state->saveSyncState({});
  resetCounters();

  UploadOptions options;
  options.seedFromServer = true;
  auto report = runOnce(options);

  // Seeded entries are pushed again but nothing is new
  EXPECT_EQ(report.created, 0u);
  EXPECT_EQ(api->fileSyncCalls, 2);
  EXPECT_EQ(state->loadSyncState().size(), 2u);
}

TEST_F(UploadReconcilerTest, SeededIgnoredRecordStaysIgnored) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  runOnce();
  api->fileSync(config.modpack_id,
                FileSyncBody{"mods/a.jar", FileState::Ignored,
                             BlobStore::digestOf("a")});
  state->saveSyncState({});
  resetCounters();

  UploadOptions options;
  options.seedFromServer = true;
  auto report = runOnce(options);

  EXPECT_EQ(report.updated, 0u);
  EXPECT_EQ(api->uploadCalls, 0);
  auto record = db->getFileByPath(config.modpack_id, "mods/a.jar");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, FileState::Ignored);
  EXPECT_EQ(state->loadSyncState()["mods/a.jar"].state, FileState::Ignored);

  // Later plain runs leave it alone as well
  resetCounters();
  runOnce();
  EXPECT_EQ(api->fileSyncCalls, 0);
  EXPECT_EQ(db->getFileByPath(config.modpack_id, "mods/a.jar")->state,
            FileState::Ignored);
}

TEST_F(UploadReconcilerTest, FailedRunDoesNotPersistState) {
  writeFile(syncDir / "mods" / "a.jar", "a");
  writeFile(syncDir / "mods" / "b.jar", "b");
  api->failUploadAt = 2;

  EXPECT_THROW(runOnce(), SyncError);
  EXPECT_TRUE(state->loadSyncState().empty());

  // The next run picks everything up again
  api->failUploadAt.reset();
  resetCounters();
  auto report = runOnce();
  EXPECT_EQ(report.created, 2u);
  EXPECT_EQ(api->uploadCalls, 2);
}

TEST(UploadReconcileLocalStateTest, MarksCreatedUpdatedDeleted) {
  SyncState state;
  state["kept"] = SyncFile{std::string("h1"), FileState::Exists,
                           FileDirtyness::Clean};
  state["changed"] = SyncFile{std::string("h2"), FileState::Exists,
                              FileDirtyness::Clean};
  state["gone"] = SyncFile{std::string("h3"), FileState::Exists,
                           FileDirtyness::Clean};
  state["tomb"] = SyncFile{std::string("h4"), FileState::Deleted,
                           FileDirtyness::Clean};
  state["revived"] = SyncFile{std::string("h6"), FileState::Deleted,
                              FileDirtyness::Clean};
  state["ignored"] = SyncFile{std::string("h7"), FileState::Ignored,
                              FileDirtyness::Clean};

  std::vector<ScannedFile> scanned = {
      ScannedFile{"kept", "/x/kept", "h1", 1},
      ScannedFile{"changed", "/x/changed", "h2b", 1},
      ScannedFile{"new", "/x/new", "h5", 1},
      ScannedFile{"revived", "/x/revived", "h6", 1},
      ScannedFile{"ignored", "/x/ignored", "h7", 1},
  };

  UploadReport report;
  UploadReconciler::reconcileLocalState(scanned, state, report);

  EXPECT_EQ(state["kept"].dirty, FileDirtyness::Clean);
  EXPECT_EQ(state["changed"].dirty, FileDirtyness::Updated);
  EXPECT_EQ(state["changed"].hash, std::string("h2b"));
  EXPECT_EQ(state["new"].dirty, FileDirtyness::Created);
  EXPECT_EQ(state["gone"].dirty, FileDirtyness::Deleted);
  EXPECT_EQ(state["gone"].state, FileState::Deleted);
  EXPECT_EQ(state["tomb"].dirty, FileDirtyness::Clean);
  EXPECT_EQ(state["revived"].state, FileState::Exists);
  EXPECT_EQ(state["revived"].dirty, FileDirtyness::Updated);
  EXPECT_EQ(state["ignored"].state, FileState::Ignored);
  EXPECT_EQ(state["ignored"].dirty, FileDirtyness::Clean);
  EXPECT_EQ(report.created, 1u);
  EXPECT_EQ(report.updated, 2u);
  EXPECT_EQ(report.deleted, 1u);
}
