#include "DownloadReconciler.hpp"
#include "FakeModpackApi.hpp"
#include "UploadReconciler.hpp"
#include <gtest/gtest.h>

using namespace modsync;
using namespace modsync::test;

class DownloadReconcilerTest : public ::testing::Test {
protected:
  fs::path serverDir;
  fs::path sourceDir;
  fs::path clientDir;
  std::shared_ptr<DatabaseManager> db;
  std::unique_ptr<FakeModpackApi> api;
  std::unique_ptr<LocalStateStore> uploadState;
  std::unique_ptr<LocalStateStore> clientState;
  UploadConfig uploadConfig;
  ClientConfig clientConfig;

  void SetUp() override {
    serverDir = makeTempDir("modsync_dl_server");
    sourceDir = makeTempDir("modsync_dl_src");
    clientDir = makeTempDir("modsync_dl_client");
    db = std::make_shared<DatabaseManager>((serverDir / "server.db").string());
    db->initializeSchema();
    api = std::make_unique<FakeModpackApi>(db, serverDir / "uploads");

    uploadConfig.modpack_id = api->createModpack(
        ModpackCreateBody{"Pack", "minecraft", "1.20.1", "forge", "47"});
    uploadConfig.include_globs = {"**"};
    clientConfig.modpack_id = uploadConfig.modpack_id;

    uploadState = std::make_unique<LocalStateStore>(
        (sourceDir / "modsync.state.db").string());
    uploadState->open();
    clientState = std::make_unique<LocalStateStore>(
        (clientDir / "modsync.client.db").string());
    clientState->open();
  }

  void TearDown() override {
    clientState.reset();
    uploadState.reset();
    api.reset();
    db.reset();
    fs::remove_all(serverDir);
    fs::remove_all(sourceDir);
    fs::remove_all(clientDir);
  }

  void publish() {
    UploadReconciler uploader(*api, *uploadState, uploadConfig,
                              sourceDir.string());
    uploader.run({});
  }

  DownloadReport download(const DownloadOptions &options = {}) {
    DownloadReconciler reconciler(*api, *clientState, clientConfig,
                                  clientDir.string());
    return reconciler.run(options);
  }
};

TEST_F(DownloadReconcilerTest, ReproducesUploadedTree) {
  writeFile(sourceDir / "mods" / "a.jar", "alpha");
  writeFile(sourceDir / "config" / "deep" / "b.toml", "beta");
  publish();

  auto report = download();
  EXPECT_EQ(report.downloaded, 2u);
  EXPECT_TRUE(report.failures.empty());
  EXPECT_EQ(readFile(clientDir / "mods" / "a.jar"), "alpha");
  EXPECT_EQ(readFile(clientDir / "config" / "deep" / "b.toml"), "beta");

  for (const auto &[path, info] : clientState->loadClientFiles()) {
    EXPECT_FALSE(info.dirty) << path;
    EXPECT_EQ(info.sync_version, 1) << path;
  }
}

TEST_F(DownloadReconcilerTest, RepeatRunTransfersNothing) {
  writeFile(sourceDir / "mods" / "a.jar", "alpha");
  publish();
  download();
  api->downloadCalls = 0;

  auto report = download();
  EXPECT_EQ(api->downloadCalls, 0);
  EXPECT_EQ(report.downloaded + report.redownloaded + report.verified, 0u);
}

TEST_F(DownloadReconcilerTest, NewerVersionIsRedownloaded) {
  writeFile(sourceDir / "mods" / "a.jar", "v1");
  publish();
  download();

  writeFile(sourceDir / "mods" / "a.jar", "v2");
  publish();
  auto report = download();
  EXPECT_EQ(report.redownloaded, 1u);
  EXPECT_EQ(readFile(clientDir / "mods" / "a.jar"), "v2");
}

TEST_F(DownloadReconcilerTest, DeletedRecordRemovesLocalFile) {
  writeFile(sourceDir / "mods" / "a.jar", "a");
  writeFile(sourceDir / "mods" / "b.jar", "b");
  publish();
  download();

  fs::remove(sourceDir / "mods" / "b.jar");
  publish();
  auto report = download();
  EXPECT_EQ(report.deleted, 1u);
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "b.jar"));
  EXPECT_TRUE(fs::exists(clientDir / "mods" / "a.jar"));
}

TEST_F(DownloadReconcilerTest, ForceCheckRepairsLocalEdits) {
  writeFile(sourceDir / "mods" / "a.jar", "original");
  publish();
  download();

  writeFile(clientDir / "mods" / "a.jar", "edited");
  auto report = download();
  EXPECT_EQ(report.redownloaded, 0u);
  EXPECT_EQ(readFile(clientDir / "mods" / "a.jar"), "edited");

  DownloadOptions options;
  options.forceCheck = true;
  report = download(options);
  EXPECT_EQ(report.redownloaded, 1u);
  EXPECT_EQ(readFile(clientDir / "mods" / "a.jar"), "original");
}

TEST_F(DownloadReconcilerTest, DisabledEntryIsLeftAlone) {
  writeFile(sourceDir / "options.txt", "server");
  publish();
  download();

  auto files = clientState->loadClientFiles();
  files["options.txt"].disable_sync = true;
  clientState->saveClientFiles(files);
  writeFile(clientDir / "options.txt", "mine");

  writeFile(sourceDir / "options.txt", "server v2");
  publish();
  auto report = download();
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(readFile(clientDir / "options.txt"), "mine");
}

TEST_F(DownloadReconcilerTest, MissingBlobSkipsOnlyThatFile) {
  writeFile(sourceDir / "mods" / "a.jar", "a");
  publish();
  api->fileSync(uploadConfig.modpack_id,
                FileSyncBody{"mods/pending.jar", FileState::Exists,
                             BlobStore::digestOf("never uploaded")});

  auto report = download();
  EXPECT_EQ(report.downloaded, 1u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "pending.jar"));
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "pending.jar.modsync-part"));

  auto files = clientState->loadClientFiles();
  EXPECT_TRUE(files["mods/pending.jar"].dirty);
  EXPECT_FALSE(files["mods/a.jar"].dirty);
}

TEST_F(DownloadReconcilerTest, DigestMismatchKeepsFileDirty) {
  writeFile(sourceDir / "mods" / "a.jar", "genuine");
  publish();
  api->tamperedDigest = BlobStore::digestOf("genuine");

  auto report = download();
  EXPECT_EQ(report.downloaded, 0u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "a.jar"));
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "a.jar.modsync-part"));
  EXPECT_TRUE(clientState->loadClientFiles()["mods/a.jar"].dirty);

  api->tamperedDigest.reset();
  report = download();
  EXPECT_EQ(report.downloaded, 1u);
  EXPECT_EQ(readFile(clientDir / "mods" / "a.jar"), "genuine");
}

TEST_F(DownloadReconcilerTest, IgnoredAndUnsafeRecordsAreNotApplied) {
  ModpackResponse listing;
  FileRecord ignored;
  ignored.path = "ignored.txt";
  ignored.state = FileState::Ignored;
  ignored.hash = BlobStore::digestOf("x");
  FileRecord escape;
  escape.path = "../escape.txt";
  escape.state = FileState::Exists;
  escape.hash = BlobStore::digestOf("x");
  listing.files = {ignored, escape};

  ClientFileMap files;
  DownloadReport report;
  DownloadReconciler reconciler(*api, *clientState, clientConfig,
                                clientDir.string());
  reconciler.apply(listing, files, {}, report);

  EXPECT_TRUE(files.empty());
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(api->downloadCalls, 0);
  EXPECT_FALSE(fs::exists(clientDir.parent_path() / "escape.txt"));
}

TEST_F(DownloadReconcilerTest, BookkeepingNamesAreNeverWritten) {
  writeFile(clientDir / "modsync.json", "{}");

  ModpackResponse listing;
  for (const std::string path :
       {"modsync.client.db", "modsync.json", "mods/a.jar.modsync-part"}) {
    FileRecord record;
    record.path = path;
    record.state = FileState::Exists;
    record.sync_version = 1;
    record.hash = BlobStore::digestOf("x");
    listing.files.push_back(record);
  }

  ClientFileMap files;
  DownloadReport report;
  DownloadReconciler reconciler(*api, *clientState, clientConfig,
                                clientDir.string());
  reconciler.apply(listing, files, {}, report);

  EXPECT_TRUE(files.empty());
  EXPECT_EQ(report.skipped, 3u);
  EXPECT_EQ(report.failures.size(), 3u);
  EXPECT_EQ(api->downloadCalls, 0);
  EXPECT_EQ(readFile(clientDir / "modsync.json"), "{}");
  EXPECT_FALSE(fs::exists(clientDir / "mods" / "a.jar.modsync-part"));
}

TEST_F(DownloadReconcilerTest, UnknownModpackAbortsWithoutSaving) {
  clientConfig.modpack_id = "missing";
  EXPECT_THROW(download(), SyncError);
  EXPECT_TRUE(clientState->loadClientFiles().empty());
}
