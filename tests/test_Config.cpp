#include "Config.hpp"
#include "SyncError.hpp"
#include "TestUtils.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

using namespace modsync;
using namespace modsync::test;

class ConfigTest : public ::testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    dir = makeTempDir("modsync_config");
    for (const char *name : {"MODSYNC_DATABASE_PATH", "MODSYNC_MASTER_KEY",
                             "MODSYNC_PORT", "MODSYNC_UPLOADS_DIRECTORY"})
      unsetenv(name);
  }

  void TearDown() override {
    unsetenv("MODSYNC_MASTER_KEY");
    unsetenv("MODSYNC_PORT");
    fs::remove_all(dir);
  }
};

TEST_F(ConfigTest, LoadsUploadConfig) {
  writeFile(dir / "modsync.sync.json", R"({
    "modpack_id": "abc",
    "server_url": "http://localhost:7040/",
    "api_key": "key",
    "include_globs": ["mods/**"],
    "excludes": ["*.bak"]
  })");

  auto config = loadUploadConfig((dir / "modsync.sync.json").string());
  EXPECT_EQ(config.modpack_id, "abc");
  EXPECT_EQ(config.server_url, "http://localhost:7040");
  EXPECT_EQ(config.include_globs, std::vector<std::string>{"mods/**"});
  EXPECT_EQ(config.excludes, std::vector<std::string>{"*.bak"});
}

TEST_F(ConfigTest, MissingKeyIsConfigError) {
  writeFile(dir / "modsync.json", R"({"modpack_id": "abc"})");
  try {
    loadClientConfig((dir / "modsync.json").string());
    FAIL() << "expected SyncError";
  } catch (const SyncError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Config);
  }
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
  EXPECT_THROW(loadClientConfig((dir / "absent.json").string()), SyncError);
}

TEST_F(ConfigTest, ServerDefaultsAndEnvironmentOverrides) {
  writeFile(dir / "server.json",
            R"({"master_key": "from-file", "port": 9000})");
  setenv("MODSYNC_PORT", "9100", 1);

  auto config = loadServerConfig((dir / "server.json").string());
  EXPECT_EQ(config.master_key, "from-file");
  EXPECT_EQ(config.port, 9100);
  EXPECT_EQ(config.uploads_directory, "uploads");
  EXPECT_EQ(config.file_size_limit, 262144000u);
  EXPECT_EQ(config.request_timeout, 15);
}

TEST_F(ConfigTest, ServerRequiresMasterKey) {
  try {
    loadServerConfig((dir / "absent.json").string());
    FAIL() << "expected SyncError";
  } catch (const SyncError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Config);
    EXPECT_STREQ(e.what(), "No master key set!");
  }
}

TEST_F(ConfigTest, EnvironmentMasterKeyIsEnough) {
  setenv("MODSYNC_MASTER_KEY", "env-key", 1);
  auto config = loadServerConfig((dir / "absent.json").string());
  EXPECT_EQ(config.master_key, "env-key");
  EXPECT_EQ(config.port, 7040);
}
