#include <gtest/gtest.h>

#include "AppConfig.hpp"
#include "ArchiveErrors.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <fstream>

using namespace archiver;

namespace {

// Keeps ARCHIVER_* variables out of the way for the duration of a test.
struct ConfigFixture : ::testing::Test {
  void SetUp() override {
    for (const char *name : {"ARCHIVER_DATA_DIR", "ARCHIVER_PORT", "ARCHIVER_BROWSER"})
      unsetenv(name);
  }
  void TearDown() override { SetUp(); }
};

} // namespace

TEST_F(ConfigFixture, DefaultsToServe) {
  CommandLine cmd = ConfigLoader::parse(std::vector<std::string>{});
  EXPECT_EQ(cmd.command, "serve");
  EXPECT_EQ(cmd.config.dataDir, "archive_data");
  EXPECT_EQ(cmd.config.port, 5757);
  EXPECT_EQ(cmd.config.host, "127.0.0.1");
  EXPECT_EQ(cmd.config.maxPosts, 500);
  EXPECT_EQ(cmd.config.databasePath(), "archive_data/archive.db");
  EXPECT_EQ(cmd.config.mediaPath(), "archive_data/media");
}

TEST_F(ConfigFixture, FlagsAndCommandArguments) {
  CommandLine cmd = ConfigLoader::parse(std::vector<std::string>{
      "--data-dir", "/srv/arch", "--port=6000", "--max-posts", "40",
      "--instance", "ex.social", "archive", "@bob@ex.social"});
  EXPECT_EQ(cmd.command, "archive");
  ASSERT_EQ(cmd.args.size(), 1u);
  EXPECT_EQ(cmd.args[0], "@bob@ex.social");
  EXPECT_EQ(cmd.config.dataDir, "/srv/arch");
  EXPECT_EQ(cmd.config.port, 6000);
  EXPECT_EQ(cmd.config.maxPosts, 40);
  EXPECT_EQ(cmd.config.defaultInstance, "ex.social");
}

TEST_F(ConfigFixture, PrecedenceFileThenEnvironmentThenFlags) {
  test::TempDir dir;
  const std::string path = dir.str("config.json");
  {
    std::ofstream out(path);
    out << R"({"data_dir": "/from/file", "port": 7000, "browser": "/file/chrome",
               "max_posts": 50, "unknown_key": true})";
  }
  setenv("ARCHIVER_PORT", "7100", 1);

  CommandLine cmd = ConfigLoader::parse(
      std::vector<std::string>{"--config", path, "--browser", "/flag/chrome"});
  EXPECT_EQ(cmd.config.dataDir, "/from/file");
  EXPECT_EQ(cmd.config.port, 7100);
  EXPECT_EQ(cmd.config.browser, "/flag/chrome");
  EXPECT_EQ(cmd.config.maxPosts, 50);
}

TEST_F(ConfigFixture, WrongTypeInFileIsRejected) {
  test::TempDir dir;
  const std::string path = dir.str("config.json");
  {
    std::ofstream out(path);
    out << R"({"port": "not a number"})";
  }
  EXPECT_THROW(ConfigLoader::parse(std::vector<std::string>{"--config", path}),
               InputError);
}

TEST_F(ConfigFixture, BadCommandLinesAreRejected) {
  using Args = std::vector<std::string>;
  EXPECT_THROW(ConfigLoader::parse(Args{"--bogus"}), InputError);
  EXPECT_THROW(ConfigLoader::parse(Args{"--port"}), InputError);
  EXPECT_THROW(ConfigLoader::parse(Args{"--port", "abc"}), InputError);
  EXPECT_THROW(ConfigLoader::parse(Args{"--max-posts", "0"}), InputError);
  EXPECT_THROW(ConfigLoader::parse(Args{"frobnicate"}), InputError);
  EXPECT_THROW(ConfigLoader::parse(Args{"export", "only-one"}), InputError);
}

TEST_F(ConfigFixture, HelpSkipsArityCheck) {
  CommandLine cmd = ConfigLoader::parse(std::vector<std::string>{"archive", "--help"});
  EXPECT_TRUE(cmd.showHelp);
  EXPECT_NE(ConfigLoader::usage().find("export <post-id> <dir>"), std::string::npos);
}
