/**
 * @file test_config.cpp
 * @brief Defaults < JSON file < environment, including the TABLE_NAME fallback.
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "contactform/config/AppConfig.hpp"
#include "contactform/repository/DatabaseConfig.hpp"

using contactform::config::AppConfig;
using contactform::config::loadAppConfig;
using contactform::util::LogLevel;

namespace {

const char* kManagedVariables[] = {
    "TABLE_NAME",
    "CONTACTFORM_DB_HOST",
    "CONTACTFORM_DB_PORT",
    "CONTACTFORM_DB_USER",
    "CONTACTFORM_DB_PASSWORD",
    "CONTACTFORM_DB_NAME",
    "CONTACTFORM_DB_CHARSET",
    "CONTACTFORM_DB_POOL",
    "CONTACTFORM_HTTP_HOST",
    "CONTACTFORM_HTTP_PORT",
    "CONTACTFORM_IO_THREADS",
    "CONTACTFORM_LOG_LEVEL",
};

class AppConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const char* name : kManagedVariables) {
      unsetenv(name);
    }
    dir_ = std::filesystem::temp_directory_path() /
           ("contactform-config-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    for (const char* name : kManagedVariables) {
      unsetenv(name);
    }
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::filesystem::path writeFile(const std::string& content) {
    auto path = dir_ / "contactform.json";
    std::ofstream ofs(path);
    ofs << content;
    return path;
  }

  std::filesystem::path dir_;
};

} // namespace

TEST_F(AppConfigTest, MissingFileUsesDefaults) {
  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.database.table, "ContactFormSubmissions");
  EXPECT_EQ(config.database.host, "127.0.0.1");
  EXPECT_EQ(config.database.port, 33060);
  EXPECT_EQ(config.database.database, "contact_form");
  EXPECT_EQ(config.database.poolSize, 4u);
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.server.ioThreads, 2u);
  EXPECT_EQ(config.logLevel, LogLevel::info);
}

TEST_F(AppConfigTest, FileOverridesDefaults) {
  auto path = writeFile(R"({
    "logLevel": "debug",
    "server": {"host": "127.0.0.1", "port": 9090, "ioThreads": 4},
    "database": {"host": "db.internal", "port": 33070, "table": "Leads", "poolSize": 2}
  })");

  auto config = loadAppConfig(path);

  EXPECT_EQ(config.logLevel, LogLevel::debug);
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 9090);
  EXPECT_EQ(config.server.ioThreads, 4u);
  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 33070);
  EXPECT_EQ(config.database.table, "Leads");
  EXPECT_EQ(config.database.poolSize, 2u);
  EXPECT_EQ(config.database.user, "root");
}

TEST_F(AppConfigTest, EnvironmentOverridesFile) {
  auto path = writeFile(R"({"database": {"table": "FromFile", "host": "file-host"}})");
  setenv("TABLE_NAME", "FromEnv", 1);
  setenv("CONTACTFORM_HTTP_PORT", "8181", 1);
  setenv("CONTACTFORM_DB_POOL", "0", 1);
  setenv("CONTACTFORM_LOG_LEVEL", "ERROR", 1);

  auto config = loadAppConfig(path);

  EXPECT_EQ(config.database.table, "FromEnv");
  EXPECT_EQ(config.database.host, "file-host");
  EXPECT_EQ(config.server.port, 8181);
  EXPECT_EQ(config.database.poolSize, 4u);
  EXPECT_EQ(config.logLevel, LogLevel::error);
}

TEST_F(AppConfigTest, MalformedFileIsIgnored) {
  auto path = writeFile("{ not json");

  auto config = loadAppConfig(path);

  EXPECT_EQ(config.database.table, "ContactFormSubmissions");
  EXPECT_EQ(config.server.port, 8080);
}

TEST_F(AppConfigTest, NonNumericEnvironmentKeepsPrevious) {
  setenv("CONTACTFORM_DB_PORT", "abc", 1);

  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.database.port, 33060);
}

TEST_F(AppConfigTest, PortAboveRangeKeepsPrevious) {
  setenv("CONTACTFORM_HTTP_PORT", "70000", 1);
  setenv("CONTACTFORM_DB_PORT", "65536", 1);

  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.database.port, 33060);
}

TEST_F(AppConfigTest, NegativeCountsKeepPrevious) {
  setenv("CONTACTFORM_IO_THREADS", "-1", 1);
  setenv("CONTACTFORM_DB_POOL", "-1", 1);
  setenv("CONTACTFORM_HTTP_PORT", "-1", 1);

  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.server.ioThreads, 2u);
  EXPECT_EQ(config.database.poolSize, 4u);
  EXPECT_EQ(config.server.port, 8080);
}

TEST_F(AppConfigTest, SignsBlanksAndHugeValuesRejected) {
  setenv("CONTACTFORM_HTTP_PORT", "+9090", 1);
  setenv("CONTACTFORM_DB_PORT", " 33070", 1);
  setenv("CONTACTFORM_IO_THREADS", "99999999999999999999999", 1);

  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.database.port, 33060);
  EXPECT_EQ(config.server.ioThreads, 2u);
}

TEST_F(AppConfigTest, BoundaryValuesAccepted) {
  setenv("CONTACTFORM_HTTP_PORT", "65535", 1);
  setenv("CONTACTFORM_IO_THREADS", "64", 1);

  auto config = loadAppConfig(dir_ / "absent.json");

  EXPECT_EQ(config.server.port, 65535);
  EXPECT_EQ(config.server.ioThreads, 64u);
}

TEST_F(AppConfigTest, OutOfRangeFileValuesKeepDefaults) {
  auto path = writeFile(R"({
    "server": {"port": 70000, "ioThreads": -1},
    "database": {"port": 0, "poolSize": 100000}
  })");

  auto config = loadAppConfig(path);

  EXPECT_EQ(config.server.port, 8080);
  EXPECT_EQ(config.server.ioThreads, 2u);
  EXPECT_EQ(config.database.port, 33060);
  EXPECT_EQ(config.database.poolSize, 4u);
}

TEST(DatabaseConfig, WrongTypedKeysSkipped) {
  boost::json::object json{{"host", 5}, {"table", "Entries"}, {"poolSize", -3}};
  auto config = contactform::repository::loadConfig(json);

  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.table, "Entries");
  EXPECT_EQ(config.poolSize, 4u);
}

TEST(LogLevel, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(contactform::util::parseLogLevel("TRACE"), LogLevel::trace);
  EXPECT_EQ(contactform::util::parseLogLevel("Warning"), LogLevel::warn);
  EXPECT_EQ(contactform::util::parseLogLevel("bogus"), LogLevel::info);
}
