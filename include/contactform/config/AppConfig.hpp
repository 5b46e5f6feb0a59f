#pragma once

#include "contactform/repository/DatabaseConfig.hpp"
#include "contactform/util/Logging.hpp"

#include <filesystem>
#include <string>

namespace contactform::config {

inline constexpr unsigned int kMaxIoThreads = 64;

struct ServerConfig {
    std::string host{"0.0.0.0"};
    unsigned short port{8080};
    unsigned int ioThreads{2};
};

struct AppConfig {
    ServerConfig server;
    repository::DatabaseConfig database;
    util::LogLevel logLevel{util::LogLevel::info};
};

// Defaults, then the JSON file at path (if present), then environment
// variables. A missing file is fine; a malformed one is logged and skipped.
// Numeric settings outside their range are logged and leave the earlier value.
AppConfig loadAppConfig(const std::filesystem::path& path);

void applyEnvironment(AppConfig& config);

} // namespace contactform::config
