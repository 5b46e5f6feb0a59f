#include "contactform/config/AppConfig.hpp"
#include "contactform/util/JsonUtil.hpp"
#include "contactform/util/Logging.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace contactform::config {
namespace {

constexpr unsigned long kMaxPort = 65535;

// Plain decimal digits only: strtoul would otherwise accept a sign or leading
// blanks and wrap "-1" to ULONG_MAX.
std::optional<unsigned long> readUnsigned(const char* name, const char* text,
                                          unsigned long min, unsigned long max) {
    auto reject = [&]() -> std::optional<unsigned long> {
        util::log(util::LogLevel::warn, std::string{"Ignoring "} + name + "='" + text + "': expected an integer in [" +
                                            std::to_string(min) + ", " + std::to_string(max) + "]");
        return std::nullopt;
    };
    if (!std::isdigit(static_cast<unsigned char>(text[0]))) {
        return reject();
    }
    errno = 0;
    char* end = nullptr;
    auto value = std::strtoul(text, &end, 10);
    if (errno == ERANGE || *end != '\0' || value < min || value > max) {
        return reject();
    }
    return value;
}

void applyServer(const boost::json::object& json, ServerConfig& server) {
    if (auto it = json.if_contains("host"); it && it->is_string()) server.host = std::string(it->as_string());
    if (auto port = util::readIntInRange(json, "port", 1, kMaxPort)) {
        server.port = static_cast<unsigned short>(*port);
    }
    if (auto threads = util::readIntInRange(json, "ioThreads", 1, kMaxIoThreads)) {
        server.ioThreads = static_cast<unsigned int>(*threads);
    }
}

void applyFile(const std::filesystem::path& path, AppConfig& config) {
    if (!std::filesystem::exists(path)) {
        util::log(util::LogLevel::debug, "No config file at " + path.string() + ", using defaults");
        return;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        util::log(util::LogLevel::warn, "Cannot open config file " + path.string());
        return;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return;
    }
    try {
        auto json = util::parseJson(content);
        if (!json.is_object()) {
            util::log(util::LogLevel::warn, "Config file " + path.string() + " is not a JSON object");
            return;
        }
        const auto& root = json.as_object();
        if (auto it = root.if_contains("server"); it && it->is_object()) {
            applyServer(it->as_object(), config.server);
        }
        if (auto it = root.if_contains("database"); it && it->is_object()) {
            config.database = repository::loadConfig(it->as_object(), config.database);
        }
        if (auto it = root.if_contains("logLevel"); it && it->is_string()) {
            config.logLevel = util::parseLogLevel(std::string(it->as_string()));
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Failed to parse config file: "} + ex.what());
    }
}

} // namespace

void applyEnvironment(AppConfig& config) {
    auto& db = config.database;
    if (const char* value = std::getenv("TABLE_NAME")) db.table = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_HOST")) db.host = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_PORT")) {
        if (auto port = readUnsigned("CONTACTFORM_DB_PORT", value, 1, kMaxPort)) {
            db.port = static_cast<std::uint16_t>(*port);
        }
    }
    if (const char* value = std::getenv("CONTACTFORM_DB_USER")) db.user = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_PASSWORD")) db.password = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_NAME")) db.database = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_CHARSET")) db.charset = value;
    if (const char* value = std::getenv("CONTACTFORM_DB_POOL")) {
        if (auto size = readUnsigned("CONTACTFORM_DB_POOL", value, 1, repository::kMaxPoolSize)) {
            db.poolSize = static_cast<unsigned int>(*size);
        }
    }

    auto& server = config.server;
    if (const char* value = std::getenv("CONTACTFORM_HTTP_HOST")) server.host = value;
    if (const char* value = std::getenv("CONTACTFORM_HTTP_PORT")) {
        if (auto port = readUnsigned("CONTACTFORM_HTTP_PORT", value, 1, kMaxPort)) {
            server.port = static_cast<unsigned short>(*port);
        }
    }
    if (const char* value = std::getenv("CONTACTFORM_IO_THREADS")) {
        if (auto threads = readUnsigned("CONTACTFORM_IO_THREADS", value, 1, kMaxIoThreads)) {
            server.ioThreads = static_cast<unsigned int>(*threads);
        }
    }

    if (const char* value = std::getenv("CONTACTFORM_LOG_LEVEL")) config.logLevel = util::parseLogLevel(value);
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;
    applyFile(path, config);
    applyEnvironment(config);
    return config;
}

} // namespace contactform::config
