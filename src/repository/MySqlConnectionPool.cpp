#include "contactform/repository/MySqlConnectionPool.hpp"
#include "contactform/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace contactform::repository {
namespace {

DatabaseConfig normalize(DatabaseConfig config) {
    if (config.host.empty()) {
        config.host = "127.0.0.1";
    }
    if (config.database.empty()) {
        throw std::runtime_error("Database name must be provided in configuration");
    }
    if (config.poolSize == 0) {
        config.poolSize = 4;
    }
    return config;
}

} // namespace

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config)
    : config_(normalize(std::move(config)))
    , sessions_([this]() { return createSession(); }, config_.poolSize) {}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::createSession() {
    try {
        auto session = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, config_.host,
            mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
            mysqlx::SessionOption::USER, config_.user,
            mysqlx::SessionOption::PWD, config_.password);
        if (!config_.charset.empty()) {
            session->sql("SET NAMES '" + config_.charset + "'").execute();
        }
        session->sql("USE `" + config_.database + "`").execute();

        util::log(util::LogLevel::debug,
                  "Opened MySQL session to " + config_.host + ":" + std::to_string(config_.port));
        return session;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"Create MySQL session failed: "} + err.what());
        throw;
    }
}

std::shared_ptr<mysqlx::Session> MySqlConnectionPool::acquire() {
    return sessions_.acquire();
}

void MySqlConnectionPool::invalidate(const std::shared_ptr<mysqlx::Session>& session) noexcept {
    sessions_.invalidate(session);
}

} // namespace contactform::repository
