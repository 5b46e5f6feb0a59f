#pragma once

#include "contactform/repository/DatabaseConfig.hpp"
#include "contactform/repository/SessionPool.hpp"

#include <mysqlx/xdevapi.h>

#include <memory>
#include <string>

namespace contactform::repository {

class MySqlConnectionPool {
public:
    explicit MySqlConnectionPool(DatabaseConfig config);

    std::shared_ptr<mysqlx::Session> acquire();

    // X DevAPI sessions do not reconnect; a session that failed a statement
    // is closed when released instead of going back to the idle list.
    void invalidate(const std::shared_ptr<mysqlx::Session>& session) noexcept;

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    std::unique_ptr<mysqlx::Session> createSession();

    DatabaseConfig config_;
    SessionPool<mysqlx::Session> sessions_;
};

} // namespace contactform::repository
