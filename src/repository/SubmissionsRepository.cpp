#include "contactform/repository/SubmissionsRepository.hpp"
#include "contactform/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace contactform::repository {
namespace {
constexpr std::size_t kMaxIdentifierLength = 64;
}

SubmissionsRepository::SubmissionsRepository(MySqlConnectionPool& pool, std::string tableName)
    : pool_(pool)
    , tableName_(std::move(tableName)) {
    if (!isValidTableName(tableName_)) {
        throw std::invalid_argument("Invalid table name: '" + tableName_ + "'");
    }
    replaceSql_ = "REPLACE INTO `" + pool_.schemaName() + "`.`" + tableName_ +
                  "` (id, name, email, message, submitted_at) VALUES (?, ?, ?, ?, ?)";
}

bool SubmissionsRepository::isValidTableName(const std::string& name) {
    if (name.empty() || name.size() > kMaxIdentifierLength) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '$' || c == '-';
    });
}

void SubmissionsRepository::put(const model::Submission& submission) {
    auto session = pool_.acquire();
    try {
        session->sql(replaceSql_)
            .bind(submission.id)
            .bind(submission.name)
            .bind(submission.email)
            .bind(submission.message)
            .bind(submission.submittedAt)
            .execute();
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"Put submission failed: "} + err.what());
        pool_.invalidate(session);
        throw;
    }
}

} // namespace contactform::repository
