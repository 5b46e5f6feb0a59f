#pragma once

#include "contactform/repository/MySqlConnectionPool.hpp"
#include "contactform/repository/SubmissionStore.hpp"

#include <string>

namespace contactform::repository {

class SubmissionsRepository : public SubmissionStore {
public:
    // Throws std::invalid_argument unless tableName is a plain identifier.
    SubmissionsRepository(MySqlConnectionPool& pool, std::string tableName);

    void put(const model::Submission& submission) override;

    const std::string& tableName() const noexcept { return tableName_; }

    static bool isValidTableName(const std::string& name);

private:
    MySqlConnectionPool& pool_;
    std::string tableName_;
    std::string replaceSql_;
};

} // namespace contactform::repository
