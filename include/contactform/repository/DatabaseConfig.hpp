#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <string>

namespace contactform::repository {

inline constexpr const char* kDefaultTableName = "ContactFormSubmissions";
inline constexpr unsigned int kMaxPoolSize = 64;

struct DatabaseConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{33060};
    std::string user{"root"};
    std::string password;
    std::string database{"contact_form"};
    std::string table{kDefaultTableName};
    std::string charset{"utf8mb4"};
    unsigned int poolSize{4};
};

// Overlays the keys present in json onto base. Keys of the wrong type or out
// of range are logged and skipped.
DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base = {});

} // namespace contactform::repository
