#include "contactform/repository/DatabaseConfig.hpp"
#include "contactform/util/JsonUtil.hpp"

#include <utility>

namespace contactform::repository {

DatabaseConfig loadConfig(const boost::json::object& json, DatabaseConfig base) {
    DatabaseConfig cfg = std::move(base);
    if (auto it = json.if_contains("host"); it && it->is_string()) cfg.host = std::string(it->as_string());
    if (auto port = util::readIntInRange(json, "port", 1, 65535)) cfg.port = static_cast<std::uint16_t>(*port);
    if (auto it = json.if_contains("user"); it && it->is_string()) cfg.user = std::string(it->as_string());
    if (auto it = json.if_contains("password"); it && it->is_string()) cfg.password = std::string(it->as_string());
    if (auto it = json.if_contains("database"); it && it->is_string()) cfg.database = std::string(it->as_string());
    if (auto it = json.if_contains("table"); it && it->is_string()) cfg.table = std::string(it->as_string());
    if (auto it = json.if_contains("charset"); it && it->is_string()) cfg.charset = std::string(it->as_string());
    if (auto size = util::readIntInRange(json, "poolSize", 1, kMaxPoolSize)) {
        cfg.poolSize = static_cast<unsigned int>(*size);
    }
    return cfg;
}

} // namespace contactform::repository
