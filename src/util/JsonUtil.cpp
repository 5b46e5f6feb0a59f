#include "contactform/util/JsonUtil.hpp"
#include "contactform/util/Logging.hpp"

namespace contactform::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<std::int64_t> readIntInRange(const boost::json::object& object,
                                           const char* key,
                                           std::int64_t min,
                                           std::int64_t max) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (!it->is_int64() || it->as_int64() < min || it->as_int64() > max) {
        log(LogLevel::warn, std::string{"Ignoring setting '"} + key + "': expected an integer in [" +
                                std::to_string(min) + ", " + std::to_string(max) + "], got " +
                                boost::json::serialize(*it));
        return std::nullopt;
    }
    return it->as_int64();
}

} // namespace contactform::util
