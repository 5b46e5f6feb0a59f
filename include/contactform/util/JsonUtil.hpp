#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace contactform::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Integer at key when present and within [min, max]. A present value of the
// wrong type or out of range is logged and reported as nullopt.
std::optional<std::int64_t> readIntInRange(const boost::json::object& object,
                                           const char* key,
                                           std::int64_t min,
                                           std::int64_t max);

} // namespace contactform::util
