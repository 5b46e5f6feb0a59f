#pragma once

#include "contactform/server/RequestContext.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace contactform::server {

// Exact method + path dispatch. Methods are case-insensitive; the query string
// and a single trailing slash on the request target are ignored.
class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    // Replaces any handler already registered for the same method and path.
    void addRoute(std::string_view method, std::string_view path, Handler handler);

    // Empty handler when nothing matches.
    Handler resolve(std::string_view method, std::string_view target) const;

private:
    static std::string routeKey(std::string_view method, std::string_view path);

    std::unordered_map<std::string, Handler> routes_;
};

} // namespace contactform::server
