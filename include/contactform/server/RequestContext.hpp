#pragma once

#include <boost/beast/http.hpp>
#include <chrono>

namespace contactform::server {

// One request/response exchange as seen by a route handler.
struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpRequest request;
    HttpResponse response;
    std::chrono::steady_clock::time_point startedAt{std::chrono::steady_clock::now()};
};

} // namespace contactform::server
