#pragma once

#include "contactform/server/RequestContext.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

namespace contactform::util {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kAllowAnyOrigin = "*";

// Every response leaves through here so the CORS header is never missed.
inline void sendJsonResponse(server::RequestContext& ctx,
                             boost::beast::http::status status,
                             const boost::json::value& body) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, kJsonContentType);
    ctx.response.set(boost::beast::http::field::access_control_allow_origin, kAllowAnyOrigin);
    ctx.response.body() = boost::json::serialize(body);
    ctx.response.prepare_payload();
}

inline void sendJsonError(server::RequestContext& ctx,
                          boost::beast::http::status status,
                          const char* message) {
    sendJsonResponse(ctx, status, boost::json::object{{"error", message}});
}

} // namespace contactform::util
