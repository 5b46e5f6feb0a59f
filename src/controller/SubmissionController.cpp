#include "contactform/controller/SubmissionController.hpp"
#include "contactform/util/JsonResponse.hpp"
#include "contactform/util/Logging.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <exception>
#include <optional>
#include <string>

namespace contactform::controller {
namespace {

constexpr const char* kSuccessMessage = "Form submitted successfully!";
constexpr const char* kMissingFieldsError = "Missing required fields: name, email, message";
constexpr const char* kInternalError = "An internal error occurred.";

std::optional<std::string> requestBody(const contactform::server::RequestContext& ctx) {
    if (ctx.request.body().empty()) {
        return std::nullopt;
    }
    return ctx.request.body();
}

} // namespace

SubmissionController::SubmissionController(service::SubmissionService& submissionService)
    : submissionService_(submissionService) {}

void SubmissionController::registerRoutes(contactform::server::Router& router) {
    router.addRoute("POST", "/submit", [this](auto& ctx) { handleSubmit(ctx); });
    router.addRoute("POST", "/api/submissions", [this](auto& ctx) { handleSubmit(ctx); });
}

void SubmissionController::handleSubmit(contactform::server::RequestContext& ctx) {
    util::log(util::LogLevel::info,
              "Received request: " + std::string(ctx.request.method_string()) + " " +
                  std::string(ctx.request.target()) + " " + ctx.request.body());

    try {
        auto result = submissionService_.submit(requestBody(ctx));
        switch (result.status) {
        case service::SubmissionResult::Status::accepted:
            util::sendJsonResponse(ctx, boost::beast::http::status::ok,
                                   boost::json::object{{"message", kSuccessMessage}});
            return;
        case service::SubmissionResult::Status::invalid:
            util::sendJsonError(ctx, boost::beast::http::status::bad_request, kMissingFieldsError);
            return;
        case service::SubmissionResult::Status::failed:
            break;
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Error processing request: "} + ex.what());
    }
    util::sendJsonError(ctx, boost::beast::http::status::internal_server_error, kInternalError);
}

} // namespace contactform::controller
