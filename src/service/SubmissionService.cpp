#include "contactform/service/SubmissionService.hpp"
#include "contactform/util/Identifiers.hpp"
#include "contactform/util/JsonUtil.hpp"
#include "contactform/util/Logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace contactform::service {
namespace {

std::optional<std::string> readField(const boost::json::object& object, const char* key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return std::string(it->as_string().c_str(), it->as_string().size());
    }
    return util::stringifyJson(*it);
}

} // namespace

boost::json::object parseSubmissionBody(const std::optional<std::string>& body) {
    if (!body) {
        return {};
    }
    auto value = util::parseJson(*body);
    if (!value.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return std::move(value.as_object());
}

std::optional<model::SubmissionInput> validateSubmission(const boost::json::object& body) {
    auto name = readField(body, "name");
    auto email = readField(body, "email");
    auto message = readField(body, "message");
    if (!name || !email || !message) {
        return std::nullopt;
    }
    return model::SubmissionInput{std::move(*name), std::move(*email), std::move(*message)};
}

model::Submission buildSubmission(model::SubmissionInput input,
                                  std::string id,
                                  std::string submittedAt) {
    model::Submission submission;
    submission.id = std::move(id);
    submission.name = std::move(input.name);
    submission.email = std::move(input.email);
    submission.message = std::move(input.message);
    submission.submittedAt = std::move(submittedAt);
    return submission;
}

SubmissionService::SubmissionService(repository::SubmissionStore& store)
    : store_(store) {}

SubmissionResult SubmissionService::submit(const std::optional<std::string>& body) {
    SubmissionResult result;
    try {
        auto payload = parseSubmissionBody(body);

        auto input = validateSubmission(payload);
        if (!input) {
            util::log(util::LogLevel::warn, "Validation failed: missing required fields");
            result.status = SubmissionResult::Status::invalid;
            return result;
        }

        auto submission = buildSubmission(std::move(*input), util::generateUuid(), util::makeIsoTimestamp());
        store_.put(submission);
        util::log(util::LogLevel::info,
                  "Successfully saved submission: " + util::stringifyJson(model::toJson(submission)));

        result.status = SubmissionResult::Status::accepted;
        result.record = std::move(submission);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Error processing submission: "} + ex.what());
        result.status = SubmissionResult::Status::failed;
        result.record.reset();
    }
    return result;
}

} // namespace contactform::service
