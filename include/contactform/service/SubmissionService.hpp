#pragma once

#include "contactform/model/Submission.hpp"
#include "contactform/repository/SubmissionStore.hpp"

#include <boost/json.hpp>

#include <optional>
#include <string>

namespace contactform::service {

struct SubmissionResult {
    enum class Status {
        accepted,
        invalid,
        failed
    };

    Status status{Status::failed};
    std::optional<model::Submission> record;
};

// Absent body parses as {}. Throws on malformed JSON or a non-object document.
boost::json::object parseSubmissionBody(const std::optional<std::string>& body);

// nullopt when name, email or message is missing. Non-string values are kept
// as their JSON text.
std::optional<model::SubmissionInput> validateSubmission(const boost::json::object& body);

model::Submission buildSubmission(model::SubmissionInput input,
                                  std::string id,
                                  std::string submittedAt);

class SubmissionService {
public:
    explicit SubmissionService(repository::SubmissionStore& store);

    SubmissionResult submit(const std::optional<std::string>& body);

private:
    repository::SubmissionStore& store_;
};

} // namespace contactform::service
