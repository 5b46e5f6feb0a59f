#pragma once

#include <boost/json.hpp>
#include <string>

namespace contactform::model {

// Fields a caller must supply. Values are kept as received.
struct SubmissionInput {
    std::string name;
    std::string email;
    std::string message;
};

struct Submission {
    std::string id;
    std::string name;
    std::string email;
    std::string message;
    std::string submittedAt;
};

boost::json::object toJson(const Submission& submission);

} // namespace contactform::model
