#include "contactform/model/Submission.hpp"

namespace contactform::model {

boost::json::object toJson(const Submission& submission) {
    boost::json::object json;
    json["id"] = submission.id;
    json["name"] = submission.name;
    json["email"] = submission.email;
    json["message"] = submission.message;
    json["submittedAt"] = submission.submittedAt;
    return json;
}

} // namespace contactform::model
