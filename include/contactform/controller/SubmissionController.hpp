#pragma once

#include "contactform/server/Router.hpp"
#include "contactform/service/SubmissionService.hpp"

namespace contactform::controller {

class SubmissionController {
public:
    explicit SubmissionController(service::SubmissionService& submissionService);

    void registerRoutes(contactform::server::Router& router);

    void handleSubmit(contactform::server::RequestContext& ctx);

private:
    service::SubmissionService& submissionService_;
};

} // namespace contactform::controller
