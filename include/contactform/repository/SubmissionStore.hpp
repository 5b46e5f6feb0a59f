#pragma once

#include "contactform/model/Submission.hpp"

namespace contactform::repository {

// Durable key-value store for submissions, keyed by Submission::id.
class SubmissionStore {
public:
    virtual ~SubmissionStore() = default;

    /**
     * Insert-or-replace the record under its id. Throws on any store failure;
     * there is no retry.
     */
    virtual void put(const model::Submission& submission) = 0;
};

} // namespace contactform::repository
