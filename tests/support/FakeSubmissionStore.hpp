#pragma once

#include "contactform/model/Submission.hpp"
#include "contactform/repository/SubmissionStore.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace contactform::testing {

/// Records every put() in memory.
class RecordingSubmissionStore : public repository::SubmissionStore {
public:
    void put(const model::Submission& submission) override { records.push_back(submission); }

    std::vector<model::Submission> records;
};

/// Fails every put() the way an unreachable database would.
class FailingSubmissionStore : public repository::SubmissionStore {
public:
    explicit FailingSubmissionStore(std::string reason = "connection refused")
        : reason_(std::move(reason)) {}

    void put(const model::Submission&) override {
        ++attempts;
        throw std::runtime_error(reason_);
    }

    int attempts{0};

private:
    std::string reason_;
};

} // namespace contactform::testing
