#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace contactform::repository {

// Bounded pool of sessions opened on demand by the factory. A lease goes back
// to the idle list when its last shared_ptr holder lets go, unless it was
// invalidated, in which case it is closed and its slot freed. acquire()
// blocks while maxSize leases are out.
template <typename Session>
class SessionPool {
public:
    using Factory = std::function<std::unique_ptr<Session>()>;

    SessionPool(Factory factory, unsigned int maxSize)
        : factory_(std::move(factory))
        , maxSize_(maxSize == 0 ? 1 : maxSize) {
        if (!factory_) {
            throw std::invalid_argument("Session factory must be provided");
        }
        // The idle list never outgrows maxSize_, so giveBack() never reallocates.
        idle_.reserve(maxSize_);
    }

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    std::shared_ptr<Session> acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !idle_.empty() || currentSize_ < maxSize_; });

        if (!idle_.empty()) {
            std::unique_ptr<Session> session = std::move(idle_.back());
            idle_.pop_back();
            return std::shared_ptr<Session>(session.release(), Deleter{this});
        }

        // Reserve the slot before opening so other callers are not held up.
        ++currentSize_;
        lock.unlock();

        std::unique_ptr<Session> session;
        try {
            session = factory_();
            if (!session) {
                throw std::runtime_error("Session factory returned no session");
            }
        } catch (...) {
            freeSlot();
            throw;
        }
        return std::shared_ptr<Session>(session.release(), Deleter{this});
    }

    // Marks a lease as unusable. Has no effect on pointers this pool did not hand out.
    void invalidate(const std::shared_ptr<Session>& lease) noexcept {
        if (auto* deleter = std::get_deleter<Deleter>(lease)) {
            deleter->broken = true;
        }
    }

    unsigned int openCount() const {
        std::lock_guard lock(mutex_);
        return currentSize_;
    }

    std::size_t idleCount() const {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

private:
    struct Deleter {
        SessionPool* pool;
        bool broken{false};

        void operator()(Session* session) const noexcept {
            std::unique_ptr<Session> holder(session);
            if (broken) {
                holder.reset();
                pool->freeSlot();
            } else {
                pool->giveBack(std::move(holder));
            }
        }
    };

    void giveBack(std::unique_ptr<Session> session) noexcept {
        {
            std::lock_guard lock(mutex_);
            idle_.push_back(std::move(session));
        }
        cv_.notify_one();
    }

    void freeSlot() noexcept {
        {
            std::lock_guard lock(mutex_);
            --currentSize_;
        }
        cv_.notify_one();
    }

    Factory factory_;
    unsigned int maxSize_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Session>> idle_;
    unsigned int currentSize_{};
};

} // namespace contactform::repository
