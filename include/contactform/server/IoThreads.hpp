#pragma once

#include <boost/asio/io_context.hpp>

#include <thread>
#include <vector>

namespace contactform::server {

// Extra threads running an io_context. The destructor stops the context and
// joins, so an exception on the owning thread never meets a joinable thread.
class IoThreads {
public:
    explicit IoThreads(boost::asio::io_context& io) : io_(io) {}
    IoThreads(const IoThreads&) = delete;
    IoThreads& operator=(const IoThreads&) = delete;

    ~IoThreads() {
        io_.stop();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void spawn(unsigned int count) {
        threads_.reserve(threads_.size() + count);
        for (unsigned int i = 0; i < count; ++i) {
            threads_.emplace_back([this]() { io_.run(); });
        }
    }

    std::size_t size() const noexcept { return threads_.size(); }

private:
    boost::asio::io_context& io_;
    std::vector<std::thread> threads_;
};

} // namespace contactform::server
