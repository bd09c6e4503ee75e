#pragma once

#include <memory>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace phub::core {

// Single io_context driven by one background thread. Hosts the deadline timers of the
// pipeline so that waiting on a deadline never occupies a caller thread.
class TimerService {
public:
    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    boost::asio::io_context& context() noexcept { return ioc_; }

    // Lets queued handlers finish, then joins the thread. Idempotent.
    void stop();

private:
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread thread_;
};

}  // namespace phub::core
