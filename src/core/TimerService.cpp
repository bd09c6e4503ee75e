#include "core/TimerService.hpp"

#include <exception>

#include "common/Log.hpp"

namespace phub::core {

TimerService::TimerService()
    : work_(std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
          boost::asio::make_work_guard(ioc_))) {
    thread_ = std::thread([this]() {
        for (;;) {
            try {
                ioc_.run();
                break;
            } catch (const std::exception& ex) {
                LOG_ERR("TimerService handler threw: " << ex.what());
            }
        }
        LOG_DEBUG("TimerService thread exiting");
    });
}

TimerService::~TimerService() { stop(); }

void TimerService::stop() {
    if (work_) {
        work_->reset();
        work_.reset();
    }
    if (thread_.joinable()) {
        // Timers still armed here are abandoned; owners cancel their waits first.
        ioc_.stop();
        thread_.join();
    }
}

}  // namespace phub::core
