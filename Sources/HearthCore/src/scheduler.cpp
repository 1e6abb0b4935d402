#include "hearth/scheduler.hpp"
#include "hearth/log.hpp"
#include <stdexcept>

namespace hearth {

void periodic_task::start(std::chrono::milliseconds interval, callback_t fn) {
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        throw std::logic_error("periodic_task cannot be restarted from its own tick");
    }
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn_ = std::move(fn);
        stop_requested_ = false;
    }
    ticks_ = 0;
    running_ = true;
    worker_ = std::thread([this, interval] { run_loop(interval); });
}

void periodic_task::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    running_ = false;

    if (worker_.joinable()) {
        // From inside a tick the loop exits once the tick returns; the
        // worker is joined by the next stop() from another thread
        if (worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }
}

void periodic_task::run_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
            break;
        }
        callback_t fn = fn_;
        lock.unlock();
        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            LOG_ERROR("scheduler", "Periodic task failed: %s", e.what());
        }
        ++ticks_;
        lock.lock();
    }
}

} // namespace hearth
