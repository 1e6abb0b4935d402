#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>
#include <cstdint>

namespace hearth {

// ============================================================================
// Scheduler interface - where status callbacks are delivered
// ============================================================================
//
// Applications with a UI thread provide their own implementation that hops
// onto that thread; the default runs callbacks inline.

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // May return false if the event loop isn't running.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Periodic task - cancellable repeating timer on a dedicated worker thread
// ============================================================================
//
// stop() cancels future ticks and joins the worker. A tick already running
// is allowed to finish; stop() returns after it does. Called from inside a
// tick, stop() only cancels; the worker is joined by a later stop() on
// another thread or by the destructor. start() from inside a tick throws
// std::logic_error.

class periodic_task {
public:
    using callback_t = std::function<void()>;

    periodic_task() = default;
    ~periodic_task() { stop(); }

    periodic_task(const periodic_task&) = delete;
    periodic_task& operator=(const periodic_task&) = delete;

    /// Starts ticking every `interval`. Restarts if already running.
    void start(std::chrono::milliseconds interval, callback_t fn);

    void stop();

    bool is_running() const { return running_.load(); }

    /// Number of ticks delivered since the last start().
    uint64_t tick_count() const { return ticks_.load(); }

private:
    void run_loop(std::chrono::milliseconds interval);

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    callback_t fn_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
};

} // namespace hearth
