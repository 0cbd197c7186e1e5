#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace nearfetch::core {

using StrandExecutor = boost::asio::strand<boost::asio::io_context::executor_type>;

// One-shot, cancellable timer whose task runs on the owning context's strand.
class Alarm : public std::enable_shared_from_this<Alarm> {
public:
    Alarm(StrandExecutor executor, std::function<void()> task);

    void arm(std::chrono::milliseconds delay);
    void cancel();

    bool is_cancelled() const { return cancelled_; }
    bool has_fired() const { return fired_; }

private:
    void fire(const boost::system::error_code& ec);

    StrandExecutor executor_;
    boost::asio::steady_timer timer_;
    std::function<void()> task_;
    std::atomic<bool> cancelled_;
    std::atomic<bool> fired_;
};

// Serialized event queue. Every task posted here, and every alarm, runs on a
// single strand, so tasks never overlap in time.
class CallbackContext {
public:
    CallbackContext();
    ~CallbackContext();

    CallbackContext(const CallbackContext&) = delete;
    CallbackContext& operator=(const CallbackContext&) = delete;

    void post(std::function<void()> task);
    std::shared_ptr<Alarm> schedule(std::chrono::milliseconds delay, std::function<void()> task);

    // Runs the queue on a dedicated thread.
    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Manual driving, for embedders without a dedicated thread.
    std::size_t poll();
    std::size_t run_for(std::chrono::milliseconds duration);

    bool running_in_this_thread() const { return strand_.running_in_this_thread(); }

private:
    static void run_task(const std::function<void()>& task);

    boost::asio::io_context io_context_;
    StrandExecutor strand_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;

    std::thread thread_;
    std::atomic<bool> running_;
};

} // namespace nearfetch::core
