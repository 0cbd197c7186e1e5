#include "nearfetch/core/callback_context.hpp"
#include "nearfetch/core/logger.hpp"
#include <boost/asio/post.hpp>

namespace nearfetch::core {

Alarm::Alarm(StrandExecutor executor, std::function<void()> task)
    : executor_(executor)
    , timer_(executor)
    , task_(std::move(task))
    , cancelled_(false)
    , fired_(false) {
}

void Alarm::arm(std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->fire(ec);
    });
}

void Alarm::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }

    // The timer is only touched from the strand.
    boost::asio::post(executor_, [self = shared_from_this()]() {
        self->timer_.cancel();
        self->task_ = nullptr;
    });
}

void Alarm::fire(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || cancelled_) {
        return;
    }

    fired_ = true;
    auto task = std::move(task_);
    task_ = nullptr;

    if (task) {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Alarm task failed: {}", e.what());
        }
    }
}

CallbackContext::CallbackContext()
    : io_context_()
    , strand_(boost::asio::make_strand(io_context_))
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , running_(false) {
}

CallbackContext::~CallbackContext() {
    stop();
}

void CallbackContext::post(std::function<void()> task) {
    if (!task) {
        return;
    }

    boost::asio::post(strand_, [task = std::move(task)]() {
        run_task(task);
    });
}

std::shared_ptr<Alarm> CallbackContext::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    auto alarm = std::make_shared<Alarm>(strand_, std::move(task));
    alarm->arm(delay);
    return alarm;
}

bool CallbackContext::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Callback context already running");
        return false;
    }

    if (io_context_.stopped()) {
        io_context_.restart();
    }

    thread_ = std::thread([this]() {
        LOG_DEBUG("Callback context thread started");
        io_context_.run();
        LOG_DEBUG("Callback context thread stopped");
    });

    return true;
}

void CallbackContext::stop() {
    work_guard_.reset();
    io_context_.stop();

    if (thread_.joinable()) {
        thread_.join();
    }

    running_ = false;
}

std::size_t CallbackContext::poll() {
    if (io_context_.stopped()) {
        io_context_.restart();
    }
    return io_context_.poll();
}

std::size_t CallbackContext::run_for(std::chrono::milliseconds duration) {
    if (io_context_.stopped()) {
        io_context_.restart();
    }
    return io_context_.run_for(duration);
}

void CallbackContext::run_task(const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR("Callback context task failed: {}", e.what());
    }
}

} // namespace nearfetch::core
