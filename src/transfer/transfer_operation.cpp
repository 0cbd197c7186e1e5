#include "nearfetch/transfer/transfer_operation.hpp"
#include "nearfetch/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace nearfetch::transfer {

TransferOperation::TransferOperation(OperationKind kind, const std::string& file_id,
                                     std::shared_ptr<core::CallbackContext> context)
    : id_(generate_id())
    , kind_(kind)
    , file_id_(file_id)
    , context_(std::move(context))
    , state_(OperationState::CREATED)
    , progress_(0.0)
    , subscription_id_(0) {
}

TransferOperation::~TransferOperation() {
    detach_progress_source();
}

bool TransferOperation::set_remote_peer(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (remote_peer_) {
        LOG_WARN("Operation {} already bound to {}, ignoring {}", id_, *remote_peer_, peer);
        return false;
    }
    remote_peer_ = peer;
    return true;
}

std::optional<PeerId> TransferOperation::get_remote_peer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_peer_;
}

bool TransferOperation::has_remote_peer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_peer_.has_value();
}

bool TransferOperation::set_state(OperationState new_state) {
    if (new_state == OperationState::TERMINATED) {
        LOG_WARN("Operation {} can only terminate through stop()", id_);
        return false;
    }

    OperationState current = state_.load();
    do {
        if (current == OperationState::TERMINATED) {
            return false;
        }
    } while (!state_.compare_exchange_weak(current, new_state));

    if (current != new_state) {
        LOG_INFO("Operation {} ({} {}): {} -> {}", id_, to_string(kind_), file_id_,
                 to_string(current), to_string(new_state));
    }
    return true;
}

bool TransferOperation::is_running() const {
    OperationState state = state_;
    return state >= OperationState::ADVERTISING && state <= OperationState::FINISHING;
}

bool TransferOperation::has_started() const {
    return state_ > OperationState::QUEUED;
}

bool TransferOperation::start() {
    OperationState expected = OperationState::QUEUED;
    OperationState next = is_download() ? OperationState::ADVERTISING : OperationState::INVITING;

    if (!state_.compare_exchange_strong(expected, next)) {
        LOG_WARN("Operation {} cannot start from state {}", id_, to_string(expected));
        return false;
    }

    LOG_INFO("Operation {} ({} {}): {} -> {}", id_, to_string(kind_), file_id_,
             to_string(OperationState::QUEUED), to_string(next));

    std::function<void(const std::shared_ptr<TransferOperation>&)> on_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_start = hooks_.on_start;
    }

    auto self = weak_from_this().lock();
    if (on_start && self) {
        on_start(self);
    }
    return true;
}

void TransferOperation::stop() {
    OperationState previous = state_.exchange(OperationState::TERMINATED);
    if (previous == OperationState::TERMINATED) {
        return;
    }

    LOG_INFO("Operation {} ({} {}): {} -> {}", id_, to_string(kind_), file_id_,
             to_string(previous), to_string(OperationState::TERMINATED));

    detach_progress_source();

    OperationHooks hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks = std::move(hooks_);
        hooks_ = OperationHooks{};
        progress_callback_ = nullptr;
        completion_callback_ = nullptr;
    }

    auto self = weak_from_this().lock();
    if (hooks.on_stop && self) {
        hooks.on_stop(self);
    }
}

void TransferOperation::cancel() {
    if (is_terminated()) {
        return;
    }

    std::function<void(const std::shared_ptr<TransferOperation>&)> on_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_cancel = hooks_.on_cancel;
    }

    auto self = weak_from_this().lock();
    if (on_cancel && self) {
        on_cancel(self);
        return;
    }

    LOG_DEBUG("Operation {} has no cancel hook, stopping", id_);
    stop();
}

bool TransferOperation::update_progress(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);

    double current = progress_.load();
    while (fraction > current) {
        if (progress_.compare_exchange_weak(current, fraction)) {
            return true;
        }
    }
    return false;
}

double TransferOperation::get_transfer_fraction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (progress_source_) {
        return std::max(progress_source_->fraction_completed(), progress_.load());
    }
    return progress_;
}

void TransferOperation::attach_progress_source(std::shared_ptr<ProgressSource> source) {
    detach_progress_source();
    if (!source) {
        return;
    }

    std::weak_ptr<TransferOperation> weak_self = weak_from_this();
    std::weak_ptr<core::CallbackContext> weak_context = context_;

    SubscriptionId id = source->subscribe([weak_self, weak_context](double fraction) {
        auto context = weak_context.lock();
        if (!context) {
            return;
        }

        context->post([weak_self, fraction]() {
            auto self = weak_self.lock();
            if (!self || self->is_terminated()) {
                return;
            }
            self->update_progress(fraction);
            self->notify_progress();
        });
    });

    // Units published before the subscription existed are only visible here.
    update_progress(source->fraction_completed());

    std::lock_guard<std::mutex> lock(mutex_);
    progress_source_ = std::move(source);
    subscription_id_ = id;
}

void TransferOperation::detach_progress_source() {
    std::shared_ptr<ProgressSource> source;
    SubscriptionId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = std::move(progress_source_);
        progress_source_.reset();
        id = subscription_id_;
        subscription_id_ = 0;
    }

    if (source) {
        source->unsubscribe(id);
    }
}

void TransferOperation::notify_progress() {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = progress_callback_;
    }

    auto self = weak_from_this().lock();
    if (!callback || !self) {
        return;
    }

    try {
        callback(self, progress_);
    } catch (const std::exception& e) {
        LOG_ERROR("Progress callback for operation {} failed: {}", id_, e.what());
    }
}

void TransferOperation::set_callbacks(ProgressCallback progress_callback,
                                      CompletionCallback completion_callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_callback_ = std::move(progress_callback);
    completion_callback_ = std::move(completion_callback);
}

void TransferOperation::set_progress_callback(ProgressCallback progress_callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_callback_ = std::move(progress_callback);
}

CompletionCallback TransferOperation::take_completion_callback() {
    std::lock_guard<std::mutex> lock(mutex_);
    CompletionCallback callback = std::move(completion_callback_);
    completion_callback_ = nullptr;
    return callback;
}

void TransferOperation::set_hooks(OperationHooks hooks) {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_ = std::move(hooks);
}

DiscoveryPayload TransferOperation::discovery_payload() const {
    return make_transfer_payload(file_id_);
}

std::string TransferOperation::generate_id() {
    thread_local std::mt19937_64 generator(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> distribution;

    std::ostringstream oss;
    oss << "op_" << std::hex << std::setw(12) << std::setfill('0')
        << (distribution(generator) & 0xffffffffffffULL);
    return oss.str();
}

} // namespace nearfetch::transfer
