#include "nearfetch/transfer/operation_registry.hpp"
#include "nearfetch/core/logger.hpp"
#include <algorithm>

namespace nearfetch::transfer {

OperationRegistry::OperationRegistry(std::shared_ptr<core::CallbackContext> context)
    : context_(std::move(context))
    , scheduler_interval_(DEFAULT_SCHEDULER_INTERVAL)
    , scheduler_running_(false) {
}

OperationRegistry::~OperationRegistry() {
    stop_scheduler();
}

bool OperationRegistry::try_add(const OperationPtr& operation) {
    if (!operation) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!admissible(operation)) {
        return false;
    }

    operations_.push_back(operation);
    if (!operation->has_started()) {
        operation->set_state(OperationState::QUEUED);
    }

    LOG_DEBUG("Admitted {} operation {} for {} ({} registered)",
              to_string(operation->get_kind()), operation->get_id(),
              operation->get_file_id(), operations_.size());
    return true;
}

bool OperationRegistry::admissible(const OperationPtr& operation) const {
    if (operation->is_terminated()) {
        LOG_DEBUG("Rejected operation {}: already terminated", operation->get_id());
        return false;
    }

    bool has_download = false;
    bool has_upload = false;
    for (const auto& existing : operations_) {
        if (existing == operation) {
            LOG_DEBUG("Rejected operation {}: already registered", operation->get_id());
            return false;
        }
        has_download = has_download || existing->is_download();
        has_upload = has_upload || existing->is_upload();
    }

    if (operation->is_download()) {
        if (has_download || has_upload) {
            LOG_DEBUG("Rejected download {} for {}: session busy ({})", operation->get_id(),
                      operation->get_file_id(), has_download ? "download" : "upload");
            return false;
        }
        return true;
    }

    auto peer = operation->get_remote_peer();
    if (!peer) {
        LOG_DEBUG("Rejected upload {}: no remote peer", operation->get_id());
        return false;
    }

    if (has_download) {
        LOG_DEBUG("Rejected upload {} to {}: download registered", operation->get_id(), *peer);
        return false;
    }

    for (const auto& existing : operations_) {
        if (existing->is_upload() && existing->get_remote_peer() == peer) {
            LOG_DEBUG("Rejected upload {} to {}: peer already served by {}",
                      operation->get_id(), *peer, existing->get_id());
            return false;
        }
    }
    return true;
}

bool OperationRegistry::remove(const OperationPtr& operation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find(operations_.begin(), operations_.end(), operation);
    if (it == operations_.end()) {
        return false;
    }

    operations_.erase(it);
    LOG_DEBUG("Removed operation {} ({} registered)", operation->get_id(), operations_.size());
    return true;
}

void OperationRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!operations_.empty()) {
        LOG_DEBUG("Clearing {} registered operations", operations_.size());
    }
    operations_.clear();
}

std::vector<OperationRegistry::OperationPtr> OperationRegistry::query(const Predicate& predicate) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<OperationPtr> result;
    for (const auto& operation : operations_) {
        if (!predicate || predicate(operation)) {
            result.push_back(operation);
        }
    }
    return result;
}

std::vector<OperationRegistry::OperationPtr> OperationRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return operations_;
}

OperationRegistry::OperationPtr OperationRegistry::find(OperationKind kind, const PeerId& peer) const {
    auto matches = query(by_peer(kind, peer));
    return matches.empty() ? nullptr : matches.front();
}

OperationRegistry::OperationPtr OperationRegistry::current_download() const {
    auto downloads = query(by_kind(OperationKind::DOWNLOAD));
    return downloads.empty() ? nullptr : downloads.front();
}

bool OperationRegistry::contains(const OperationPtr& operation) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::find(operations_.begin(), operations_.end(), operation) != operations_.end();
}

size_t OperationRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return operations_.size();
}

bool OperationRegistry::empty() const {
    return size() == 0;
}

OperationRegistry::Predicate OperationRegistry::by_kind(OperationKind kind) {
    return [kind](const OperationPtr& operation) {
        return operation->get_kind() == kind;
    };
}

OperationRegistry::Predicate OperationRegistry::running(OperationKind kind, const std::string& file_id) {
    return [kind, file_id](const OperationPtr& operation) {
        return operation->get_kind() == kind &&
               operation->is_running() &&
               operation->get_file_id() == file_id;
    };
}

OperationRegistry::Predicate OperationRegistry::not_started(OperationKind kind) {
    return [kind](const OperationPtr& operation) {
        return operation->get_kind() == kind && !operation->has_started();
    };
}

OperationRegistry::Predicate OperationRegistry::by_peer(OperationKind kind, const PeerId& peer) {
    return [kind, peer](const OperationPtr& operation) {
        return operation->get_kind() == kind && operation->get_remote_peer() == peer;
    };
}

void OperationRegistry::start_scheduler(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    if (scheduler_running_) {
        return;
    }

    scheduler_interval_ = interval;
    scheduler_running_ = true;
    arm_scheduler();
    LOG_DEBUG("Download scheduler started ({} ms)", interval.count());
}

void OperationRegistry::stop_scheduler() {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    if (!scheduler_running_) {
        return;
    }

    scheduler_running_ = false;
    if (scheduler_alarm_) {
        scheduler_alarm_->cancel();
        scheduler_alarm_.reset();
    }
    LOG_DEBUG("Download scheduler stopped");
}

bool OperationRegistry::is_scheduler_running() const {
    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    return scheduler_running_;
}

void OperationRegistry::tick() {
    auto downloads = query(by_kind(OperationKind::DOWNLOAD));
    if (downloads.empty()) {
        return;
    }

    bool any_running = std::any_of(downloads.begin(), downloads.end(),
                                   [](const OperationPtr& operation) { return operation->is_running(); });
    if (any_running) {
        return;
    }

    for (const auto& download : downloads) {
        if (download->get_state() == OperationState::QUEUED) {
            LOG_DEBUG("Promoting queued download {} for {}", download->get_id(), download->get_file_id());
            download->start();
            return;
        }
    }
}

// Caller holds scheduler_mutex_.
void OperationRegistry::arm_scheduler() {
    if (!context_) {
        LOG_ERROR("Download scheduler has no callback context");
        return;
    }

    std::weak_ptr<OperationRegistry> weak_self = weak_from_this();
    scheduler_alarm_ = context_->schedule(scheduler_interval_, [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->on_scheduler_fired();
        }
    });
}

void OperationRegistry::on_scheduler_fired() {
    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
        if (!scheduler_running_) {
            return;
        }
    }

    tick();

    std::lock_guard<std::mutex> lock(scheduler_mutex_);
    if (scheduler_running_) {
        arm_scheduler();
    }
}

} // namespace nearfetch::transfer
