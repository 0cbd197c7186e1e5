#pragma once

#include "transfer_types.hpp"
#include "progress_source.hpp"
#include "../core/callback_context.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nearfetch::transfer {

class TransferOperation;

using ProgressCallback = std::function<void(std::shared_ptr<TransferOperation>, double)>;
using CompletionCallback = std::function<void(std::shared_ptr<TransferOperation>, const TransferResult&)>;

// Installed by whoever drives the operation. The operation keeps nothing but
// these handles, and drops them on stop().
struct OperationHooks {
    std::function<void(const std::shared_ptr<TransferOperation>&)> on_start;
    std::function<void(const std::shared_ptr<TransferOperation>&)> on_stop;
    std::function<void(const std::shared_ptr<TransferOperation>&)> on_cancel;
};

class TransferOperation : public std::enable_shared_from_this<TransferOperation> {
public:
    TransferOperation(OperationKind kind, const std::string& file_id,
                      std::shared_ptr<core::CallbackContext> context);
    ~TransferOperation();

    TransferOperation(const TransferOperation&) = delete;
    TransferOperation& operator=(const TransferOperation&) = delete;

    // Identity
    const std::string& get_id() const { return id_; }
    OperationKind get_kind() const { return kind_; }
    const std::string& get_file_id() const { return file_id_; }
    bool is_upload() const { return kind_ == OperationKind::UPLOAD; }
    bool is_download() const { return kind_ == OperationKind::DOWNLOAD; }

    // Remote peer, bound at most once
    bool set_remote_peer(const PeerId& peer);
    std::optional<PeerId> get_remote_peer() const;
    bool has_remote_peer() const;

    // State
    OperationState get_state() const { return state_; }
    bool set_state(OperationState new_state);
    bool is_running() const;
    bool has_started() const;
    bool is_terminated() const { return state_ == OperationState::TERMINATED; }

    // Lifecycle
    bool start();
    void stop();
    void cancel();

    // Progress
    double get_progress() const { return progress_; }
    // Live fraction of the attached source, or the last progress seen.
    double get_transfer_fraction() const;
    bool update_progress(double fraction);
    void attach_progress_source(std::shared_ptr<ProgressSource> source);
    void detach_progress_source();
    void notify_progress();

    // Callbacks
    void set_callbacks(ProgressCallback progress_callback, CompletionCallback completion_callback);
    void set_progress_callback(ProgressCallback progress_callback);
    CompletionCallback take_completion_callback();
    void set_hooks(OperationHooks hooks);

    DiscoveryPayload discovery_payload() const;

private:
    static std::string generate_id();

    const std::string id_;
    const OperationKind kind_;
    const std::string file_id_;
    std::shared_ptr<core::CallbackContext> context_;

    std::atomic<OperationState> state_;
    std::atomic<double> progress_;

    mutable std::mutex mutex_;
    std::optional<PeerId> remote_peer_;
    ProgressCallback progress_callback_;
    CompletionCallback completion_callback_;
    OperationHooks hooks_;

    std::shared_ptr<ProgressSource> progress_source_;
    SubscriptionId subscription_id_;
};

} // namespace nearfetch::transfer
