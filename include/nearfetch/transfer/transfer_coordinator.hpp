#pragma once

#include "transfer_operation.hpp"
#include "operation_registry.hpp"
#include "permission_gate.hpp"
#include "../network/peer_transport.hpp"
#include "../network/session_context.hpp"
#include "../storage/file_store.hpp"
#include "../core/callback_context.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nearfetch::core {
class Config;
}

namespace nearfetch::transfer {

struct CoordinatorOptions {
    std::chrono::milliseconds scheduler_interval = DEFAULT_SCHEDULER_INTERVAL;
    std::chrono::milliseconds accept_timeout = DEFAULT_ACCEPT_TIMEOUT;
    std::chrono::milliseconds invite_timeout = DEFAULT_INVITE_TIMEOUT;

    static CoordinatorOptions from_config(const core::Config& config);
};

// Drives downloads and uploads over one shared transport session.
//
// Transport events, alarms, scheduler ticks and the public mutators below are
// all funneled onto the CallbackContext, so coordinator state is only ever
// touched from that context and user callbacks never run concurrently.
// request_download() is the exception: admission happens on the caller's
// thread so that conflicts can be reported synchronously.
class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator> {
public:
    static std::shared_ptr<TransferCoordinator> create(
        std::shared_ptr<network::PeerTransport> transport,
        std::shared_ptr<storage::FileStore> file_store,
        std::shared_ptr<PermissionGate> permission_gate,
        std::shared_ptr<core::CallbackContext> context,
        CoordinatorOptions options = CoordinatorOptions{});

    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Returns ALREADY_IN_PROGRESS, leaving `operation` empty, when another
    // transfer holds the session.
    TransferResult request_download(const std::string& file_id,
                                    ProgressCallback on_progress,
                                    CompletionCallback on_complete,
                                    std::shared_ptr<TransferOperation>& operation);

    void set_upload_callbacks(ProgressCallback on_progress, CompletionCallback on_complete);
    void set_upload_permission_override(PermissionOverride permission_override);

    void start_listening();
    void stop_listening();

    void suspend();
    void resume();

    void cancel_all();

    bool is_listening() const;
    bool is_advertising() const;
    bool is_suspended() const;
    network::SessionContext session() const;

    std::shared_ptr<OperationRegistry> registry() const { return registry_; }
    const CoordinatorOptions& options() const { return options_; }

private:
    TransferCoordinator(std::shared_ptr<network::PeerTransport> transport,
                        std::shared_ptr<storage::FileStore> file_store,
                        std::shared_ptr<PermissionGate> permission_gate,
                        std::shared_ptr<core::CallbackContext> context,
                        CoordinatorOptions options);

    using Task = std::function<void(TransferCoordinator&)>;

    void install_transport_handlers();
    void post_event(Task task);
    void dispatch(Task task);
    OperationHooks make_hooks();

    // Transport events
    void handle_peer_found(const PeerId& peer, const DiscoveryPayload& payload);
    void handle_peer_lost(const PeerId& peer);
    void handle_invitation(const PeerId& peer, const DiscoveryPayload& context,
                           const network::InvitationHandler& accept);
    void handle_session_state(const PeerId& peer, network::SessionState state);
    void handle_receive_started(const std::string& name, const PeerId& peer,
                                std::shared_ptr<ProgressSource> progress);
    void handle_receive_finished(const std::string& name, const PeerId& peer,
                                 const std::optional<std::filesystem::path>& location,
                                 const TransferResult& result);
    void handle_advertising_failed(const TransferResult& result);
    void handle_browsing_failed(const TransferResult& result);

    // Operation hooks
    void handle_operation_started(const std::shared_ptr<TransferOperation>& operation);
    void handle_operation_stopped(const std::shared_ptr<TransferOperation>& operation);
    void handle_cancel_request(const std::shared_ptr<TransferOperation>& operation);

    // Download
    void arm_acceptance_alarm(const std::shared_ptr<TransferOperation>& download);
    void cancel_acceptance_alarm(const std::shared_ptr<TransferOperation>& download);
    void handle_acceptance_timeout(const std::shared_ptr<TransferOperation>& download);
    void finish_download(const std::shared_ptr<TransferOperation>& download, const std::string& name,
                         const std::optional<std::filesystem::path>& location,
                         const TransferResult& transport_result);

    // Upload
    void handle_permission_decision(const std::shared_ptr<TransferOperation>& upload, bool granted);
    void begin_upload_send(const std::shared_ptr<TransferOperation>& upload);
    void handle_upload_sent(const std::shared_ptr<TransferOperation>& upload,
                            const std::filesystem::path& location, const TransferResult& result);
    void finish_upload(const std::shared_ptr<TransferOperation>& upload, const TransferResult& result,
                       bool bypass_barrier);
    ProgressCallback make_upload_progress_callback() const;

    // Session
    void cancel_all_operations(const TransferResult& result);
    void start_listening_internal();
    void stop_listening_internal();
    void stop_advertising_internal();
    void disconnect_session();
    void update_session(const network::SessionContext& next);

    static void deliver(const CompletionCallback& completion,
                        const std::shared_ptr<TransferOperation>& operation,
                        const TransferResult& result);

    std::shared_ptr<network::PeerTransport> transport_;
    std::shared_ptr<storage::FileStore> file_store_;
    std::shared_ptr<PermissionGate> permission_gate_;
    std::shared_ptr<core::CallbackContext> context_;
    std::shared_ptr<OperationRegistry> registry_;
    CoordinatorOptions options_;

    mutable std::mutex session_mutex_;
    network::SessionContext session_;

    // Context-only state
    ProgressCallback upload_progress_callback_;
    CompletionCallback upload_completion_callback_;
    PermissionOverride permission_override_;
    std::map<std::string, std::shared_ptr<core::Alarm>> acceptance_alarms_;
};

} // namespace nearfetch::transfer
