#include "nearfetch/transfer/transfer_coordinator.hpp"
#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"
#include <atomic>

namespace nearfetch::transfer {

using network::SessionContext;
using network::SessionState;

namespace {

TransferResult connection_lost(const PeerId& peer) {
    return TransferResult(TransferError::CONNECTION_LOST, "Connection to " + peer + " lost.");
}

TransferResult cancelled() {
    return TransferResult(TransferError::CANCELLED, "The operation was cancelled.");
}

TransferResult as_transport_error(const TransferResult& result) {
    if (!result.success()) {
        return result;
    }
    return TransferResult(TransferError::TRANSPORT_ERROR, "Transport reported a failure");
}

}

CoordinatorOptions CoordinatorOptions::from_config(const core::Config& config) {
    CoordinatorOptions options;
    options.scheduler_interval = config.get_duration("transfer.scheduler_interval_ms", DEFAULT_SCHEDULER_INTERVAL);
    options.accept_timeout = config.get_duration("transfer.accept_timeout_ms", DEFAULT_ACCEPT_TIMEOUT);
    options.invite_timeout = config.get_duration("transfer.invite_timeout_ms", DEFAULT_INVITE_TIMEOUT);
    return options;
}

std::shared_ptr<TransferCoordinator> TransferCoordinator::create(
    std::shared_ptr<network::PeerTransport> transport,
    std::shared_ptr<storage::FileStore> file_store,
    std::shared_ptr<PermissionGate> permission_gate,
    std::shared_ptr<core::CallbackContext> context,
    CoordinatorOptions options) {

    std::shared_ptr<TransferCoordinator> coordinator(new TransferCoordinator(
        std::move(transport), std::move(file_store), std::move(permission_gate),
        std::move(context), options));
    coordinator->install_transport_handlers();
    return coordinator;
}

TransferCoordinator::TransferCoordinator(std::shared_ptr<network::PeerTransport> transport,
                                         std::shared_ptr<storage::FileStore> file_store,
                                         std::shared_ptr<PermissionGate> permission_gate,
                                         std::shared_ptr<core::CallbackContext> context,
                                         CoordinatorOptions options)
    : transport_(std::move(transport))
    , file_store_(std::move(file_store))
    , permission_gate_(std::move(permission_gate))
    , context_(std::move(context))
    , registry_(std::make_shared<OperationRegistry>(context_))
    , options_(options) {
}

TransferCoordinator::~TransferCoordinator() {
    registry_->stop_scheduler();

    for (auto& [id, alarm] : acceptance_alarms_) {
        alarm->cancel();
    }
    acceptance_alarms_.clear();

    // Operations may outlive us in callers' hands; drop their hooks first.
    for (const auto& operation : registry_->all()) {
        operation->set_hooks(OperationHooks{});
        operation->stop();
    }
    registry_->clear();

    if (transport_) {
        transport_->set_handlers(network::TransportHandlers{});
        SessionContext current = session();
        if (current.is_advertising()) {
            transport_->stop_advertising();
        }
        if (current.is_browsing()) {
            transport_->stop_browsing();
        }
        if (!current.connected_peers().empty()) {
            transport_->disconnect();
        }
    }
}

void TransferCoordinator::install_transport_handlers() {
    std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
    network::TransportHandlers handlers;

    handlers.on_peer_found = [weak_self](const PeerId& peer, const DiscoveryPayload& payload) {
        if (auto self = weak_self.lock()) {
            self->post_event([peer, payload](TransferCoordinator& coordinator) {
                coordinator.handle_peer_found(peer, payload);
            });
        }
    };

    handlers.on_peer_lost = [weak_self](const PeerId& peer) {
        if (auto self = weak_self.lock()) {
            self->post_event([peer](TransferCoordinator& coordinator) {
                coordinator.handle_peer_lost(peer);
            });
        }
    };

    handlers.on_invitation_received = [weak_self](const PeerId& peer, const DiscoveryPayload& context,
                                                  network::InvitationHandler accept) {
        auto self = weak_self.lock();
        if (!self) {
            if (accept) accept(false);
            return;
        }
        self->post_event([peer, context, accept](TransferCoordinator& coordinator) {
            coordinator.handle_invitation(peer, context, accept);
        });
    };

    handlers.on_session_state_changed = [weak_self](const PeerId& peer, SessionState state) {
        if (auto self = weak_self.lock()) {
            self->post_event([peer, state](TransferCoordinator& coordinator) {
                coordinator.handle_session_state(peer, state);
            });
        }
    };

    handlers.on_resource_receive_started = [weak_self](const std::string& name, const PeerId& peer,
                                                       std::shared_ptr<ProgressSource> progress) {
        if (auto self = weak_self.lock()) {
            self->post_event([name, peer, progress](TransferCoordinator& coordinator) {
                coordinator.handle_receive_started(name, peer, progress);
            });
        }
    };

    handlers.on_resource_receive_finished = [weak_self](const std::string& name, const PeerId& peer,
                                                        const std::optional<std::filesystem::path>& location,
                                                        const TransferResult& result) {
        if (auto self = weak_self.lock()) {
            self->post_event([name, peer, location, result](TransferCoordinator& coordinator) {
                coordinator.handle_receive_finished(name, peer, location, result);
            });
        }
    };

    handlers.on_advertising_failed = [weak_self](const TransferResult& result) {
        if (auto self = weak_self.lock()) {
            self->post_event([result](TransferCoordinator& coordinator) {
                coordinator.handle_advertising_failed(result);
            });
        }
    };

    handlers.on_browsing_failed = [weak_self](const TransferResult& result) {
        if (auto self = weak_self.lock()) {
            self->post_event([result](TransferCoordinator& coordinator) {
                coordinator.handle_browsing_failed(result);
            });
        }
    };

    transport_->set_handlers(std::move(handlers));
}

void TransferCoordinator::post_event(Task task) {
    std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
    context_->post([weak_self, task = std::move(task)]() {
        if (auto self = weak_self.lock()) {
            task(*self);
        }
    });
}

void TransferCoordinator::dispatch(Task task) {
    if (context_->running_in_this_thread()) {
        task(*this);
        return;
    }
    post_event(std::move(task));
}

// Hooks hold a plain pointer. The destructor clears them on every registered
// operation, and stop() clears them on the rest.
OperationHooks TransferCoordinator::make_hooks() {
    OperationHooks hooks;
    hooks.on_start = [this](const std::shared_ptr<TransferOperation>& operation) {
        dispatch([operation](TransferCoordinator& coordinator) {
            coordinator.handle_operation_started(operation);
        });
    };
    hooks.on_stop = [this](const std::shared_ptr<TransferOperation>& operation) {
        dispatch([operation](TransferCoordinator& coordinator) {
            coordinator.handle_operation_stopped(operation);
        });
    };
    hooks.on_cancel = [this](const std::shared_ptr<TransferOperation>& operation) {
        post_event([operation](TransferCoordinator& coordinator) {
            coordinator.handle_cancel_request(operation);
        });
    };
    return hooks;
}

TransferResult TransferCoordinator::request_download(const std::string& file_id,
                                                     ProgressCallback on_progress,
                                                     CompletionCallback on_complete,
                                                     std::shared_ptr<TransferOperation>& operation) {
    operation.reset();

    if (file_id.empty()) {
        return TransferResult(TransferError::INVALID_STATE, "Empty file identifier");
    }

    auto download = std::make_shared<TransferOperation>(OperationKind::DOWNLOAD, file_id, context_);
    download->set_callbacks(std::move(on_progress), std::move(on_complete));
    download->set_hooks(make_hooks());

    if (!registry_->try_add(download)) {
        LOG_INFO("Download of {} rejected: another transfer is in progress", file_id);
        download->set_hooks(OperationHooks{});
        download->stop();
        return TransferResult(TransferError::ALREADY_IN_PROGRESS,
                              "Another transfer is already in progress");
    }

    LOG_INFO("Queued download {} for {}", download->get_id(), file_id);
    operation = download;
    return TransferResult(TransferError::SUCCESS);
}

void TransferCoordinator::set_upload_callbacks(ProgressCallback on_progress, CompletionCallback on_complete) {
    post_event([on_progress = std::move(on_progress), on_complete = std::move(on_complete)](TransferCoordinator& coordinator) {
        coordinator.upload_progress_callback_ = on_progress;
        coordinator.upload_completion_callback_ = on_complete;
    });
}

void TransferCoordinator::set_upload_permission_override(PermissionOverride permission_override) {
    post_event([permission_override = std::move(permission_override)](TransferCoordinator& coordinator) {
        coordinator.permission_override_ = permission_override;
    });
}

void TransferCoordinator::start_listening() {
    post_event([](TransferCoordinator& coordinator) {
        coordinator.start_listening_internal();
    });
}

void TransferCoordinator::stop_listening() {
    post_event([](TransferCoordinator& coordinator) {
        coordinator.stop_listening_internal();
    });
}

void TransferCoordinator::suspend() {
    post_event([](TransferCoordinator& coordinator) {
        SessionContext current = coordinator.session();
        if (!current.is_active()) {
            return;
        }

        LOG_INFO("Suspending transfer session");
        bool listening = current.is_listening();
        coordinator.cancel_all_operations(cancelled());
        coordinator.stop_listening_internal();
        coordinator.stop_advertising_internal();
        coordinator.disconnect_session();
        coordinator.update_session(coordinator.session().with_listening(listening).torn_down());
    });
}

void TransferCoordinator::resume() {
    post_event([](TransferCoordinator& coordinator) {
        SessionContext current = coordinator.session();
        if (current.is_active()) {
            return;
        }

        LOG_INFO("Resuming transfer session");
        coordinator.update_session(current.rebuilt());
        if (coordinator.session().is_listening()) {
            coordinator.start_listening_internal();
        }
    });
}

void TransferCoordinator::cancel_all() {
    post_event([](TransferCoordinator& coordinator) {
        coordinator.cancel_all_operations(cancelled());
    });
}

bool TransferCoordinator::is_listening() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_.is_listening();
}

bool TransferCoordinator::is_advertising() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_.is_advertising();
}

bool TransferCoordinator::is_suspended() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return !session_.is_active();
}

network::SessionContext TransferCoordinator::session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void TransferCoordinator::update_session(const SessionContext& next) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = next;
}

void TransferCoordinator::handle_peer_found(const PeerId& peer, const DiscoveryPayload& payload) {
    if (!is_transfer_payload(payload)) {
        LOG_DEBUG("Ignoring peer {} advertising {}", peer, to_string(payload));
        return;
    }

    auto file_id = payload_file_id(payload);
    if (!file_id) {
        LOG_WARN("Ignoring malformed payload from {}: {}", peer, to_string(payload));
        return;
    }

    if (!session().is_active()) {
        LOG_DEBUG("Session suspended, ignoring peer {}", peer);
        return;
    }

    LOG_INFO("Peer {} is looking for {}", peer, *file_id);

    if (!file_store_->exists(*file_id)) {
        LOG_DEBUG("{} is not available locally", *file_id);
        return;
    }

    if (!registry_->query(OperationRegistry::by_kind(OperationKind::DOWNLOAD)).empty()) {
        LOG_DEBUG("Not offering {} to {}: a download holds the session", *file_id, peer);
        return;
    }

    auto upload = std::make_shared<TransferOperation>(OperationKind::UPLOAD, *file_id, context_);
    upload->set_remote_peer(peer);
    upload->set_callbacks(make_upload_progress_callback(), upload_completion_callback_);
    upload->set_state(OperationState::AWAITING_PERMISSION);

    // The decision may come from any thread, once.
    auto decided = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
    PermissionDecision decision = [weak_self, upload, decided](bool granted) {
        if (decided->exchange(true)) {
            LOG_WARN("Ignoring repeated permission decision for {}", upload->get_id());
            return;
        }
        if (auto self = weak_self.lock()) {
            self->post_event([upload, granted](TransferCoordinator& coordinator) {
                coordinator.handle_permission_decision(upload, granted);
            });
        }
    };

    LOG_INFO("Asking permission to upload {} to {}", *file_id, peer);
    try {
        if (permission_override_) {
            permission_override_(upload, *file_id, decision);
        } else if (permission_gate_) {
            permission_gate_->request_permission(upload, *file_id, decision);
        } else {
            LOG_WARN("No permission gate configured, denying upload of {}", *file_id);
            decision(false);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Permission request for {} failed: {}", *file_id, e.what());
        decision(false);
    }
}

void TransferCoordinator::handle_permission_decision(const std::shared_ptr<TransferOperation>& upload, bool granted) {
    auto peer = upload->get_remote_peer().value_or("");

    if (!granted) {
        LOG_INFO("Upload of {} to {} denied", upload->get_file_id(), peer);
        upload->stop();
        return;
    }

    if (upload->is_terminated() || !session().is_active()) {
        LOG_DEBUG("Dropping upload {}: session changed while awaiting permission", upload->get_id());
        upload->stop();
        return;
    }

    upload->set_hooks(make_hooks());
    if (!registry_->try_add(upload)) {
        LOG_INFO("Dropping upload of {} to {}: already in progress", upload->get_file_id(), peer);
        upload->set_hooks(OperationHooks{});
        upload->stop();
        return;
    }

    if (!upload->start()) {
        return;
    }

    LOG_INFO("Inviting {} to receive {}", peer, upload->get_file_id());
    transport_->invite(peer, upload->discovery_payload(), options_.invite_timeout);
}

void TransferCoordinator::handle_peer_lost(const PeerId& peer) {
    LOG_INFO("Peer {} stopped advertising", peer);

    // A connected peer reports its loss through the session state instead.
    if (session().is_connected(peer)) {
        return;
    }

    auto upload = registry_->find(OperationKind::UPLOAD, peer);
    if (upload) {
        LOG_INFO("Peer {} left before the invitation was accepted", peer);
        finish_upload(upload, connection_lost(peer), false);
    }
}

void TransferCoordinator::handle_invitation(const PeerId& peer, const DiscoveryPayload& context,
                                            const network::InvitationHandler& accept) {
    auto download = registry_->current_download();

    bool matches = download && download->is_running() &&
                   !download->has_remote_peer() &&
                   context == download->discovery_payload();

    if (!matches || !download->set_remote_peer(peer)) {
        LOG_INFO("Rejecting invitation from {} carrying {}", peer, to_string(context));
        if (accept) accept(false);
        return;
    }

    LOG_INFO("Found peer {} for downloading {}", peer, download->get_file_id());
    download->set_state(OperationState::NEGOTIATING);
    if (accept) accept(true);
    arm_acceptance_alarm(download);
}

void TransferCoordinator::arm_acceptance_alarm(const std::shared_ptr<TransferOperation>& download) {
    cancel_acceptance_alarm(download);

    std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
    std::weak_ptr<TransferOperation> weak_download = download;
    acceptance_alarms_[download->get_id()] = context_->schedule(options_.accept_timeout,
        [weak_self, weak_download]() {
            auto self = weak_self.lock();
            auto operation = weak_download.lock();
            if (self && operation) {
                self->handle_acceptance_timeout(operation);
            }
        });
}

void TransferCoordinator::cancel_acceptance_alarm(const std::shared_ptr<TransferOperation>& download) {
    auto it = acceptance_alarms_.find(download->get_id());
    if (it != acceptance_alarms_.end()) {
        it->second->cancel();
        acceptance_alarms_.erase(it);
    }
}

void TransferCoordinator::handle_acceptance_timeout(const std::shared_ptr<TransferOperation>& download) {
    acceptance_alarms_.erase(download->get_id());

    if (registry_->current_download() != download ||
        download->get_state() != OperationState::NEGOTIATING) {
        return;
    }

    auto peer = download->get_remote_peer().value_or("");
    LOG_WARN("Peer {} accepted the invitation but never started sending {}", peer, download->get_file_id());
    finish_download(download, download->get_file_id(), std::nullopt, connection_lost(peer));
}

void TransferCoordinator::handle_session_state(const PeerId& peer, SessionState state) {
    update_session(session().with_peer_state(peer, state));

    auto upload = registry_->find(OperationKind::UPLOAD, peer);

    switch (state) {
        case SessionState::CONNECTING:
            LOG_DEBUG("Peer {} is connecting", peer);
            break;

        case SessionState::CONNECTED:
            LOG_INFO("Peer {} connected", peer);
            if (upload) {
                begin_upload_send(upload);
            }
            break;

        case SessionState::NOT_CONNECTED:
            LOG_INFO("Peer {} disconnected", peer);
            if (upload && upload->get_transfer_fraction() < 1.0) {
                LOG_WARN("Peer {} disconnected before {} was sent completely", peer, upload->get_file_id());
                finish_upload(upload, connection_lost(peer), false);
            }
            break;
    }
}

void TransferCoordinator::begin_upload_send(const std::shared_ptr<TransferOperation>& upload) {
    if (upload->get_state() != OperationState::INVITING) {
        LOG_WARN("Upload {} already past the invitation ({})", upload->get_id(), to_string(upload->get_state()));
        return;
    }

    upload->set_state(OperationState::CONNECTING);

    auto peer = upload->get_remote_peer().value_or("");
    auto location = file_store_->locate(upload->get_file_id());
    if (!location) {
        finish_upload(upload, TransferResult(TransferError::FILE_UNAVAILABLE,
                                             upload->get_file_id() + " is no longer available"), false);
        return;
    }

    std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
    std::weak_ptr<TransferOperation> weak_upload = upload;
    std::filesystem::path sent = *location;

    auto progress = transport_->send_resource(*location, upload->get_file_id(), peer,
        [weak_self, weak_upload, sent](const TransferResult& result) {
            auto self = weak_self.lock();
            if (!self) {
                return;
            }
            self->post_event([weak_upload, sent, result](TransferCoordinator& coordinator) {
                if (auto operation = weak_upload.lock()) {
                    coordinator.handle_upload_sent(operation, sent, result);
                }
            });
        });

    upload->set_state(OperationState::TRANSFERRING);
    upload->attach_progress_source(progress);
    upload->notify_progress();
}

void TransferCoordinator::handle_upload_sent(const std::shared_ptr<TransferOperation>& upload,
                                             const std::filesystem::path& location,
                                             const TransferResult& result) {
    if (upload->is_terminated()) {
        LOG_DEBUG("Ignoring send completion for finished upload {}", upload->get_id());
        return;
    }

    LOG_INFO("Sending {} completed: {}", upload->get_file_id(), to_string(result.error));
    if (result.success()) {
        finish_upload(upload, TransferResult::ok(location), false);
    } else {
        finish_upload(upload, as_transport_error(result), false);
    }
}

void TransferCoordinator::finish_upload(const std::shared_ptr<TransferOperation>& upload,
                                        const TransferResult& result, bool bypass_barrier) {
    if (upload->is_terminated()) {
        return;
    }

    upload->set_state(OperationState::FINISHING);

    size_t in_progress = registry_->query(
        OperationRegistry::running(OperationKind::UPLOAD, upload->get_file_id())).size();

    auto completion = upload->take_completion_callback();
    registry_->remove(upload);
    upload->stop();

    if (bypass_barrier || in_progress <= 1) {
        deliver(completion, upload, result);
    } else {
        LOG_DEBUG("Upload {} finished, {} more still sending {}", upload->get_id(),
                  in_progress - 1, upload->get_file_id());
    }
}

ProgressCallback TransferCoordinator::make_upload_progress_callback() const {
    std::weak_ptr<OperationRegistry> weak_registry = registry_;
    ProgressCallback user_callback = upload_progress_callback_;
    if (!user_callback) {
        return nullptr;
    }

    return [weak_registry, user_callback](std::shared_ptr<TransferOperation> operation, double) {
        auto registry = weak_registry.lock();
        if (!registry) {
            return;
        }

        auto siblings = registry->query(OperationRegistry::running(OperationKind::UPLOAD, operation->get_file_id()));
        if (siblings.empty()) {
            return;
        }

        double total = 0.0;
        for (const auto& sibling : siblings) {
            total += sibling->get_progress();
        }
        user_callback(operation, total / static_cast<double>(siblings.size()));
    };
}

void TransferCoordinator::handle_receive_started(const std::string& name, const PeerId& peer,
                                                 std::shared_ptr<ProgressSource> progress) {
    auto download = registry_->current_download();
    if (!download || !download->is_running() || download->get_remote_peer() != peer) {
        LOG_WARN("Ignoring resource {} from {}: not linked to the current download", name, peer);
        return;
    }

    LOG_INFO("Receiving {} from {}", name, peer);
    cancel_acceptance_alarm(download);
    stop_advertising_internal();
    download->set_state(OperationState::TRANSFERRING);
    download->attach_progress_source(std::move(progress));
    download->notify_progress();
}

void TransferCoordinator::handle_receive_finished(const std::string& name, const PeerId& peer,
                                                  const std::optional<std::filesystem::path>& location,
                                                  const TransferResult& result) {
    auto download = registry_->current_download();
    if (!download || download->get_remote_peer() != peer) {
        LOG_WARN("Ignoring finished resource {} from {}: not linked to the current download", name, peer);
        return;
    }

    finish_download(download, name, location, result);
}

void TransferCoordinator::handle_advertising_failed(const TransferResult& result) {
    auto download = registry_->current_download();
    LOG_ERROR("Advertising failed: {}", result.message);
    update_session(session().with_advertising(std::nullopt));

    if (download && download->is_running()) {
        finish_download(download, download->get_file_id(), std::nullopt, as_transport_error(result));
    }
}

void TransferCoordinator::finish_download(const std::shared_ptr<TransferOperation>& download,
                                          const std::string& name,
                                          const std::optional<std::filesystem::path>& location,
                                          const TransferResult& transport_result) {
    if (download->is_terminated()) {
        return;
    }

    cancel_acceptance_alarm(download);
    download->set_state(OperationState::FINISHING);
    disconnect_session();

    auto completion = download->take_completion_callback();
    registry_->remove(download);
    download->stop();

    TransferResult result = transport_result;
    if (result.success()) {
        if (!location) {
            result = TransferResult(TransferError::STORAGE_COMMIT_FAILED, "No received resource to store");
        } else {
            std::filesystem::path permanent;
            result = file_store_->commit(*location, name, permanent);
            if (result.success()) {
                result.location = permanent;
            } else if (result.error != TransferError::STORAGE_COMMIT_FAILED) {
                result = TransferResult(TransferError::STORAGE_COMMIT_FAILED, result.message);
            }
        }
    }

    if (result.success()) {
        LOG_INFO("Download of {} stored at {}", download->get_file_id(), result.location.string());
    } else {
        LOG_WARN("Download of {} failed: {} ({})", download->get_file_id(), result.message, to_string(result.error));
    }

    deliver(completion, download, result);
}

void TransferCoordinator::handle_browsing_failed(const TransferResult& result) {
    LOG_ERROR("Could not browse for peers: {}", result.message);
    stop_listening_internal();

    if (upload_completion_callback_) {
        deliver(upload_completion_callback_, nullptr, as_transport_error(result));
    }
}

void TransferCoordinator::handle_operation_started(const std::shared_ptr<TransferOperation>& operation) {
    if (!operation->is_download()) {
        return;
    }

    if (!session().is_active()) {
        LOG_WARN("Not advertising {} while suspended", operation->get_file_id());
        return;
    }

    auto payload = operation->discovery_payload();
    LOG_INFO("Advertising {}", to_string(payload));
    transport_->advertise(payload);
    update_session(session().with_advertising(payload));
}

// Operations finished by the coordinator have already left the registry. One
// still registered was stopped by its holder and must not keep blocking
// admission.
void TransferCoordinator::handle_operation_stopped(const std::shared_ptr<TransferOperation>& operation) {
    bool evicted = registry_->remove(operation);
    if (evicted) {
        LOG_INFO("Operation {} stopped outside the coordinator, evicted", operation->get_id());
    }

    if (operation->is_download()) {
        cancel_acceptance_alarm(operation);
        stop_advertising_internal();
        if (evicted && operation->get_remote_peer()) {
            disconnect_session();
        }
    }
}

void TransferCoordinator::handle_cancel_request(const std::shared_ptr<TransferOperation>& operation) {
    if (operation->is_terminated()) {
        return;
    }

    LOG_INFO("Cancelling {}: tearing down the shared session", operation->get_id());

    if (!registry_->contains(operation)) {
        deliver(operation->take_completion_callback(), operation, cancelled());
        operation->stop();
    }

    cancel_all_operations(cancelled());
    disconnect_session();
}

void TransferCoordinator::cancel_all_operations(const TransferResult& result) {
    auto download = registry_->current_download();
    if (download) {
        finish_download(download, download->get_file_id(), std::nullopt, result);
    }

    for (const auto& upload : registry_->query(OperationRegistry::by_kind(OperationKind::UPLOAD))) {
        finish_upload(upload, result, true);
    }

    registry_->clear();
}

void TransferCoordinator::start_listening_internal() {
    SessionContext current = session();
    if (!current.is_active()) {
        LOG_DEBUG("Session suspended, will listen on resume");
        update_session(current.with_listening(true));
        return;
    }

    if (current.is_browsing()) {
        return;
    }

    LOG_INFO("Starting to listen for requests as {}", transport_->local_peer());
    registry_->start_scheduler(options_.scheduler_interval);
    transport_->browse();
    update_session(current.with_listening(true).with_browsing(true));
}

void TransferCoordinator::stop_listening_internal() {
    SessionContext current = session();
    registry_->stop_scheduler();

    if (current.is_browsing()) {
        LOG_INFO("Stopping to listen for requests");
        transport_->stop_browsing();
    }
    update_session(current.with_listening(false).with_browsing(false));
}

void TransferCoordinator::stop_advertising_internal() {
    SessionContext current = session();
    if (!current.is_advertising()) {
        return;
    }

    LOG_INFO("Stopping advertiser");
    transport_->stop_advertising();
    update_session(current.with_advertising(std::nullopt));
}

void TransferCoordinator::disconnect_session() {
    LOG_DEBUG("Disconnecting session");
    transport_->disconnect();
    update_session(session().without_peers());
}

void TransferCoordinator::deliver(const CompletionCallback& completion,
                                  const std::shared_ptr<TransferOperation>& operation,
                                  const TransferResult& result) {
    if (!completion) {
        return;
    }

    try {
        completion(operation, result);
    } catch (const std::exception& e) {
        LOG_ERROR("Completion callback failed: {}", e.what());
    }
}

} // namespace nearfetch::transfer
