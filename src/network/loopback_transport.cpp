#include "nearfetch/network/loopback_transport.hpp"
#include "nearfetch/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <vector>

namespace nearfetch::network {

using transfer::ProgressTracker;
using transfer::TransferError;

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub, const PeerId& peer)
    : hub_(std::move(hub))
    , peer_(peer) {
}

LoopbackTransport::~LoopbackTransport() {
    PeerId peer = peer_;
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer]() { hub->do_leave(peer); });
}

void LoopbackTransport::set_handlers(TransportHandlers handlers) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_ = std::move(handlers);
}

TransportHandlers LoopbackTransport::handlers() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_;
}

void LoopbackTransport::advertise(const DiscoveryPayload& payload) {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer = peer_, payload]() { hub->do_advertise(peer, payload); });
}

void LoopbackTransport::stop_advertising() {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer = peer_]() { hub->do_stop_advertising(peer); });
}

void LoopbackTransport::browse() {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer = peer_]() { hub->do_browse(peer); });
}

void LoopbackTransport::stop_browsing() {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer = peer_]() { hub->do_stop_browsing(peer); });
}

void LoopbackTransport::invite(const PeerId& peer, const DiscoveryPayload& context,
                               std::chrono::milliseconds timeout) {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, from = peer_, peer, context, timeout]() {
        hub->do_invite(from, peer, context, timeout);
    });
}

std::shared_ptr<transfer::ProgressSource> LoopbackTransport::send_resource(
    const std::filesystem::path& location, const std::string& name,
    const PeerId& peer, SendCompletionHandler completion) {

    auto transfer = std::make_shared<LoopbackHub::Transfer>();
    transfer->id = hub_->next_transfer_id_++;
    transfer->from = peer_;
    transfer->to = peer;
    transfer->name = name;
    transfer->sender_progress = std::make_shared<ProgressTracker>();
    transfer->receiver_progress = std::make_shared<ProgressTracker>();
    transfer->completion = std::move(completion);

    LoopbackHub* hub = hub_.get();
    hub->post([hub, transfer, location]() { hub->do_send(transfer, location); });
    return transfer->sender_progress;
}

void LoopbackTransport::disconnect() {
    LoopbackHub* hub = hub_.get();
    hub->post([hub, peer = peer_]() { hub->do_disconnect(peer); });
}

LoopbackHub::LoopbackHub(const std::filesystem::path& incoming_directory, std::size_t chunk_size)
    : work_guard_(boost::asio::make_work_guard(io_context_))
    , running_(false)
    , incoming_directory_(incoming_directory)
    , chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_LOOPBACK_CHUNK_SIZE)
    , chunk_delay_ms_(0)
    , next_invitation_id_(1)
    , next_transfer_id_(1) {
}

LoopbackHub::~LoopbackHub() {
    stop();
}

bool LoopbackHub::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Loopback hub already running");
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(incoming_directory_, ec);
    if (ec) {
        LOG_ERROR("Cannot create loopback incoming directory {}: {}", incoming_directory_.string(), ec.message());
        running_ = false;
        return false;
    }

    thread_ = std::thread([this]() {
        LOG_DEBUG("Loopback hub thread started");
        io_context_.run();
        LOG_DEBUG("Loopback hub thread stopped");
    });

    LOG_INFO("Loopback hub started, incoming resources in {}", incoming_directory_.string());
    return true;
}

void LoopbackHub::stop() {
    work_guard_.reset();
    io_context_.stop();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

std::shared_ptr<LoopbackTransport> LoopbackHub::join(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(members_mutex_);
    auto it = members_.find(peer);
    if (it != members_.end() && !it->second.expired()) {
        LOG_WARN("Peer {} already joined the loopback hub", peer);
        return nullptr;
    }

    auto transport = std::make_shared<LoopbackTransport>(shared_from_this(), peer);
    members_[peer] = transport;
    LOG_DEBUG("Peer {} joined the loopback hub", peer);
    return transport;
}

void LoopbackHub::post(std::function<void()> task) {
    boost::asio::post(io_context_, std::move(task));
}

std::shared_ptr<LoopbackTransport> LoopbackHub::member(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(members_mutex_);
    auto it = members_.find(peer);
    return it != members_.end() ? it->second.lock() : nullptr;
}

TransportHandlers LoopbackHub::handlers_of(const PeerId& peer) const {
    auto transport = member(peer);
    return transport ? transport->handlers() : TransportHandlers{};
}

std::pair<PeerId, PeerId> LoopbackHub::make_link(const PeerId& a, const PeerId& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

bool LoopbackHub::linked(const PeerId& a, const PeerId& b) const {
    return links_.count(make_link(a, b)) > 0;
}

void LoopbackHub::do_advertise(const PeerId& peer, const DiscoveryPayload& payload) {
    advertisements_[peer] = payload;
    LOG_DEBUG("{} advertises {}", peer, transfer::to_string(payload));

    for (const auto& browser : browsers_) {
        if (browser == peer) continue;
        auto handlers = handlers_of(browser);
        if (handlers.on_peer_found) handlers.on_peer_found(peer, payload);
    }
}

void LoopbackHub::do_stop_advertising(const PeerId& peer) {
    if (advertisements_.erase(peer) == 0) {
        return;
    }

    for (const auto& browser : browsers_) {
        if (browser == peer) continue;
        auto handlers = handlers_of(browser);
        if (handlers.on_peer_lost) handlers.on_peer_lost(peer);
    }
}

void LoopbackHub::do_browse(const PeerId& peer) {
    if (!browsers_.insert(peer).second) {
        return;
    }

    auto handlers = handlers_of(peer);
    if (!handlers.on_peer_found) {
        return;
    }

    for (const auto& [advertiser, payload] : advertisements_) {
        if (advertiser == peer) continue;
        handlers.on_peer_found(advertiser, payload);
    }
}

void LoopbackHub::do_stop_browsing(const PeerId& peer) {
    browsers_.erase(peer);
}

void LoopbackHub::do_invite(const PeerId& from, const PeerId& to, const DiscoveryPayload& context,
                            std::chrono::milliseconds timeout) {
    auto invitee = handlers_of(to);
    if (advertisements_.count(to) == 0 || !invitee.on_invitation_received) {
        LOG_DEBUG("Invitation from {} to {} went nowhere", from, to);
        auto inviter = handlers_of(from);
        if (inviter.on_session_state_changed) inviter.on_session_state_changed(to, SessionState::NOT_CONNECTED);
        return;
    }

    auto invitation = std::make_shared<Invitation>();
    invitation->id = next_invitation_id_++;
    invitation->from = from;
    invitation->to = to;
    invitation->timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    invitations_[invitation->id] = invitation;

    std::uint64_t id = invitation->id;
    invitation->timer->expires_after(timeout);
    invitation->timer->async_wait([this, id](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        LOG_DEBUG("Invitation {} timed out", id);
        resolve_invitation(id, false);
    });

    std::weak_ptr<LoopbackHub> weak_hub = weak_from_this();
    InvitationHandler accept = [weak_hub, id](bool accepted) {
        if (auto hub = weak_hub.lock()) {
            LoopbackHub* raw = hub.get();
            raw->post([raw, id, accepted]() { raw->resolve_invitation(id, accepted); });
        }
    };

    invitee.on_invitation_received(from, context, accept);
}

void LoopbackHub::resolve_invitation(std::uint64_t id, bool accepted) {
    auto it = invitations_.find(id);
    if (it == invitations_.end()) {
        return;
    }

    auto invitation = it->second;
    invitations_.erase(it);
    invitation->timer->cancel();

    auto inviter = handlers_of(invitation->from);
    auto invitee = handlers_of(invitation->to);

    if (!accepted || !member(invitation->from) || !member(invitation->to)) {
        LOG_DEBUG("Invitation from {} to {} declined", invitation->from, invitation->to);
        if (inviter.on_session_state_changed) {
            inviter.on_session_state_changed(invitation->to, SessionState::NOT_CONNECTED);
        }
        return;
    }

    links_.insert(make_link(invitation->from, invitation->to));
    LOG_DEBUG("Linked {} and {}", invitation->from, invitation->to);

    for (SessionState state : {SessionState::CONNECTING, SessionState::CONNECTED}) {
        if (invitee.on_session_state_changed) invitee.on_session_state_changed(invitation->from, state);
        if (inviter.on_session_state_changed) inviter.on_session_state_changed(invitation->to, state);
    }
}

void LoopbackHub::do_send(const std::shared_ptr<Transfer>& transfer, const std::filesystem::path& location) {
    auto fail = [&transfer](const std::string& message) {
        LOG_WARN("Loopback send of {} failed: {}", transfer->name, message);
        if (transfer->completion) {
            transfer->completion(TransferResult(TransferError::TRANSPORT_ERROR, message));
        }
    };

    if (!linked(transfer->from, transfer->to)) {
        fail(transfer->to + " is not connected to " + transfer->from);
        return;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(location, ec);
    if (ec) {
        fail("Cannot read " + location.string() + ": " + ec.message());
        return;
    }

    transfer->input.open(location, std::ios::binary);
    if (!transfer->input) {
        fail("Cannot open " + location.string());
        return;
    }

    auto file_name = std::filesystem::path(transfer->name).filename().string();
    transfer->temp_path = incoming_directory_ /
        ("loopback_" + std::to_string(transfer->id) + "_" + file_name + ".part");
    transfer->output.open(transfer->temp_path, std::ios::binary | std::ios::trunc);
    if (!transfer->output) {
        fail("Cannot create " + transfer->temp_path.string());
        return;
    }

    transfer->total_bytes = size;
    transfer->sender_progress->set_total_units(size);
    transfer->receiver_progress->set_total_units(size);
    transfers_.push_back(transfer);

    auto receiver = handlers_of(transfer->to);
    if (receiver.on_resource_receive_started) {
        receiver.on_resource_receive_started(transfer->name, transfer->from, transfer->receiver_progress);
    }

    pump(transfer);
}

void LoopbackHub::pump(const std::shared_ptr<Transfer>& transfer) {
    if (transfer->done) {
        return;
    }

    if (!linked(transfer->from, transfer->to)) {
        finish_transfer(transfer, TransferResult(TransferError::CONNECTION_LOST, "Session disconnected"));
        return;
    }

    std::vector<char> buffer(chunk_size_);
    transfer->input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize count = transfer->input.gcount();

    if (transfer->input.bad()) {
        finish_transfer(transfer, TransferResult(TransferError::TRANSPORT_ERROR, "Read error"));
        return;
    }

    if (count > 0) {
        transfer->output.write(buffer.data(), count);
        if (!transfer->output) {
            finish_transfer(transfer, TransferResult(TransferError::TRANSPORT_ERROR, "Write error"));
            return;
        }
        transfer->sent_bytes += static_cast<std::uint64_t>(count);
        transfer->sender_progress->set_completed_units(transfer->sent_bytes);
        transfer->receiver_progress->set_completed_units(transfer->sent_bytes);
    }

    if (transfer->sent_bytes >= transfer->total_bytes || count == 0) {
        transfer->output.flush();
        transfer->sender_progress->complete();
        transfer->receiver_progress->complete();
        finish_transfer(transfer, TransferResult(TransferError::SUCCESS));
        return;
    }

    auto delay = std::chrono::milliseconds(chunk_delay_ms_.load());
    if (delay.count() > 0) {
        transfer->timer = std::make_unique<boost::asio::steady_timer>(io_context_);
        transfer->timer->expires_after(delay);
        transfer->timer->async_wait([this, transfer](const boost::system::error_code& ec) {
            if (!ec) pump(transfer);
        });
    } else {
        post([this, transfer]() { pump(transfer); });
    }
}

void LoopbackHub::finish_transfer(const std::shared_ptr<Transfer>& transfer, const TransferResult& result) {
    if (transfer->done) {
        return;
    }

    transfer->done = true;
    transfer->input.close();
    transfer->output.close();
    if (transfer->timer) {
        transfer->timer->cancel();
    }
    std::erase(transfers_, transfer);

    auto receiver = handlers_of(transfer->to);

    if (result.success()) {
        LOG_DEBUG("Delivered {} from {} to {} ({} bytes)", transfer->name, transfer->from,
                  transfer->to, transfer->sent_bytes);
        if (receiver.on_resource_receive_finished) {
            receiver.on_resource_receive_finished(transfer->name, transfer->from, transfer->temp_path, result);
        }
        if (transfer->completion) {
            transfer->completion(result);
        }
        return;
    }

    std::error_code ec;
    std::filesystem::remove(transfer->temp_path, ec);

    if (receiver.on_resource_receive_finished) {
        receiver.on_resource_receive_finished(transfer->name, transfer->from, std::nullopt, result);
    }
    if (transfer->completion) {
        transfer->completion(TransferResult(TransferError::TRANSPORT_ERROR, result.message));
    }
}

void LoopbackHub::do_disconnect(const PeerId& peer) {
    drop_links(peer);
}

void LoopbackHub::drop_links(const PeerId& peer) {
    std::vector<std::pair<PeerId, PeerId>> dropped;
    for (const auto& link : links_) {
        if (link.first == peer || link.second == peer) {
            dropped.push_back(link);
        }
    }

    for (const auto& link : dropped) {
        links_.erase(link);
    }

    // Transfers on a dropped link fail before anyone hears about the state change.
    std::vector<std::shared_ptr<Transfer>> broken;
    for (const auto& transfer : transfers_) {
        if (!linked(transfer->from, transfer->to)) {
            broken.push_back(transfer);
        }
    }
    for (const auto& transfer : broken) {
        finish_transfer(transfer, TransferResult(TransferError::CONNECTION_LOST, "Session disconnected"));
    }

    for (const auto& [a, b] : dropped) {
        LOG_DEBUG("Unlinked {} and {}", a, b);
        auto first = handlers_of(a);
        auto second = handlers_of(b);
        if (first.on_session_state_changed) first.on_session_state_changed(b, SessionState::NOT_CONNECTED);
        if (second.on_session_state_changed) second.on_session_state_changed(a, SessionState::NOT_CONNECTED);
    }
}

void LoopbackHub::do_leave(const PeerId& peer) {
    do_stop_advertising(peer);
    browsers_.erase(peer);
    drop_links(peer);

    std::vector<std::uint64_t> pending;
    for (const auto& [id, invitation] : invitations_) {
        if (invitation->from == peer || invitation->to == peer) {
            pending.push_back(id);
        }
    }
    for (auto id : pending) {
        resolve_invitation(id, false);
    }

    std::lock_guard<std::mutex> lock(members_mutex_);
    auto it = members_.find(peer);
    if (it != members_.end() && it->second.expired()) {
        members_.erase(it);
        LOG_DEBUG("Peer {} left the loopback hub", peer);
    }
}

}
