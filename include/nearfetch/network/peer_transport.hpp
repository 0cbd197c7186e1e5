#pragma once

#include "../transfer/transfer_types.hpp"
#include "../transfer/progress_source.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace nearfetch::network {

using transfer::PeerId;
using transfer::DiscoveryPayload;
using transfer::TransferResult;

enum class SessionState {
    CONNECTING,
    CONNECTED,
    NOT_CONNECTED
};

const char* to_string(SessionState state);

using InvitationHandler = std::function<void(bool accept)>;
using SendCompletionHandler = std::function<void(const TransferResult& result)>;

// Events may be delivered on any transport-owned thread.
struct TransportHandlers {
    std::function<void(const PeerId&, const DiscoveryPayload&)> on_peer_found;
    std::function<void(const PeerId&)> on_peer_lost;
    std::function<void(const PeerId&, const DiscoveryPayload&, InvitationHandler)> on_invitation_received;
    std::function<void(const PeerId&, SessionState)> on_session_state_changed;
    std::function<void(const std::string& name, const PeerId&,
                       std::shared_ptr<transfer::ProgressSource>)> on_resource_receive_started;
    std::function<void(const std::string& name, const PeerId&,
                       const std::optional<std::filesystem::path>& location,
                       const TransferResult&)> on_resource_receive_finished;
    std::function<void(const TransferResult&)> on_advertising_failed;
    std::function<void(const TransferResult&)> on_browsing_failed;
};

// One shared session to nearby peers. Every call is fire-and-forget, with
// outcomes reported through TransportHandlers.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual void set_handlers(TransportHandlers handlers) = 0;

    virtual void advertise(const DiscoveryPayload& payload) = 0;
    virtual void stop_advertising() = 0;

    virtual void browse() = 0;
    virtual void stop_browsing() = 0;

    virtual void invite(const PeerId& peer, const DiscoveryPayload& context,
                        std::chrono::milliseconds timeout) = 0;

    virtual std::shared_ptr<transfer::ProgressSource> send_resource(
        const std::filesystem::path& location, const std::string& name,
        const PeerId& peer, SendCompletionHandler completion) = 0;

    virtual void disconnect() = 0;

    virtual PeerId local_peer() const = 0;
};

}
