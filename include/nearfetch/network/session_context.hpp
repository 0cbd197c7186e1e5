#pragma once

#include "peer_transport.hpp"
#include <optional>
#include <set>

namespace nearfetch::network {

// Snapshot of what the coordinator has asked of the shared session. Lifecycle
// transitions replace the whole value instead of mutating it piecemeal.
class SessionContext {
public:
    SessionContext() = default;

    bool is_active() const { return active_; }
    bool is_listening() const { return listening_; }
    bool is_advertising() const { return advertised_payload_.has_value(); }
    bool is_browsing() const { return browsing_; }

    const std::optional<DiscoveryPayload>& advertised_payload() const { return advertised_payload_; }
    const std::set<PeerId>& connected_peers() const { return connected_peers_; }
    bool is_connected(const PeerId& peer) const;

    SessionContext with_listening(bool listening) const;
    SessionContext with_advertising(std::optional<DiscoveryPayload> payload) const;
    SessionContext with_browsing(bool browsing) const;
    SessionContext with_peer_state(const PeerId& peer, SessionState state) const;
    SessionContext without_peers() const;

    // Suspended session: nothing advertised, browsed or connected, but the
    // listening intent survives so that the owner can restart browsing after
    // rebuilt().
    SessionContext torn_down() const;
    SessionContext rebuilt() const;

private:
    bool active_ = true;
    bool listening_ = false;
    bool browsing_ = false;
    std::optional<DiscoveryPayload> advertised_payload_;
    std::set<PeerId> connected_peers_;
};

} // namespace nearfetch::network
