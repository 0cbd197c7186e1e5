#include "nearfetch/network/session_context.hpp"

namespace nearfetch::network {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING: return "Connecting";
        case SessionState::CONNECTED: return "Connected";
        case SessionState::NOT_CONNECTED: return "NotConnected";
    }
    return "Unknown";
}

bool SessionContext::is_connected(const PeerId& peer) const {
    return connected_peers_.count(peer) > 0;
}

SessionContext SessionContext::with_listening(bool listening) const {
    SessionContext next = *this;
    next.listening_ = listening;
    return next;
}

SessionContext SessionContext::with_advertising(std::optional<DiscoveryPayload> payload) const {
    SessionContext next = *this;
    next.advertised_payload_ = std::move(payload);
    return next;
}

SessionContext SessionContext::with_browsing(bool browsing) const {
    SessionContext next = *this;
    next.browsing_ = browsing;
    return next;
}

SessionContext SessionContext::with_peer_state(const PeerId& peer, SessionState state) const {
    SessionContext next = *this;
    if (state == SessionState::CONNECTED) {
        next.connected_peers_.insert(peer);
    } else {
        next.connected_peers_.erase(peer);
    }
    return next;
}

SessionContext SessionContext::without_peers() const {
    SessionContext next = *this;
    next.connected_peers_.clear();
    return next;
}

SessionContext SessionContext::torn_down() const {
    SessionContext next;
    next.active_ = false;
    next.listening_ = listening_;
    return next;
}

SessionContext SessionContext::rebuilt() const {
    SessionContext next;
    next.active_ = true;
    next.listening_ = listening_;
    return next;
}

} // namespace nearfetch::network
