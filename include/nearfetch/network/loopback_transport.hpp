#pragma once

#include "peer_transport.hpp"
#include "../transfer/progress_source.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace nearfetch::network {

constexpr std::size_t DEFAULT_LOOPBACK_CHUNK_SIZE = 64 * 1024;

class LoopbackHub;

// PeerTransport endpoint attached to a LoopbackHub. Events are delivered on
// the hub thread.
class LoopbackTransport : public PeerTransport {
public:
    LoopbackTransport(std::shared_ptr<LoopbackHub> hub, const PeerId& peer);
    ~LoopbackTransport() override;

    void set_handlers(TransportHandlers handlers) override;

    void advertise(const DiscoveryPayload& payload) override;
    void stop_advertising() override;

    void browse() override;
    void stop_browsing() override;

    void invite(const PeerId& peer, const DiscoveryPayload& context,
                std::chrono::milliseconds timeout) override;

    std::shared_ptr<transfer::ProgressSource> send_resource(
        const std::filesystem::path& location, const std::string& name,
        const PeerId& peer, SendCompletionHandler completion) override;

    void disconnect() override;

    PeerId local_peer() const override { return peer_; }

    TransportHandlers handlers() const;

private:
    std::shared_ptr<LoopbackHub> hub_;
    PeerId peer_;

    mutable std::mutex handlers_mutex_;
    TransportHandlers handlers_;
};

// In-process stand-in for a nearby-peer radio. Every transport call is posted
// to the hub's own thread, which plays the part of the transport's callback
// thread. Resources are copied chunk by chunk into the incoming directory.
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
public:
    explicit LoopbackHub(const std::filesystem::path& incoming_directory,
                         std::size_t chunk_size = DEFAULT_LOOPBACK_CHUNK_SIZE);
    ~LoopbackHub();

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_; }

    std::shared_ptr<LoopbackTransport> join(const PeerId& peer);

    // Pause between chunks, to make transfers observable.
    void set_chunk_delay(std::chrono::milliseconds delay) { chunk_delay_ms_ = delay.count(); }

    const std::filesystem::path& incoming_directory() const { return incoming_directory_; }

private:
    friend class LoopbackTransport;

    struct Invitation {
        std::uint64_t id;
        PeerId from;
        PeerId to;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    struct Transfer {
        std::uint64_t id;
        PeerId from;
        PeerId to;
        std::string name;
        std::filesystem::path temp_path;
        std::ifstream input;
        std::ofstream output;
        std::uint64_t total_bytes = 0;
        std::uint64_t sent_bytes = 0;
        std::shared_ptr<transfer::ProgressTracker> sender_progress;
        std::shared_ptr<transfer::ProgressTracker> receiver_progress;
        SendCompletionHandler completion;
        std::unique_ptr<boost::asio::steady_timer> timer;
        bool done = false;
    };

    // Hub thread entry points, posted by transports
    void do_advertise(const PeerId& peer, const DiscoveryPayload& payload);
    void do_stop_advertising(const PeerId& peer);
    void do_browse(const PeerId& peer);
    void do_stop_browsing(const PeerId& peer);
    void do_invite(const PeerId& from, const PeerId& to, const DiscoveryPayload& context,
                   std::chrono::milliseconds timeout);
    void do_send(const std::shared_ptr<Transfer>& transfer, const std::filesystem::path& location);
    void do_disconnect(const PeerId& peer);
    void do_leave(const PeerId& peer);

    void post(std::function<void()> task);
    void resolve_invitation(std::uint64_t id, bool accepted);
    void pump(const std::shared_ptr<Transfer>& transfer);
    void finish_transfer(const std::shared_ptr<Transfer>& transfer, const TransferResult& result);
    void drop_links(const PeerId& peer);

    std::shared_ptr<LoopbackTransport> member(const PeerId& peer) const;
    TransportHandlers handlers_of(const PeerId& peer) const;
    bool linked(const PeerId& a, const PeerId& b) const;
    static std::pair<PeerId, PeerId> make_link(const PeerId& a, const PeerId& b);

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread thread_;
    std::atomic<bool> running_;

    std::filesystem::path incoming_directory_;
    std::size_t chunk_size_;
    std::atomic<long long> chunk_delay_ms_;

    mutable std::mutex members_mutex_;
    std::map<PeerId, std::weak_ptr<LoopbackTransport>> members_;

    // Hub thread only
    std::map<PeerId, DiscoveryPayload> advertisements_;
    std::set<PeerId> browsers_;
    std::set<std::pair<PeerId, PeerId>> links_;
    std::map<std::uint64_t, std::shared_ptr<Invitation>> invitations_;
    std::vector<std::shared_ptr<Transfer>> transfers_;
    std::uint64_t next_invitation_id_;
    std::atomic<std::uint64_t> next_transfer_id_;
};

}
