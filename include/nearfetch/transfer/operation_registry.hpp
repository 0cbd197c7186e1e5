#pragma once

#include "transfer_operation.hpp"
#include "../core/callback_context.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace nearfetch::transfer {

// Thread-safe set of live operations. Admission enforces the role rules of
// the single shared transport session:
//   - at most one download,
//   - at most one upload per remote peer, never an upload without a peer,
//   - never uploads and a download at the same time.
//
// Must be owned by a std::shared_ptr for the scheduler to run.
class OperationRegistry : public std::enable_shared_from_this<OperationRegistry> {
public:
    using OperationPtr = std::shared_ptr<TransferOperation>;
    using Predicate = std::function<bool(const OperationPtr&)>;

    explicit OperationRegistry(std::shared_ptr<core::CallbackContext> context);
    ~OperationRegistry();

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    // Admission
    bool try_add(const OperationPtr& operation);
    bool remove(const OperationPtr& operation);
    void clear();

    // Queries, in insertion order
    std::vector<OperationPtr> query(const Predicate& predicate) const;
    std::vector<OperationPtr> all() const;
    OperationPtr find(OperationKind kind, const PeerId& peer) const;
    OperationPtr current_download() const;
    bool contains(const OperationPtr& operation) const;
    size_t size() const;
    bool empty() const;

    static Predicate by_kind(OperationKind kind);
    static Predicate running(OperationKind kind, const std::string& file_id);
    static Predicate not_started(OperationKind kind);
    static Predicate by_peer(OperationKind kind, const PeerId& peer);

    // Download promotion
    void start_scheduler(std::chrono::milliseconds interval = DEFAULT_SCHEDULER_INTERVAL);
    void stop_scheduler();
    bool is_scheduler_running() const;
    void tick();

private:
    bool admissible(const OperationPtr& operation) const;
    void arm_scheduler();
    void on_scheduler_fired();

    std::shared_ptr<core::CallbackContext> context_;

    mutable std::shared_mutex mutex_;
    std::vector<OperationPtr> operations_;

    mutable std::mutex scheduler_mutex_;
    std::shared_ptr<core::Alarm> scheduler_alarm_;
    std::chrono::milliseconds scheduler_interval_;
    bool scheduler_running_;
};

} // namespace nearfetch::transfer
