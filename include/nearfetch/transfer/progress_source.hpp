#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace nearfetch::transfer {

using ProgressHandler = std::function<void(double)>;
using SubscriptionId = std::uint64_t;

// Observable completion fraction of a transfer in flight.
class ProgressSource {
public:
    virtual ~ProgressSource() = default;

    virtual SubscriptionId subscribe(ProgressHandler handler) = 0;
    // Unknown or already removed ids are ignored.
    virtual void unsubscribe(SubscriptionId id) = 0;
    virtual double fraction_completed() const = 0;
};

class ProgressTracker : public ProgressSource {
public:
    explicit ProgressTracker(std::uint64_t total_units = 0);

    SubscriptionId subscribe(ProgressHandler handler) override;
    void unsubscribe(SubscriptionId id) override;
    double fraction_completed() const override;

    void set_total_units(std::uint64_t total_units);
    void set_completed_units(std::uint64_t completed_units);
    void add_completed_units(std::uint64_t units);
    void set_fraction(double fraction);
    void complete();

    std::uint64_t total_units() const { return total_units_; }
    std::uint64_t completed_units() const { return completed_units_; }
    size_t subscriber_count() const;

private:
    void publish(double fraction);

    std::atomic<std::uint64_t> total_units_;
    std::atomic<std::uint64_t> completed_units_;
    std::atomic<double> fraction_;

    mutable std::mutex subscribers_mutex_;
    std::map<SubscriptionId, ProgressHandler> subscribers_;
    SubscriptionId next_id_;
};

} // namespace nearfetch::transfer
