#include "nearfetch/transfer/progress_source.hpp"
#include "nearfetch/core/logger.hpp"
#include <algorithm>
#include <vector>

namespace nearfetch::transfer {

ProgressTracker::ProgressTracker(std::uint64_t total_units)
    : total_units_(total_units)
    , completed_units_(0)
    , fraction_(0.0)
    , next_id_(1) {
}

SubscriptionId ProgressTracker::subscribe(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[id] = std::move(handler);
    return id;
}

void ProgressTracker::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(id);
}

double ProgressTracker::fraction_completed() const {
    return fraction_;
}

size_t ProgressTracker::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

void ProgressTracker::set_total_units(std::uint64_t total_units) {
    total_units_ = total_units;
}

void ProgressTracker::set_completed_units(std::uint64_t completed_units) {
    std::uint64_t total = total_units_;
    completed_units_ = std::min(completed_units, total);
    if (total == 0) {
        return;
    }
    set_fraction(static_cast<double>(completed_units_) / static_cast<double>(total));
}

void ProgressTracker::add_completed_units(std::uint64_t units) {
    set_completed_units(completed_units_ + units);
}

void ProgressTracker::set_fraction(double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);

    double current = fraction_.load();
    while (fraction > current) {
        if (fraction_.compare_exchange_weak(current, fraction)) {
            publish(fraction);
            return;
        }
    }
}

void ProgressTracker::complete() {
    completed_units_ = total_units_.load();
    set_fraction(1.0);
}

void ProgressTracker::publish(double fraction) {
    std::vector<ProgressHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        handlers.reserve(subscribers_.size());
        for (const auto& [id, handler] : subscribers_) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        if (!handler) continue;
        try {
            handler(fraction);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress handler failed: {}", e.what());
        }
    }
}

} // namespace nearfetch::transfer
