#pragma once

#include "transfer_operation.hpp"
#include <functional>
#include <memory>
#include <string>

namespace nearfetch::core {
class Config;
}

namespace nearfetch::transfer {

using PermissionDecision = std::function<void(bool granted)>;

// Replaces the gate for one coordinator. Must call `decision` exactly once.
using PermissionOverride = std::function<void(std::shared_ptr<TransferOperation>,
                                              const std::string& file_id,
                                              PermissionDecision decision)>;

// Asks whoever owns the device whether an upload may proceed. The answer may
// arrive later and on any thread.
class PermissionGate {
public:
    virtual ~PermissionGate() = default;

    virtual void request_permission(std::shared_ptr<TransferOperation> operation,
                                    const std::string& file_id,
                                    PermissionDecision decision) = 0;
};

class AutoPermissionGate : public PermissionGate {
public:
    explicit AutoPermissionGate(bool grant);

    // Reads upload.auto_accept.
    static std::shared_ptr<AutoPermissionGate> from_config(const core::Config& config);

    void request_permission(std::shared_ptr<TransferOperation> operation,
                            const std::string& file_id,
                            PermissionDecision decision) override;

    bool grants() const { return grant_; }

private:
    bool grant_;
};

} // namespace nearfetch::transfer
