#include "nearfetch/transfer/permission_gate.hpp"
#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"

namespace nearfetch::transfer {

AutoPermissionGate::AutoPermissionGate(bool grant)
    : grant_(grant) {
}

std::shared_ptr<AutoPermissionGate> AutoPermissionGate::from_config(const core::Config& config) {
    return std::make_shared<AutoPermissionGate>(config.get_bool("upload.auto_accept", false));
}

void AutoPermissionGate::request_permission(std::shared_ptr<TransferOperation> operation,
                                            const std::string& file_id,
                                            PermissionDecision decision) {
    LOG_INFO("{} upload of {} to {}", grant_ ? "Granting" : "Denying", file_id,
             operation ? operation->get_remote_peer().value_or("<unbound>") : "<none>");
    if (decision) {
        decision(grant_);
    }
}

} // namespace nearfetch::transfer
