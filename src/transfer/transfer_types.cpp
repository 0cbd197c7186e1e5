#include "nearfetch/transfer/transfer_types.hpp"
#include <sstream>

namespace nearfetch::transfer {

DiscoveryPayload make_transfer_payload(const std::string& file_id) {
    return DiscoveryPayload{
        {PAYLOAD_TYPE_KEY, PAYLOAD_TYPE_TRANSFER},
        {PAYLOAD_FILE_ID_KEY, file_id}
    };
}

bool is_transfer_payload(const DiscoveryPayload& payload) {
    auto it = payload.find(PAYLOAD_TYPE_KEY);
    return it != payload.end() && it->second == PAYLOAD_TYPE_TRANSFER;
}

std::optional<std::string> payload_file_id(const DiscoveryPayload& payload) {
    if (!is_transfer_payload(payload)) {
        return std::nullopt;
    }

    auto it = payload.find(PAYLOAD_FILE_ID_KEY);
    if (it == payload.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::string to_string(const DiscoveryPayload& payload) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : payload) {
        if (!first) oss << ", ";
        oss << key << ": " << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

const char* to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::UPLOAD: return "Upload";
        case OperationKind::DOWNLOAD: return "Download";
    }
    return "Unknown";
}

const char* to_string(OperationState state) {
    switch (state) {
        case OperationState::CREATED: return "Created";
        case OperationState::AWAITING_PERMISSION: return "AwaitingPermission";
        case OperationState::QUEUED: return "Queued";
        case OperationState::ADVERTISING: return "Advertising";
        case OperationState::INVITING: return "Inviting";
        case OperationState::NEGOTIATING: return "Negotiating";
        case OperationState::CONNECTING: return "Connecting";
        case OperationState::TRANSFERRING: return "Transferring";
        case OperationState::FINISHING: return "Finishing";
        case OperationState::TERMINATED: return "Terminated";
    }
    return "Unknown";
}

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "Success";
        case TransferError::ALREADY_IN_PROGRESS: return "AlreadyInProgress";
        case TransferError::CONNECTION_LOST: return "ConnectionLost";
        case TransferError::STORAGE_COMMIT_FAILED: return "StorageCommitFailed";
        case TransferError::CANCELLED: return "Cancelled";
        case TransferError::TRANSPORT_ERROR: return "TransportError";
        case TransferError::FILE_UNAVAILABLE: return "FileUnavailable";
        case TransferError::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

} // namespace nearfetch::transfer
