#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace nearfetch::transfer {

constexpr std::chrono::milliseconds DEFAULT_SCHEDULER_INTERVAL{5000};
constexpr std::chrono::milliseconds DEFAULT_ACCEPT_TIMEOUT{45000};
constexpr std::chrono::milliseconds DEFAULT_INVITE_TIMEOUT{30000};

constexpr const char* PAYLOAD_TYPE_KEY = "type";
constexpr const char* PAYLOAD_TYPE_TRANSFER = "transfer";
constexpr const char* PAYLOAD_FILE_ID_KEY = "file_id";

// Remote device identity as reported by the transport.
using PeerId = std::string;

// Small key/value descriptor correlating an advertised download with an
// upload offer. Two payloads correlate iff they compare equal.
using DiscoveryPayload = std::map<std::string, std::string>;

DiscoveryPayload make_transfer_payload(const std::string& file_id);
bool is_transfer_payload(const DiscoveryPayload& payload);
std::optional<std::string> payload_file_id(const DiscoveryPayload& payload);
std::string to_string(const DiscoveryPayload& payload);

enum class OperationKind {
    UPLOAD,
    DOWNLOAD
};

enum class OperationState {
    CREATED,
    AWAITING_PERMISSION,
    QUEUED,
    ADVERTISING,
    INVITING,
    NEGOTIATING,
    CONNECTING,
    TRANSFERRING,
    FINISHING,
    TERMINATED
};

const char* to_string(OperationKind kind);
const char* to_string(OperationState state);

enum class TransferError {
    SUCCESS = 0,
    ALREADY_IN_PROGRESS,
    CONNECTION_LOST,
    STORAGE_COMMIT_FAILED,
    CANCELLED,
    TRANSPORT_ERROR,
    FILE_UNAVAILABLE,
    INVALID_STATE
};

const char* to_string(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    std::filesystem::path location;

    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    static TransferResult ok(std::filesystem::path location) {
        TransferResult result;
        result.location = std::move(location);
        return result;
    }

    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace nearfetch::transfer
