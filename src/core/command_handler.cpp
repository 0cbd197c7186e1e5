#include "nearfetch/core/command_handler.hpp"
#include "nearfetch/core/callback_context.hpp"
#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"
#include "nearfetch/network/loopback_transport.hpp"
#include "nearfetch/storage/indexed_file_store.hpp"
#include "nearfetch/transfer/permission_gate.hpp"
#include "nearfetch/transfer/transfer_coordinator.hpp"
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>

namespace nearfetch::core {

using transfer::TransferOperation;
using transfer::TransferResult;

namespace {

// Asks on the terminal, like a device owner confirming a share.
class ConsolePermissionGate : public transfer::PermissionGate {
public:
    void request_permission(std::shared_ptr<TransferOperation> operation,
                            const std::string& file_id,
                            transfer::PermissionDecision decision) override {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::cout << "\nAllow sending " << file_id << " to "
                  << operation->get_remote_peer().value_or("unknown peer") << "? [y/N] " << std::flush;

        std::string answer;
        std::getline(std::cin, answer);
        answer = utils::StringUtils::to_lower(utils::StringUtils::trim(answer));
        decision(answer == "y" || answer == "yes");
    }

private:
    std::mutex console_mutex_;
};

void print_progress(const std::string& label, double fraction) {
    std::cout << "\r" << label << ": " << utils::StringUtils::format_percentage(fraction) << "   " << std::flush;
}

}

CommandResult DemoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    auto& config = Config::instance();
    auto base_dir = config.get_path("storage.base_dir", "./nearfetch_data");
    auto peer_name = config.get_string("peer.name", "nearfetch");
    auto options = transfer::CoordinatorOptions::from_config(config);

    auto sharer_store = std::make_shared<storage::IndexedFileStore>(storage::StorageConfig(base_dir / "sharer"));
    auto fetcher_store = std::make_shared<storage::IndexedFileStore>(storage::StorageConfig(base_dir / "fetcher"));
    if (!sharer_store->initialize() || !fetcher_store->initialize()) {
        return CommandResult::error("Failed to initialize storage under " + base_dir.string());
    }

    std::string file_id = file_path.filename().string();
    auto shared = sharer_store->share_file(file_id, file_path);
    if (!shared) {
        return CommandResult::error("Failed to share file: " + shared.message);
    }

    auto hub = std::make_shared<network::LoopbackHub>(base_dir / "radio");
    hub->set_chunk_delay(config.get_duration("demo.chunk_delay_ms", std::chrono::milliseconds(2)));
    if (!hub->start()) {
        return CommandResult::error("Failed to start loopback hub");
    }

    auto sharer_context = std::make_shared<CallbackContext>();
    auto fetcher_context = std::make_shared<CallbackContext>();
    sharer_context->start();
    fetcher_context->start();

    std::shared_ptr<transfer::PermissionGate> gate;
    if (config.get_bool("upload.auto_accept", false)) {
        gate = transfer::AutoPermissionGate::from_config(config);
    } else {
        gate = std::make_shared<ConsolePermissionGate>();
    }

    auto sharer = transfer::TransferCoordinator::create(
        hub->join(peer_name + "-sharer"), sharer_store, gate, sharer_context, options);
    auto fetcher = transfer::TransferCoordinator::create(
        hub->join(peer_name + "-fetcher"), fetcher_store,
        std::make_shared<transfer::AutoPermissionGate>(false), fetcher_context, options);

    auto shutdown = [&]() {
        sharer_context->stop();
        fetcher_context->stop();
        sharer.reset();
        fetcher.reset();
        hub->stop();
    };

    sharer->set_upload_callbacks(
        [](std::shared_ptr<TransferOperation>, double fraction) {
            print_progress("Sending", fraction);
        },
        [](std::shared_ptr<TransferOperation> operation, const TransferResult& result) {
            std::cout << "\nUpload " << (operation ? operation->get_id() : std::string("-")) << ": "
                      << (result ? "done" : result.message) << "\n";
        });
    sharer->start_listening();

    auto finished = std::make_shared<std::promise<TransferResult>>();
    auto outcome = finished->get_future();

    std::shared_ptr<TransferOperation> download;
    auto admitted = fetcher->request_download(file_id,
        [](std::shared_ptr<TransferOperation>, double fraction) {
            print_progress("Receiving", fraction);
        },
        [finished](std::shared_ptr<TransferOperation>, const TransferResult& result) {
            finished->set_value(result);
        },
        download);

    if (!admitted) {
        shutdown();
        return CommandResult::error("Download rejected: " + admitted.message);
    }

    std::cout << "Requesting " << file_id << " as " << peer_name << "-fetcher...\n";
    fetcher->start_listening();

    auto deadline = options.scheduler_interval + options.invite_timeout + options.accept_timeout;
    if (outcome.wait_for(deadline) != std::future_status::ready) {
        LOG_WARN("Demo download of {} timed out", file_id);
        download->cancel();
        outcome.wait_for(std::chrono::seconds(5));
        shutdown();
        return CommandResult::error("Timed out waiting for " + file_id);
    }

    TransferResult result = outcome.get();
    shutdown();

    if (!result) {
        return CommandResult::error("Download failed: " + result.message);
    }

    std::cout << "\nStored " << file_id << " at " << result.location.string() << "\n";
    return CommandResult::ok();
}

CommandResult ConfigCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;

    for (const auto& [key, value] : Config::instance().values()) {
        std::cout << key << "=" << value << "\n";
    }
    return CommandResult::ok();
}

}
