#include <gtest/gtest.h>
#include "nearfetch/network/loopback_transport.hpp"
#include "nearfetch/storage/indexed_file_store.hpp"
#include "nearfetch/transfer/permission_gate.hpp"
#include "nearfetch/transfer/transfer_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace nearfetch;
using namespace nearfetch::transfer;
using namespace std::chrono_literals;

namespace {

struct Node {
    std::shared_ptr<core::CallbackContext> context;
    std::shared_ptr<storage::IndexedFileStore> store;
    std::shared_ptr<TransferCoordinator> coordinator;
};

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}

class LoopbackTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir_ = std::filesystem::temp_directory_path() / "nearfetch_loopback_test";
        std::filesystem::remove_all(base_dir_);
        std::filesystem::create_directories(base_dir_ / "originals");

        hub_ = std::make_shared<network::LoopbackHub>(base_dir_ / "radio", 16 * 1024);
        ASSERT_TRUE(hub_->start());

        options_.scheduler_interval = 20ms;
        options_.accept_timeout = 3000ms;
        options_.invite_timeout = 3000ms;
    }

    void TearDown() override {
        for (auto& node : nodes_) {
            node.context->stop();
        }
        for (auto& node : nodes_) {
            node.coordinator.reset();
        }
        nodes_.clear();
        hub_->stop();
        std::filesystem::remove_all(base_dir_);
    }

    Node& add_node(const std::string& name, std::shared_ptr<PermissionGate> gate) {
        Node node;
        node.context = std::make_shared<core::CallbackContext>();
        node.context->start();

        node.store = std::make_shared<storage::IndexedFileStore>(storage::StorageConfig(base_dir_ / name));
        EXPECT_TRUE(node.store->initialize());

        auto transport = hub_->join(name);
        EXPECT_NE(transport, nullptr);
        node.coordinator = TransferCoordinator::create(transport, node.store, std::move(gate), node.context, options_);

        nodes_.push_back(std::move(node));
        return nodes_.back();
    }

    std::filesystem::path make_original(const std::string& name, std::size_t size) {
        std::string content;
        content.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            content.push_back(static_cast<char>('a' + (i * 7) % 26));
        }

        auto path = base_dir_ / "originals" / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path base_dir_;
    std::shared_ptr<network::LoopbackHub> hub_;
    CoordinatorOptions options_;
    std::deque<Node> nodes_;
};

TEST_F(LoopbackTransferTest, FetchesSharedFile) {
    auto original = make_original("atlas.bin", 100 * 1024);

    auto& sharer = add_node("sharer", std::make_shared<AutoPermissionGate>(true));
    auto& fetcher = add_node("fetcher", std::make_shared<AutoPermissionGate>(false));
    ASSERT_TRUE(sharer.store->share_file("atlas.bin", original));

    std::promise<TransferResult> uploaded;
    sharer.coordinator->set_upload_callbacks(nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { uploaded.set_value(result); });
    sharer.coordinator->start_listening();

    std::promise<TransferResult> downloaded;
    std::atomic<double> last_progress{0.0};
    std::shared_ptr<TransferOperation> download;
    ASSERT_TRUE(fetcher.coordinator->request_download("atlas.bin",
        [&](std::shared_ptr<TransferOperation>, double fraction) { last_progress = fraction; },
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { downloaded.set_value(result); },
        download));
    fetcher.coordinator->start_listening();

    auto download_result = downloaded.get_future();
    ASSERT_EQ(download_result.wait_for(10s), std::future_status::ready);
    auto result = download_result.get();

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.location, fetcher.store->get_config().download_directory / "atlas.bin");
    EXPECT_EQ(read_file(result.location), read_file(original));
    EXPECT_DOUBLE_EQ(last_progress.load(), 1.0);
    EXPECT_TRUE(download->is_terminated());

    auto upload_result = uploaded.get_future();
    ASSERT_EQ(upload_result.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(upload_result.get());

    EXPECT_TRUE(wait_until([&]() { return sharer.coordinator->registry()->empty(); }));
    EXPECT_TRUE(fetcher.coordinator->registry()->empty());

    // The fetched copy can be served onwards.
    EXPECT_TRUE(fetcher.store->exists("atlas.bin"));
}

TEST_F(LoopbackTransferTest, ExistingDownloadIsNotOverwritten) {
    auto original = make_original("notes.txt", 4096);

    auto& sharer = add_node("sharer", std::make_shared<AutoPermissionGate>(true));
    auto& fetcher = add_node("fetcher", std::make_shared<AutoPermissionGate>(false));
    ASSERT_TRUE(sharer.store->share_file("notes.txt", original));

    auto existing = fetcher.store->get_config().download_directory / "notes.txt";
    {
        std::ofstream file(existing);
        file << "keep me";
    }

    sharer.coordinator->start_listening();

    std::promise<TransferResult> downloaded;
    std::shared_ptr<TransferOperation> download;
    ASSERT_TRUE(fetcher.coordinator->request_download("notes.txt", nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { downloaded.set_value(result); },
        download));
    fetcher.coordinator->start_listening();

    auto future = downloaded.get_future();
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    auto result = future.get();

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.location.filename(), "notes (1).txt");
    EXPECT_EQ(read_file(existing), "keep me");
    EXPECT_EQ(read_file(result.location), read_file(original));
}

TEST_F(LoopbackTransferTest, DeniedUploadLeavesDownloadAdvertising) {
    auto original = make_original("private.doc", 1024);

    auto& sharer = add_node("sharer", std::make_shared<AutoPermissionGate>(false));
    auto& fetcher = add_node("fetcher", std::make_shared<AutoPermissionGate>(false));
    ASSERT_TRUE(sharer.store->share_file("private.doc", original));
    sharer.coordinator->start_listening();

    std::promise<TransferResult> downloaded;
    std::shared_ptr<TransferOperation> download;
    ASSERT_TRUE(fetcher.coordinator->request_download("private.doc", nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { downloaded.set_value(result); },
        download));
    fetcher.coordinator->start_listening();

    ASSERT_TRUE(wait_until([&]() { return fetcher.coordinator->is_advertising(); }));
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(download->get_state(), OperationState::ADVERTISING);
    EXPECT_TRUE(sharer.coordinator->registry()->empty());

    download->cancel();
    auto future = downloaded.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get().error, TransferError::CANCELLED);
    EXPECT_TRUE(wait_until([&]() { return !fetcher.coordinator->is_advertising(); }));
}

TEST_F(LoopbackTransferTest, TwoFetchersShareOneUploadCompletion) {
    auto original = make_original("video.mp4", 256 * 1024);
    hub_->set_chunk_delay(5ms);

    // Grant both requests together so that both uploads are in flight at once.
    std::mutex pending_mutex;
    std::vector<PermissionDecision> pending;

    auto& sharer = add_node("sharer", nullptr);
    auto& first = add_node("fetcher-1", nullptr);
    auto& second = add_node("fetcher-2", nullptr);
    ASSERT_TRUE(sharer.store->share_file("video.mp4", original));

    sharer.coordinator->set_upload_permission_override(
        [&](std::shared_ptr<TransferOperation>, const std::string&, PermissionDecision decision) {
            std::vector<PermissionDecision> ready;
            {
                std::lock_guard<std::mutex> lock(pending_mutex);
                pending.push_back(std::move(decision));
                if (pending.size() == 2) {
                    ready.swap(pending);
                }
            }
            for (auto& grant : ready) {
                grant(true);
            }
        });

    std::atomic<int> upload_completions{0};
    std::atomic<double> aggregate{0.0};
    sharer.coordinator->set_upload_callbacks(
        [&](std::shared_ptr<TransferOperation>, double fraction) { aggregate = fraction; },
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) {
            EXPECT_TRUE(result) << result.message;
            ++upload_completions;
        });

    std::promise<TransferResult> first_done;
    std::promise<TransferResult> second_done;
    std::shared_ptr<TransferOperation> first_download;
    std::shared_ptr<TransferOperation> second_download;
    ASSERT_TRUE(first.coordinator->request_download("video.mp4", nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { first_done.set_value(result); },
        first_download));
    ASSERT_TRUE(second.coordinator->request_download("video.mp4", nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { second_done.set_value(result); },
        second_download));
    first.coordinator->start_listening();
    second.coordinator->start_listening();

    ASSERT_TRUE(wait_until([&]() {
        return first.coordinator->is_advertising() && second.coordinator->is_advertising();
    }));
    sharer.coordinator->start_listening();

    auto first_result = first_done.get_future();
    auto second_result = second_done.get_future();
    ASSERT_EQ(first_result.wait_for(15s), std::future_status::ready);
    ASSERT_EQ(second_result.wait_for(15s), std::future_status::ready);
    EXPECT_TRUE(first_result.get());
    EXPECT_TRUE(second_result.get());

    ASSERT_TRUE(wait_until([&]() { return sharer.coordinator->registry()->empty(); }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(upload_completions.load(), 1);
    EXPECT_GT(aggregate.load(), 0.0);
}

TEST_F(LoopbackTransferTest, CancelDuringTransferFailsBothSides) {
    auto original = make_original("archive.tar", 1024 * 1024);
    hub_->set_chunk_delay(10ms);

    auto& sharer = add_node("sharer", std::make_shared<AutoPermissionGate>(true));
    auto& fetcher = add_node("fetcher", std::make_shared<AutoPermissionGate>(false));
    ASSERT_TRUE(sharer.store->share_file("archive.tar", original));

    std::promise<TransferResult> uploaded;
    sharer.coordinator->set_upload_callbacks(nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { uploaded.set_value(result); });
    sharer.coordinator->start_listening();

    std::promise<TransferResult> downloaded;
    std::shared_ptr<TransferOperation> download;
    ASSERT_TRUE(fetcher.coordinator->request_download("archive.tar", nullptr,
        [&](std::shared_ptr<TransferOperation>, const TransferResult& result) { downloaded.set_value(result); },
        download));
    fetcher.coordinator->start_listening();

    ASSERT_TRUE(wait_until([&]() { return download->get_state() == OperationState::TRANSFERRING; }));
    download->cancel();

    auto download_result = downloaded.get_future();
    ASSERT_EQ(download_result.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(download_result.get().error, TransferError::CANCELLED);

    auto upload_result = uploaded.get_future();
    ASSERT_EQ(upload_result.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(upload_result.get());

    EXPECT_FALSE(std::filesystem::exists(fetcher.store->get_config().download_directory / "archive.tar"));
}
