#include <gtest/gtest.h>
#include "nearfetch/transfer/transfer_operation.hpp"
#include <memory>
#include <vector>

using namespace nearfetch::transfer;
using nearfetch::core::CallbackContext;

class TransferOperationTest : public ::testing::Test {
protected:
    std::shared_ptr<TransferOperation> make(OperationKind kind, const std::string& file_id = "song.mp3") {
        return std::make_shared<TransferOperation>(kind, file_id, context_);
    }

    std::shared_ptr<CallbackContext> context_ = std::make_shared<CallbackContext>();
};

TEST_F(TransferOperationTest, Identity) {
    auto first = make(OperationKind::DOWNLOAD);
    auto second = make(OperationKind::UPLOAD);

    EXPECT_TRUE(first->is_download());
    EXPECT_TRUE(second->is_upload());
    EXPECT_EQ(first->get_file_id(), "song.mp3");
    EXPECT_EQ(first->get_id().rfind("op_", 0), 0u);
    EXPECT_NE(first->get_id(), second->get_id());
    EXPECT_EQ(first->get_state(), OperationState::CREATED);
}

TEST_F(TransferOperationTest, RemotePeerBindsOnce) {
    auto upload = make(OperationKind::UPLOAD);
    EXPECT_FALSE(upload->has_remote_peer());

    EXPECT_TRUE(upload->set_remote_peer("alpha"));
    EXPECT_FALSE(upload->set_remote_peer("beta"));
    EXPECT_EQ(upload->get_remote_peer(), PeerId("alpha"));
}

TEST_F(TransferOperationTest, StartRequiresQueued) {
    auto download = make(OperationKind::DOWNLOAD);
    EXPECT_FALSE(download->start());

    download->set_state(OperationState::QUEUED);
    EXPECT_FALSE(download->has_started());
    EXPECT_TRUE(download->start());
    EXPECT_EQ(download->get_state(), OperationState::ADVERTISING);
    EXPECT_TRUE(download->is_running());
    EXPECT_FALSE(download->start());

    auto upload = make(OperationKind::UPLOAD);
    upload->set_state(OperationState::QUEUED);
    EXPECT_TRUE(upload->start());
    EXPECT_EQ(upload->get_state(), OperationState::INVITING);
}

TEST_F(TransferOperationTest, StopIsTerminalAndRunsHookOnce) {
    auto download = make(OperationKind::DOWNLOAD);
    int started = 0;
    int stopped = 0;

    OperationHooks hooks;
    hooks.on_start = [&](const std::shared_ptr<TransferOperation>&) { ++started; };
    hooks.on_stop = [&](const std::shared_ptr<TransferOperation>&) { ++stopped; };
    download->set_hooks(hooks);

    download->set_state(OperationState::QUEUED);
    download->start();
    download->stop();
    download->stop();

    EXPECT_EQ(started, 1);
    EXPECT_EQ(stopped, 1);
    EXPECT_TRUE(download->is_terminated());
    EXPECT_FALSE(download->is_running());
    EXPECT_FALSE(download->set_state(OperationState::TRANSFERRING));
    EXPECT_FALSE(download->set_state(OperationState::TERMINATED));
}

TEST_F(TransferOperationTest, StopDropsCallbacks) {
    auto download = make(OperationKind::DOWNLOAD);
    int completions = 0;
    download->set_callbacks(nullptr, [&](std::shared_ptr<TransferOperation>, const TransferResult&) {
        ++completions;
    });

    download->stop();
    EXPECT_FALSE(download->take_completion_callback());
    EXPECT_EQ(completions, 0);
}

TEST_F(TransferOperationTest, CompletionCallbackIsTakenOnce) {
    auto download = make(OperationKind::DOWNLOAD);
    download->set_callbacks(nullptr, [](std::shared_ptr<TransferOperation>, const TransferResult&) {});

    EXPECT_TRUE(download->take_completion_callback());
    EXPECT_FALSE(download->take_completion_callback());
}

TEST_F(TransferOperationTest, CancelUsesHookOrStops) {
    auto with_hook = make(OperationKind::DOWNLOAD);
    int cancels = 0;
    OperationHooks hooks;
    hooks.on_cancel = [&](const std::shared_ptr<TransferOperation>&) { ++cancels; };
    with_hook->set_hooks(hooks);

    with_hook->cancel();
    EXPECT_EQ(cancels, 1);
    EXPECT_FALSE(with_hook->is_terminated());

    auto bare = make(OperationKind::DOWNLOAD);
    bare->cancel();
    EXPECT_TRUE(bare->is_terminated());

    with_hook->stop();
    with_hook->cancel();
    EXPECT_EQ(cancels, 1);
}

TEST_F(TransferOperationTest, ProgressIsClampedAndMonotonic) {
    auto upload = make(OperationKind::UPLOAD);

    EXPECT_TRUE(upload->update_progress(0.4));
    EXPECT_FALSE(upload->update_progress(0.2));
    EXPECT_DOUBLE_EQ(upload->get_progress(), 0.4);

    EXPECT_TRUE(upload->update_progress(3.0));
    EXPECT_DOUBLE_EQ(upload->get_progress(), 1.0);
}

TEST_F(TransferOperationTest, AttachedSourceReportsOnContext) {
    auto download = make(OperationKind::DOWNLOAD);
    std::vector<double> reported;
    download->set_progress_callback([&](std::shared_ptr<TransferOperation> operation, double fraction) {
        EXPECT_EQ(operation->get_file_id(), "song.mp3");
        reported.push_back(fraction);
    });

    auto tracker = std::make_shared<ProgressTracker>(100);
    download->attach_progress_source(tracker);
    EXPECT_EQ(tracker->subscriber_count(), 1u);

    tracker->set_completed_units(30);
    EXPECT_DOUBLE_EQ(download->get_transfer_fraction(), 0.3);
    EXPECT_TRUE(reported.empty());

    context_->poll();
    EXPECT_EQ(reported, (std::vector<double>{0.3}));
    EXPECT_DOUBLE_EQ(download->get_progress(), 0.3);
}

TEST_F(TransferOperationTest, AttachPicksUpEarlierProgress) {
    auto download = make(OperationKind::DOWNLOAD);
    auto tracker = std::make_shared<ProgressTracker>(10);
    tracker->set_completed_units(7);

    download->attach_progress_source(tracker);
    EXPECT_DOUBLE_EQ(download->get_progress(), 0.7);

    tracker->set_completed_units(9);
    context_->poll();
    EXPECT_DOUBLE_EQ(download->get_progress(), 0.9);
}

TEST_F(TransferOperationTest, DetachUnsubscribes) {
    auto download = make(OperationKind::DOWNLOAD);
    auto tracker = std::make_shared<ProgressTracker>(10);

    download->attach_progress_source(tracker);
    download->detach_progress_source();
    download->detach_progress_source();
    EXPECT_EQ(tracker->subscriber_count(), 0u);

    download->attach_progress_source(tracker);
    download->stop();
    EXPECT_EQ(tracker->subscriber_count(), 0u);
}

TEST_F(TransferOperationTest, DiscoveryPayloadNamesFile) {
    auto download = make(OperationKind::DOWNLOAD, "notes.txt");
    auto payload = download->discovery_payload();

    EXPECT_TRUE(is_transfer_payload(payload));
    EXPECT_EQ(payload_file_id(payload), std::string("notes.txt"));
    EXPECT_EQ(payload, make_transfer_payload("notes.txt"));
    EXPECT_NE(payload, make_transfer_payload("other.txt"));
}

TEST(DiscoveryPayloadTest, ForeignPayloadsAreNotTransfers) {
    DiscoveryPayload chat{{"type", "chat"}, {"file_id", "x"}};
    DiscoveryPayload empty_id{{"type", "transfer"}, {"file_id", ""}};

    EXPECT_FALSE(is_transfer_payload(chat));
    EXPECT_FALSE(payload_file_id(chat).has_value());
    EXPECT_TRUE(is_transfer_payload(empty_id));
    EXPECT_FALSE(payload_file_id(empty_id).has_value());
    EXPECT_EQ(to_string(make_transfer_payload("a")), "{file_id: a, type: transfer}");
}

TEST(TransferResultTest, SuccessCarriesLocation) {
    auto ok = TransferResult::ok("/tmp/a.txt");
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.location, std::filesystem::path("/tmp/a.txt"));

    TransferResult failed(TransferError::CONNECTION_LOST, "gone");
    EXPECT_FALSE(failed);
    EXPECT_STREQ(to_string(failed.error), "ConnectionLost");
}
