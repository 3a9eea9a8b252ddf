/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end transfers between two loopback sessions
 */

#include "test_fixtures.h"

namespace kcenon::peer_transfer::test {

// Connection setup
class ConnectionSetupTest : public PeerPairFixture {};

TEST_F(ConnectionSetupTest, OfferAnswerOpensChannel) {
    ASSERT_TRUE(connect_pair());

    EXPECT_EQ(alice_->state(), connection_state::connected);
    EXPECT_EQ(bob_->state(), connection_state::connected);
    EXPECT_EQ(alice_->connection().role(), connection_role::initiator);
    EXPECT_EQ(bob_->connection().role(), connection_role::responder);
    EXPECT_EQ(bob_->data_channel_state(), channel_state::open);
}

TEST_F(ConnectionSetupTest, StateEventsInOrder) {
    ASSERT_TRUE(connect_pair());

    auto changes = events_of<connection_state_changed>(alice_->events().drain());
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].current, connection_state::connecting);
    EXPECT_EQ(changes[1].current, connection_state::connected);
}

TEST_F(ConnectionSetupTest, RemoteCodeDispatch) {
    std::optional<result<std::string>> offer;
    alice_->apply_remote_code("", [&](result<std::string> r) { offer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return offer.has_value(); }));
    EXPECT_EQ(offer->error().code, error_code::malformed_signal);

    offer.reset();
    alice_->create_offer([&](result<std::string> r) { offer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return offer.has_value(); }));

    std::optional<result<std::string>> answer;
    bob_->apply_remote_code(offer->value(), [&](result<std::string> r) { answer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return answer.has_value(); }));
    ASSERT_TRUE(answer->has_value());

    std::optional<result<std::string>> applied;
    alice_->apply_remote_code(answer->value(), [&](result<std::string> r) { applied = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return applied.has_value(); }));
    ASSERT_TRUE(applied->has_value());
    EXPECT_TRUE(applied->value().empty());

    EXPECT_TRUE(run_until(io_, [&] {
        return alice_->is_channel_open() && bob_->is_channel_open();
    }));
}

// File transfer
class FileTransferTest : public PeerPairFixture {};

TEST_F(FileTransferTest, SingleFileFromDisk) {
    ASSERT_TRUE(connect_pair());
    auto path = create_test_file("report.pdf", test_data::small_file_size);
    auto source = disk_file_source::open(path);
    ASSERT_TRUE(source);

    auto sent = send_from_alice({source.value()});
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    ASSERT_TRUE(wait_received(1));

    auto events = bob_->events().drain();
    auto received = events_of<file_received_event>(events);
    ASSERT_EQ(received.size(), 1u);

    const auto& file = received[0].file;
    EXPECT_EQ(file->name(), "report.pdf");
    EXPECT_EQ(file->mime_type(), "application/pdf");
    EXPECT_EQ(file->size(), 51200u);
    EXPECT_EQ(file->data(), read_file(path));

    auto saved = file->save_to(download_dir_);
    ASSERT_TRUE(saved);
    EXPECT_EQ(read_file(saved.value()), read_file(path));
}

TEST_F(FileTransferTest, ZeroByteFile) {
    ASSERT_TRUE(connect_pair());

    auto sent = send_from_alice({memory_file_source::from_string("empty.txt", "")});
    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(wait_received(1));

    auto file = bob_->received_files().front();
    EXPECT_EQ(file->name(), "empty.txt");
    EXPECT_EQ(file->size(), 0u);
}

TEST_F(FileTransferTest, MultipleFilesSequential) {
    ASSERT_TRUE(connect_pair());

    std::vector<file_source_ptr> files;
    files.push_back(memory_file_source::from_string("one.txt", std::string(40000, '1')));
    files.push_back(memory_file_source::from_string("two.txt", std::string(10, '2')));
    files.push_back(memory_file_source::from_string("three.txt", std::string(16384, '3')));

    auto sent = send_from_alice(std::move(files));
    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(wait_received(3));

    auto received = events_of<file_received_event>(bob_->events().drain());
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].file->name(), "one.txt");
    EXPECT_EQ(received[1].file->name(), "two.txt");
    EXPECT_EQ(received[2].file->name(), "three.txt");
    EXPECT_EQ(received[0].file->size(), 40000u);
    EXPECT_EQ(received[2].file->size(), 16384u);

    auto sent_events = events_of<transfer_sent_event>(alice_->events().drain());
    EXPECT_EQ(sent_events.size(), 3u);
}

TEST_F(FileTransferTest, BothDirections) {
    ASSERT_TRUE(connect_pair());

    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("to-bob.txt", "hi bob")}));
    ASSERT_TRUE(wait_received(1));

    std::optional<result<void>> back;
    bob_->send_files({memory_file_source::from_string("to-alice.txt", "hi alice")},
                     [&](result<void> r) { back = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] {
        return back.has_value() && alice_->received_files().size() == 1;
    }));

    ASSERT_TRUE(back->has_value());
    EXPECT_EQ(alice_->received_files().front()->name(), "to-alice.txt");
}

TEST_F(FileTransferTest, ProgressReachesCompletion) {
    ASSERT_TRUE(connect_pair());
    (void)bob_->events().drain();

    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("p.bin", std::string(100000, 'p'))}));
    ASSERT_TRUE(wait_received(1));

    auto outgoing = events_of<progress_event>(alice_->events().drain());
    ASSERT_FALSE(outgoing.empty());
    EXPECT_TRUE(outgoing.back().progress.is_complete());

    auto incoming = events_of<progress_event>(bob_->events().drain());
    ASSERT_FALSE(incoming.empty());
    EXPECT_EQ(incoming.front().progress.done_bytes, 0u);
    EXPECT_TRUE(incoming.back().progress.is_complete());
}

TEST_F(FileTransferTest, ReceivedListNewestFirst) {
    ASSERT_TRUE(connect_pair());

    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("first.txt", "1")}));
    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("second.txt", "2")}));
    ASSERT_TRUE(wait_received(2));

    auto files = bob_->received_files();
    EXPECT_EQ(files[0]->name(), "second.txt");
    EXPECT_EQ(files[1]->name(), "first.txt");
}

// Backpressure
class BackpressureTest : public PeerPairFixture {
protected:
    auto hub_options() const -> loopback_options override {
        loopback_options options;
        options.drain_bytes_per_tick = 64 * 1024;
        return options;
    }

    auto session_config() const -> peer_config override {
        return peer_config_builder().with_buffered_amount_limits(128 * 1024, 32 * 1024).build();
    }
};

TEST_F(BackpressureTest, LargeFileThroughSmallBuffer) {
    ASSERT_TRUE(connect_pair());
    auto path = create_test_file("large.bin", test_data::medium_file_size);
    auto source = disk_file_source::open(path);
    ASSERT_TRUE(source);

    auto sent = send_from_alice({source.value()});
    ASSERT_TRUE(sent.has_value()) << sent.error().message;
    ASSERT_TRUE(wait_received(1));

    EXPECT_EQ(bob_->received_files().front()->data(), read_file(path));
}

}  // namespace kcenon::peer_transfer::test
