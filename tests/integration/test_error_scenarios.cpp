/**
 * @file test_error_scenarios.cpp
 * @brief Integration tests for cancellation, disconnects and failed negotiation
 */

#include "test_fixtures.h"

namespace kcenon::peer_transfer::test {

using namespace std::chrono_literals;

// Cancellation
class CancellationTest : public PeerPairFixture {};

TEST_F(CancellationTest, CancelMidFileLeavesReceiverUnfinished) {
    ASSERT_TRUE(connect_pair());
    constexpr uint64_t chunk = chunk_config::default_chunk_size;

    std::optional<result<void>> outcome;
    alice_->send_files({memory_file_source::from_string("big.bin", std::string(10 * chunk, 'b')),
                        memory_file_source::from_string("next.bin", "never sent")},
                       [&](result<void> r) { outcome = std::move(r); });

    ASSERT_TRUE(run_until(io_, [&] {
        auto progress = alice_->send_progress();
        return progress && progress->done_bytes >= 3 * chunk;
    }));
    alice_->cancel();

    ASSERT_TRUE(run_until(io_, [&] { return outcome.has_value(); }));
    EXPECT_EQ(outcome->error().code, error_code::transfer_cancelled);

    // Let the loopback deliver everything that was enqueued
    ASSERT_TRUE(run_until(io_, [&] {
        auto progress = bob_->receive_progress();
        return progress && progress->done_bytes == 3 * chunk;
    }));
    EXPECT_FALSE(run_until(io_, [&] { return !bob_->received_files().empty(); }, 50ms));

    auto failed = events_of<transfer_failed_event>(alice_->events().drain());
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].sent_bytes, 3 * chunk);

    (void)bob_->events().drain();
    bob_->teardown();
    auto abandoned = events_of<transfer_abandoned_event>(bob_->events().drain());
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_EQ(abandoned[0].file_name, "big.bin");
    EXPECT_EQ(abandoned[0].received_bytes, 3 * chunk);
    EXPECT_TRUE(bob_->received_files().empty());
}

TEST_F(CancellationTest, NewMetaAfterCancelReplacesUnfinished) {
    ASSERT_TRUE(connect_pair());

    std::optional<result<void>> outcome;
    alice_->send_files({memory_file_source::from_string("big.bin", std::string(200000, 'b'))},
                       [&](result<void> r) { outcome = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] {
        auto progress = alice_->send_progress();
        return progress && progress->done_bytes > 0;
    }));
    alice_->cancel();
    ASSERT_TRUE(run_until(io_, [&] { return outcome.has_value(); }));

    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("small.txt", "ok")}));
    ASSERT_TRUE(wait_received(1));

    EXPECT_EQ(bob_->received_files().front()->name(), "small.txt");
    auto abandoned = events_of<transfer_abandoned_event>(bob_->events().drain());
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_EQ(abandoned[0].file_name, "big.bin");
}

// Duplicate meta handling
class DuplicateMetaTest : public PeerPairFixture {
protected:
    void send_raw(const std::string& text) {
        ASSERT_TRUE(alice_->connection().channel()->send_text(text));
    }

    void send_raw(const byte_buffer& data) {
        ASSERT_TRUE(alice_->connection().channel()->send_binary(data));
    }
};

TEST_F(DuplicateMetaTest, ReplacePolicyKeepsLatest) {
    ASSERT_TRUE(connect_pair());

    send_raw(serialize(meta_message{"x", "first.bin", 100, "application/octet-stream"}));
    send_raw(byte_buffer(40));
    send_raw(serialize(meta_message{"y", "second.bin", 4, "application/octet-stream"}));
    send_raw(byte_buffer(4));
    send_raw(serialize(end_message{"y"}));
    send_raw(serialize(end_message{"x"}));

    ASSERT_TRUE(wait_received(1));
    EXPECT_FALSE(run_until(io_, [&] { return bob_->received_files().size() > 1; }, 50ms));

    auto events = bob_->events().drain();
    auto received = events_of<file_received_event>(events);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].file->name(), "second.bin");

    auto abandoned = events_of<transfer_abandoned_event>(events);
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_EQ(abandoned[0].transfer_id, "x");
}

class IgnoreDuplicateMetaTest : public DuplicateMetaTest {
protected:
    auto session_config() const -> peer_config override {
        return peer_config_builder().with_duplicate_meta_policy(duplicate_meta_policy::ignore).build();
    }
};

TEST_F(IgnoreDuplicateMetaTest, IgnorePolicyKeepsFirst) {
    ASSERT_TRUE(connect_pair());

    send_raw(serialize(meta_message{"x", "first.bin", 4, "application/octet-stream"}));
    send_raw(serialize(meta_message{"y", "second.bin", 4, "application/octet-stream"}));
    send_raw(byte_buffer(4));
    send_raw(serialize(end_message{"y"}));
    send_raw(serialize(end_message{"x"}));

    ASSERT_TRUE(wait_received(1));

    auto files = bob_->received_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0]->id(), "x");
    EXPECT_EQ(files[0]->size(), 4u);
}

// Disconnects
class DisconnectTest : public PeerPairFixture {};

TEST_F(DisconnectTest, RemoteTeardownFailsPeer) {
    ASSERT_TRUE(connect_pair());
    (void)bob_->events().drain();

    alice_->teardown();

    ASSERT_TRUE(run_until(io_, [&] { return bob_->state() == connection_state::failed; }));
    EXPECT_FALSE(bob_->is_channel_open());
    EXPECT_EQ(alice_->state(), connection_state::idle);

    auto errors = events_of<error_event>(bob_->events().drain());
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.front().reason.code, error_code::channel_closed);

    std::optional<result<void>> outcome;
    bob_->send_files({memory_file_source::from_string("late.txt", "x")},
                     [&](result<void> r) { outcome = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return outcome.has_value(); }));
    EXPECT_EQ(outcome->error().code, error_code::channel_closed);
}

TEST_F(DisconnectTest, DisconnectDuringTransferFailsSender) {
    ASSERT_TRUE(connect_pair());

    std::optional<result<void>> outcome;
    alice_->send_files({memory_file_source::from_string("big.bin", std::string(2000000, 'z'))},
                       [&](result<void> r) { outcome = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] {
        auto progress = alice_->send_progress();
        return progress && progress->done_bytes > 0;
    }));

    bob_->teardown();

    ASSERT_TRUE(run_until(io_, [&] { return outcome.has_value(); }));
    EXPECT_EQ(outcome->error().code, error_code::channel_closed);
    EXPECT_TRUE(bob_->received_files().empty());
}

TEST_F(DisconnectTest, ResetAndReconnect) {
    ASSERT_TRUE(connect_pair());
    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("a.txt", "a")}));
    ASSERT_TRUE(wait_received(1));

    alice_->reset();
    bob_->reset();
    EXPECT_TRUE(bob_->received_files().empty());

    ASSERT_TRUE(connect_pair());
    ASSERT_TRUE(send_from_alice({memory_file_source::from_string("b.txt", "b")}));
    ASSERT_TRUE(wait_received(1));
    EXPECT_EQ(bob_->received_files().front()->name(), "b.txt");
    EXPECT_EQ(hub_->open_peers(), 2u);
}

// Negotiation failures
class NegotiationFailureTest : public PeerPairFixture {
protected:
    auto session_config() const -> peer_config override {
        return peer_config_builder().with_gathering_timeout(50ms).build();
    }
};

TEST_F(NegotiationFailureTest, FailedConnectivity) {
    hub_->set_fail_negotiation(true);

    ASSERT_TRUE(exchange_codes());
    ASSERT_TRUE(run_until(io_, [&] {
        return alice_->state() == connection_state::failed
            && bob_->state() == connection_state::failed;
    }));

    auto errors = events_of<error_event>(alice_->events().drain());
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.front().reason.code, error_code::negotiation_failed);
}

TEST_F(NegotiationFailureTest, GatheringTimeout) {
    hub_->set_gathering_enabled(false);

    std::optional<result<std::string>> offer;
    alice_->create_offer([&](result<std::string> r) { offer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return offer.has_value(); }));

    ASSERT_FALSE(offer->has_value());
    EXPECT_EQ(offer->error().code, error_code::gathering_timeout);
    EXPECT_EQ(alice_->state(), connection_state::idle);
    EXPECT_EQ(hub_->open_peers(), 0u);
}

TEST_F(NegotiationFailureTest, MalformedOfferRejected) {
    std::optional<result<std::string>> answer;
    bob_->accept_offer("this is not a connection code", [&](result<std::string> r) {
        answer = std::move(r);
    });
    ASSERT_TRUE(run_until(io_, [&] { return answer.has_value(); }));

    EXPECT_EQ(answer->error().code, error_code::malformed_signal);
    EXPECT_EQ(bob_->state(), connection_state::idle);
}

TEST_F(NegotiationFailureTest, AnswerForAnotherOfferRejected) {
    std::optional<result<std::string>> offer;
    alice_->create_offer([&](result<std::string> r) { offer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return offer.has_value(); }));

    auto carol = make_session();
    std::optional<result<std::string>> carol_offer;
    carol->create_offer([&](result<std::string> r) { carol_offer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return carol_offer.has_value(); }));

    std::optional<result<std::string>> answer;
    bob_->accept_offer(carol_offer->value(), [&](result<std::string> r) { answer = std::move(r); });
    ASSERT_TRUE(run_until(io_, [&] { return answer.has_value(); }));
    ASSERT_TRUE(answer->has_value());

    auto applied = alice_->accept_answer(answer->value());
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::backend_error);
}

TEST_F(NegotiationFailureTest, AnswerWithoutOffer) {
    auto applied = alice_->accept_answer(
        encode_signal(signal_descriptor{signal_kind::answer, "v=0\r\n"}));

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::invalid_state);
}

}  // namespace kcenon::peer_transfer::test
