/**
 * @file test_connection_manager.cpp
 * @brief Unit tests for the peer connection state machine
 */

#include <gtest/gtest.h>

#include <kcenon/peer_transfer/connection/connection_manager.h>

#include "../../fixtures/event_helpers.h"
#include "../../fixtures/fake_backend.h"

#include <boost/asio/io_context.hpp>

#include <optional>

namespace kcenon::peer_transfer::test {

using namespace std::chrono_literals;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<scripted_factory>();
        events_ = std::make_shared<event_queue<transfer_event>>();
    }

    auto make_manager(peer_config config = {}) -> std::shared_ptr<connection_manager> {
        return connection_manager::create(io_, factory_, config, events_);
    }

    auto code_handler() -> connection_manager::code_handler {
        code_.reset();
        return [this](result<std::string> r) { code_ = std::move(r); };
    }

    auto wait_code(std::chrono::milliseconds timeout = 2s) -> bool {
        return run_until(io_, [this] { return code_.has_value(); }, timeout);
    }

    static auto offer_code() -> std::string {
        return encode_signal(signal_descriptor{signal_kind::offer, "v=0\r\ns=remote offer"});
    }

    static auto answer_code() -> std::string {
        return encode_signal(signal_descriptor{signal_kind::answer, "v=0\r\ns=remote answer"});
    }

    /// Initiator with its connection code generated
    auto make_offering_manager() -> std::shared_ptr<connection_manager> {
        auto manager = make_manager();
        manager->create_as_initiator(code_handler());
        EXPECT_TRUE(wait_code());
        EXPECT_TRUE(code_ && code_->has_value());
        return manager;
    }

    boost::asio::io_context io_;
    std::shared_ptr<scripted_factory> factory_;
    std::shared_ptr<event_queue<transfer_event>> events_;
    std::optional<result<std::string>> code_;
};

// ============================================================================
// Initiator
// ============================================================================

TEST_F(ConnectionManagerTest, Initiator_ProducesOfferCode) {
    auto manager = make_manager();
    std::shared_ptr<data_channel> announced;
    manager->set_channel_listener([&](std::shared_ptr<data_channel> ch) { announced = ch; });

    manager->create_as_initiator(code_handler());
    ASSERT_TRUE(wait_code());
    ASSERT_TRUE(code_->has_value());

    auto decoded = decode_signal(code_->value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().kind, signal_kind::offer);
    EXPECT_EQ(manager->local_code(), code_->value());

    EXPECT_EQ(manager->state(), connection_state::connecting);
    EXPECT_EQ(manager->role(), connection_role::initiator);
    EXPECT_FALSE(manager->is_generating_code());

    auto record = factory_->last();
    ASSERT_TRUE(record->channel);
    EXPECT_EQ(record->channel->label(), "file");
    EXPECT_EQ(announced, record->channel);
    EXPECT_EQ(manager->channel(), record->channel);
}

TEST_F(ConnectionManagerTest, Initiator_WaitsForGatheringComplete) {
    factory_->complete_gathering_immediately = false;
    auto manager = make_manager();

    manager->create_as_initiator(code_handler());
    EXPECT_FALSE(wait_code(30ms));
    EXPECT_TRUE(manager->is_generating_code());

    factory_->last()->peer->emit_gathering(gathering_state::complete);

    ASSERT_TRUE(wait_code());
    EXPECT_TRUE(code_->has_value());
}

TEST_F(ConnectionManagerTest, Initiator_GatheringTimeoutReturnsToIdle) {
    factory_->complete_gathering_immediately = false;
    auto manager = make_manager(peer_config_builder().with_gathering_timeout(20ms).build());

    manager->create_as_initiator(code_handler());
    ASSERT_TRUE(wait_code());

    ASSERT_FALSE(code_->has_value());
    EXPECT_EQ(code_->error().code, error_code::gathering_timeout);
    EXPECT_EQ(manager->state(), connection_state::idle);
    EXPECT_TRUE(factory_->last()->closed);

    auto errors = events_of<error_event>(events_->drain());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].reason.code, error_code::gathering_timeout);
}

TEST_F(ConnectionManagerTest, Initiator_FactoryFailure) {
    factory_->fail_creation = true;
    auto manager = make_manager();

    manager->create_as_initiator(code_handler());
    ASSERT_TRUE(wait_code());

    EXPECT_EQ(code_->error().code, error_code::backend_error);
    EXPECT_EQ(manager->state(), connection_state::idle);
}

TEST_F(ConnectionManagerTest, Initiator_ChannelCreationFailureClosesPeer) {
    factory_->fail_channel_creation = true;
    auto manager = make_manager();

    manager->create_as_initiator(code_handler());
    ASSERT_TRUE(wait_code());

    EXPECT_FALSE(code_->has_value());
    EXPECT_TRUE(factory_->last()->closed);
    EXPECT_EQ(manager->state(), connection_state::idle);
}

TEST_F(ConnectionManagerTest, Initiator_RecreateClosesPreviousPeer) {
    auto manager = make_offering_manager();
    auto first = factory_->last();

    manager->create_as_initiator(code_handler());
    ASSERT_TRUE(wait_code());

    EXPECT_TRUE(first->closed);
    EXPECT_EQ(factory_->records.size(), 2u);
    EXPECT_FALSE(factory_->last()->closed);
}

// ============================================================================
// Answer application
// ============================================================================

TEST_F(ConnectionManagerTest, Answer_AppliedToInitiator) {
    auto manager = make_offering_manager();

    auto applied = manager->apply_remote_answer(answer_code());

    ASSERT_TRUE(applied);
    ASSERT_TRUE(factory_->last()->remote);
    EXPECT_EQ(factory_->last()->remote->kind, signal_kind::answer);
    EXPECT_EQ(factory_->last()->remote->sdp, "v=0\r\ns=remote answer");
}

TEST_F(ConnectionManagerTest, Answer_WithoutOfferIsInvalidState) {
    auto manager = make_manager();

    auto applied = manager->apply_remote_answer(answer_code());

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::invalid_state);
    EXPECT_EQ(applied.error().message, "generate a connection code first");
}

TEST_F(ConnectionManagerTest, Answer_WhileGeneratingIsInvalidState) {
    factory_->complete_gathering_immediately = false;
    auto manager = make_manager();
    manager->create_as_initiator(code_handler());

    auto applied = manager->apply_remote_answer(answer_code());

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::invalid_state);
}

TEST_F(ConnectionManagerTest, Answer_OfferCodeRejected) {
    auto manager = make_offering_manager();

    auto applied = manager->apply_remote_answer(offer_code());

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::malformed_signal);
}

TEST_F(ConnectionManagerTest, Answer_MalformedCodeKeepsConnection) {
    auto manager = make_offering_manager();

    auto applied = manager->apply_remote_answer("%%%");

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::malformed_signal);
    EXPECT_EQ(manager->state(), connection_state::connecting);
    EXPECT_FALSE(factory_->last()->closed);
}

TEST_F(ConnectionManagerTest, Answer_BackendRejection) {
    auto manager = make_offering_manager();
    factory_->last()->reject_remote_description = true;

    auto applied = manager->apply_remote_answer(answer_code());

    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, error_code::negotiation_failed);
}

// ============================================================================
// Responder
// ============================================================================

TEST_F(ConnectionManagerTest, Responder_ProducesAnswerCode) {
    auto manager = make_manager();

    manager->create_as_responder(offer_code(), code_handler());
    ASSERT_TRUE(wait_code());
    ASSERT_TRUE(code_->has_value());

    auto decoded = decode_signal(code_->value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().kind, signal_kind::answer);
    EXPECT_EQ(manager->role(), connection_role::responder);

    auto record = factory_->last();
    ASSERT_TRUE(record->remote);
    EXPECT_EQ(record->remote->kind, signal_kind::offer);
    EXPECT_FALSE(record->channel);
}

TEST_F(ConnectionManagerTest, Responder_MalformedCodeLeavesStateUntouched) {
    auto manager = make_offering_manager();

    manager->create_as_responder("definitely not a code", code_handler());
    ASSERT_TRUE(wait_code());

    EXPECT_EQ(code_->error().code, error_code::malformed_signal);
    EXPECT_EQ(manager->role(), connection_role::initiator);
    EXPECT_EQ(factory_->records.size(), 1u);
}

TEST_F(ConnectionManagerTest, Responder_AnswerCodeRejected) {
    auto manager = make_manager();

    manager->create_as_responder(answer_code(), code_handler());
    ASSERT_TRUE(wait_code());

    EXPECT_EQ(code_->error().code, error_code::malformed_signal);
    EXPECT_TRUE(factory_->records.empty());
}

TEST_F(ConnectionManagerTest, Responder_AdoptsRemoteChannel) {
    auto manager = make_manager();
    std::shared_ptr<data_channel> announced;
    manager->set_channel_listener([&](std::shared_ptr<data_channel> ch) { announced = ch; });

    manager->create_as_responder(offer_code(), code_handler());
    ASSERT_TRUE(wait_code());

    auto remote = std::make_shared<scripted_channel>();
    factory_->last()->peer->emit_channel(remote);

    EXPECT_EQ(announced, remote);
    EXPECT_EQ(manager->channel(), remote);

    auto extra = std::make_shared<scripted_channel>("other");
    factory_->last()->peer->emit_channel(extra);
    EXPECT_EQ(manager->channel(), remote);
    EXPECT_EQ(extra->close_calls(), 1);
}

TEST_F(ConnectionManagerTest, RemoteCode_DispatchesByKind) {
    auto responder = make_manager();
    responder->apply_remote_code(offer_code(), code_handler());
    ASSERT_TRUE(wait_code());
    ASSERT_TRUE(code_->has_value());
    EXPECT_FALSE(code_->value().empty());
    EXPECT_EQ(responder->role(), connection_role::responder);

    auto initiator = make_offering_manager();
    initiator->apply_remote_code(answer_code(), code_handler());
    ASSERT_TRUE(wait_code());
    ASSERT_TRUE(code_->has_value());
    EXPECT_TRUE(code_->value().empty());
}

// ============================================================================
// State transitions
// ============================================================================

TEST_F(ConnectionManagerTest, State_ConnectedOnPeerConnected) {
    auto manager = make_offering_manager();
    ASSERT_TRUE(manager->apply_remote_answer(answer_code()));
    (void)events_->drain();

    factory_->last()->peer->emit_ice_state(ice_state::connected);
    factory_->last()->peer->emit_state(peer_state::connected);

    EXPECT_EQ(manager->state(), connection_state::connected);
    EXPECT_EQ(manager->ice(), ice_state::connected);

    auto drained = events_->drain();
    EXPECT_EQ(count_events<ice_state_changed>(drained), 1u);
    auto changes = events_of<connection_state_changed>(drained);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].previous, connection_state::connecting);
    EXPECT_EQ(changes[0].current, connection_state::connected);
}

TEST_F(ConnectionManagerTest, State_PeerFailureIsNegotiationFailed) {
    auto manager = make_offering_manager();
    (void)events_->drain();

    factory_->last()->peer->emit_state(peer_state::failed);

    EXPECT_EQ(manager->state(), connection_state::failed);
    auto errors = events_of<error_event>(events_->drain());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].reason.code, error_code::negotiation_failed);
}

TEST_F(ConnectionManagerTest, State_IceFailureIsNegotiationFailed) {
    auto manager = make_offering_manager();

    factory_->last()->peer->emit_ice_state(ice_state::failed);

    EXPECT_EQ(manager->state(), connection_state::failed);
}

TEST_F(ConnectionManagerTest, State_RemoteDisconnectWhileConnected) {
    auto manager = make_offering_manager();
    factory_->last()->peer->emit_state(peer_state::connected);
    (void)events_->drain();

    factory_->last()->peer->emit_state(peer_state::disconnected);

    EXPECT_EQ(manager->state(), connection_state::failed);
    auto errors = events_of<error_event>(events_->drain());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].reason.code, error_code::channel_closed);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(ConnectionManagerTest, Teardown_ClosesEverything) {
    auto manager = make_offering_manager();
    std::vector<std::shared_ptr<data_channel>> announced;
    manager->set_channel_listener([&](std::shared_ptr<data_channel> ch) { announced.push_back(ch); });
    auto record = factory_->last();

    manager->teardown();

    EXPECT_TRUE(record->closed);
    EXPECT_EQ(record->channel->close_calls(), 1);
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0], nullptr);

    EXPECT_EQ(manager->state(), connection_state::idle);
    EXPECT_EQ(manager->role(), connection_role::none);
    EXPECT_TRUE(manager->local_code().empty());
    EXPECT_FALSE(manager->channel());
}

TEST_F(ConnectionManagerTest, Teardown_FailsPendingCode) {
    factory_->complete_gathering_immediately = false;
    auto manager = make_manager();
    manager->create_as_initiator(code_handler());

    manager->teardown();
    ASSERT_TRUE(wait_code());

    EXPECT_EQ(code_->error().code, error_code::invalid_state);
}

TEST_F(ConnectionManagerTest, Teardown_IgnoresLateBackendEvents) {
    auto manager = make_offering_manager();
    auto record = factory_->last();
    manager->teardown();
    (void)events_->drain();

    ASSERT_EQ(record->peer, nullptr);
    EXPECT_EQ(manager->state(), connection_state::idle);
    EXPECT_TRUE(events_->empty());
}

TEST_F(ConnectionManagerTest, Teardown_IdempotentWhenIdle) {
    auto manager = make_manager();

    manager->teardown();
    manager->teardown();

    EXPECT_EQ(manager->state(), connection_state::idle);
    EXPECT_TRUE(events_->empty());
}

TEST_F(ConnectionManagerTest, RoleNames) {
    EXPECT_STREQ(to_string(connection_role::none), "none");
    EXPECT_STREQ(to_string(connection_role::initiator), "initiator");
    EXPECT_STREQ(to_string(connection_role::responder), "responder");
}

}  // namespace kcenon::peer_transfer::test
