/**
 * @file connection_manager.cpp
 * @brief Implementation of the peer connection state machine
 */

#include <kcenon/peer_transfer/connection/connection_manager.h>

#include <kcenon/peer_transfer/core/logging.h>

#include <boost/asio/post.hpp>

namespace kcenon::peer_transfer {

auto connection_manager::create(boost::asio::io_context& io,
                                std::shared_ptr<backend_factory> factory,
                                const peer_config& config,
                                std::shared_ptr<event_queue<transfer_event>> events)
    -> std::shared_ptr<connection_manager> {
    return std::shared_ptr<connection_manager>(
        new connection_manager(io, std::move(factory), config, std::move(events)));
}

connection_manager::connection_manager(boost::asio::io_context& io,
                                       std::shared_ptr<backend_factory> factory,
                                       const peer_config& config,
                                       std::shared_ptr<event_queue<transfer_event>> events)
    : io_(io),
      factory_(std::move(factory)),
      config_(config),
      events_(std::move(events)),
      gathering_timer_(io) {}

connection_manager::~connection_manager() {
    gathering_timer_.cancel();
    if (channel_) {
        channel_->set_handlers({});
        channel_->close();
    }
    if (peer_) {
        peer_->set_handlers({});
        peer_->close();
    }
}

void connection_manager::create_as_initiator(code_handler handler) {
    teardown();

    if (auto opened = open_peer(connection_role::initiator); !opened) {
        abort_creation(std::move(handler), opened.error());
        return;
    }

    auto channel = peer_->create_data_channel(config_.channel_label);
    if (!channel) {
        abort_creation(std::move(handler), channel.error());
        return;
    }
    adopt_channel(std::move(channel.value()));

    if (auto offered = peer_->set_local_description(signal_kind::offer); !offered) {
        abort_creation(std::move(handler), offered.error());
        return;
    }

    PT_LOG_INFO(log_category::connection, "offer created, gathering candidates");
    wait_for_gathering(std::move(handler));
}

void connection_manager::create_as_responder(std::string_view remote_offer_code,
                                             code_handler handler) {
    auto remote = decode_signal(remote_offer_code);
    if (!remote) {
        post_result(std::move(handler), unexpected(remote.error()));
        return;
    }
    if (remote.value().kind != signal_kind::offer) {
        post_result(std::move(handler),
                    unexpected(error{error_code::malformed_signal,
                                     "expected an offer but the connection code is an answer"}));
        return;
    }

    teardown();

    if (auto opened = open_peer(connection_role::responder); !opened) {
        abort_creation(std::move(handler), opened.error());
        return;
    }

    if (auto applied = peer_->set_remote_description(remote.value()); !applied) {
        abort_creation(std::move(handler), applied.error());
        return;
    }

    if (auto answered = peer_->set_local_description(signal_kind::answer); !answered) {
        abort_creation(std::move(handler), answered.error());
        return;
    }

    PT_LOG_INFO(log_category::connection, "remote offer applied, answer created");
    wait_for_gathering(std::move(handler));
}

auto connection_manager::apply_remote_answer(std::string_view code) -> result<void> {
    if (!peer_ || role_ != connection_role::initiator || state_ != connection_state::connecting) {
        return unexpected(error{error_code::invalid_state, "generate a connection code first"});
    }
    if (pending_code_) {
        return unexpected(
            error{error_code::invalid_state, "the local connection code is still being generated"});
    }

    auto remote = decode_signal(code);
    if (!remote) {
        return unexpected(remote.error());
    }
    if (remote.value().kind != signal_kind::answer) {
        return unexpected(error{error_code::malformed_signal,
                                "expected an answer but the connection code is an offer"});
    }

    if (auto applied = peer_->set_remote_description(remote.value()); !applied) {
        PT_LOG_ERROR(log_category::connection,
                     "failed to apply remote answer: " + applied.error().message);
        return applied;
    }

    PT_LOG_INFO(log_category::connection, "remote answer applied");
    return {};
}

void connection_manager::apply_remote_code(std::string_view code, code_handler handler) {
    auto remote = decode_signal(code);
    if (!remote) {
        post_result(std::move(handler), unexpected(remote.error()));
        return;
    }

    if (remote.value().kind == signal_kind::offer) {
        create_as_responder(code, std::move(handler));
        return;
    }

    auto applied = apply_remote_answer(code);
    if (!applied) {
        post_result(std::move(handler), unexpected(applied.error()));
        return;
    }
    post_result(std::move(handler), std::string{});
}

void connection_manager::teardown() {
    ++generation_;
    gathering_timer_.cancel();

    auto pending = std::move(pending_code_);
    pending_code_ = nullptr;

    if (channel_) {
        auto channel = std::move(channel_);
        channel_.reset();
        if (channel_listener_) {
            channel_listener_(nullptr);
        }
        channel->set_handlers({});
        channel->close();
    }

    if (peer_) {
        peer_->set_handlers({});
        peer_->close();
        peer_.reset();
        PT_LOG_INFO(log_category::connection, "peer connection closed");
    }

    role_ = connection_role::none;
    ice_ = ice_state::created;
    local_code_.clear();
    set_state(connection_state::idle);

    if (pending) {
        post_result(std::move(pending),
                    unexpected(error{error_code::invalid_state, "connection torn down"}));
    }
}

auto connection_manager::open_peer(connection_role role) -> result<void> {
    if (!factory_) {
        return unexpected(error{error_code::internal_error, "no peer backend configured"});
    }

    auto created = factory_->create_peer(config_);
    if (!created) {
        return unexpected(created.error());
    }

    peer_ = std::move(created.value());
    role_ = role;
    install_handlers();
    set_state(connection_state::connecting);
    return {};
}

void connection_manager::install_handlers() {
    std::weak_ptr<connection_manager> weak = weak_from_this();
    auto generation = generation_;

    auto guard = [weak, generation]() -> std::shared_ptr<connection_manager> {
        auto self = weak.lock();
        if (!self || self->generation_ != generation) {
            return nullptr;
        }
        return self;
    };

    peer_handlers handlers;
    handlers.on_state = [guard](peer_state state) {
        if (auto self = guard()) {
            self->on_peer_state(state);
        }
    };
    handlers.on_ice_state = [guard](ice_state state) {
        if (auto self = guard()) {
            self->on_ice_state(state);
        }
    };
    handlers.on_gathering_state = [guard](gathering_state state) {
        if (auto self = guard()) {
            self->on_gathering_state(state);
        }
    };
    handlers.on_data_channel = [guard](std::shared_ptr<data_channel> channel) {
        if (auto self = guard()) {
            self->on_remote_channel(std::move(channel));
        }
    };
    peer_->set_handlers(std::move(handlers));
}

void connection_manager::adopt_channel(std::shared_ptr<data_channel> channel) {
    channel_ = std::move(channel);
    PT_LOG_DEBUG(log_category::connection, "data channel '" + channel_->label() + "' attached");
    if (channel_listener_) {
        channel_listener_(channel_);
    }
}

void connection_manager::wait_for_gathering(code_handler handler) {
    pending_code_ = std::move(handler);

    if (peer_->gathering() == gathering_state::complete) {
        finish_gathering();
        return;
    }

    gathering_timer_.expires_after(config_.gathering_timeout);
    std::weak_ptr<connection_manager> weak = weak_from_this();
    auto generation = generation_;
    gathering_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto self = weak.lock();
        if (!self || self->generation_ != generation || !self->pending_code_) {
            return;
        }
        self->on_gathering_timeout();
    });
}

void connection_manager::finish_gathering() {
    gathering_timer_.cancel();
    auto handler = std::move(pending_code_);
    pending_code_ = nullptr;

    auto description = peer_->local_description();
    if (!description) {
        abort_creation(std::move(handler),
                       error{error_code::negotiation_failed, "no local session description"});
        return;
    }

    local_code_ = encode_signal(*description);
    PT_LOG_INFO(log_category::connection,
                std::string("connection code ready (") + to_string(description->kind) + ", "
                    + std::to_string(local_code_.size()) + " characters)");
    post_result(std::move(handler), local_code_);
}

void connection_manager::on_gathering_timeout() {
    auto handler = std::move(pending_code_);
    pending_code_ = nullptr;

    error reason{error_code::gathering_timeout,
                 "candidate gathering did not complete within "
                     + std::to_string(config_.gathering_timeout.count()) + " ms"};
    PT_LOG_WARN(log_category::connection, reason.message);
    events_->push(error_event{reason});
    abort_creation(std::move(handler), std::move(reason));
}

void connection_manager::abort_creation(code_handler handler, error reason) {
    PT_LOG_ERROR(log_category::connection, "connection setup failed: " + reason.message);
    teardown();
    post_result(std::move(handler), unexpected(std::move(reason)));
}

void connection_manager::post_result(code_handler handler, result<std::string> outcome) {
    if (!handler) {
        return;
    }
    boost::asio::post(io_, [handler = std::move(handler), outcome = std::move(outcome)]() mutable {
        handler(std::move(outcome));
    });
}

void connection_manager::on_peer_state(peer_state state) {
    PT_LOG_DEBUG(log_category::connection, std::string("peer state: ") + to_string(state));

    switch (state) {
        case peer_state::connected:
            if (state_ == connection_state::connecting) {
                set_state(connection_state::connected);
            }
            break;
        case peer_state::failed:
            fail(error{error_code::negotiation_failed,
                       "peer connection failed; reset and retry, optionally with STUN enabled"});
            break;
        case peer_state::disconnected:
        case peer_state::closed:
            if (state_ == connection_state::connected) {
                fail(error{error_code::channel_closed, "remote peer disconnected"});
            }
            break;
        default:
            break;
    }
}

void connection_manager::on_ice_state(ice_state state) {
    if (state == ice_) {
        return;
    }
    ice_ = state;
    events_->push(ice_state_changed{state});
    PT_LOG_DEBUG(log_category::connection, std::string("ice state: ") + to_string(state));

    if (state == ice_state::failed) {
        fail(error{error_code::negotiation_failed,
                   "connectivity checks failed; reset and retry, optionally with STUN enabled"});
    }
}

void connection_manager::on_gathering_state(gathering_state state) {
    PT_LOG_DEBUG(log_category::connection, std::string("gathering state: ") + to_string(state));
    if (state == gathering_state::complete && pending_code_) {
        finish_gathering();
    }
}

void connection_manager::on_remote_channel(std::shared_ptr<data_channel> channel) {
    if (!channel) {
        return;
    }
    if (role_ != connection_role::responder || channel_) {
        PT_LOG_WARN(log_category::connection,
                    "ignoring unexpected data channel '" + channel->label() + "'");
        channel->close();
        return;
    }
    adopt_channel(std::move(channel));
}

void connection_manager::fail(error reason) {
    if (state_ != connection_state::connecting && state_ != connection_state::connected) {
        return;
    }
    PT_LOG_ERROR(log_category::connection, reason.message);
    set_state(connection_state::failed);
    events_->push(error_event{std::move(reason)});
}

void connection_manager::set_state(connection_state state) {
    if (state == state_) {
        return;
    }
    auto previous = state_;
    state_ = state;
    events_->push(connection_state_changed{previous, state});
    PT_LOG_INFO(log_category::connection,
                std::string("connection ") + to_string(previous) + " -> " + to_string(state));
}

}  // namespace kcenon::peer_transfer
