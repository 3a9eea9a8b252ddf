/**
 * @file channel_transport.cpp
 * @brief Implementation of the chunked send loop and inbound routing
 */

#include <kcenon/peer_transfer/transport/channel_transport.h>

#include <kcenon/peer_transfer/core/logging.h>
#include <kcenon/peer_transfer/core/progress_throttle.h>
#include <kcenon/peer_transfer/protocol/control_message.h>

#include <boost/asio/post.hpp>

namespace kcenon::peer_transfer {

struct channel_transport::send_operation {
    std::string transfer_id;
    file_source_ptr source;
    chunk_splitter::chunk_iterator chunks;
    abort_flag abort;
    completion_handler handler;
    progress_throttle throttle;
    uint64_t sent_bytes = 0;

    send_operation(std::string id,
                   file_source_ptr src,
                   chunk_splitter::chunk_iterator it,
                   abort_flag flag,
                   completion_handler done,
                   std::chrono::milliseconds interval)
        : transfer_id(std::move(id)),
          source(std::move(src)),
          chunks(std::move(it)),
          abort(std::move(flag)),
          handler(std::move(done)),
          throttle(interval) {}

    [[nodiscard]] auto aborted() const -> bool {
        return abort && abort->load();
    }

    [[nodiscard]] auto progress() const -> transfer_progress {
        transfer_progress snapshot;
        snapshot.direction = transfer_direction::outgoing;
        snapshot.transfer_id = transfer_id;
        snapshot.file_name = source->name();
        snapshot.done_bytes = sent_bytes;
        snapshot.total_bytes = source->size();
        return snapshot;
    }
};

auto channel_transport::create(boost::asio::io_context& io,
                               std::shared_ptr<data_channel> channel,
                               const peer_config& config,
                               std::shared_ptr<event_queue<transfer_event>> events,
                               std::shared_ptr<received_file_list> received)
    -> std::shared_ptr<channel_transport> {
    return std::shared_ptr<channel_transport>(new channel_transport(
        io, std::move(channel), config, std::move(events), std::move(received)));
}

channel_transport::channel_transport(boost::asio::io_context& io,
                                     std::shared_ptr<data_channel> channel,
                                     const peer_config& config,
                                     std::shared_ptr<event_queue<transfer_event>> events,
                                     std::shared_ptr<received_file_list> received)
    : io_(io),
      channel_(std::move(channel)),
      config_(config),
      events_(std::move(events)),
      splitter_(config.chunks),
      receiver_(events_, std::move(received), config.duplicate_meta, config.progress_interval),
      flow_timer_(io) {}

channel_transport::~channel_transport() {
    if (attached_ && channel_) {
        channel_->set_handlers({});
    }
}

void channel_transport::attach() {
    if (attached_ || !channel_) {
        return;
    }
    attached_ = true;

    channel_->set_buffered_amount_low_threshold(config_.chunks.buffered_amount_low_threshold);

    std::weak_ptr<channel_transport> weak = weak_from_this();
    channel_handlers handlers;
    handlers.on_open = [weak]() {
        if (auto self = weak.lock()) self->on_open();
    };
    handlers.on_closed = [weak]() {
        if (auto self = weak.lock()) self->on_closed();
    };
    handlers.on_error = [weak](std::string message) {
        if (auto self = weak.lock()) self->on_error(message);
    };
    handlers.on_text = [weak](std::string text) {
        if (auto self = weak.lock()) self->receiver_.on_text(text);
    };
    handlers.on_binary = [weak](byte_buffer data) {
        if (auto self = weak.lock()) self->receiver_.on_binary(std::move(data));
    };
    handlers.on_buffered_amount_low = [weak]() {
        if (auto self = weak.lock()) self->on_buffered_amount_low();
    };
    channel_->set_handlers(std::move(handlers));

    PT_LOG_DEBUG(log_category::channel,
        "attached to channel '" + channel_->label() + "' (" + to_string(channel_->state()) + ")");

    if (channel_->is_open()) {
        events_->push(channel_state_changed{channel_state::open});
    }
}

void channel_transport::detach() {
    if (!attached_) {
        return;
    }
    attached_ = false;

    if (channel_) {
        channel_->set_handlers({});
    }

    if (current_) {
        complete(current_, unexpected(error{error_code::channel_closed, "connection torn down"}));
    }
    flow_timer_.cancel();
    receiver_.abandon();

    PT_LOG_DEBUG(log_category::channel, "detached from channel");
}

void channel_transport::send_file(std::string transfer_id,
                                  file_source_ptr source,
                                  abort_flag abort,
                                  completion_handler handler) {
    auto fail_early = [this, &handler](error err) {
        PT_LOG_WARN(log_category::channel, "send rejected: " + err.message);
        if (handler) {
            boost::asio::post(io_, [handler = std::move(handler), err = std::move(err)]() {
                handler(unexpected(err));
            });
        }
    };

    if (current_) {
        fail_early(error{error_code::transfer_in_progress, "a file is already being sent"});
        return;
    }
    if (!attached_ || !is_open()) {
        fail_early(error{error_code::channel_closed, "data channel is not open"});
        return;
    }

    auto chunks = splitter_.split(source);
    if (!chunks) {
        fail_early(chunks.error());
        return;
    }

    auto op = std::make_shared<send_operation>(std::move(transfer_id), source,
                                               std::move(chunks).value(), std::move(abort),
                                               std::move(handler), config_.progress_interval);
    current_ = op;

    meta_message meta{op->transfer_id, source->name(), source->size(), source->mime_type()};
    if (auto sent = channel_->send_text(serialize(meta)); !sent) {
        complete(op, std::move(sent));
        return;
    }

    transfer_log_context ctx;
    ctx.transfer_id = op->transfer_id;
    ctx.filename = source->name();
    ctx.file_size = source->size();
    PT_LOG_INFO_CTX(log_category::channel, "outgoing transfer started", ctx);

    op->throttle.reset();
    publish_progress(*op);
    schedule_step(op);
}

void channel_transport::interrupt() {
    resume_waiting_send();
}

auto channel_transport::is_open() const -> bool {
    return channel_ && channel_->is_open();
}

auto channel_transport::send_progress() const -> std::optional<transfer_progress> {
    if (!current_) {
        return std::nullopt;
    }
    return current_->progress();
}

auto channel_transport::receive_progress() const -> std::optional<transfer_progress> {
    return receiver_.progress();
}

void channel_transport::schedule_step(const operation_ptr& op) {
    boost::asio::post(io_, [weak = weak_from_this(), op]() {
        if (auto self = weak.lock()) {
            self->step(op);
        }
    });
}

void channel_transport::step(const operation_ptr& op) {
    if (current_ != op) {
        return;
    }

    if (op->aborted()) {
        complete(op, unexpected(error{error_code::transfer_cancelled}));
        return;
    }
    if (!is_open()) {
        complete(op, unexpected(error{error_code::channel_closed, "connection lost during transfer"}));
        return;
    }

    if (!op->chunks.has_next()) {
        auto sent = channel_->send_text(serialize(end_message{op->transfer_id}));
        complete(op, std::move(sent));
        return;
    }

    auto chunk = op->chunks.next();
    if (!chunk) {
        complete(op, unexpected(chunk.error()));
        return;
    }

    auto size = chunk.value().size();
    if (auto sent = channel_->send_binary(chunk.value()); !sent) {
        complete(op, std::move(sent));
        return;
    }
    op->sent_bytes += size;

    if (op->throttle.should_report(op->sent_bytes, op->source->size())) {
        publish_progress(*op);
    }

    if (channel_->buffered_amount() > config_.chunks.max_buffered_amount) {
        wait_for_drain(op);
        return;
    }

    schedule_step(op);
}

void channel_transport::wait_for_drain(const operation_ptr& op) {
    if (channel_->buffered_amount() <= config_.chunks.buffered_amount_low_threshold) {
        schedule_step(op);
        return;
    }

    transfer_log_context ctx;
    ctx.transfer_id = op->transfer_id;
    ctx.buffered_amount = channel_->buffered_amount();
    PT_LOG_DEBUG_CTX(log_category::channel, "send suspended on backpressure", ctx);

    drain_wait_ = op;
    flow_timer_.expires_after(config_.flow_control_timeout);
    flow_timer_.async_wait([weak = weak_from_this(), op](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto self = weak.lock();
        if (!self || self->drain_wait_ != op) {
            return;
        }
        self->drain_wait_.reset();
        self->complete(op, unexpected(error{error_code::flow_control_timeout}));
    });
}

void channel_transport::on_buffered_amount_low() {
    if (!drain_wait_) {
        return;
    }
    // Notifications are posted, so the backlog may have grown again since
    if (channel_ && channel_->buffered_amount() > config_.chunks.buffered_amount_low_threshold) {
        transfer_log_context ctx;
        ctx.transfer_id = drain_wait_->transfer_id;
        ctx.buffered_amount = channel_->buffered_amount();
        PT_LOG_DEBUG_CTX(log_category::channel, "stale buffered-low notification ignored", ctx);
        return;
    }
    resume_waiting_send();
}

void channel_transport::resume_waiting_send() {
    auto op = std::move(drain_wait_);
    drain_wait_.reset();
    if (!op) {
        return;
    }
    flow_timer_.cancel();
    schedule_step(op);
}

void channel_transport::complete(operation_ptr op, result<void> outcome) {
    if (current_ == op) {
        current_.reset();
    }
    if (drain_wait_ == op) {
        drain_wait_.reset();
        flow_timer_.cancel();
    }

    transfer_log_context ctx;
    ctx.transfer_id = op->transfer_id;
    ctx.filename = op->source->name();
    ctx.file_size = op->source->size();
    ctx.bytes_transferred = op->sent_bytes;

    if (outcome) {
        PT_LOG_INFO_CTX(log_category::channel, "outgoing transfer completed", ctx);
        events_->push(transfer_sent_event{op->transfer_id, op->source->name(), op->sent_bytes});
    } else {
        ctx.error_message = outcome.error().message;
        if (outcome.error().code == error_code::transfer_cancelled) {
            PT_LOG_INFO_CTX(log_category::channel, "outgoing transfer cancelled", ctx);
        } else {
            PT_LOG_ERROR_CTX(log_category::channel, "outgoing transfer failed", ctx);
        }
        events_->push(transfer_failed_event{op->transfer_id, op->source->name(),
                                            op->sent_bytes, outcome.error()});
    }

    if (op->handler) {
        boost::asio::post(io_, [handler = std::move(op->handler), outcome = std::move(outcome)]() {
            handler(outcome);
        });
    }
}

void channel_transport::publish_progress(const send_operation& op) {
    events_->push(progress_event{op.progress()});
}

void channel_transport::on_open() {
    PT_LOG_INFO(log_category::channel, "data channel open");
    events_->push(channel_state_changed{channel_state::open});
}

void channel_transport::on_closed() {
    PT_LOG_INFO(log_category::channel, "data channel closed");
    events_->push(channel_state_changed{channel_state::closed});
    // A send waiting for the backlog to drain would otherwise sit until its timeout
    resume_waiting_send();
}

void channel_transport::on_error(const std::string& message) {
    transfer_log_context ctx;
    ctx.error_message = message;
    PT_LOG_ERROR_CTX(log_category::channel, "data channel error", ctx);
    events_->push(error_event{error{error_code::backend_error, "data channel error"}});
}

}  // namespace kcenon::peer_transfer
