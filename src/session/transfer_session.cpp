/**
 * @file transfer_session.cpp
 * @brief Implementation of the transfer session
 */

#include <kcenon/peer_transfer/session/transfer_session.h>

#include <kcenon/peer_transfer/core/file_utils.h>
#include <kcenon/peer_transfer/core/logging.h>
#include <kcenon/peer_transfer/core/transfer_id.h>

#include <boost/asio/post.hpp>

#include <algorithm>

namespace kcenon::peer_transfer {

auto transfer_session::create(boost::asio::io_context& io,
                              std::shared_ptr<backend_factory> factory,
                              const peer_config& config)
    -> result<std::shared_ptr<transfer_session>> {
    if (!factory) {
        return unexpected(error{error_code::invalid_argument, "backend factory is required"});
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    if (!get_logger().is_initialized()) {
        get_logger().initialize();
    }

    std::shared_ptr<transfer_session> session(new transfer_session(io, std::move(factory), config));

    std::weak_ptr<transfer_session> weak = session;
    session->connection_->set_channel_listener([weak](std::shared_ptr<data_channel> channel) {
        if (auto self = weak.lock()) {
            self->on_channel(std::move(channel));
        }
    });

    PT_LOG_DEBUG(log_category::session, "session created");
    return session;
}

transfer_session::transfer_session(boost::asio::io_context& io,
                                   std::shared_ptr<backend_factory> factory,
                                   const peer_config& config)
    : io_(io),
      config_(config),
      events_(std::make_shared<event_queue<transfer_event>>()),
      received_(std::make_shared<received_file_list>()),
      connection_(connection_manager::create(io, std::move(factory), config, events_)),
      abort_(std::make_shared<std::atomic<bool>>(false)) {
    events_->set_merge_rule(supersedes_progress);
}

transfer_session::~transfer_session() {
    abort_->store(true);
    connection_->set_channel_listener(nullptr);
    if (transport_) {
        transport_->detach();
        transport_.reset();
    }
    connection_->teardown();
}

void transfer_session::create_offer(code_handler handler) {
    queue_.clear();
    connection_->create_as_initiator(std::move(handler));
}

void transfer_session::accept_offer(std::string_view remote_code, code_handler handler) {
    connection_->create_as_responder(remote_code, std::move(handler));
}

auto transfer_session::accept_answer(std::string_view remote_code) -> result<void> {
    return connection_->apply_remote_answer(remote_code);
}

void transfer_session::apply_remote_code(std::string_view remote_code, code_handler handler) {
    connection_->apply_remote_code(remote_code, std::move(handler));
}

void transfer_session::teardown() {
    if (sending_) {
        abort_->store(true);
    }
    queue_.clear();
    connection_->teardown();
}

void transfer_session::reset() {
    teardown();
    received_->clear();
    PT_LOG_INFO(log_category::session, "session reset");
}

void transfer_session::send_files(std::vector<file_source_ptr> files, batch_handler handler) {
    if (sending_) {
        reject(std::move(handler),
               error{error_code::transfer_in_progress, "a batch of files is already being sent"});
        return;
    }
    if (files.empty()) {
        reject(std::move(handler), error{error_code::invalid_argument, "no files selected"});
        return;
    }
    if (std::any_of(files.begin(), files.end(), [](const file_source_ptr& f) { return !f; })) {
        reject(std::move(handler), error{error_code::invalid_argument, "file source is null"});
        return;
    }
    if (!is_channel_open()) {
        reject(std::move(handler),
               error{error_code::channel_closed,
                     "connect first and wait for the data channel to open before sending"});
        return;
    }

    abort_->store(false);
    queue_.assign(files.begin(), files.end());
    batch_handler_ = std::move(handler);
    batch_total_ = queue_.size();
    sending_ = true;

    uint64_t total_bytes = 0;
    for (const auto& file : queue_) {
        total_bytes += file->size();
    }
    PT_LOG_INFO(log_category::session,
                "sending " + std::to_string(batch_total_) + " file(s), " + format_size(total_bytes));

    send_next();
}

void transfer_session::cancel() {
    if (!sending_) {
        return;
    }
    PT_LOG_INFO(log_category::session, "cancelling outgoing batch");
    abort_->store(true);
    if (transport_) {
        transport_->interrupt();
    }
}

auto transfer_session::send_progress() const -> std::optional<transfer_progress> {
    return transport_ ? transport_->send_progress() : std::nullopt;
}

auto transfer_session::receive_progress() const -> std::optional<transfer_progress> {
    return transport_ ? transport_->receive_progress() : std::nullopt;
}

auto transfer_session::received_files() const -> std::vector<received_file_ptr> {
    return received_->files();
}

auto transfer_session::find_received(std::string_view transfer_id) const -> received_file_ptr {
    return received_->find(transfer_id);
}

auto transfer_session::data_channel_state() const -> channel_state {
    const auto& channel = connection_->channel();
    return channel ? channel->state() : channel_state::closed;
}

auto transfer_session::is_channel_open() const -> bool {
    return transport_ && transport_->is_open();
}

void transfer_session::on_channel(std::shared_ptr<data_channel> channel) {
    if (transport_) {
        transport_->detach();
        transport_.reset();
    }
    if (!channel) {
        return;
    }

    transport_ = channel_transport::create(io_, std::move(channel), config_, events_, received_);
    transport_->attach();
}

void transfer_session::send_next() {
    if (abort_->load() && !queue_.empty()) {
        queue_.clear();
        finish_batch(unexpected(error{error_code::transfer_cancelled, "transfer cancelled"}));
        return;
    }
    if (queue_.empty()) {
        finish_batch({});
        return;
    }
    if (!transport_) {
        queue_.clear();
        finish_batch(unexpected(error{error_code::channel_closed, "data channel is gone"}));
        return;
    }

    auto source = std::move(queue_.front());
    queue_.pop_front();
    auto transfer_id = next_transfer_id();

    std::weak_ptr<transfer_session> weak = weak_from_this();
    transport_->send_file(transfer_id, std::move(source), abort_,
                          [weak, transfer_id](result<void> outcome) {
                              if (auto self = weak.lock()) {
                                  self->on_file_sent(transfer_id, std::move(outcome));
                              }
                          });
}

void transfer_session::on_file_sent(const std::string& transfer_id, result<void> outcome) {
    if (!sending_) {
        return;
    }
    if (!outcome) {
        PT_LOG_WARN(log_category::session,
                    "transfer " + transfer_id + " stopped, dropping " + std::to_string(queue_.size())
                        + " queued file(s)");
        queue_.clear();
        finish_batch(std::move(outcome));
        return;
    }
    send_next();
}

void transfer_session::finish_batch(result<void> outcome) {
    sending_ = false;
    auto handler = std::move(batch_handler_);
    batch_handler_ = nullptr;

    if (outcome) {
        PT_LOG_INFO(log_category::session,
                    "batch of " + std::to_string(batch_total_) + " file(s) sent");
    } else {
        PT_LOG_WARN(log_category::session, "batch failed: " + outcome.error().message);
    }

    if (handler) {
        handler(std::move(outcome));
    }
}

void transfer_session::reject(batch_handler handler, error reason) {
    PT_LOG_WARN(log_category::session, "send rejected: " + reason.message);
    if (!handler) {
        return;
    }
    boost::asio::post(io_, [handler = std::move(handler), reason = std::move(reason)]() {
        handler(unexpected(reason));
    });
}

auto transfer_session::next_transfer_id() -> std::string {
    auto id = generate_transfer_id();
    while (used_ids_.count(id) != 0) {
        id = generate_transfer_id();
    }
    used_ids_.insert(id);
    return id;
}

}  // namespace kcenon::peer_transfer
