/**
 * @file receive_handler.cpp
 * @brief Implementation of inbound frame handling
 */

#include <kcenon/peer_transfer/protocol/receive_handler.h>

#include <kcenon/peer_transfer/core/logging.h>

namespace kcenon::peer_transfer {

receive_handler::receive_handler(std::shared_ptr<event_queue<transfer_event>> events,
                                 std::shared_ptr<received_file_list> received,
                                 duplicate_meta_policy policy,
                                 std::chrono::milliseconds progress_interval)
    : events_(std::move(events)),
      received_(std::move(received)),
      assembler_(policy),
      throttle_(progress_interval) {}

void receive_handler::on_text(std::string_view text, clock::time_point now) {
    auto message = parse_control_message(text);
    if (!message) {
        ++dropped_frames_;
        PT_LOG_DEBUG(log_category::protocol,
            "dropped unrecognized text frame (" + std::to_string(text.size()) + " bytes)");
        return;
    }

    if (auto* meta = std::get_if<meta_message>(&*message)) {
        handle_meta(std::move(*meta), now);
    } else {
        handle_end(std::get<end_message>(*message));
    }
}

void receive_handler::on_binary(byte_buffer data, clock::time_point now) {
    auto size = data.size();
    if (!assembler_.append(std::move(data))) {
        ++dropped_frames_;
        PT_LOG_DEBUG(log_category::protocol,
            "dropped binary frame without active transfer (" + std::to_string(size) + " bytes)");
        return;
    }

    const auto* active = assembler_.active();
    if (throttle_.should_report(active->received_bytes, active->declared_size, now)) {
        if (auto snapshot = progress()) {
            events_->push(progress_event{*snapshot});
        }
    }
}

void receive_handler::abandon() {
    if (auto discarded = assembler_.reset()) {
        publish_abandoned(*discarded);
    }
}

auto receive_handler::progress() const -> std::optional<transfer_progress> {
    const auto* active = assembler_.active();
    if (!active) {
        return std::nullopt;
    }

    transfer_progress snapshot;
    snapshot.direction = transfer_direction::incoming;
    snapshot.transfer_id = active->id;
    snapshot.file_name = active->name;
    snapshot.done_bytes = active->received_bytes;
    snapshot.total_bytes = active->declared_size;
    return snapshot;
}

auto receive_handler::has_active_transfer() const -> bool {
    return assembler_.has_active();
}

void receive_handler::handle_meta(meta_message meta, clock::time_point now) {
    transfer_log_context ctx;
    ctx.transfer_id = meta.id;
    ctx.filename = meta.name;
    ctx.file_size = meta.size;

    auto outcome = assembler_.begin(std::move(meta.id), std::move(meta.name),
                                    meta.size, std::move(meta.mime));
    if (!outcome.accepted) {
        ++dropped_frames_;
        PT_LOG_WARN_CTX(log_category::protocol,
            "ignored meta frame while another transfer is active", ctx);
        return;
    }

    if (outcome.abandoned) {
        PT_LOG_WARN_CTX(log_category::protocol,
            "meta frame replaced unfinished transfer " + outcome.abandoned->id, ctx);
        publish_abandoned(*outcome.abandoned);
    }

    PT_LOG_INFO_CTX(log_category::protocol, "incoming transfer started", ctx);

    throttle_.reset(now);
    if (auto snapshot = progress()) {
        events_->push(progress_event{*snapshot});
    }
}

void receive_handler::handle_end(const end_message& end) {
    auto file = assembler_.finish(end.id);
    if (!file) {
        ++dropped_frames_;
        PT_LOG_DEBUG(log_category::protocol, "ignored end frame for unknown transfer " + end.id);
        return;
    }

    transfer_log_context ctx;
    ctx.transfer_id = file->id();
    ctx.filename = file->name();
    ctx.file_size = file->declared_size();
    ctx.bytes_transferred = file->size();
    if (file->size() != file->declared_size()) {
        PT_LOG_WARN_CTX(log_category::protocol, "received size differs from declared size", ctx);
    }
    PT_LOG_INFO_CTX(log_category::protocol, "incoming transfer completed", ctx);

    auto shared = std::make_shared<received_file>(std::move(*file));
    if (received_) {
        received_->add(shared);
    }
    events_->push(file_received_event{std::move(shared)});
}

void receive_handler::publish_abandoned(const incoming_transfer& transfer) {
    transfer_abandoned_event event;
    event.transfer_id = transfer.id;
    event.file_name = transfer.name;
    event.received_bytes = transfer.received_bytes;
    event.declared_size = transfer.declared_size;
    events_->push(std::move(event));
}

}  // namespace kcenon::peer_transfer
