/**
 * @file fake_backend.h
 * @brief Scripted peer backend for unit tests
 *
 * Nothing happens on its own: tests drive channel state, backlog and peer
 * events explicitly, and all handlers run synchronously.
 */

#ifndef KCENON_PEER_TRANSFER_TEST_FAKE_BACKEND_H
#define KCENON_PEER_TRANSFER_TEST_FAKE_BACKEND_H

#include <kcenon/peer_transfer/transport/peer_backend.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::peer_transfer::test {

/**
 * @brief Data channel whose state and backlog are set by the test
 */
class scripted_channel : public data_channel {
public:
    struct frame {
        bool is_text = false;
        std::string text;
        byte_buffer data;
    };

    explicit scripted_channel(std::string label = "file",
                              channel_state state = channel_state::open)
        : label_(std::move(label)), state_(state) {}

    [[nodiscard]] auto label() const -> std::string override { return label_; }
    [[nodiscard]] auto state() const -> channel_state override { return state_; }
    [[nodiscard]] auto buffered_amount() const -> uint64_t override { return buffered_; }

    void set_buffered_amount_low_threshold(uint64_t threshold) override { threshold_ = threshold; }
    [[nodiscard]] auto buffered_amount_low_threshold() const -> uint64_t override {
        return threshold_;
    }

    [[nodiscard]] auto send_text(std::string_view text) -> result<void> override {
        if (auto refused = refuse()) {
            return *refused;
        }
        frame f;
        f.is_text = true;
        f.text = std::string(text);
        frames_.push_back(std::move(f));
        if (grow_on_send_) {
            buffered_ += text.size();
        }
        return {};
    }

    [[nodiscard]] auto send_binary(const byte_buffer& data) -> result<void> override {
        if (auto refused = refuse()) {
            return *refused;
        }
        frame f;
        f.data = data;
        frames_.push_back(std::move(f));
        if (grow_on_send_) {
            buffered_ += data.size();
        }
        return {};
    }

    void close() override {
        ++close_calls_;
        if (state_ == channel_state::closed) {
            return;
        }
        state_ = channel_state::closed;
        if (handlers_.on_closed) {
            handlers_.on_closed();
        }
    }

    // Scripting

    void open() {
        state_ = channel_state::open;
        if (handlers_.on_open) {
            handlers_.on_open();
        }
    }

    void remote_close() {
        state_ = channel_state::closed;
        if (handlers_.on_closed) {
            handlers_.on_closed();
        }
    }

    /// Change the backlog; crossing down to the threshold fires buffered-low
    void set_buffered_amount(uint64_t amount) {
        auto previous = buffered_;
        buffered_ = amount;
        if (previous > threshold_ && amount <= threshold_ && handlers_.on_buffered_amount_low) {
            handlers_.on_buffered_amount_low();
        }
    }

    /// Deliver a buffered-low notification without touching the backlog
    void notify_buffered_amount_low() {
        if (handlers_.on_buffered_amount_low) handlers_.on_buffered_amount_low();
    }

    /// Every sent frame adds its size to the backlog
    void set_grow_on_send(bool grow) { grow_on_send_ = grow; }

    void set_fail_sends(bool fail) { fail_sends_ = fail; }

    void deliver_text(const std::string& text) {
        if (handlers_.on_text) handlers_.on_text(text);
    }

    void deliver_binary(byte_buffer data) {
        if (handlers_.on_binary) handlers_.on_binary(std::move(data));
    }

    void raise_error(const std::string& message) {
        if (handlers_.on_error) handlers_.on_error(message);
    }

    [[nodiscard]] auto has_handlers() const -> bool {
        return static_cast<bool>(handlers_.on_text);
    }

    [[nodiscard]] auto frames() const -> const std::vector<frame>& { return frames_; }

    [[nodiscard]] auto text_frames() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& f : frames_) {
            if (f.is_text) out.push_back(f.text);
        }
        return out;
    }

    [[nodiscard]] auto binary_frame_count() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& f : frames_) {
            if (!f.is_text) ++count;
        }
        return count;
    }

    [[nodiscard]] auto close_calls() const -> int { return close_calls_; }

private:
    [[nodiscard]] auto refuse() const -> std::optional<result<void>> {
        if (state_ != channel_state::open) {
            return result<void>(unexpected(error{error_code::channel_closed, "channel not open"}));
        }
        if (fail_sends_) {
            return result<void>(unexpected(error{error_code::backend_error, "scripted failure"}));
        }
        return std::nullopt;
    }

    std::string label_;
    channel_state state_;
    uint64_t buffered_ = 0;
    uint64_t threshold_ = 0;
    bool grow_on_send_ = false;
    bool fail_sends_ = false;
    int close_calls_ = 0;
    std::vector<frame> frames_;
};

class scripted_peer;

/**
 * @brief Test-side view of a scripted peer; outlives the peer itself
 */
struct scripted_peer_record {
    scripted_peer* peer = nullptr;  ///< nullptr once the peer was destroyed
    bool closed = false;
    std::optional<signal_kind> local_kind;
    std::optional<signal_descriptor> remote;
    std::shared_ptr<scripted_channel> channel;

    // Behaviour
    bool complete_gathering_immediately = true;
    bool fail_channel_creation = false;
    bool reject_remote_description = false;
};

/**
 * @brief Peer connection driven by the test through emit_* calls
 */
class scripted_peer : public peer_backend {
public:
    explicit scripted_peer(std::shared_ptr<scripted_peer_record> record) : record_(std::move(record)) {
        record_->peer = this;
    }

    ~scripted_peer() override { record_->peer = nullptr; }

    [[nodiscard]] auto create_data_channel(const std::string& label)
        -> result<std::shared_ptr<data_channel>> override {
        if (record_->fail_channel_creation) {
            return unexpected(error{error_code::backend_error, "scripted channel failure"});
        }
        record_->channel = std::make_shared<scripted_channel>(label, channel_state::connecting);
        return std::shared_ptr<data_channel>(record_->channel);
    }

    [[nodiscard]] auto set_local_description(signal_kind kind) -> result<void> override {
        record_->local_kind = kind;
        gathering_ = record_->complete_gathering_immediately ? gathering_state::complete
                                                            : gathering_state::in_progress;
        return {};
    }

    [[nodiscard]] auto set_remote_description(const signal_descriptor& descriptor)
        -> result<void> override {
        if (record_->reject_remote_description) {
            return unexpected(error{error_code::negotiation_failed, "scripted rejection"});
        }
        record_->remote = descriptor;
        return {};
    }

    [[nodiscard]] auto local_description() const -> std::optional<signal_descriptor> override {
        if (!record_->local_kind) {
            return std::nullopt;
        }
        return signal_descriptor{*record_->local_kind,
                                 std::string("v=0\r\ns=scripted ") + to_string(*record_->local_kind)};
    }

    [[nodiscard]] auto state() const -> peer_state override { return state_; }
    [[nodiscard]] auto gathering() const -> gathering_state override { return gathering_; }

    void close() override {
        record_->closed = true;
        state_ = peer_state::closed;
    }

    // Scripting

    void emit_state(peer_state state) {
        state_ = state;
        if (handlers_.on_state) handlers_.on_state(state);
    }

    void emit_ice_state(ice_state state) {
        if (handlers_.on_ice_state) handlers_.on_ice_state(state);
    }

    void emit_gathering(gathering_state state) {
        gathering_ = state;
        if (handlers_.on_gathering_state) handlers_.on_gathering_state(state);
    }

    void emit_channel(std::shared_ptr<data_channel> channel) {
        if (handlers_.on_data_channel) handlers_.on_data_channel(std::move(channel));
    }

private:
    std::shared_ptr<scripted_peer_record> record_;
    peer_state state_ = peer_state::created;
    gathering_state gathering_ = gathering_state::created;
};

/**
 * @brief Factory keeping a record of every peer it creates
 */
class scripted_factory : public backend_factory {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "scripted"; }

    [[nodiscard]] auto create_peer(const peer_config&)
        -> result<std::unique_ptr<peer_backend>> override {
        if (fail_creation) {
            return unexpected(error{error_code::backend_error, "scripted factory failure"});
        }
        auto record = std::make_shared<scripted_peer_record>();
        record->complete_gathering_immediately = complete_gathering_immediately;
        record->fail_channel_creation = fail_channel_creation;
        record->reject_remote_description = reject_remote_description;
        records.push_back(record);
        return std::unique_ptr<peer_backend>(std::make_unique<scripted_peer>(record));
    }

    [[nodiscard]] auto last() const -> std::shared_ptr<scripted_peer_record> {
        return records.empty() ? nullptr : records.back();
    }

    // Defaults applied to new peers
    bool fail_creation = false;
    bool complete_gathering_immediately = true;
    bool fail_channel_creation = false;
    bool reject_remote_description = false;

    std::vector<std::shared_ptr<scripted_peer_record>> records;
};

}  // namespace kcenon::peer_transfer::test

#endif  // KCENON_PEER_TRANSFER_TEST_FAKE_BACKEND_H
