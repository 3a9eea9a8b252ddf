/**
 * @file signal_codec.cpp
 * @brief Implementation of connection code encoding and decoding
 */

#include <kcenon/peer_transfer/signal/signal_codec.h>

#include <kcenon/peer_transfer/core/encoding.h>
#include <kcenon/peer_transfer/core/json_utils.h>
#include <kcenon/peer_transfer/core/logging.h>

namespace kcenon::peer_transfer {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

auto is_blank(std::string_view text) -> bool {
    return trim(text).empty();
}

auto malformed(std::string reason) -> unexpected {
    PT_LOG_DEBUG(log_category::signal, "rejected connection code: " + reason);
    return unexpected(error{error_code::malformed_signal, std::move(reason)});
}

}  // namespace

auto parse_signal_kind(std::string_view text) -> std::optional<signal_kind> {
    if (text == "offer") return signal_kind::offer;
    if (text == "answer") return signal_kind::answer;
    return std::nullopt;
}

auto encode_signal(const signal_descriptor& descriptor) -> std::string {
    auto payload = json::writer()
        .add("type", to_string(descriptor.kind))
        .add("sdp", descriptor.sdp)
        .str();
    return encoding::base64url_encode(payload);
}

auto decode_signal(std::string_view text) -> result<signal_descriptor> {
    auto input = trim(text);
    if (input.empty()) {
        return malformed("connection code is empty");
    }

    std::string payload;
    if (input.front() == '{') {
        payload = std::string(input);
    } else {
        auto decoded = encoding::base64url_decode(input);
        if (!decoded) {
            return malformed("connection code is not a valid token");
        }
        payload = std::move(*decoded);
    }

    auto parsed = json::parse_object(payload);
    if (!parsed) {
        return malformed("connection code does not contain valid JSON");
    }

    auto type = parsed->get_string("type");
    std::optional<signal_kind> kind;
    if (type) {
        kind = parse_signal_kind(*type);
    }
    if (!kind) {
        return malformed("connection code is neither an offer nor an answer");
    }

    auto sdp = parsed->get_string("sdp");
    if (!sdp || is_blank(*sdp)) {
        return malformed("connection code carries no session description");
    }

    return signal_descriptor{*kind, std::move(*sdp)};
}

}  // namespace kcenon::peer_transfer
