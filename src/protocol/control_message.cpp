/**
 * @file control_message.cpp
 * @brief Implementation of control frame encoding and decoding
 */

#include <kcenon/peer_transfer/protocol/control_message.h>

#include <kcenon/peer_transfer/core/file_utils.h>
#include <kcenon/peer_transfer/core/json_utils.h>

namespace kcenon::peer_transfer {

auto serialize(const meta_message& message) -> std::string {
    return json::writer()
        .add("type", "meta")
        .add("id", message.id)
        .add("name", message.name)
        .add("size", message.size)
        .add("mime", message.mime)
        .str();
}

auto serialize(const end_message& message) -> std::string {
    return json::writer()
        .add("type", "end")
        .add("id", message.id)
        .str();
}

auto serialize(const control_message& message) -> std::string {
    return std::visit([](const auto& m) { return serialize(m); }, message);
}

auto parse_control_message(std::string_view text) -> std::optional<control_message> {
    auto parsed = json::parse_object(text);
    if (!parsed) {
        return std::nullopt;
    }

    auto type = parsed->get_string("type");
    if (!type) {
        return std::nullopt;
    }

    auto id = parsed->get_string("id");
    if (!id) {
        return std::nullopt;
    }

    if (*type == "end") {
        return end_message{std::move(*id)};
    }

    if (*type != "meta") {
        return std::nullopt;
    }

    auto name = parsed->get_string("name");
    auto size = parsed->get_uint("size");
    if (!name || !size) {
        return std::nullopt;
    }

    meta_message meta;
    meta.id = std::move(*id);
    meta.name = std::move(*name);
    meta.size = *size;

    auto mime = parsed->get_string("mime");
    if (!mime && parsed->contains("mime")) {
        const auto* raw = parsed->find("mime");
        if (raw->type != json::value_type::null) {
            return std::nullopt;
        }
    }
    meta.mime = mime && !mime->empty() ? std::move(*mime) : std::string(default_mime_type);
    return meta;
}

}  // namespace kcenon::peer_transfer
