/**
 * @file chunk_assembler.cpp
 * @brief Implementation of single-slot chunk reassembly
 */

#include <kcenon/peer_transfer/core/chunk_assembler.h>

namespace kcenon::peer_transfer {

chunk_assembler::chunk_assembler(duplicate_meta_policy policy) : policy_(policy) {}

auto chunk_assembler::begin(std::string id,
                            std::string name,
                            uint64_t declared_size,
                            std::string mime) -> begin_result {
    begin_result outcome;

    if (active_) {
        if (policy_ == duplicate_meta_policy::ignore) {
            outcome.accepted = false;
            return outcome;
        }
        outcome.abandoned = std::move(active_);
    }

    active_.emplace();
    active_->id = std::move(id);
    active_->name = std::move(name);
    active_->mime = std::move(mime);
    active_->declared_size = declared_size;
    return outcome;
}

auto chunk_assembler::append(byte_buffer chunk) -> bool {
    if (!active_) {
        return false;
    }

    active_->received_bytes += chunk.size();
    active_->chunks.push_back(std::move(chunk));
    return true;
}

auto chunk_assembler::finish(std::string_view id) -> std::optional<received_file> {
    if (!active_ || active_->id != id) {
        return std::nullopt;
    }

    auto data = std::make_shared<byte_buffer>();
    data->reserve(static_cast<std::size_t>(active_->received_bytes));
    for (const auto& chunk : active_->chunks) {
        data->insert(data->end(), chunk.begin(), chunk.end());
    }

    received_file file(std::move(active_->id),
                       std::move(active_->name),
                       std::move(active_->mime),
                       active_->declared_size,
                       std::move(data));
    active_.reset();
    return file;
}

auto chunk_assembler::reset() -> std::optional<incoming_transfer> {
    auto discarded = std::move(active_);
    active_.reset();
    return discarded;
}

}  // namespace kcenon::peer_transfer
