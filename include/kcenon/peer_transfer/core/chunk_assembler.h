/**
 * @file chunk_assembler.h
 * @brief Reassembly of the incoming transfer on a data channel
 */

#ifndef KCENON_PEER_TRANSFER_CORE_CHUNK_ASSEMBLER_H
#define KCENON_PEER_TRANSFER_CORE_CHUNK_ASSEMBLER_H

#include <kcenon/peer_transfer/core/received_file.h>
#include <kcenon/peer_transfer/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief What to do with a meta frame that arrives while a transfer is active
 */
enum class duplicate_meta_policy {
    replace,  ///< Abandon the unfinished transfer and start the new one
    ignore    ///< Keep the active transfer and drop the new meta frame
};

[[nodiscard]] constexpr auto to_string(duplicate_meta_policy policy) -> const char* {
    switch (policy) {
        case duplicate_meta_policy::replace: return "replace";
        case duplicate_meta_policy::ignore: return "ignore";
        default: return "unknown";
    }
}

/**
 * @brief Accumulator for a file being received
 */
struct incoming_transfer {
    std::string id;
    std::string name;
    std::string mime;
    uint64_t declared_size = 0;
    uint64_t received_bytes = 0;
    std::vector<byte_buffer> chunks;  ///< In arrival order
};

/**
 * @brief Reassembles chunks of one transfer at a time
 *
 * Binary frames carry no header, so at most one transfer can be active on a
 * channel: every chunk belongs to the transfer announced by the latest
 * accepted meta frame.
 */
class chunk_assembler {
public:
    /**
     * @brief Outcome of begin()
     */
    struct begin_result {
        bool accepted = true;
        /// Unfinished transfer discarded to make room for the new one
        std::optional<incoming_transfer> abandoned;
    };

    explicit chunk_assembler(duplicate_meta_policy policy = duplicate_meta_policy::replace);

    /**
     * @brief Start accumulating a transfer announced by a meta frame
     */
    [[nodiscard]] auto begin(std::string id,
                             std::string name,
                             uint64_t declared_size,
                             std::string mime) -> begin_result;

    /**
     * @brief Append a binary frame to the active transfer
     * @return false if no transfer is active (the frame is dropped)
     */
    [[nodiscard]] auto append(byte_buffer chunk) -> bool;

    /**
     * @brief Finalize the active transfer
     *
     * Chunks are concatenated in arrival order and tagged with the declared
     * name and MIME type.
     *
     * @param id Id carried by the end frame
     * @return The finished file, or nullopt if no transfer is active or the
     *         id does not match (the slot is left untouched)
     */
    [[nodiscard]] auto finish(std::string_view id) -> std::optional<received_file>;

    /**
     * @brief Discard the active transfer, if any
     * @return The discarded accumulator
     */
    auto reset() -> std::optional<incoming_transfer>;

    [[nodiscard]] auto has_active() const -> bool { return active_.has_value(); }

    [[nodiscard]] auto active() const -> const incoming_transfer* {
        return active_ ? &*active_ : nullptr;
    }

    [[nodiscard]] auto policy() const -> duplicate_meta_policy { return policy_; }

private:
    duplicate_meta_policy policy_;
    std::optional<incoming_transfer> active_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_CHUNK_ASSEMBLER_H
