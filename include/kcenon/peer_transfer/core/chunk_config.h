/**
 * @file chunk_config.h
 * @brief Chunking and send-buffer limits for the data channel
 */

#ifndef KCENON_PEER_TRANSFER_CORE_CHUNK_CONFIG_H
#define KCENON_PEER_TRANSFER_CORE_CHUNK_CONFIG_H

#include <kcenon/peer_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::peer_transfer {

/**
 * @brief Configuration for chunk operations and outbound backpressure
 */
struct chunk_config {
    /// Default chunk size (16KB), safe for every SCTP implementation
    static constexpr std::size_t default_chunk_size = 16 * 1024;

    /// Largest binary frame allowed on the wire (16KB)
    static constexpr std::size_t max_chunk_size = default_chunk_size;

    /// Default backlog ceiling before the sender suspends (16MB)
    static constexpr uint64_t default_max_buffered_amount = 16ULL * 1024 * 1024;

    /// Default backlog level at which a suspended sender resumes (8MB)
    static constexpr uint64_t default_low_threshold = default_max_buffered_amount / 2;

    /// Chunk size to use for splitting
    std::size_t chunk_size = default_chunk_size;

    /// Suspend sending once the channel backlog exceeds this many bytes
    uint64_t max_buffered_amount = default_max_buffered_amount;

    /// Resume sending once the backlog drops to this many bytes
    uint64_t buffered_amount_low_threshold = default_low_threshold;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_argument, "chunk size must be positive"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_argument,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_buffered_amount == 0) {
            return unexpected(error{error_code::invalid_argument,
                                    "buffered amount ceiling must be positive"});
        }
        if (buffered_amount_low_threshold > max_buffered_amount) {
            return unexpected(error{error_code::invalid_argument,
                                    "low threshold exceeds buffered amount ceiling"});
        }
        return {};
    }

    /**
     * @brief Calculate number of binary frames for a given file size
     * @param file_size Size of the file in bytes
     * @return Number of chunks needed (0 for an empty file)
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_CHUNK_CONFIG_H
