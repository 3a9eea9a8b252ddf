/**
 * @file chunk_splitter.h
 * @brief Splitting a file source into binary frames
 */

#ifndef KCENON_PEER_TRANSFER_CORE_CHUNK_SPLITTER_H
#define KCENON_PEER_TRANSFER_CORE_CHUNK_SPLITTER_H

#include <kcenon/peer_transfer/core/chunk_config.h>
#include <kcenon/peer_transfer/core/file_source.h>
#include <kcenon/peer_transfer/core/types.h>

#include <memory>

namespace kcenon::peer_transfer {

/**
 * @brief Splits file sources into fixed-size chunks for streaming transfer
 *
 * Every chunk but the last has exactly chunk_size bytes. An empty file yields
 * no chunks at all.
 */
class chunk_splitter {
public:
    /**
     * @brief Iterator for streaming chunk access
     *
     * Reads one slice per call to next(), so only a single chunk is held in
     * memory at a time.
     */
    class chunk_iterator {
    public:
        /**
         * @brief Check if more chunks are available
         */
        [[nodiscard]] auto has_next() const -> bool;

        /**
         * @brief Read the next chunk
         * @return Chunk bytes, or file_read_error
         */
        [[nodiscard]] auto next() -> result<byte_buffer>;

        /**
         * @brief Index of the chunk next() will return (0-based)
         */
        [[nodiscard]] auto current_index() const -> uint64_t;

        [[nodiscard]] auto total_chunks() const -> uint64_t;

        [[nodiscard]] auto file_size() const -> uint64_t;

        /**
         * @brief Bytes handed out so far
         */
        [[nodiscard]] auto bytes_read() const -> uint64_t;

        chunk_iterator(chunk_iterator&&) noexcept = default;
        auto operator=(chunk_iterator&&) noexcept -> chunk_iterator& = default;
        ~chunk_iterator() = default;

        chunk_iterator(const chunk_iterator&) = delete;
        auto operator=(const chunk_iterator&) -> chunk_iterator& = delete;

    private:
        friend class chunk_splitter;

        chunk_iterator(file_source_ptr source, chunk_config config, uint64_t total_chunks);

        file_source_ptr source_;
        chunk_config config_;
        uint64_t file_size_;
        uint64_t total_chunks_;
        uint64_t current_index_;
        uint64_t offset_;
    };

    chunk_splitter();

    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Create chunk iterator for a source
     * @param source File to split
     * @return Chunk iterator, or invalid_argument for a null source or bad config
     */
    [[nodiscard]] auto split(file_source_ptr source) const -> result<chunk_iterator>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_CHUNK_SPLITTER_H
