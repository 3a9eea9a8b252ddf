/**
 * @file received_file.h
 * @brief Finalized files received from the remote peer
 */

#ifndef KCENON_PEER_TRANSFER_CORE_RECEIVED_FILE_H
#define KCENON_PEER_TRANSFER_CORE_RECEIVED_FILE_H

#include <kcenon/peer_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief An immutable, fully reassembled incoming file
 *
 * The contents are shared rather than copied; holding a received_file keeps
 * them alive.
 */
class received_file {
public:
    using clock = std::chrono::system_clock;

    received_file(std::string id,
                  std::string name,
                  std::string mime,
                  uint64_t declared_size,
                  std::shared_ptr<const byte_buffer> data,
                  clock::time_point received_at = clock::now());

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto mime_type() const -> const std::string& { return mime_; }

    /// Size announced by the sender in its meta frame
    [[nodiscard]] auto declared_size() const -> uint64_t { return declared_size_; }

    /// Number of bytes actually received
    [[nodiscard]] auto size() const -> uint64_t { return data_->size(); }

    [[nodiscard]] auto data() const -> const byte_buffer& { return *data_; }
    [[nodiscard]] auto shared_data() const -> std::shared_ptr<const byte_buffer> { return data_; }

    [[nodiscard]] auto received_at() const -> clock::time_point { return received_at_; }

    /**
     * @brief Write the contents into a directory
     *
     * The remote-supplied name is reduced to a single path component. An
     * existing file is never overwritten: " (1)", " (2)"... is appended to
     * the stem instead.
     *
     * @param directory Target directory (created if missing)
     * @return Path of the written file, or file_write_error
     */
    [[nodiscard]] auto save_to(const std::filesystem::path& directory) const
        -> result<std::filesystem::path>;

private:
    std::string id_;
    std::string name_;
    std::string mime_;
    uint64_t declared_size_;
    std::shared_ptr<const byte_buffer> data_;
    clock::time_point received_at_;
};

using received_file_ptr = std::shared_ptr<const received_file>;

/**
 * @brief Received files of a session, newest first
 */
class received_file_list {
public:
    void add(received_file_ptr file);

    /// Snapshot of the list, newest first
    [[nodiscard]] auto files() const -> std::vector<received_file_ptr>;

    [[nodiscard]] auto find(std::string_view id) const -> received_file_ptr;

    [[nodiscard]] auto size() const -> std::size_t { return files_.size(); }
    [[nodiscard]] auto empty() const -> bool { return files_.empty(); }

    void clear() { files_.clear(); }

private:
    std::deque<received_file_ptr> files_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_RECEIVED_FILE_H
