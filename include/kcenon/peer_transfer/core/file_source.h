/**
 * @file file_source.h
 * @brief Lazily readable file contents offered for sending
 */

#ifndef KCENON_PEER_TRANSFER_CORE_FILE_SOURCE_H
#define KCENON_PEER_TRANSFER_CORE_FILE_SOURCE_H

#include <kcenon/peer_transfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief A file selected for sending
 *
 * Contents are read slice by slice so that large files never need to be held
 * in memory.
 */
class file_source {
public:
    virtual ~file_source() = default;

    /// Name announced to the receiver
    [[nodiscard]] virtual auto name() const -> const std::string& = 0;

    /// Size in bytes announced to the receiver
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /// MIME type announced to the receiver (never empty)
    [[nodiscard]] virtual auto mime_type() const -> const std::string& = 0;

    /**
     * @brief Read a slice of the contents
     * @param offset Byte offset of the slice
     * @param length Maximum number of bytes; fewer are returned at end of file
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::size_t length)
        -> result<byte_buffer> = 0;
};

using file_source_ptr = std::shared_ptr<file_source>;

/**
 * @brief File contents already held in memory
 */
class memory_file_source : public file_source {
public:
    /**
     * @param name File name
     * @param data File contents
     * @param mime MIME type; guessed from the name when empty
     */
    memory_file_source(std::string name, byte_buffer data, std::string mime = {});

    /**
     * @brief Convenience factory for text contents
     */
    [[nodiscard]] static auto from_string(std::string name,
                                          std::string_view text,
                                          std::string mime = {})
        -> std::shared_ptr<memory_file_source>;

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto size() const -> uint64_t override { return data_.size(); }
    [[nodiscard]] auto mime_type() const -> const std::string& override { return mime_; }

    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<byte_buffer> override;

private:
    std::string name_;
    byte_buffer data_;
    std::string mime_;
};

/**
 * @brief File on the local file system
 */
class disk_file_source : public file_source {
public:
    /**
     * @brief Open a regular file for sending
     * @param path Path to the file
     * @param mime MIME type override; guessed from the extension otherwise
     * @return Source, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   std::optional<std::string> mime = std::nullopt)
        -> result<std::shared_ptr<disk_file_source>>;

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto mime_type() const -> const std::string& override { return mime_; }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto read(uint64_t offset, std::size_t length)
        -> result<byte_buffer> override;

private:
    disk_file_source(std::filesystem::path path, std::ifstream stream,
                     uint64_t size, std::string mime);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::string name_;
    uint64_t size_;
    std::string mime_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_FILE_SOURCE_H
