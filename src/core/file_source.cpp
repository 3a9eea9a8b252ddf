/**
 * @file file_source.cpp
 * @brief Implementation of in-memory and on-disk file sources
 */

#include <kcenon/peer_transfer/core/file_source.h>

#include <kcenon/peer_transfer/core/file_utils.h>

#include <algorithm>
#include <cstring>

namespace kcenon::peer_transfer {

// memory_file_source implementation

memory_file_source::memory_file_source(std::string name, byte_buffer data, std::string mime)
    : name_(std::move(name)), data_(std::move(data)), mime_(std::move(mime)) {
    if (mime_.empty()) {
        mime_ = detect_mime_type(name_);
    }
}

auto memory_file_source::from_string(std::string name, std::string_view text, std::string mime)
    -> std::shared_ptr<memory_file_source> {
    byte_buffer data(text.size());
    if (!text.empty()) {
        std::memcpy(data.data(), text.data(), text.size());
    }
    return std::make_shared<memory_file_source>(std::move(name), std::move(data), std::move(mime));
}

auto memory_file_source::read(uint64_t offset, std::size_t length) -> result<byte_buffer> {
    if (offset > data_.size()) {
        return unexpected(error{error_code::file_read_error, "read offset beyond end of file"});
    }

    auto available = static_cast<std::size_t>(data_.size() - offset);
    auto count = std::min(length, available);
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return byte_buffer(first, first + static_cast<std::ptrdiff_t>(count));
}

// disk_file_source implementation

disk_file_source::disk_file_source(std::filesystem::path path, std::ifstream stream,
                                   uint64_t size, std::string mime)
    : path_(std::move(path)),
      stream_(std::move(stream)),
      name_(path_.filename().string()),
      size_(size),
      mime_(std::move(mime)) {}

auto disk_file_source::open(const std::filesystem::path& path, std::optional<std::string> mime)
    -> result<std::shared_ptr<disk_file_source>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error{error_code::file_not_found, "file not found: " + path.string()});
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::file_read_error, "not a regular file: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected(error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    std::string type = mime && !mime->empty() ? *mime : detect_mime_type(path.filename().string());

    return std::shared_ptr<disk_file_source>(
        new disk_file_source(path, std::move(stream), file_size, std::move(type)));
}

auto disk_file_source::read(uint64_t offset, std::size_t length) -> result<byte_buffer> {
    if (offset > size_) {
        return unexpected(error{error_code::file_read_error, "read offset beyond end of file"});
    }

    auto count = static_cast<std::size_t>(std::min<uint64_t>(length, size_ - offset));
    byte_buffer buffer(count);
    if (count == 0) {
        return buffer;
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed: " + path_.string()});
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(stream_.gcount()) != count) {
        return unexpected(
            error{error_code::file_read_error, "failed to read expected bytes: " + path_.string()});
    }

    return buffer;
}

}  // namespace kcenon::peer_transfer
