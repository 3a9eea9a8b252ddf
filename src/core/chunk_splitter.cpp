/**
 * @file chunk_splitter.cpp
 * @brief Implementation of file splitting into chunks
 */

#include <kcenon/peer_transfer/core/chunk_splitter.h>

namespace kcenon::peer_transfer {

// chunk_iterator implementation

chunk_splitter::chunk_iterator::chunk_iterator(file_source_ptr source,
                                               chunk_config config,
                                               uint64_t total_chunks)
    : source_(std::move(source)),
      config_(config),
      file_size_(source_->size()),
      total_chunks_(total_chunks),
      current_index_(0),
      offset_(0) {}

auto chunk_splitter::chunk_iterator::has_next() const -> bool {
    return current_index_ < total_chunks_;
}

auto chunk_splitter::chunk_iterator::next() -> result<byte_buffer> {
    if (!has_next()) {
        return unexpected(error{error_code::internal_error, "no more chunks available"});
    }

    std::size_t bytes_to_read = config_.chunk_size;

    // For the last chunk, adjust the size
    if (current_index_ == total_chunks_ - 1) {
        bytes_to_read = static_cast<std::size_t>(file_size_ - offset_);
    }

    auto data = source_->read(offset_, bytes_to_read);
    if (!data) {
        return unexpected(data.error());
    }
    if (data.value().size() != bytes_to_read) {
        return unexpected(error{error_code::file_read_error,
                                "short read from " + source_->name()});
    }

    offset_ += bytes_to_read;
    ++current_index_;
    return std::move(data).value();
}

auto chunk_splitter::chunk_iterator::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_splitter::chunk_iterator::total_chunks() const -> uint64_t {
    return total_chunks_;
}

auto chunk_splitter::chunk_iterator::file_size() const -> uint64_t {
    return file_size_;
}

auto chunk_splitter::chunk_iterator::bytes_read() const -> uint64_t {
    return offset_;
}

// chunk_splitter implementation

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::split(file_source_ptr source) const -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    if (!source) {
        return unexpected(error{error_code::invalid_argument, "null file source"});
    }

    uint64_t total_chunks = config_.calculate_chunk_count(source->size());
    return chunk_iterator(std::move(source), config_, total_chunks);
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::peer_transfer
