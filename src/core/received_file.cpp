/**
 * @file received_file.cpp
 * @brief Implementation of received files and their list
 */

#include <kcenon/peer_transfer/core/received_file.h>

#include <kcenon/peer_transfer/core/file_utils.h>

#include <fstream>

namespace kcenon::peer_transfer {

namespace {

auto unique_target(const std::filesystem::path& directory, const std::string& file_name)
    -> std::filesystem::path {
    std::filesystem::path candidate = directory / file_name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    std::filesystem::path name(file_name);
    auto stem = name.stem().string();
    auto ext = name.extension().string();
    for (int n = 1;; ++n) {
        candidate = directory / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

}  // namespace

received_file::received_file(std::string id,
                             std::string name,
                             std::string mime,
                             uint64_t declared_size,
                             std::shared_ptr<const byte_buffer> data,
                             clock::time_point received_at)
    : id_(std::move(id)),
      name_(std::move(name)),
      mime_(std::move(mime)),
      declared_size_(declared_size),
      data_(data ? std::move(data) : std::make_shared<byte_buffer>()),
      received_at_(received_at) {}

auto received_file::save_to(const std::filesystem::path& directory) const
    -> result<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create directory: " + directory.string()});
    }

    auto target = unique_target(directory, sanitize_file_name(name_));

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(error{error_code::file_write_error,
                                "cannot open file for writing: " + target.string()});
    }

    out.write(reinterpret_cast<const char*>(data_->data()),
              static_cast<std::streamsize>(data_->size()));
    out.close();
    if (!out) {
        return unexpected(error{error_code::file_write_error,
                                "write failed: " + target.string()});
    }

    return target;
}

void received_file_list::add(received_file_ptr file) {
    if (file) {
        files_.push_front(std::move(file));
    }
}

auto received_file_list::files() const -> std::vector<received_file_ptr> {
    return {files_.begin(), files_.end()};
}

auto received_file_list::find(std::string_view id) const -> received_file_ptr {
    for (const auto& file : files_) {
        if (file->id() == id) {
            return file;
        }
    }
    return nullptr;
}

}  // namespace kcenon::peer_transfer
