/**
 * @file file_utils.h
 * @brief File naming, MIME type and display formatting helpers
 */

#ifndef KCENON_PEER_TRANSFER_CORE_FILE_UTILS_H
#define KCENON_PEER_TRANSFER_CORE_FILE_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/// MIME type announced for files without a known type
inline constexpr const char* default_mime_type = "application/octet-stream";

/**
 * @brief Guess a MIME type from the extension of a file name
 * @param file_name File name or path
 * @return MIME type, or application/octet-stream if the extension is unknown
 */
[[nodiscard]] auto detect_mime_type(std::string_view file_name) -> std::string;

/**
 * @brief Reduce a remote-supplied file name to a safe single path component
 *
 * Directory parts (either separator) are stripped, control characters are
 * removed, and names that are empty, "." or ".." fall back to "received_file".
 */
[[nodiscard]] auto sanitize_file_name(std::string_view name) -> std::string;

/**
 * @brief Format a byte count for display ("512 B", "50.0 KB", "1.50 MB")
 */
[[nodiscard]] auto format_size(uint64_t bytes) -> std::string;

/**
 * @brief Format a transfer ratio as a percentage ("42.5%")
 *
 * A zero total formats as "0.0%".
 */
[[nodiscard]] auto format_percent(uint64_t done, uint64_t total) -> std::string;

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_FILE_UTILS_H
