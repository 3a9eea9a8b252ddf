/**
 * @file file_utils.cpp
 * @brief Implementation of file naming and formatting helpers
 */

#include <kcenon/peer_transfer/core/file_utils.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace kcenon::peer_transfer {

auto detect_mime_type(std::string_view file_name) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".ico", "image/x-icon"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
    };

    auto slash_pos = file_name.find_last_of("/\\");
    if (slash_pos != std::string_view::npos) {
        file_name.remove_prefix(slash_pos + 1);
    }

    auto dot_pos = file_name.rfind('.');
    if (dot_pos == std::string_view::npos) {
        return default_mime_type;
    }

    std::string ext(file_name.substr(dot_pos));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return default_mime_type;
}

auto sanitize_file_name(std::string_view name) -> std::string {
    auto slash_pos = name.find_last_of("/\\");
    if (slash_pos != std::string_view::npos) {
        name.remove_prefix(slash_pos + 1);
    }

    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F || c == ':') {
            continue;
        }
        result += c;
    }

    // Trailing dots and spaces are dropped by some file systems
    while (!result.empty() && (result.back() == ' ' || result.back() == '.')) {
        result.pop_back();
    }

    if (result.empty() || result == "." || result == "..") {
        return "received_file";
    }
    return result;
}

auto format_size(uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value < 10.0 ? 2 : 1) << value
        << ' ' << units[unit];
    return oss.str();
}

auto format_percent(uint64_t done, uint64_t total) -> std::string {
    double percent = 0.0;
    if (total > 0) {
        percent = static_cast<double>(done) / static_cast<double>(total) * 100.0;
        percent = std::min(percent, 100.0);
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent << '%';
    return oss.str();
}

}  // namespace kcenon::peer_transfer
