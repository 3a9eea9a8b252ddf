/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::peer_transfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_sdp(std::size_t candidates) -> std::string {
    std::ostringstream oss;
    oss << "v=0\r\n"
        << "o=rtc 2318263847 0 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << "a=group:BUNDLE 0\r\n"
        << "a=msid-semantic:WMS *\r\n"
        << "a=setup:actpass\r\n"
        << "a=ice-ufrag:T4Zu\r\n"
        << "a=ice-pwd:4sR0Eg2nP2Ty8VHcEYtdnYy3\r\n"
        << "a=ice-options:ice2,trickle\r\n"
        << "a=fingerprint:sha-256 0B:3D:2F:A1:7C:8E:45:91:D2:6A:03:BF:58:E4:12:9C:"
           "77:C0:1E:A8:63:F5:2B:94:DE:70:09:4A:B6:35:C1:8F\r\n"
        << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        << "c=IN IP4 0.0.0.0\r\n"
        << "a=mid:0\r\n"
        << "a=sendrecv\r\n"
        << "a=sctp-port:5000\r\n"
        << "a=max-message-size:262144\r\n";
    for (std::size_t i = 0; i < candidates; ++i) {
        oss << "a=candidate:" << i + 1 << " 1 UDP " << 2122317823 - i * 256
            << " 192.168." << i % 256 << "." << (i * 7) % 254 + 1 << " " << 50000 + i
            << " typ host\r\n";
    }
    oss << "a=end-of-candidates\r\n";
    return oss.str();
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "peer_trans_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// Utility functions

auto run_until(boost::asio::io_context& io,
               const std::function<bool()>& done,
               std::chrono::milliseconds timeout) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    io.restart();
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (io.run_one_for(std::chrono::milliseconds(10)) == 0) {
            io.restart();
        }
    }
    return true;
}

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= sizes::MB) {
        oss << bytes_per_second / sizes::MB << " MB/s";
    } else if (bytes_per_second >= sizes::KB) {
        oss << bytes_per_second / sizes::KB << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

}  // namespace kcenon::peer_transfer::benchmark
