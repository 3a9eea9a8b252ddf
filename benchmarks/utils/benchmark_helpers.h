/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_PEER_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_PEER_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace kcenon::peer_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate SDP-like text, roughly the shape of a real session description
     * @param candidates Number of candidate lines
     */
    static auto generate_sdp(std::size_t candidates) -> std::string;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Run the loop until the predicate holds or the timeout elapses
 */
auto run_until(boost::asio::io_context& io,
               const std::function<bool()>& done,
               std::chrono::milliseconds timeout = std::chrono::seconds(60)) -> bool;

/**
 * @brief Format throughput as human-readable string
 * @param bytes_per_second Throughput in bytes per second
 * @return Formatted string (e.g., "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 4 * MB;
constexpr std::size_t large_file = 32 * MB;

// Chunk sizes for testing
constexpr std::size_t min_chunk = 4 * KB;
constexpr std::size_t default_chunk = 16 * KB;
constexpr std::size_t max_chunk = 16 * KB;
}  // namespace sizes

}  // namespace kcenon::peer_transfer::benchmark

#endif  // KCENON_PEER_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
