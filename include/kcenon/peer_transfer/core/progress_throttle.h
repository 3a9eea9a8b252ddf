/**
 * @file progress_throttle.h
 * @brief Rate limiting for progress notifications
 */

#ifndef KCENON_PEER_TRANSFER_CORE_PROGRESS_THROTTLE_H
#define KCENON_PEER_TRANSFER_CORE_PROGRESS_THROTTLE_H

#include <chrono>
#include <cstdint>

namespace kcenon::peer_transfer {

/**
 * @brief Decides when a progress snapshot should be published
 *
 * A snapshot is due once the interval has elapsed since the previous one,
 * or when the transfer has reached its total. Time points are injectable
 * so that tests do not depend on the wall clock.
 */
class progress_throttle {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds default_interval{120};

    explicit progress_throttle(std::chrono::milliseconds interval = default_interval)
        : interval_(interval), last_report_(clock::now()) {}

    /**
     * @brief Restart the interval, treating @p now as the last report
     */
    void reset(clock::time_point now = clock::now()) {
        last_report_ = now;
    }

    /**
     * @brief Check whether a snapshot should be published, and record it if so
     */
    [[nodiscard]] auto should_report(uint64_t done_bytes,
                                     uint64_t total_bytes,
                                     clock::time_point now = clock::now()) -> bool {
        if (now - last_report_ >= interval_ || done_bytes >= total_bytes) {
            last_report_ = now;
            return true;
        }
        return false;
    }

    [[nodiscard]] auto interval() const -> std::chrono::milliseconds {
        return interval_;
    }

private:
    std::chrono::milliseconds interval_;
    clock::time_point last_report_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_PROGRESS_THROTTLE_H
