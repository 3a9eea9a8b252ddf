/**
 * @file event_helpers.h
 * @brief Helpers for inspecting drained transfer events
 */

#ifndef KCENON_PEER_TRANSFER_TEST_EVENT_HELPERS_H
#define KCENON_PEER_TRANSFER_TEST_EVENT_HELPERS_H

#include <kcenon/peer_transfer/core/transfer_event.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <vector>

namespace kcenon::peer_transfer::test {

template <typename T>
auto count_events(const std::vector<transfer_event>& events) -> std::size_t {
    std::size_t count = 0;
    for (const auto& e : events) {
        if (std::holds_alternative<T>(e)) ++count;
    }
    return count;
}

template <typename T>
auto events_of(const std::vector<transfer_event>& events) -> std::vector<T> {
    std::vector<T> out;
    for (const auto& e : events) {
        if (const auto* typed = std::get_if<T>(&e)) out.push_back(*typed);
    }
    return out;
}

/**
 * @brief Run the loop until the predicate holds or the timeout elapses
 * @return Whether the predicate held
 */
inline auto run_until(boost::asio::io_context& io,
                      const std::function<bool()>& done,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
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

/// Run every handler that is ready now
inline void run_ready(boost::asio::io_context& io) {
    io.restart();
    io.poll();
}

}  // namespace kcenon::peer_transfer::test

#endif  // KCENON_PEER_TRANSFER_TEST_EVENT_HELPERS_H
