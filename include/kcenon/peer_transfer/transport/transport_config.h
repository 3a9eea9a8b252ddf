/**
 * @file transport_config.h
 * @brief Peer connection and data channel configuration
 * @version 0.1.0
 */

#ifndef KCENON_PEER_TRANSFER_TRANSPORT_TRANSPORT_CONFIG_H
#define KCENON_PEER_TRANSFER_TRANSPORT_TRANSPORT_CONFIG_H

#include <kcenon/peer_transfer/core/chunk_assembler.h>
#include <kcenon/peer_transfer/core/chunk_config.h>
#include <kcenon/peer_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief STUN or TURN server used for candidate gathering
 */
struct ice_server {
    std::string url;         ///< e.g. "stun:stun.l.google.com:19302"
    std::string username;    ///< TURN only
    std::string credential;  ///< TURN only
};

/**
 * @brief Configuration of a peer connection and its data channel
 */
struct peer_config {
    /// Public STUN server added when use_stun is set
    static constexpr const char* default_stun_server = "stun:stun.l.google.com:19302";

    /// Explicit ICE servers; empty means host candidates only
    std::vector<ice_server> ice_servers;

    /// Add the public STUN server to the ICE servers
    bool use_stun = false;

    /// Label of the single data channel
    std::string channel_label = "file";

    /// Chunk size and backlog limits
    chunk_config chunks;

    /// Bound on waiting for candidate gathering to complete
    std::chrono::milliseconds gathering_timeout{10000};

    /// Bound on waiting for the send backlog to drain
    std::chrono::milliseconds flow_control_timeout{10000};

    /// Minimum interval between progress snapshots
    std::chrono::milliseconds progress_interval{120};

    /// Handling of a meta frame that arrives while a transfer is active
    duplicate_meta_policy duplicate_meta = duplicate_meta_policy::replace;

    /**
     * @brief ICE servers to hand to the backend
     */
    [[nodiscard]] auto effective_ice_servers() const -> std::vector<ice_server> {
        auto servers = ice_servers;
        if (use_stun) {
            bool present = false;
            for (const auto& server : servers) {
                if (server.url == default_stun_server) present = true;
            }
            if (!present) {
                servers.push_back(ice_server{default_stun_server, {}, {}});
            }
        }
        return servers;
    }

    /**
     * @brief Validate configuration
     * @return Success if valid, invalid_argument otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (auto valid = chunks.validate(); !valid) {
            return valid;
        }
        if (channel_label.empty()) {
            return unexpected(error{error_code::invalid_argument, "channel label must not be empty"});
        }
        if (gathering_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_argument, "gathering timeout must be positive"});
        }
        if (flow_control_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_argument,
                                    "flow control timeout must be positive"});
        }
        if (progress_interval.count() < 0) {
            return unexpected(error{error_code::invalid_argument,
                                    "progress interval must not be negative"});
        }
        for (const auto& server : ice_servers) {
            if (server.url.empty()) {
                return unexpected(error{error_code::invalid_argument, "ICE server URL is empty"});
            }
        }
        return {};
    }
};

/**
 * @brief Options of the in-process loopback backend
 */
struct loopback_options {
    /// Bytes delivered to the remote side per drain tick
    uint64_t drain_bytes_per_tick = 1024 * 1024;

    /// Interval between drain ticks
    std::chrono::milliseconds drain_interval{1};

    /// Delay between local description and gathering completion
    std::chrono::milliseconds gathering_delay{0};
};

/**
 * @brief Builder for peer_config
 *
 * @code
 * auto config = peer_config_builder()
 *     .with_stun(true)
 *     .with_gathering_timeout(std::chrono::seconds{5})
 *     .build();
 * @endcode
 */
class peer_config_builder {
public:
    auto with_ice_server(std::string url,
                         std::string username = {},
                         std::string credential = {}) -> peer_config_builder& {
        config_.ice_servers.push_back(
            ice_server{std::move(url), std::move(username), std::move(credential)});
        return *this;
    }

    auto with_stun(bool enable) -> peer_config_builder& {
        config_.use_stun = enable;
        return *this;
    }

    auto with_channel_label(std::string label) -> peer_config_builder& {
        config_.channel_label = std::move(label);
        return *this;
    }

    auto with_chunk_size(std::size_t size) -> peer_config_builder& {
        config_.chunks.chunk_size = size;
        return *this;
    }

    auto with_buffered_amount_limits(uint64_t ceiling, uint64_t low_threshold)
        -> peer_config_builder& {
        config_.chunks.max_buffered_amount = ceiling;
        config_.chunks.buffered_amount_low_threshold = low_threshold;
        return *this;
    }

    auto with_gathering_timeout(std::chrono::milliseconds timeout) -> peer_config_builder& {
        config_.gathering_timeout = timeout;
        return *this;
    }

    auto with_flow_control_timeout(std::chrono::milliseconds timeout) -> peer_config_builder& {
        config_.flow_control_timeout = timeout;
        return *this;
    }

    auto with_progress_interval(std::chrono::milliseconds interval) -> peer_config_builder& {
        config_.progress_interval = interval;
        return *this;
    }

    auto with_duplicate_meta_policy(duplicate_meta_policy policy) -> peer_config_builder& {
        config_.duplicate_meta = policy;
        return *this;
    }

    /**
     * @brief Build the configuration without validating it
     */
    [[nodiscard]] auto build() const -> peer_config {
        return config_;
    }

    /**
     * @brief Build and validate the configuration
     */
    [[nodiscard]] auto build_validated() const -> result<peer_config> {
        if (auto valid = config_.validate(); !valid) {
            return unexpected(valid.error());
        }
        return config_;
    }

private:
    peer_config config_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_TRANSPORT_TRANSPORT_CONFIG_H
