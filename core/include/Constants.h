#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for Tessera
 *
 * Defaults for every tunable that can also be overridden from the
 * config file live here so the executables and the library agree.
 */

#include <cstddef>
#include <cstdint>

namespace tsr::config {

// =============================================================================
// Relay / Signaling
// =============================================================================

/// Default relay port (clients and relay)
constexpr int DEFAULT_RELAY_PORT = 9000;

/// Default relay URL used by peers
constexpr const char* DEFAULT_RELAY_URL = "tcp://localhost:9000";

/// Relay listen backlog
constexpr int RELAY_BACKLOG = 64;

/// How long a new relay connection may stay unregistered (milliseconds)
constexpr int HANDSHAKE_TIMEOUT_MS = 5000;

/// Accept loop poll interval (milliseconds)
constexpr int ACCEPT_POLL_INTERVAL_MS = 250;

/// Send timeout applied to relay sockets (seconds)
constexpr int SOCKET_SEND_TIMEOUT_SEC = 5;

/// Upper bound for one framed envelope (bytes)
constexpr std::size_t MAX_FRAME_BYTES = 10 * 1024 * 1024;  // 10MB

/// Frame header: 4-byte big-endian payload length
constexpr std::size_t FRAME_HEADER_BYTES = 4;

// =============================================================================
// Client timing
// =============================================================================

/// Heartbeat (ping) interval (milliseconds), 0 disables
constexpr int HEARTBEAT_INTERVAL_MS = 30000;

/// First reconnection delay (milliseconds)
constexpr int RECONNECT_BASE_DELAY_MS = 1000;

/// Reconnection delay ceiling (milliseconds)
constexpr int RECONNECT_MAX_DELAY_MS = 30000;

/// Random jitter added to every reconnection delay (milliseconds)
constexpr int RECONNECT_JITTER_MS = 1000;

// =============================================================================
// Buffer Sizes
// =============================================================================

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

/// Read buffer used when hashing staged files
constexpr std::size_t HASH_READ_BUFFER_SIZE = 64 * 1024;  // 64KB

} // namespace tsr::config
