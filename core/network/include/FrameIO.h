#pragma once

#include <cstddef>
#include <string>

#include "Constants.h"
#include "Result.h"

namespace Tessera {
namespace Signaling {

/**
 * Wire framing: 4-byte big-endian payload length, then the payload
 * (one JSON envelope). Both calls block on the socket; callers serialize
 * writers per socket themselves.
 */

tsr::Result<void> writeFrame(int fd, const std::string& payload);

/**
 * @brief Read one complete frame
 *
 * ConnectionClosed on orderly EOF, ReceiveFailed on socket errors and
 * FrameTooLarge when the announced length exceeds maxFrameBytes (the
 * stream is then out of sync and must be closed).
 */
tsr::Result<std::string> readFrame(int fd, size_t maxFrameBytes = tsr::config::MAX_FRAME_BYTES);

} // namespace Signaling
} // namespace Tessera
