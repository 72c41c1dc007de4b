// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace mcpbridge
{

/// @brief Abstract interface for a line-framed JSON channel to one backend.
///
/// send() and receive() may be called from different threads concurrently;
/// callers serialize send() among themselves.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Writes one JSON message followed by a line terminator, and flushes.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message (blocking). Blank lines are skipped.
    /// @return The received message; MalformedLine for a line that is not JSON (the
    ///         stream remains usable); ConnectionClosed once the stream has ended or
    ///         close() was called.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the channel and terminates the peer. Unblocks a pending receive().
    virtual void close() = 0;

    /// @brief Non-blocking liveness probe of the peer.
    [[nodiscard]] virtual auto isRunning() const -> bool = 0;
};

} // namespace mcpbridge
