// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace mcpbridge
{

/// @brief Table of outstanding requests on one connection, keyed by request id.
///
/// Each id owns a single-use completion slot. A slot is filled at most once,
/// either by a matching response or by failAll(), and is removed exactly once
/// by the waiting caller (or by discard() if the request never went out).
class PendingRequests
{
  public:
    /// @brief Registers a completion slot for @p id.
    /// @return Success, InvalidState if the id is already pending, or the closing
    ///         error once the table has been failed.
    [[nodiscard]] auto add(int64_t id) -> VoidResult;

    /// @brief Blocks until the slot for @p id is filled or @p deadline passes, then removes it.
    /// @return The response, the error the slot was failed with, or Timeout.
    [[nodiscard]] auto wait(int64_t id, std::chrono::steady_clock::time_point deadline)
        -> Result<jsonrpc::Response>;

    /// @brief Fills the slot for @p id with @p response.
    /// @return false if no unfilled slot exists for the id (stale or unknown id).
    auto fulfill(int64_t id, jsonrpc::Response response) -> bool;

    /// @brief Removes the slot for @p id without filling it.
    /// @return false if no slot existed.
    auto discard(int64_t id) -> bool;

    /// @brief Fails every unfilled slot with @p error and rejects later add() calls with it.
    void failAll(const Error& error);

    /// @brief Returns the number of registered slots.
    [[nodiscard]] auto size() const -> size_t;

    /// @brief Returns true once failAll() has been called.
    [[nodiscard]] auto isClosed() const -> bool;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<int64_t, std::optional<Result<jsonrpc::Response>>> _slots;
    std::optional<Error> _closedError;
};

} // namespace mcpbridge
