// SPDX-License-Identifier: Apache-2.0
#include "PendingRequests.hpp"

#include <format>

namespace mcpbridge
{

auto PendingRequests::add(int64_t id) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    if (_closedError)
        return std::unexpected(*_closedError);

    auto const [it, inserted] = _slots.try_emplace(id);
    if (!inserted)
        return makeError(ErrorCode::InvalidState, std::format("Request id {} is already pending", id));

    return {};
}

auto PendingRequests::wait(int64_t id, std::chrono::steady_clock::time_point deadline)
    -> Result<jsonrpc::Response>
{
    auto lock = std::unique_lock(_mutex);

    _cv.wait_until(lock, deadline, [&] {
        auto const it = _slots.find(id);
        return it == _slots.end() || it->second.has_value();
    });

    auto const it = _slots.find(id);
    if (it == _slots.end())
        return makeError(ErrorCode::InvalidState, std::format("Request id {} is not pending", id));

    if (!it->second)
    {
        _slots.erase(it);
        return makeError(ErrorCode::Timeout, std::format("Request {} timed out", id));
    }

    auto outcome = std::move(*it->second);
    _slots.erase(it);
    return outcome;
}

auto PendingRequests::fulfill(int64_t id, jsonrpc::Response response) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _slots.find(id);
        if (it == _slots.end() || it->second.has_value())
            return false;
        it->second.emplace(std::move(response));
    }
    _cv.notify_all();
    return true;
}

auto PendingRequests::discard(int64_t id) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _slots.erase(id) > 0;
}

void PendingRequests::failAll(const Error& error)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_closedError)
            _closedError = error;

        for (auto& [id, slot]: _slots)
        {
            if (!slot)
                slot.emplace(std::unexpected(error));
        }
    }
    _cv.notify_all();
}

auto PendingRequests::size() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _slots.size();
}

auto PendingRequests::isClosed() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _closedError.has_value();
}

} // namespace mcpbridge
