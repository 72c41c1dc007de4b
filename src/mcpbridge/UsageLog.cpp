// SPDX-License-Identifier: Apache-2.0
#include "UsageLog.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Protocol.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <format>
#include <fstream>
#include <iterator>

namespace mcpbridge
{

namespace
{

    auto currentTimestamp() -> std::string
    {
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()));
    }

    auto readLines(const std::filesystem::path& path) -> Result<std::vector<std::string>>
    {
        auto lines = std::vector<std::string> {};
        if (!std::filesystem::exists(path))
            return lines;

        auto file = std::ifstream(path);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open usage log: {}", path.string()));

        auto line = std::string {};
        while (std::getline(file, line))
        {
            if (!line.empty())
                lines.push_back(line);
        }
        return lines;
    }

} // namespace

UsageLog::UsageLog(std::filesystem::path path): _path(std::move(path))
{
}

auto UsageLog::append(const UsageEntry& entry) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    if (!_lineCount)
    {
        auto lines = readLines(_path);
        if (!lines)
            return std::unexpected(lines.error());
        _lineCount = lines->size();
    }

    auto ec = std::error_code {};
    if (_path.has_parent_path())
        std::filesystem::create_directories(_path.parent_path(), ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create log directory '{}': {}", _path.parent_path().string(), ec.message()));

    {
        auto file = std::ofstream(_path, std::ios::app);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot append to usage log: {}", _path.string()));
        file << toJson(entry).dump() << '\n';
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed to write usage log: {}", _path.string()));
    }

    *_lineCount += 1;
    if (*_lineCount > RotateThreshold)
        return trim();
    return {};
}

void UsageLog::record(const ToolCallRecord& call)
{
    auto entry = UsageEntry {
        .timestamp = currentTimestamp(),
        .mcp = {},
        .tool = call.namespacedName,
        .args = call.arguments,
        .durationMs = call.duration.count(),
        .success = !call.error.has_value(),
        .error = call.error.transform([](const Error& e) { return e.message; }),
    };

    if (auto split = protocol::splitNamespacedToolName(call.namespacedName))
    {
        entry.mcp = split->first;
        entry.tool = split->second;
    }

    if (auto appended = append(entry); !appended)
        log::warning("Failed to record tool usage: {}", appended.error());
}

auto UsageLog::read(std::optional<size_t> limit) const -> Result<std::vector<UsageEntry>>
{
    auto lines = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto readResult = readLines(_path);
        if (!readResult)
            return std::unexpected(readResult.error());
        lines = std::move(*readResult);
    }

    auto const first = limit && *limit < lines.size() ? lines.size() - *limit : size_t { 0 };

    auto entries = std::vector<UsageEntry> {};
    for (auto i = first; i < lines.size(); ++i)
    {
        auto parsed = json::parse(lines[i]).and_then(parseUsageEntry);
        if (!parsed)
        {
            log::debug("Skipping unreadable usage log line {}: {}", i + 1, parsed.error().message);
            continue;
        }
        entries.push_back(std::move(*parsed));
    }
    return entries;
}

auto UsageLog::query(const UsageQuery& query) const -> Result<UsagePage>
{
    auto all = read();
    if (!all)
        return std::unexpected(all.error());

    auto matching = std::vector<UsageEntry> {};
    for (auto& entry: *all)
    {
        if (query.mcp && entry.mcp != *query.mcp)
            continue;
        if (query.success && entry.success != *query.success)
            continue;
        matching.push_back(std::move(entry));
    }

    auto page = UsagePage { .entries = {}, .total = matching.size() };
    auto const end = matching.size() - std::min(query.offset, matching.size());
    auto const begin = query.limit == 0 || query.limit >= end ? size_t { 0 } : end - query.limit;
    page.entries.assign(std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(begin)),
                        std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(end)));
    return page;
}

void UsageLog::follow(std::stop_token stopToken,
                      const std::function<void(const UsageEntry&)>& onEntry,
                      std::chrono::milliseconds pollInterval) const
{
    auto const fileSize = [this]() -> std::uintmax_t {
        auto ec = std::error_code {};
        auto const size = std::filesystem::file_size(_path, ec);
        return ec ? 0 : size;
    };

    auto position = fileSize();
    auto partial = std::string {};

    auto mutex = std::mutex {};
    auto wakeup = std::condition_variable_any {};

    while (!stopToken.stop_requested())
    {
        auto const size = fileSize();
        if (size < position)
        {
            log::debug("Usage log shrank from {} to {} bytes, following from the new end", position, size);
            position = size;
            partial.clear();
        }
        else if (size > position)
        {
            auto file = std::ifstream(_path, std::ios::binary);
            if (file.is_open())
            {
                file.seekg(static_cast<std::streamoff>(position));
                auto chunk = std::string(static_cast<size_t>(size - position), '\0');
                file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                chunk.resize(static_cast<size_t>(file.gcount()));
                position += chunk.size();
                partial += chunk;

                // Only complete lines are reported; a line still being written waits for the next poll.
                auto newline = partial.find('\n');
                while (newline != std::string::npos)
                {
                    auto const line = partial.substr(0, newline);
                    partial.erase(0, newline + 1);
                    if (!line.empty())
                    {
                        if (auto entry = json::parse(line).and_then(parseUsageEntry))
                            onEntry(*entry);
                        else
                            log::debug("Skipping unreadable usage log line: {}", entry.error().message);
                    }
                    newline = partial.find('\n');
                }
            }
        }

        auto lock = std::unique_lock(mutex);
        wakeup.wait_for(lock, stopToken, pollInterval, [] { return false; });
    }
}

auto UsageLog::trim() -> VoidResult
{
    auto lines = readLines(_path);
    if (!lines)
        return std::unexpected(lines.error());

    if (lines->size() <= MaxEntries)
    {
        _lineCount = lines->size();
        return {};
    }

    auto const tmpPath = std::filesystem::path(_path.string() + ".tmp");
    {
        auto file = std::ofstream(tmpPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot rotate usage log: {}", tmpPath.string()));
        for (auto i = lines->size() - MaxEntries; i < lines->size(); ++i)
            file << (*lines)[i] << '\n';
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed to write {}", tmpPath.string()));
    }

    auto ec = std::error_code {};
    std::filesystem::rename(tmpPath, _path, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Failed to rotate usage log: {}", ec.message()));

    log::debug("Usage log trimmed from {} to {} entries", lines->size(), MaxEntries);
    _lineCount = MaxEntries;
    return {};
}

auto toJson(const UsageEntry& entry) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "timestamp", entry.timestamp },
        { "mcp", entry.mcp },
        { "tool", entry.tool },
        { "args", entry.args },
        { "durationMs", entry.durationMs },
        { "success", entry.success },
    };
    if (entry.error)
        obj["error"] = *entry.error;
    return obj;
}

auto parseUsageEntry(const nlohmann::json& value) -> Result<UsageEntry>
{
    if (!value.is_object())
        return makeError(ErrorCode::ProtocolError, "Usage log entry must be an object");

    auto entry = UsageEntry {
        .timestamp = json::getStringOr(value, "timestamp", ""),
        .mcp = json::getStringOr(value, "mcp", ""),
        .tool = json::getStringOr(value, "tool", ""),
        .args = value.value("args", nlohmann::json::object()),
        .durationMs = value.contains("durationMs") && value["durationMs"].is_number_integer()
                          ? value["durationMs"].get<int64_t>()
                          : 0,
        .success = json::getBoolOr(value, "success", true),
        .error = std::nullopt,
    };

    if (value.contains("error") && value["error"].is_string())
        entry.error = value["error"].get<std::string>();
    return entry;
}

auto formatUsageEntry(const UsageEntry& entry) -> std::string
{
    auto line = std::format("{}  {} {}{}{}  {}ms",
                            entry.timestamp,
                            entry.success ? "ok  " : "FAIL",
                            entry.mcp,
                            entry.mcp.empty() ? "" : protocol::NamespaceSeparator,
                            entry.tool,
                            entry.durationMs);
    if (entry.error)
        line += std::format("  ({})", *entry.error);
    return line;
}

} // namespace mcpbridge
