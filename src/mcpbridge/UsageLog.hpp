// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Router.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge
{

/// @brief One line of the tool usage log.
struct UsageEntry
{
    std::string timestamp; ///< ISO-8601 UTC.
    std::string mcp;       ///< Backend name.
    std::string tool;      ///< Local tool name.
    nlohmann::json args;
    int64_t durationMs = 0;
    bool success = true;
    std::optional<std::string> error;
};

/// @brief Filter and page selection for UsageLog::query().
struct UsageQuery
{
    size_t limit = 50; ///< Newest entries to return after filtering; 0 for all.
    size_t offset = 0; ///< Newest matching entries to skip before applying the limit.
    std::optional<std::string> mcp;
    std::optional<bool> success;
};

/// @brief One page of usage entries, oldest first.
struct UsagePage
{
    std::vector<UsageEntry> entries;
    size_t total = 0; ///< Number of entries matching the filters.
};

/// @brief Append-only JSON-lines record of routed tool calls, trimmed to the newest entries.
class UsageLog
{
  public:
    /// @brief Number of entries kept after trimming.
    static constexpr auto MaxEntries = size_t { 5000 };

    /// @brief Entry count above which the file is trimmed back to MaxEntries.
    static constexpr auto RotateThreshold = size_t { 6000 };

    explicit UsageLog(std::filesystem::path path);

    /// @brief Appends one entry, trimming the file when it grows past RotateThreshold.
    [[nodiscard]] auto append(const UsageEntry& entry) -> VoidResult;

    /// @brief Records a routed tool call. Failures are logged, not propagated.
    void record(const ToolCallRecord& call);

    /// @brief Reads the newest @p limit entries (all entries if empty), oldest first.
    [[nodiscard]] auto read(std::optional<size_t> limit = std::nullopt) const -> Result<std::vector<UsageEntry>>;

    /// @brief Returns the filtered entries, paged from the newest end.
    [[nodiscard]] auto query(const UsageQuery& query) const -> Result<UsagePage>;

    /// @brief Reports entries appended after the call, until @p stopToken is triggered.
    ///
    /// Blocks the calling thread, checking the file every @p pollInterval.
    /// A file that shrank (trimmed or replaced) is followed from its new end.
    void follow(std::stop_token stopToken,
                const std::function<void(const UsageEntry&)>& onEntry,
                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(250)) const;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    [[nodiscard]] auto trim() -> VoidResult;

    std::filesystem::path _path;
    mutable std::mutex _mutex;
    std::optional<size_t> _lineCount;
};

/// @brief Converts an entry to its JSON line representation.
[[nodiscard]] auto toJson(const UsageEntry& entry) -> nlohmann::json;

/// @brief Parses one JSON line of the usage log.
[[nodiscard]] auto parseUsageEntry(const nlohmann::json& value) -> Result<UsageEntry>;

/// @brief Renders an entry as one human-readable line for the `logs` command.
[[nodiscard]] auto formatUsageEntry(const UsageEntry& entry) -> std::string;

} // namespace mcpbridge
