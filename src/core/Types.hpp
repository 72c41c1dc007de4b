// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpbridge
{

/// @brief Describes one backend process: how to launch it and whether it is active.
struct ServerDescriptor
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
};

/// @brief A tool offered by a backend (or, namespaced, by the bridge).
struct Tool
{
    std::string name;
    std::optional<std::string> description;
    nlohmann::json inputSchema = nlohmann::json::object(); // Passed through unmodified.
};

/// @brief Plain text content block.
struct TextContent
{
    std::string text;
};

/// @brief Base64-encoded image content block.
struct ImageContent
{
    std::string data;
    std::string mimeType;
};

/// @brief Embedded resource content block.
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

using ToolContent = std::variant<TextContent, ImageContent, ResourceContent>;

/// @brief The structured result of a tools/call invocation.
struct ToolCallResult
{
    std::vector<ToolContent> content;
    bool isError = false;
};

/// @brief Name and version of a protocol peer.
struct PeerInfo
{
    std::string name;
    std::string version;
};

/// @brief Capability flags advertised by a server during the handshake.
struct ServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief The cached outcome of a successful initialize handshake.
struct InitializeResult
{
    std::string protocolVersion;
    ServerCapabilities capabilities;
    PeerInfo serverInfo;
};

} // namespace mcpbridge
