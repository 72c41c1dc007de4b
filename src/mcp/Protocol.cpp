// SPDX-License-Identifier: Apache-2.0
#include "Protocol.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpbridge::protocol
{

namespace
{

    auto optionalString(const nlohmann::json& obj, std::string_view key) -> Result<std::optional<std::string>>
    {
        auto const keyStr = std::string(key);
        if (!obj.contains(keyStr) || obj[keyStr].is_null())
            return std::optional<std::string> {};
        if (!obj[keyStr].is_string())
            return makeError(ErrorCode::ProtocolError, std::format("Field '{}' must be a string", key));
        return std::optional<std::string> { obj[keyStr].get<std::string>() };
    }

    auto parseContent(const nlohmann::json& item) -> Result<ToolContent>
    {
        if (!item.is_object())
            return makeError(ErrorCode::ProtocolError, "Content block must be an object");

        auto const type = json::getStringOr(item, "type", "");

        if (type == "text")
        {
            return json::getString(item, "text").transform(
                [](std::string text) -> ToolContent { return TextContent { std::move(text) }; });
        }

        if (type == "image")
        {
            auto data = json::getString(item, "data");
            if (!data)
                return std::unexpected(data.error());
            auto mimeType = json::getString(item, "mimeType");
            if (!mimeType)
                return std::unexpected(mimeType.error());
            return ImageContent { .data = std::move(*data), .mimeType = std::move(*mimeType) };
        }

        if (type == "resource")
        {
            if (!item.contains("resource") || !item["resource"].is_object())
                return makeError(ErrorCode::ProtocolError, "Resource content block is missing 'resource'");

            auto const& resource = item["resource"];
            auto uri = json::getString(resource, "uri");
            if (!uri)
                return std::unexpected(uri.error());

            auto mimeType = optionalString(resource, "mimeType");
            auto text = optionalString(resource, "text");
            auto blob = optionalString(resource, "blob");
            if (!mimeType)
                return std::unexpected(mimeType.error());
            if (!text)
                return std::unexpected(text.error());
            if (!blob)
                return std::unexpected(blob.error());

            return ResourceContent {
                .uri = std::move(*uri),
                .mimeType = std::move(*mimeType),
                .text = std::move(*text),
                .blob = std::move(*blob),
            };
        }

        return makeError(ErrorCode::ProtocolError, std::format("Unsupported content type: '{}'", type));
    }

} // namespace

auto namespaceToolName(std::string_view backendName, std::string_view toolName) -> std::string
{
    return std::format("{}{}{}", backendName, NamespaceSeparator, toolName);
}

auto splitNamespacedToolName(std::string_view namespacedName) -> Result<std::pair<std::string, std::string>>
{
    auto const pos = namespacedName.find(NamespaceSeparator);
    if (pos == std::string_view::npos)
        return makeError(ErrorCode::InvalidToolName,
                         std::format("Invalid tool name format: {} (expected <server>{}<tool>)",
                                     namespacedName,
                                     NamespaceSeparator));

    return std::pair { std::string(namespacedName.substr(0, pos)),
                       std::string(namespacedName.substr(pos + NamespaceSeparator.size())) };
}

auto isValidBackendName(std::string_view name) -> bool
{
    return !name.empty() && name.find(NamespaceSeparator) == std::string_view::npos;
}

auto makeInitializeParams() -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", BridgeName },
              { "version", BridgeVersion },
          } },
    };
}

auto makeBridgeInitializeResult() -> nlohmann::json
{
    return nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", { { "tools", { { "listChanged", false } } } } },
        { "serverInfo",
          nlohmann::json {
              { "name", BridgeName },
              { "version", BridgeVersion },
          } },
    };
}

auto parseInitializeResult(const nlohmann::json& result) -> Result<InitializeResult>
{
    if (!result.is_object())
        return makeError(ErrorCode::ProtocolError, "initialize result must be an object");

    auto protocolVersion = json::getString(result, "protocolVersion");
    if (!protocolVersion)
        return std::unexpected(protocolVersion.error());

    if (!result.contains("serverInfo") || !result["serverInfo"].is_object())
        return makeError(ErrorCode::ProtocolError, "initialize result is missing 'serverInfo'");

    auto const& serverInfo = result["serverInfo"];
    auto name = json::getString(serverInfo, "name");
    if (!name)
        return std::unexpected(name.error());

    auto initResult = InitializeResult {
        .protocolVersion = std::move(*protocolVersion),
        .capabilities = {},
        .serverInfo = { .name = std::move(*name), .version = json::getStringOr(serverInfo, "version", "") },
    };

    if (result.contains("capabilities"))
    {
        auto const& caps = result["capabilities"];
        if (!caps.is_object())
            return makeError(ErrorCode::ProtocolError, "initialize 'capabilities' must be an object");
        initResult.capabilities.hasTools = caps.contains("tools");
        initResult.capabilities.hasResources = caps.contains("resources");
        initResult.capabilities.hasPrompts = caps.contains("prompts");
    }

    return initResult;
}

auto parseToolsList(const nlohmann::json& result) -> Result<std::vector<Tool>>
{
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        return makeError(ErrorCode::ProtocolError, "tools/list result is missing the 'tools' array");

    auto tools = std::vector<Tool> {};
    for (const auto& toolJson: result["tools"])
    {
        if (!toolJson.is_object())
            return makeError(ErrorCode::ProtocolError, "tools/list entry must be an object");

        auto name = json::getString(toolJson, "name");
        if (!name)
            return std::unexpected(name.error());

        auto description = optionalString(toolJson, "description");
        if (!description)
            return std::unexpected(description.error());

        tools.push_back(Tool {
            .name = std::move(*name),
            .description = std::move(*description),
            .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
        });
    }

    return tools;
}

auto parseToolCallResult(const nlohmann::json& result) -> Result<ToolCallResult>
{
    if (!result.is_object() || !result.contains("content") || !result["content"].is_array())
        return makeError(ErrorCode::ProtocolError, "tools/call result is missing the 'content' array");

    auto callResult = ToolCallResult {};
    callResult.isError = json::getBoolOr(result, "isError", false);

    for (const auto& item: result["content"])
    {
        auto content = parseContent(item);
        if (!content)
            return std::unexpected(content.error());
        callResult.content.push_back(std::move(*content));
    }

    return callResult;
}

auto toJson(const Tool& tool) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "name", tool.name },
        { "inputSchema", tool.inputSchema },
    };
    if (tool.description)
        obj["description"] = *tool.description;
    return obj;
}

auto toJson(const std::vector<Tool>& tools) -> nlohmann::json
{
    auto array = nlohmann::json::array();
    for (const auto& tool: tools)
        array.push_back(toJson(tool));
    return array;
}

auto toJson(const ToolContent& content) -> nlohmann::json
{
    struct Visitor
    {
        auto operator()(const TextContent& text) const -> nlohmann::json
        {
            return { { "type", "text" }, { "text", text.text } };
        }

        auto operator()(const ImageContent& image) const -> nlohmann::json
        {
            return { { "type", "image" }, { "data", image.data }, { "mimeType", image.mimeType } };
        }

        auto operator()(const ResourceContent& resource) const -> nlohmann::json
        {
            auto inner = nlohmann::json { { "uri", resource.uri } };
            if (resource.mimeType)
                inner["mimeType"] = *resource.mimeType;
            if (resource.text)
                inner["text"] = *resource.text;
            if (resource.blob)
                inner["blob"] = *resource.blob;
            return { { "type", "resource" }, { "resource", std::move(inner) } };
        }
    };

    return std::visit(Visitor {}, content);
}

auto toJson(const ToolCallResult& result) -> nlohmann::json
{
    auto content = nlohmann::json::array();
    for (const auto& item: result.content)
        content.push_back(toJson(item));

    return nlohmann::json {
        { "content", std::move(content) },
        { "isError", result.isError },
    };
}

} // namespace mcpbridge::protocol
