// SPDX-License-Identifier: Apache-2.0
#include "BackendConnection.hpp"

#include <core/Log.hpp>
#include <mcp/Protocol.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <format>

namespace mcpbridge
{

namespace
{

    /// @brief Drains @p transport until it ends, completing requests in @p pending by id.
    void readResponses(std::string const& name,
                       std::shared_ptr<Transport> const& transport,
                       std::shared_ptr<PendingRequests> const& pending)
    {
        while (true)
        {
            auto message = transport->receive();
            if (!message)
            {
                if (message.error().code == ErrorCode::MalformedLine)
                {
                    log::warning("[{}] Ignoring malformed line: {}", name, message.error().message);
                    continue;
                }

                log::debug("[{}] Output stream ended: {}", name, message.error().message);
                pending->failAll(Error {
                    .code = ErrorCode::ConnectionClosed,
                    .message = std::format("Backend '{}' closed its output stream", name),
                });
                return;
            }

            auto response = jsonrpc::parseResponse(*message);
            if (!response)
            {
                if (message->is_object() && message->contains("method"))
                    log::debug("[{}] Ignoring backend-initiated message: {}", name, message->dump());
                else
                    log::warning("[{}] Ignoring malformed response: {}", name, response.error().message);
                continue;
            }

            log::trace("[{}] <- {}", name, message->dump());

            auto const id = response->numericId();
            if (!id)
            {
                log::debug("[{}] Dropping response without a numeric id", name);
                continue;
            }

            if (!pending->fulfill(*id, std::move(*response)))
                log::debug("[{}] Dropping response for unknown or expired request id {}", name, *id);
        }
    }

} // namespace

auto BackendConnection::spawn(const ServerDescriptor& descriptor, const ConnectionOptions& options)
    -> Result<std::unique_ptr<BackendConnection>>
{
    auto transport = std::make_shared<StdioTransport>();

    auto transportConfig = StdioTransportConfig {
        .command = descriptor.command,
        .args = descriptor.args,
        .env = descriptor.env,
        .terminateGrace = options.terminateGrace,
        .writeTimeout = options.requestTimeout,
    };

    auto startResult = transport->start(transportConfig);
    if (!startResult)
        return std::unexpected(startResult.error());

    return std::make_unique<BackendConnection>(descriptor.name, std::move(transport), options);
}

BackendConnection::BackendConnection(std::string name,
                                     std::shared_ptr<Transport> transport,
                                     ConnectionOptions options):
    _name(std::move(name)),
    _options(options),
    _transport(std::move(transport)),
    _pending(std::make_shared<PendingRequests>())
{
    _reader = std::jthread([name = _name, transport = _transport, pending = _pending] {
        readResponses(name, transport, pending);
    });
}

BackendConnection::~BackendConnection()
{
    shutdown();
}

auto BackendConnection::initialize() -> Result<InitializeResult>
{
    {
        auto lock = std::lock_guard(_stateMutex);
        if (_state != ConnectionState::Spawned)
            return makeError(ErrorCode::InvalidState,
                             std::format("Cannot initialize backend '{}' in state '{}'",
                                         _name,
                                         connectionStateName(_state)));
        _state = ConnectionState::Initializing;
    }

    auto response = request(protocol::Methods::Initialize, protocol::makeInitializeParams());
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::HandshakeFailure,
                         std::format("Initialize failed for '{}': {}", _name, response->error->message));

    auto initResult = protocol::parseInitializeResult(*response->result);
    if (!initResult)
        return makeError(ErrorCode::HandshakeFailure,
                         std::format("Invalid initialize result from '{}': {}", _name, initResult.error().message));

    {
        auto lock = std::lock_guard(_stateMutex);
        _serverInfo = *initResult;
    }

    auto notified = notify(protocol::Methods::Initialized);
    if (!notified)
        return std::unexpected(notified.error());

    log::info("[{}] Connected to {} v{} (protocol {})",
              _name,
              initResult->serverInfo.name,
              initResult->serverInfo.version,
              initResult->protocolVersion);

    return initResult;
}

auto BackendConnection::listTools() -> Result<std::vector<Tool>>
{
    if (auto allowed = requireState({ ConnectionState::Initializing, ConnectionState::Ready }, "list tools");
        !allowed)
        return std::unexpected(allowed.error());

    if (!serverInfo())
        return makeError(ErrorCode::InvalidState, std::format("Backend '{}' has not completed the handshake", _name));

    auto response = request(protocol::Methods::ToolsList);
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::HandshakeFailure,
                         std::format("tools/list failed for '{}': {}", _name, response->error->message));

    auto tools = protocol::parseToolsList(*response->result);
    if (!tools)
        return makeError(ErrorCode::HandshakeFailure,
                         std::format("Invalid tools/list result from '{}': {}", _name, tools.error().message));

    {
        auto lock = std::lock_guard(_stateMutex);
        _tools = *tools;
        if (_state == ConnectionState::Initializing)
            _state = ConnectionState::Ready;
    }

    for (const auto& tool: *tools)
        log::debug("[{}]   - {}: {}", _name, tool.name, tool.description.value_or(""));

    return tools;
}

auto BackendConnection::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolCallResult>
{
    if (auto allowed = requireState({ ConnectionState::Ready }, "call tools"); !allowed)
        return std::unexpected(allowed.error());

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = request(protocol::Methods::ToolsCall, std::move(params));
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::BackendCallFailure,
                         std::format("tools/call failed: {}", response->error->message));

    auto result = protocol::parseToolCallResult(*response->result);
    if (!result)
        return makeError(ErrorCode::BackendCallFailure,
                         std::format("Invalid tools/call result from '{}': {}", _name, result.error().message));

    log::debug("[{}] Tool '{}' returned {} content block(s) (isError: {})",
               _name,
               name,
               result->content.size(),
               result->isError);
    return result;
}

auto BackendConnection::request(std::string_view method, nlohmann::json params) -> Result<jsonrpc::Response>
{
    auto const id = _nextId.fetch_add(1);

    if (auto added = _pending->add(id); !added)
        return std::unexpected(added.error());

    auto sent = write(jsonrpc::makeRequest(id, method, std::move(params)));
    if (!sent)
    {
        _pending->discard(id);
        return std::unexpected(sent.error());
    }

    auto response = _pending->wait(id, std::chrono::steady_clock::now() + _options.requestTimeout);
    if (!response && response.error().code == ErrorCode::Timeout)
    {
        log::warning("[{}] {} request {} timed out after {}", _name, method, id, _options.requestTimeout);
        return makeError(ErrorCode::Timeout,
                         std::format("Request '{}' to backend '{}' timed out after {}",
                                     method,
                                     _name,
                                     _options.requestTimeout));
    }

    return response;
}

auto BackendConnection::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    return write(jsonrpc::makeNotification(method, std::move(params)));
}

auto BackendConnection::write(const nlohmann::json& message) -> VoidResult
{
    log::trace("[{}] -> {}", _name, message.dump());

    auto lock = std::lock_guard(_writeMutex);
    return _transport->send(message);
}

void BackendConnection::shutdown()
{
    {
        auto lock = std::lock_guard(_stateMutex);
        if (_state == ConnectionState::ShuttingDown || _state == ConnectionState::Terminated)
            return;
        _state = ConnectionState::ShuttingDown;
    }

    // The notice is advisory; a caller stuck writing to the backend must not delay termination.
    {
        auto lock = std::unique_lock(_writeMutex, std::try_to_lock);
        if (!lock.owns_lock())
            log::debug("[{}] Write in progress, skipping cancellation notice", _name);
        else if (auto cancelled = _transport->send(jsonrpc::makeNotification(protocol::Methods::Cancelled));
                 !cancelled)
            log::debug("[{}] Cancellation notice not delivered: {}", _name, cancelled.error().message);
    }

    _transport->close();
    _pending->failAll(Error {
        .code = ErrorCode::ConnectionClosed,
        .message = std::format("Backend '{}' has been shut down", _name),
    });

    if (_reader.joinable())
        _reader.join();

    {
        auto lock = std::lock_guard(_stateMutex);
        _state = ConnectionState::Terminated;
    }

    log::info("[{}] Backend shut down", _name);
}

auto BackendConnection::isRunning() const -> bool
{
    return _transport->isRunning();
}

auto BackendConnection::isConnected() const -> bool
{
    return state() == ConnectionState::Ready && !_pending->isClosed();
}

auto BackendConnection::state() const -> ConnectionState
{
    auto lock = std::lock_guard(_stateMutex);
    return _state;
}

auto BackendConnection::serverInfo() const -> std::optional<InitializeResult>
{
    auto lock = std::lock_guard(_stateMutex);
    return _serverInfo;
}

auto BackendConnection::tools() const -> std::vector<Tool>
{
    auto lock = std::lock_guard(_stateMutex);
    return _tools;
}

auto BackendConnection::pendingCount() const -> size_t
{
    return _pending->size();
}

auto BackendConnection::requireState(std::initializer_list<ConnectionState> allowed,
                                     std::string_view operation) const -> VoidResult
{
    auto lock = std::lock_guard(_stateMutex);

    if (_state == ConnectionState::ShuttingDown || _state == ConnectionState::Terminated)
        return makeError(ErrorCode::ConnectionClosed, std::format("Backend '{}' has been shut down", _name));

    if (std::ranges::find(allowed, _state) == allowed.end())
        return makeError(ErrorCode::InvalidState,
                         std::format("Cannot {} on backend '{}' in state '{}'",
                                     operation,
                                     _name,
                                     connectionStateName(_state)));
    return {};
}

} // namespace mcpbridge
