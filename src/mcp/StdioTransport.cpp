// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpbridge
{

namespace
{

    constexpr auto MaxLoggedLineLength = size_t { 200 };

    /// @brief A write to a backend that has exited must fail with EPIPE instead of killing the bridge.
    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Creates a pipe whose ends are not inherited by spawned children.
    auto createPipe(int (&fds)[2]) -> bool
    {
        if (::pipe(fds) != 0)
            return false;
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    void setNonBlocking(int fd)
    {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    auto truncateForLog(std::string_view line) -> std::string
    {
        if (line.size() <= MaxLoggedLineLength)
            return std::string(line);
        return std::format("{}...", line.substr(0, MaxLoggedLineLength));
    }

} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int wakeRead = -1;
    int wakeWrite = -1;
    std::chrono::milliseconds terminateGrace { 2000 };
    std::chrono::milliseconds writeTimeout { 30000 };

    std::string readBuffer; // Owned by the receiving thread.
    bool endOfStream = false;

    std::mutex writeMutex; // Guards stdinWrite.
    mutable std::mutex processMutex;
    bool exited = false;
    std::atomic<bool> closed { false };

    ~Impl()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(wakeRead);
        closeFd(wakeWrite);
    }

    /// @brief Returns true if the child was reaped. Requires processMutex.
    auto reapIfExited() -> bool
    {
        if (childPid <= 0 || exited)
            return true;

        int status = 0;
        auto const rc = waitpid(childPid, &status, WNOHANG);
        if (rc == childPid || (rc < 0 && errno == ECHILD))
            exited = true;
        return exited;
    }

    void terminateChild()
    {
        auto lock = std::lock_guard(processMutex);
        if (reapIfExited())
            return;

        kill(childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + terminateGrace;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (reapIfExited())
            {
                log::debug("Backend process {} exited after SIGTERM", childPid);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        log::warning("Backend process {} ignored SIGTERM, sending SIGKILL", childPid);
        kill(childPid, SIGKILL);
        int status = 0;
        waitpid(childPid, &status, 0);
        exited = true;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::InvalidState, "Transport already started");

    ignoreSigpipeOnce();
    _impl->terminateGrace = config.terminateGrace;
    _impl->writeTimeout = config.writeTimeout;

    int stdinPipe[2];
    int stdoutPipe[2];
    int wakePipe[2];

    if (!createPipe(stdinPipe))
        return makeError(ErrorCode::SpawnFailure, std::format("Failed to create stdin pipe: {}", strerror(errno)));
    if (!createPipe(stdoutPipe))
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnFailure, std::format("Failed to create stdout pipe: {}", strerror(errno)));
    }
    if (!createPipe(wakePipe))
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::SpawnFailure, std::format("Failed to create wake pipe: {}", strerror(errno)));
    }
    setNonBlocking(wakePipe[0]);
    setNonBlocking(wakePipe[1]);

    // A backend that stops reading must not block a writer beyond its deadline or past close().
    setNonBlocking(stdinPipe[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + descriptor overrides, overrides win)
    auto envMap = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq != std::string_view::npos)
                envMap.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
        }
    }
    for (const auto& [key, value]: config.env)
        envMap[key] = value;

    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(envMap.size());
    for (const auto& [key, value]: envMap)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    // The child starts with an empty signal mask and default SIGPIPE handling,
    // whatever the bridge itself blocks or ignores.
    posix_spawnattr_t attrs;
    posix_spawnattr_init(&attrs);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigmask(&attrs, &emptyMask);
    posix_spawnattr_setsigdefault(&attrs, &defaultSignals);
    posix_spawnattr_setflags(&attrs, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attrs, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attrs);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(wakePipe[0]);
        ::close(wakePipe[1]);
        return makeError(ErrorCode::SpawnFailure,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->wakeRead = wakePipe[0];
    _impl->wakeWrite = wakePipe[1];

    log::debug("Backend process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto lock = std::lock_guard(_impl->writeMutex);

    if (_impl->closed || _impl->stdinWrite < 0)
        return makeError(ErrorCode::ConnectionClosed, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto remaining = std::string_view(data);
    auto const deadline = std::chrono::steady_clock::now() + _impl->writeTimeout;

    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written >= 0)
        {
            remaining.remove_prefix(static_cast<size_t>(written));
            continue;
        }

        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            return makeError(ErrorCode::ConnectionClosed, "Backend closed its stdin");
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            return makeError(ErrorCode::IoError, std::format("Failed to write to process stdin: {}", strerror(errno)));

        // The pipe is full: wait for the child to drain it, for close(), or for the deadline.
        auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left <= std::chrono::milliseconds::zero())
            return makeError(ErrorCode::Timeout,
                             std::format("Backend did not read its stdin within {}", _impl->writeTimeout));

        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 },
            { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        } };

        if (poll(fds.data(), fds.size(), static_cast<int>(left.count())) < 0 && errno != EINTR)
            return makeError(ErrorCode::IoError, std::format("poll failed: {}", strerror(errno)));

        if (fds[1].revents != 0)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed while writing");
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::ConnectionClosed, "Transport not connected");

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            auto parsed = json::parse(line);
            if (!parsed)
                return makeError(ErrorCode::MalformedLine,
                                 std::format("{} (line: {})", parsed.error().message, truncateForLog(line)));
            return parsed;
        }

        if (_impl->endOfStream || _impl->closed)
            return makeError(ErrorCode::ConnectionClosed, "Process stdout closed");

        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        } };

        if (poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::ConnectionClosed, std::format("poll failed: {}", strerror(errno)));
        }

        if (fds[1].revents != 0)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed");

        if (fds[0].revents == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;

        if (bytesRead <= 0)
        {
            _impl->endOfStream = true;
            // A final line without terminator still counts.
            if (!_impl->readBuffer.empty())
                _impl->readBuffer.push_back('\n');
            continue;
        }

        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    if (_impl->closed.exchange(true))
        return;

    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        while (::write(_impl->wakeWrite, &byte, 1) < 0 && errno == EINTR)
        {
        }
    }

    {
        auto lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    _impl->terminateChild();
    log::debug("Backend transport closed");
}

auto StdioTransport::isRunning() const -> bool
{
    auto lock = std::lock_guard(_impl->processMutex);
    return !_impl->reapIfExited();
}

auto StdioTransport::pid() const -> int
{
    return _impl->childPid;
}

} // namespace mcpbridge
