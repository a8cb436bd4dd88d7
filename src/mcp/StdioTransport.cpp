// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <mutex>

    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace toolrelay
{

namespace
{
    using Clock = std::chrono::steady_clock;

    constexpr auto ReadChunkSize = 4096;

    /// @brief Longest single wait for a full pipe to drain; cancellation is observed between slices.
    constexpr auto WriteSlice = std::chrono::milliseconds(50);

#ifndef _WIN32
    /// @brief Writes to a pipe whose reader died must not kill the host process.
    void ignoreSigpipeOnce()
    {
        static auto flag = std::once_flag {};
        std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
    }

    /// @brief Keeps pipe ends out of providers spawned later by other connections.
    void setCloseOnExec(int (&fds)[2])
    {
        for (auto const fd: fds)
            fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    /// @brief A provider that stops reading must not block the writer.
    void setNonBlocking(int fd)
    {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    /// @brief Polls waitpid until the child exits or the grace period elapses.
    auto waitForExit(pid_t pid, std::chrono::milliseconds grace) -> bool
    {
        auto const deadline = Clock::now() + grace;
        while (true)
        {
            int status = 0;
            auto const rc = waitpid(pid, &status, WNOHANG);
            if (rc == pid || rc < 0)
                return true;
            if (Clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
#endif
} // namespace

struct StdioTransport::Impl
{
#ifdef _WIN32
    HANDLE childProcess = INVALID_HANDLE_VALUE;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
#else
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
#endif
    bool connected = false;
    std::string command;
    std::chrono::milliseconds terminateGrace { 500 };
    std::string readBuffer;

    /// @brief Pops one complete non-empty line from the read buffer, if any.
    auto takeLine() -> std::optional<std::string>
    {
        while (true)
        {
            auto const newlinePos = readBuffer.find('\n');
            if (newlinePos == std::string::npos)
                return std::nullopt;

            auto line = readBuffer.substr(0, newlinePos);
            readBuffer.erase(0, newlinePos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!line.empty())
                return line;
        }
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
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.command.empty())
        return makeError(ErrorCode::LaunchFailure, "Empty launch command");

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead, stdinWrite, stdoutRead, stdoutWrite;
    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0))
        return makeError(ErrorCode::LaunchFailure, "Failed to create stdin pipe");
    if (!CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0))
    {
        CloseHandle(stdinRead);
        CloseHandle(stdinWrite);
        return makeError(ErrorCode::LaunchFailure, "Failed to create stdout pipe");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);

    auto cmdLine = config.command;
    for (const auto& arg: config.args)
        cmdLine += " " + arg;

    // Environment block: inherited variables followed by the overrides, double-NUL terminated.
    auto envBlock = std::string {};
    if (auto* inherited = GetEnvironmentStringsA())
    {
        for (auto* p = inherited; *p; p += std::strlen(p) + 1)
        {
            envBlock.append(p);
            envBlock.push_back('\0');
        }
        FreeEnvironmentStringsA(inherited);
    }
    for (const auto& [key, value]: config.env)
    {
        envBlock.append(std::format("{}={}", key, value));
        envBlock.push_back('\0');
    }
    envBlock.push_back('\0');

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(
            nullptr, cmdLine.data(), nullptr, nullptr, TRUE, 0, envBlock.data(), nullptr, &si, &pi))
    {
        CloseHandle(stdinRead);
        CloseHandle(stdinWrite);
        CloseHandle(stdoutRead);
        CloseHandle(stdoutWrite);
        return makeError(ErrorCode::LaunchFailure, std::format("Failed to start process: {}", config.command));
    }

    CloseHandle(stdinRead);
    CloseHandle(stdoutWrite);
    CloseHandle(pi.hThread);

    _impl->childProcess = pi.hProcess;
    _impl->stdinWrite = stdinWrite;
    _impl->stdoutRead = stdoutRead;
#else
    ignoreSigpipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe(stdinPipe) != 0)
        return makeError(ErrorCode::LaunchFailure, "Failed to create stdin pipe");
    if (pipe(stdoutPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::LaunchFailure, "Failed to create stdout pipe");
    }
    setCloseOnExec(stdinPipe);
    setCloseOnExec(stdoutPipe);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdinPipe[1]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment, minus variables the config overrides.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::LaunchFailure,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    setNonBlocking(stdinPipe[1]);
    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
#endif

    _impl->connected = true;
    _impl->command = config.command;
    _impl->terminateGrace = config.terminateGrace;
    log::info("Tool provider started: {}", config.command);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message,
                          [[maybe_unused]] std::chrono::milliseconds timeout,
                          [[maybe_unused]] std::stop_token stop) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";

#ifdef _WIN32
    // Anonymous pipes have no non-blocking mode here; the write completes or fails.
    DWORD written;
    if (!WriteFile(_impl->stdinWrite, data.c_str(), static_cast<DWORD>(data.size()), &written, nullptr))
        return makeError(ErrorCode::TransportError, "Failed to write to process stdin");
#else
    auto const deadline = Clock::now() + timeout;

    // Once part of a line went out, giving up leaves the provider with a torn message.
    auto const giveUp = [&](size_t offset, ErrorCode code, std::string_view reason) -> VoidResult {
        if (offset == 0)
            return makeError(code, std::format("Write to '{}' {}", _impl->command, reason));
        _impl->connected = false;
        return makeError(
            ErrorCode::TransportError,
            std::format("Write to '{}' {} after {} of {} bytes", _impl->command, reason, offset, data.size()));
    };

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const result = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (result >= 0)
        {
            offset += static_cast<size_t>(result);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }

        // The pipe is full: wait for the provider to drain it.
        if (stop.stop_requested())
            return giveUp(offset, ErrorCode::Cancelled, "abandoned");

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return giveUp(offset, ErrorCode::TimeoutError, std::format("timed out after {} ms", timeout.count()));

        auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        if (::poll(&pfd, 1, static_cast<int>(std::min(remaining, WriteSlice).count())) < 0 && errno != EINTR)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
    }
#endif

    log::trace("-> {}", data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = Clock::now() + timeout;

    while (true)
    {
        if (auto line = _impl->takeLine())
        {
            log::trace("<- {}", *line);
            return json::parse(*line);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError, "Timed out waiting for provider output");

        auto buf = std::array<char, ReadChunkSize> {};
#ifdef _WIN32
        DWORD available = 0;
        if (!PeekNamedPipe(_impl->stdoutRead, nullptr, 0, nullptr, &available, nullptr))
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        if (available == 0)
        {
            Sleep(static_cast<DWORD>(std::min<long long>(remaining.count(), 10)));
            continue;
        }
        DWORD bytesRead;
        if (!ReadFile(_impl->stdoutRead, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr)
            || bytesRead == 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), bytesRead);
#else
        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
#endif
    }
}

void StdioTransport::close()
{
#ifdef _WIN32
    if (_impl->stdinWrite != INVALID_HANDLE_VALUE)
    {
        CloseHandle(_impl->stdinWrite);
        _impl->stdinWrite = INVALID_HANDLE_VALUE;
    }
    if (_impl->stdoutRead != INVALID_HANDLE_VALUE)
    {
        CloseHandle(_impl->stdoutRead);
        _impl->stdoutRead = INVALID_HANDLE_VALUE;
    }
    if (_impl->childProcess != INVALID_HANDLE_VALUE)
    {
        if (WaitForSingleObject(_impl->childProcess, static_cast<DWORD>(_impl->terminateGrace.count()))
            != WAIT_OBJECT_0)
        {
            TerminateProcess(_impl->childProcess, 0);
            WaitForSingleObject(_impl->childProcess, 5000);
        }
        CloseHandle(_impl->childProcess);
        _impl->childProcess = INVALID_HANDLE_VALUE;
    }
#else
    // Closing stdin asks a well-behaved provider to exit on its own.
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }
    if (_impl->childPid > 0)
    {
        if (!waitForExit(_impl->childPid, _impl->terminateGrace))
        {
            kill(_impl->childPid, SIGTERM);
            if (!waitForExit(_impl->childPid, _impl->terminateGrace))
            {
                log::warning("Provider '{}' ignored SIGTERM, killing", _impl->command);
                kill(_impl->childPid, SIGKILL);
                int status;
                waitpid(_impl->childPid, &status, 0);
            }
        }
        _impl->childPid = -1;
    }
#endif

    if (_impl->connected)
        log::debug("Provider transport closed: {}", _impl->command);
    _impl->connected = false;
    _impl->readBuffer.clear();
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace toolrelay
