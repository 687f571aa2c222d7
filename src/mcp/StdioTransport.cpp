// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>
#include <utility>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolchat
{

namespace
{
    /// @brief Owns a file descriptor and closes it on destruction.
    class FileDescriptor
    {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd): _fd(fd) {}
        ~FileDescriptor() { reset(); }

        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        FileDescriptor(FileDescriptor&& other) noexcept: _fd(std::exchange(other._fd, -1)) {}
        FileDescriptor& operator=(FileDescriptor&& other) noexcept
        {
            if (this != &other)
            {
                reset();
                _fd = std::exchange(other._fd, -1);
            }
            return *this;
        }

        [[nodiscard]] auto get() const -> int { return _fd; }
        [[nodiscard]] auto valid() const -> bool { return _fd >= 0; }

        void reset()
        {
            if (_fd >= 0)
                ::close(_fd);
            _fd = -1;
        }

      private:
        int _fd = -1;
    };

    /// @brief Creates a close-on-exec pipe. Index 0 is the read end.
    auto makePipe() -> Result<std::array<FileDescriptor, 2>>
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return makeError(ErrorCode::TransportError, std::format("pipe2 failed: {}", std::strerror(errno)));
        return std::array<FileDescriptor, 2> { FileDescriptor { fds[0] }, FileDescriptor { fds[1] } };
    }

    /// @brief Builds the child environment: the parent's, with @p overrides replacing same-named entries.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto entries = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view { *e };
                auto const eq = entry.find('=');
                if (eq != std::string_view::npos && overrides.contains(std::string(entry.substr(0, eq))))
                    continue;
                entries.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            entries.push_back(std::format("{}={}", key, value));
        return entries;
    }

    auto waitForExit(pid_t pid, Timeout grace) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (true)
        {
            int status = 0;
            auto const rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid || (rc < 0 && errno == ECHILD))
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    std::once_flag ignoreSigpipeOnce;
} // namespace

struct StdioTransport::Impl
{
    std::atomic<pid_t> childPid = -1;
    FileDescriptor stdinWrite;
    FileDescriptor stdoutRead;
    bool connected = false;
    std::string readBuffer;
    std::string command;
    Timeout shutdownGrace = Timeout { 500 };
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    if (auto closed = close(); !closed)
        log::warning("{}", closed.error().message);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.command.empty())
        return makeError(ErrorCode::InvalidArgument, "No command configured");

    // A dead server must surface as EPIPE on write, not terminate the host process.
    std::call_once(ignoreSigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });

    auto stdinPipe = makePipe();
    if (!stdinPipe)
        return std::unexpected(stdinPipe.error());
    auto stdoutPipe = makePipe();
    if (!stdoutPipe)
        return std::unexpected(stdoutPipe.error());

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, (*stdinPipe)[0].get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, (*stdoutPipe)[1].get(), STDOUT_FILENO);

    auto argStrings = std::vector<std::string> { config.command };
    argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& entry: envStrings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = ::posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    if (status != 0)
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));

    // The child holds its own copies of these ends.
    (*stdinPipe)[0].reset();
    (*stdoutPipe)[1].reset();

    _impl->childPid = pid;
    _impl->stdinWrite = std::move((*stdinPipe)[1]);
    _impl->stdoutRead = std::move((*stdoutPipe)[0]);
    _impl->readBuffer.clear();
    _impl->command = config.command;
    _impl->shutdownGrace = config.shutdownGrace;
    _impl->connected = true;

    log::debug("Spawned tool server '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto remaining = std::string_view { data };

    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite.get(), remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<size_t>(written));
    }

    log::trace("-> {}", data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(Timeout timeout) -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            log::trace("<- {}", line);
            return json::parse(line);
        }

        auto waitMs = -1;
        if (timeout.count() >= 0)
        {
            auto const left = std::chrono::duration_cast<Timeout>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
                return makeError(ErrorCode::TimeoutError,
                                 std::format("Timed out waiting for '{}' after {} ms", _impl->command,
                                             timeout.count()));
            waitMs = static_cast<int>(left.count());
        }

        auto pfd = pollfd { .fd = _impl->stdoutRead.get(), .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue; // deadline is re-checked above

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead.get(), buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("Process '{}' closed its stdout", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

auto StdioTransport::close() -> VoidResult
{
    _impl->connected = false;
    _impl->stdinWrite.reset();
    _impl->stdoutRead.reset();

    if (_impl->childPid <= 0)
        return {};

    auto const pid = _impl->childPid.exchange(-1);

    // Closing stdin asks a well-behaved server to exit; escalate if it does not.
    if (waitForExit(pid, _impl->shutdownGrace))
    {
        log::debug("Tool server '{}' (pid {}) exited", _impl->command, pid);
        return {};
    }

    ::kill(pid, SIGTERM);
    if (waitForExit(pid, _impl->shutdownGrace))
    {
        log::debug("Tool server '{}' (pid {}) terminated", _impl->command, pid);
        return {};
    }

    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
    return makeError(ErrorCode::TransportError,
                     std::format("Tool server '{}' (pid {}) ignored SIGTERM and was killed", _impl->command, pid));
}

void StdioTransport::interrupt()
{
    // The blocked reader sees EOF once the child is gone; close() reaps it later.
    if (auto const pid = _impl->childPid.load(); pid > 0)
    {
        log::warning("Killing unresponsive tool server '{}' (pid {})", _impl->command, pid);
        ::kill(pid, SIGKILL);
    }
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> int
{
    return static_cast<int>(_impl->childPid);
}

} // namespace toolchat
