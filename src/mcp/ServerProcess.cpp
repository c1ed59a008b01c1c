// SPDX-License-Identifier: Apache-2.0
#include "ServerProcess.hpp"

#include <core/Log.hpp>
#include <mcp/LineFramer.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <deque>
#include <map>
#include <format>
#include <optional>
#include <string_view>
#include <vector>

#include <sys/syscall.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

namespace
{
    constexpr auto ReapInterval = std::chrono::milliseconds(50);

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    void setNonBlocking(int fd)
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    auto openPidFd(pid_t pid) -> int
    {
#ifdef SYS_pidfd_open
        return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
        static_cast<void>(pid);
        return -1;
#endif
    }

    /// Parent environment with the descriptor's variables replacing same-named entries.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const key = entry.substr(0, entry.find('='));
                if (!overrides.contains(std::string(key)))
                    envStrings.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    /// Blocks SIGPIPE for the calling thread while writing to a server's stdin, so a
    /// write to a server that already exited fails with EPIPE. The host's signal
    /// disposition is left alone; a SIGPIPE raised by our own write is consumed.
    class SigpipeBlocker
    {
      public:
        SigpipeBlocker()
        {
            sigemptyset(&_pipeSet);
            sigaddset(&_pipeSet, SIGPIPE);
            _wasPending = isPending();
            pthread_sigmask(SIG_BLOCK, &_pipeSet, &_savedMask);
        }

        ~SigpipeBlocker()
        {
            if (!_wasPending && isPending())
            {
                auto const noWait = timespec {};
                while (sigtimedwait(&_pipeSet, nullptr, &noWait) < 0 && errno == EINTR)
                    ;
            }
            pthread_sigmask(SIG_SETMASK, &_savedMask, nullptr);
        }

        SigpipeBlocker(const SigpipeBlocker&) = delete;
        SigpipeBlocker& operator=(const SigpipeBlocker&) = delete;

      private:
        [[nodiscard]] static auto isPending() -> bool
        {
            auto pending = sigset_t {};
            sigemptyset(&pending);
            sigpending(&pending);
            return sigismember(&pending, SIGPIPE) == 1;
        }

        sigset_t _pipeSet {};
        sigset_t _savedMask {};
        bool _wasPending = false;
    };

    struct PendingWrite
    {
        std::string data;
        std::size_t offset = 0;
        VoidCallback onWritten;
    };
} // namespace

auto describeExitStatus(int status) -> std::string
{
    if (WIFEXITED(status))
        return std::format("exit code {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return std::format("signal {}", WTERMSIG(status));
    return std::format("status {}", status);
}

struct ServerProcess::Impl
{
    EventLoop& loop;
    log::Logger logger;
    ServerProcessHandlers handlers;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    int pidFd = -1;
    bool running = false;

    std::optional<EventLoop::TimerId> reapTimer;
    std::optional<EventLoop::TimerId> killTimer;

    LineFramer framer;
    LineSplitter stderrLines;
    std::deque<PendingWrite> writeQueue;

    Impl(EventLoop& loop, std::string serverName, ServerProcessHandlers handlers):
        loop(loop),
        logger("mcp:" + serverName),
        handlers(std::move(handlers)),
        framer("mcp:" + serverName)
    {
    }

    void complete(VoidCallback& callback, VoidResult result)
    {
        if (!callback)
            return;
        loop.post([callback = std::move(callback), result = std::move(result)]() mutable {
            callback(std::move(result));
        });
    }

    void failWrites(const Error& error)
    {
        auto queue = std::exchange(writeQueue, {});
        for (auto& write: queue)
            complete(write.onWritten, std::unexpected(error));
    }

    void closeStdin()
    {
        if (stdinWrite < 0)
            return;
        loop.unwatch(stdinWrite);
        closeFd(stdinWrite);
        failWrites(Error { ErrorCode::TransportError, "Server stdin closed" });
    }

    void flushWrites()
    {
        while (!writeQueue.empty())
        {
            auto& front = writeQueue.front();
            auto const remaining = front.data.size() - front.offset;
            auto written = ssize_t { 0 };
            auto writeError = 0;
            {
                auto const blocker = SigpipeBlocker {};
                written = ::write(stdinWrite, front.data.data() + front.offset, remaining);
                writeError = errno;
            }

            if (written < 0)
            {
                if (writeError == EINTR)
                    continue;
                if (writeError == EAGAIN || writeError == EWOULDBLOCK)
                {
                    if (!loop.isWatched(stdinWrite))
                        loop.watch(stdinWrite, POLLOUT, [this](short) { flushWrites(); });
                    return;
                }

                auto const error = Error {
                    ErrorCode::TransportError,
                    std::format("Failed to write to server stdin: {}", strerror(writeError)),
                };
                logger.warning("{}", error.message);
                failWrites(error);
                loop.unwatch(stdinWrite);
                closeFd(stdinWrite);
                return;
            }

            front.offset += static_cast<std::size_t>(written);
            if (front.offset == front.data.size())
            {
                complete(front.onWritten, {});
                writeQueue.pop_front();
            }
        }

        loop.unwatch(stdinWrite);
    }

    /// Reads everything currently available on stdout; returns false once EOF was seen.
    auto readStdout() -> bool
    {
        auto buf = std::array<char, 4096> {};
        while (stdoutRead >= 0)
        {
            auto const bytesRead = ::read(stdoutRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return true;
            if (bytesRead <= 0)
            {
                loop.unwatch(stdoutRead);
                closeFd(stdoutRead);
                if (!framer.pending().empty())
                    logger.warning("Discarding {} bytes of unterminated output", framer.pending().size());
                framer.reset();
                return false;
            }

            for (auto& json: framer.feed(std::string_view(buf.data(), static_cast<size_t>(bytesRead))))
            {
                auto message = jsonrpc::parseMessage(json);
                if (!message)
                {
                    logger.warning("Ignoring message: {}", message.error().message);
                    continue;
                }
                if (handlers.onMessage)
                    handlers.onMessage(std::move(*message));
            }
        }
        return false;
    }

    void readStderr()
    {
        auto buf = std::array<char, 4096> {};
        while (stderrRead >= 0)
        {
            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return;
            if (bytesRead <= 0)
            {
                loop.unwatch(stderrRead);
                closeFd(stderrRead);
                if (auto rest = stderrLines.flush(); !rest.empty())
                    logger.debug("stderr: {}", rest);
                return;
            }

            for (const auto& line: stderrLines.feed(std::string_view(buf.data(), static_cast<size_t>(bytesRead))))
                logger.debug("stderr: {}", line);
        }
    }

    void tryReap()
    {
        if (!running)
            return;

        auto status = 0;
        auto const result = ::waitpid(childPid, &status, WNOHANG);
        if (result == 0)
            return;
        if (result < 0 && errno == EINTR)
            return;

        // Deliver whatever the server wrote before exiting.
        readStdout();
        readStderr();

        releaseResources();
        logger.debug("Process {} exited ({})", childPid, describeExitStatus(status));

        if (handlers.onExit)
            handlers.onExit(status);
    }

    void scheduleReap()
    {
        reapTimer = loop.startTimer(ReapInterval, [this] {
            reapTimer.reset();
            tryReap();
            if (running)
                scheduleReap();
        });
    }

    void releaseResources()
    {
        running = false;

        if (reapTimer)
            loop.cancelTimer(*std::exchange(reapTimer, std::nullopt));
        if (killTimer)
            loop.cancelTimer(*std::exchange(killTimer, std::nullopt));

        closeStdin();
        for (auto* fd: { &stdoutRead, &stderrRead, &pidFd })
        {
            if (*fd >= 0)
                loop.unwatch(*fd);
            closeFd(*fd);
        }
    }
};

ServerProcess::ServerProcess(EventLoop& loop, std::string serverName, ServerProcessHandlers handlers):
    _impl(std::make_unique<Impl>(loop, std::move(serverName), std::move(handlers)))
{
}

ServerProcess::~ServerProcess()
{
    if (_impl->running)
    {
        _impl->logger.debug("Killing process {} on teardown", _impl->childPid);
        kill(_impl->childPid, SIGKILL);
        auto status = 0;
        waitpid(_impl->childPid, &status, 0);
    }
    _impl->releaseResources();
}

auto ServerProcess::start(const ServerDescriptor& descriptor) -> VoidResult
{
    if (_impl->running)
        return makeError(ErrorCode::ProcessError, "Server process already running");
    if (descriptor.command.empty())
        return makeError(ErrorCode::ConfigError, "Server command is empty");

    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };
    int stderrPipe[2] = { -1, -1 };

    auto closePipes = [&] {
        for (auto* pipeFds: { stdinPipe, stdoutPipe, stderrPipe })
        {
            closeFd(pipeFds[0]);
            closeFd(pipeFds[1]);
        }
    };

    if (pipe2(stdinPipe, O_CLOEXEC) != 0 || pipe2(stdoutPipe, O_CLOEXEC) != 0
        || pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        auto const reason = std::string(strerror(errno));
        closePipes();
        return makeError(ErrorCode::ProcessError, std::format("Failed to create pipes: {}", reason));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // The server starts with default SIGPIPE handling, whatever the host process does with it.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    auto defaultSignals = sigset_t {};
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF);

    // Build argv
    auto argStrings = std::vector<std::string> { descriptor.command };
    argStrings.insert(argStrings.end(), descriptor.args.begin(), descriptor.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(descriptor.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status =
        posix_spawnp(&pid, descriptor.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    if (status != 0)
    {
        closePipes();
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", descriptor.command, strerror(status)));
    }

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->running = true;

    for (auto const fd: { _impl->stdinWrite, _impl->stdoutRead, _impl->stderrRead })
        setNonBlocking(fd);

    _impl->loop.watch(_impl->stdoutRead, POLLIN, [this](short) { _impl->readStdout(); });
    _impl->loop.watch(_impl->stderrRead, POLLIN, [this](short) { _impl->readStderr(); });

    _impl->pidFd = openPidFd(pid);
    if (_impl->pidFd >= 0)
        _impl->loop.watch(_impl->pidFd, POLLIN, [this](short) { _impl->tryReap(); });
    else
        _impl->scheduleReap();

    _impl->logger.info("Started '{}' (pid {})", descriptor.command, pid);
    return {};
}

void ServerProcess::send(const nlohmann::json& message, VoidCallback onWritten)
{
    if (!isConnected())
    {
        _impl->complete(onWritten, makeError(ErrorCode::TransportError, "Server process not connected"));
        return;
    }

    auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';
    _impl->logger.trace("-> {}", std::string_view(line).substr(0, line.size() - 1));

    _impl->writeQueue.push_back(PendingWrite { .data = std::move(line), .offset = 0, .onWritten = std::move(onWritten) });
    if (_impl->writeQueue.size() == 1)
        _impl->flushWrites();
}

auto ServerProcess::isConnected() const -> bool
{
    return _impl->running && _impl->stdinWrite >= 0;
}

auto ServerProcess::isRunning() const -> bool
{
    return _impl->running;
}

auto ServerProcess::pid() const -> pid_t
{
    return _impl->childPid;
}

void ServerProcess::closeStdin()
{
    _impl->closeStdin();
}

void ServerProcess::terminate(std::chrono::milliseconds killTimeout)
{
    if (!_impl->running)
        return;

    _impl->closeStdin();
    kill(_impl->childPid, SIGTERM);

    if (_impl->killTimer)
        return;

    _impl->killTimer = _impl->loop.startTimer(killTimeout, [this, killTimeout] {
        _impl->killTimer.reset();
        if (!_impl->running)
            return;
        _impl->logger.warning("Process {} still running {} ms after SIGTERM, sending SIGKILL",
                              _impl->childPid,
                              killTimeout.count());
        kill(_impl->childPid, SIGKILL);
    });
}

} // namespace mcphub
