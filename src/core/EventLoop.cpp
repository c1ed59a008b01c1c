// SPDX-License-Identifier: Apache-2.0
#include "EventLoop.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include <poll.h>

namespace mcphub
{

namespace
{
    using Clock = std::chrono::steady_clock;

    struct Watch
    {
        short events = 0;
        std::uint64_t generation = 0;
        std::shared_ptr<EventLoop::IoHandler> handler;
    };

    struct ReadyFd
    {
        int fd;
        std::uint64_t generation;
        short revents;
    };
} // namespace

struct EventLoop::Impl
{
    std::unordered_map<int, Watch> watches;
    std::uint64_t nextGeneration = 1;

    // Ordered by deadline, ties broken by creation order.
    std::map<std::pair<Clock::time_point, TimerId>, Task> timers;
    std::unordered_map<TimerId, Clock::time_point> timerDeadlines;
    TimerId nextTimerId = 1;

    std::deque<Task> posted;

    void runPosted()
    {
        auto batch = std::exchange(posted, {});
        for (auto& task: batch)
            task();
    }

    void fireExpiredTimers()
    {
        auto const now = Clock::now();
        while (!timers.empty() && timers.begin()->first.first <= now)
        {
            auto node = timers.extract(timers.begin());
            timerDeadlines.erase(node.key().second);
            node.mapped()();
        }
    }

    [[nodiscard]] auto pollTimeout(std::chrono::milliseconds maxWait) const -> int
    {
        if (!posted.empty())
            return 0;

        auto wait = maxWait;
        if (!timers.empty())
        {
            auto const untilDeadline = std::chrono::ceil<std::chrono::milliseconds>(
                timers.begin()->first.first - Clock::now());
            wait = std::clamp(untilDeadline, std::chrono::milliseconds(0), maxWait);
        }
        return static_cast<int>(wait.count());
    }
};

EventLoop::EventLoop(): _impl(std::make_unique<Impl>())
{
}

EventLoop::~EventLoop() = default;

void EventLoop::watch(int fd, short events, IoHandler handler)
{
    _impl->watches[fd] = Watch {
        .events = events,
        .generation = _impl->nextGeneration++,
        .handler = std::make_shared<IoHandler>(std::move(handler)),
    };
}

void EventLoop::unwatch(int fd)
{
    _impl->watches.erase(fd);
}

auto EventLoop::isWatched(int fd) const -> bool
{
    return _impl->watches.contains(fd);
}

auto EventLoop::startTimer(std::chrono::milliseconds delay, Task task) -> TimerId
{
    auto const id = _impl->nextTimerId++;
    auto const deadline = Clock::now() + delay;
    _impl->timers.emplace(std::pair { deadline, id }, std::move(task));
    _impl->timerDeadlines.emplace(id, deadline);
    return id;
}

auto EventLoop::cancelTimer(TimerId id) -> bool
{
    auto const it = _impl->timerDeadlines.find(id);
    if (it == _impl->timerDeadlines.end())
        return false;

    _impl->timers.erase(std::pair { it->second, id });
    _impl->timerDeadlines.erase(it);
    return true;
}

void EventLoop::post(Task task)
{
    _impl->posted.push_back(std::move(task));
}

auto EventLoop::runOnce(std::chrono::milliseconds maxWait) -> bool
{
    _impl->runPosted();

    if (!hasWork())
        return false;

    auto fds = std::vector<struct pollfd> {};
    auto generations = std::vector<std::uint64_t> {};
    fds.reserve(_impl->watches.size());
    generations.reserve(_impl->watches.size());
    for (const auto& [fd, watch]: _impl->watches)
    {
        fds.push_back({ .fd = fd, .events = watch.events, .revents = 0 });
        generations.push_back(watch.generation);
    }

    auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), _impl->pollTimeout(maxWait));
    if (pollResult < 0 && errno != EINTR)
        log::error("poll() failed: {}", strerror(errno));

    if (pollResult > 0)
    {
        auto ready = std::vector<ReadyFd> {};
        for (auto i = std::size_t { 0 }; i < fds.size(); ++i)
        {
            if (fds[i].revents != 0)
                ready.push_back({ .fd = fds[i].fd, .generation = generations[i], .revents = fds[i].revents });
        }

        for (const auto& entry: ready)
        {
            // An earlier handler in this round may have replaced or dropped the watch.
            auto const it = _impl->watches.find(entry.fd);
            if (it == _impl->watches.end() || it->second.generation != entry.generation)
                continue;
            auto const handler = it->second.handler;
            (*handler)(entry.revents);
        }
    }

    _impl->fireExpiredTimers();
    _impl->runPosted();
    return true;
}

auto EventLoop::runUntil(const std::function<bool()>& done) -> bool
{
    while (!done())
    {
        if (!runOnce(std::chrono::milliseconds(1000)))
            return done();
    }
    return true;
}

auto EventLoop::hasWork() const -> bool
{
    return !_impl->watches.empty() || !_impl->timers.empty() || !_impl->posted.empty();
}

} // namespace mcphub
