// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace mcphub
{

/// @brief Single-threaded reactor multiplexing file descriptors, timers and posted tasks.
///
/// All callbacks run on the thread that drives the loop via runOnce() or runUntil().
/// Handlers may freely watch/unwatch descriptors, start/cancel timers and post tasks,
/// including for themselves.
class EventLoop
{
  public:
    using TimerId = std::uint64_t;
    using Task = std::move_only_function<void()>;

    /// @brief Handler invoked with the poll(2) revents of a watched descriptor.
    using IoHandler = std::function<void(short revents)>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Watches a descriptor for the given poll(2) events, replacing any earlier watch.
    void watch(int fd, short events, IoHandler handler);

    /// @brief Stops watching a descriptor. Must be called before the descriptor is closed.
    void unwatch(int fd);

    [[nodiscard]] auto isWatched(int fd) const -> bool;

    /// @brief Schedules a one-shot task to run after the given delay.
    /// @return An id usable with cancelTimer().
    auto startTimer(std::chrono::milliseconds delay, Task task) -> TimerId;

    /// @brief Cancels a pending timer.
    /// @return True if the timer was still pending.
    auto cancelTimer(TimerId id) -> bool;

    /// @brief Queues a task to run on the next loop iteration.
    void post(Task task);

    /// @brief Runs one iteration: posted tasks, one poll(2) round, expired timers.
    /// @param maxWait Upper bound for blocking in poll(2).
    /// @return False if the loop had nothing to wait for (no descriptors, timers or tasks).
    auto runOnce(std::chrono::milliseconds maxWait) -> bool;

    /// @brief Runs iterations until the predicate holds or the loop runs out of work.
    /// @return The final value of the predicate.
    auto runUntil(const std::function<bool()>& done) -> bool;

    /// @brief Returns true if any descriptor, timer or posted task is pending.
    [[nodiscard]] auto hasWork() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
