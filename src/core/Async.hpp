// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventLoop.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace mcphub
{

/// @brief Continuation receiving the outcome of an asynchronous operation.
template <typename T>
using Callback = std::function<void(Result<T>)>;

/// @brief Continuation receiving the outcome of an asynchronous operation without a value.
using VoidCallback = std::function<void(VoidResult)>;

/// @brief Fan-in counter: runs a continuation once every branch has settled.
///
/// Branches settle regardless of success, so one failing branch never keeps
/// the others from completing the join.
class Join
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    /// @brief Creates a join over @p branches branches.
    ///
    /// With zero branches the continuation runs immediately.
    [[nodiscard]] static auto create(std::size_t branches, std::function<void()> onSettled)
        -> std::shared_ptr<Join>
    {
        auto join = std::make_shared<Join>(PrivateTag {}, branches, std::move(onSettled));
        if (branches == 0)
            join->fire();
        return join;
    }

    Join(PrivateTag, std::size_t branches, std::function<void()> onSettled):
        _remaining(branches), _onSettled(std::move(onSettled))
    {
    }

    /// @brief Marks one branch as settled.
    void settle()
    {
        if (_remaining == 0)
            return;
        if (--_remaining == 0)
            fire();
    }

  private:
    void fire()
    {
        if (auto onSettled = std::exchange(_onSettled, nullptr))
            onSettled();
    }

    std::size_t _remaining;
    std::function<void()> _onSettled;
};

/// @brief Starts an asynchronous operation and drives the loop until it completes.
/// @param loop The loop the operation is scheduled on.
/// @param start Callable receiving the Callback<T> to complete.
/// @return The operation's result, or an error if the loop ran dry first.
template <typename T, typename Start>
[[nodiscard]] auto awaitResult(EventLoop& loop, Start&& start) -> Result<T>
{
    auto outcome = std::make_shared<std::optional<Result<T>>>();
    std::forward<Start>(start)(Callback<T>([outcome](Result<T> result) { *outcome = std::move(result); }));

    loop.runUntil([&outcome] { return outcome->has_value(); });

    if (!outcome->has_value())
        return makeError(ErrorCode::Unknown, "Event loop ran out of work before the operation completed");
    return std::move(**outcome);
}

} // namespace mcphub
