// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace mcphub::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @param name The level name.
/// @param fallback The level returned for unknown names.
[[nodiscard]] auto levelFromString(std::string_view name, Level fallback) -> Level;

[[nodiscard]] auto levelToString(Level level) -> std::string_view;

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param source The component or server the event belongs to (may be empty).
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view source, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty/nullptr callback to revert to stderr output.
/// @param callback The callback to install, or empty to revert to stderr.
void setCallback(LogCallback callback);

/// @brief Sets the global log verbosity level.
/// @param level The maximum level to output.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Writes a log message at the given level.
///
/// If a callback is installed via setCallback(), the message is routed there.
/// Otherwise, it is written to stderr with a level prefix.
/// @param level The log level.
/// @param source The event source, or empty.
/// @param message The message to output.
void write(Level level, std::string_view source, std::string_view message);

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, {}, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, {}, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Info, {}, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, {}, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a trace message.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, {}, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logger bound to a fixed source tag, e.g. "mcp:filesystem".
class Logger
{
  public:
    explicit Logger(std::string source): _source(std::move(source)) {}

    [[nodiscard]] auto source() const -> const std::string& { return _source; }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const
    {
        write(Level::Error, _source, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) const
    {
        write(Level::Warning, _source, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const
    {
        write(Level::Info, _source, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const
    {
        if (getLevel() >= Level::Debug)
            write(Level::Debug, _source, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) const
    {
        if (getLevel() >= Level::Trace)
            write(Level::Trace, _source, std::format(fmt, std::forward<Args>(args)...));
    }

  private:
    std::string _source;
};

} // namespace mcphub::log
