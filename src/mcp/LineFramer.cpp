// SPDX-License-Identifier: Apache-2.0
#include "LineFramer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <utility>

namespace mcphub
{

namespace
{
    auto stripCarriageReturn(std::string_view line) -> std::string_view
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        return line;
    }
} // namespace

LineFramer::LineFramer(std::string source): _source(std::move(source))
{
}

auto LineFramer::feed(std::string_view chunk) -> std::vector<nlohmann::json>
{
    _buffer.append(chunk);

    auto messages = std::vector<nlohmann::json> {};
    auto start = std::size_t { 0 };

    while (true)
    {
        auto const newlinePos = _buffer.find('\n', start);
        if (newlinePos == std::string::npos)
            break;

        auto const line = stripCarriageReturn(std::string_view(_buffer).substr(start, newlinePos - start));
        start = newlinePos + 1;

        if (line.empty())
            continue;

        auto parsed = json::parse(line);
        if (!parsed)
        {
            log::Logger(_source).warning("Dropping malformed line ({}): {}", parsed.error().message, line);
            continue;
        }

        messages.push_back(std::move(*parsed));
    }

    _buffer.erase(0, start);
    return messages;
}

auto LineSplitter::feed(std::string_view chunk) -> std::vector<std::string>
{
    _buffer.append(chunk);

    auto lines = std::vector<std::string> {};
    auto start = std::size_t { 0 };
    for (auto pos = _buffer.find('\n'); pos != std::string::npos; pos = _buffer.find('\n', start))
    {
        lines.emplace_back(stripCarriageReturn(std::string_view(_buffer).substr(start, pos - start)));
        start = pos + 1;
    }

    _buffer.erase(0, start);
    return lines;
}

auto LineSplitter::flush() -> std::string
{
    return std::exchange(_buffer, {});
}

} // namespace mcphub
