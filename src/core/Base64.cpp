// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>
#include <cstdint>
#include <format>

namespace mcphub::base64
{

namespace
{
    constexpr auto Invalid = std::uint8_t { 0xFF };

    constexpr auto DecodeTable = [] {
        auto table = std::array<std::uint8_t, 256> {};
        table.fill(Invalid);
        constexpr auto alphabet =
            std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
        for (auto i = std::size_t { 0 }; i < alphabet.size(); ++i)
            table[static_cast<unsigned char>(alphabet[i])] = static_cast<std::uint8_t>(i);
        return table;
    }();

    constexpr auto isSpace(char c) -> bool
    {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }
} // namespace

auto decode(std::string_view input) -> Result<std::string>
{
    auto output = std::string {};
    output.reserve(input.size() / 4 * 3);

    auto accumulator = std::uint32_t { 0 };
    auto bits = 0;
    auto padding = 0;

    for (auto const c: input)
    {
        if (isSpace(c))
            continue;

        if (c == '=')
        {
            ++padding;
            continue;
        }

        if (padding > 0)
            return makeError(ErrorCode::InvalidArgument, "base64: data after padding");

        auto const value = DecodeTable[static_cast<unsigned char>(c)];
        if (value == Invalid)
            return makeError(ErrorCode::InvalidArgument, std::format("base64: invalid character '{}'", c));

        accumulator = (accumulator << 6) | value;
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            output.push_back(static_cast<char>((accumulator >> bits) & 0xFF));
        }
    }

    if (padding > 2 || bits >= 6)
        return makeError(ErrorCode::InvalidArgument, "base64: truncated input");

    return output;
}

} // namespace mcphub::base64
