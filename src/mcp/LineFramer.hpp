// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Splits a byte stream into newline-delimited JSON values.
///
/// Incomplete trailing data is kept until the next chunk completes the line.
/// Lines that are not valid JSON are logged and skipped without affecting
/// the lines around them.
class LineFramer
{
  public:
    explicit LineFramer(std::string source = {});

    /// @brief Appends a chunk and returns every JSON value completed by it, in order.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<nlohmann::json>;

    /// @brief Returns the buffered bytes of the incomplete last line.
    [[nodiscard]] auto pending() const -> std::string_view { return _buffer; }

    /// @brief Discards any buffered partial line.
    void reset() { _buffer.clear(); }

  private:
    std::string _source;
    std::string _buffer;
};

/// @brief Splits a byte stream into text lines (used for stderr).
class LineSplitter
{
  public:
    /// @brief Appends a chunk and returns every line completed by it, without terminators.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<std::string>;

    /// @brief Returns and clears the incomplete trailing line.
    [[nodiscard]] auto flush() -> std::string;

  private:
    std::string _buffer;
};

} // namespace mcphub
