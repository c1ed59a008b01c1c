// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace mcphub::base64
{

/// @brief Decodes standard (RFC 4648) base64 text.
///
/// Padding is optional and ASCII whitespace is skipped.
/// @param input The encoded text.
/// @return The decoded bytes or an InvalidArgument error.
[[nodiscard]] auto decode(std::string_view input) -> Result<std::string>;

} // namespace mcphub::base64
