// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace speakstream
{

/// @brief Removes characters that speech engines read out or choke on.
///
/// ASCII control characters (other than whitespace) and DEL become spaces; the UTF-8
/// byte order mark, zero-width spaces/joiners and soft hyphens are dropped. The result
/// is safe to clean again, and cleaning two halves of a text separately gives the same
/// result as cleaning the whole as long as the split does not fall inside a UTF-8 sequence.
[[nodiscard]] auto cleanText(std::string_view text) -> std::string;

/// @brief Returns how many trailing bytes of text form an incomplete UTF-8 sequence.
[[nodiscard]] auto incompleteUtf8Tail(std::string_view text) noexcept -> std::size_t;

} // namespace speakstream
