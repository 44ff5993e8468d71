#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace utf8 {

// Strict decode: rejects overlong forms, surrogates and truncated sequences.
std::optional<std::u32string> decode(std::string_view text);

std::string encode(std::u32string_view code_points);

// Number of code points, or nullopt for malformed input.
std::optional<size_t> length(std::string_view text);

// Trims ASCII whitespace at both ends.
std::string_view trim(std::string_view text);

} // namespace utf8
