#pragma once

#include <string>
#include <string_view>

namespace text {

// Removes every "<...>" token (language, region and event markers emitted by
// some models) and trims the result. An unterminated '<' is kept as text.
std::string strip_tags(std::string_view raw);

} // namespace text
