#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace wl {

// UTF-8 encoding of a code point. Surrogates and values past U+10FFFF
// encode as U+FFFD.
std::string encode_utf8(std::uint32_t cp);

// Trim leading/trailing whitespace: ASCII space, \t \n \v \f \r, plus the
// UTF-8 encoded Unicode White_Space code points. Returns a view into `s`.
std::string_view trim_space(std::string_view s) noexcept;

// Append `s` to `out`, putting a backslash before every non-overlapping
// occurrence of `delim` (scanned left to right). Empty `delim` appends as-is.
void append_escaped(std::string& out, std::string_view s, std::string_view delim);

}
