#pragma once
#include "wrapline/error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wl {

// Largest Unicode code point a hex token may name.
constexpr std::uint32_t kMaxCodePoint = 0x10FFFF;

// Turn a user-supplied delimiter token into the literal wrap text.
// "0x<hex>" names a single code point (UTF-8 encoded); anything else,
// including the empty string, is used verbatim.
// On failure returns nullopt and fills `kind_out` / `err_out` when given.
std::optional<std::string> resolve_delimiter(std::string_view token,
                                             ErrorKind* kind_out = nullptr,
                                             std::string* err_out = nullptr);

}
