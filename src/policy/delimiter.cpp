#include "wrapline/delimiter.hpp"
#include "wrapline/text_utils.hpp"
#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

namespace wl {

static std::optional<std::string> fail(ErrorKind kind, std::string msg,
                                       ErrorKind* kind_out, std::string* err_out) {
  if (kind_out) *kind_out = kind;
  if (err_out)  *err_out = std::move(msg);
  return std::nullopt;
}

std::optional<std::string> resolve_delimiter(std::string_view token,
                                             ErrorKind* kind_out,
                                             std::string* err_out) {
  if (kind_out) *kind_out = ErrorKind::None;
  if (token.substr(0, 2) != "0x") return std::string(token);

  std::string_view digits = token.substr(2);
  bool negative = false;
  if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }

  std::uint64_t value = 0;
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, value, 16);
  if (ec == std::errc::invalid_argument || ptr != end) {
    return fail(ErrorKind::InvalidDelimiterSyntax,
                "invalid hex value '" + std::string(token) + "'", kind_out, err_out);
  }
  if (ec == std::errc::result_out_of_range || (negative && value != 0) || value > kMaxCodePoint) {
    return fail(ErrorKind::DelimiterOutOfRange,
                "hex value '" + std::string(token) + "' out of valid Unicode range",
                kind_out, err_out);
  }
  return encode_utf8(static_cast<std::uint32_t>(value));
}

}
