#pragma once
#include <string_view>

namespace wl {

enum class ErrorKind { None, InvalidDelimiterSyntax, DelimiterOutOfRange, IOError };

inline std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:                   return "none";
    case ErrorKind::InvalidDelimiterSyntax: return "invalid delimiter syntax";
    case ErrorKind::DelimiterOutOfRange:    return "delimiter out of range";
    case ErrorKind::IOError:                return "i/o error";
  }
  return "unknown";
}

}
