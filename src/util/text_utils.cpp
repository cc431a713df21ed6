#include "wrapline/text_utils.hpp"

namespace wl {

std::string encode_utf8(std::uint32_t cp) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  return out;
}

static inline bool is_ascii_space(unsigned char c) noexcept {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

static bool is_unicode_space(std::uint32_t cp) noexcept {
  switch (cp) {
    case 0x0085: case 0x00A0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

// Decode the multi-byte sequence starting at s[i]; length, or 0 if malformed.
static std::size_t decode_at(std::string_view s, std::size_t i, std::uint32_t& cp) noexcept {
  const unsigned char c = static_cast<unsigned char>(s[i]);
  std::size_t len;
  std::uint32_t min;
  if      ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
  else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
  else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
  else return 0;
  if (i + len > s.size()) return 0;
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) return 0;
    cp = (cp << 6) | (cc & 0x3F);
  }
  return cp < min ? 0 : len; // overlong forms are not whitespace
}

std::string_view trim_space(std::string_view s) noexcept {
  std::size_t b = 0, e = s.size();
  std::uint32_t cp = 0;

  while (b < e) {
    const unsigned char c = static_cast<unsigned char>(s[b]);
    if (c < 0x80) {
      if (!is_ascii_space(c)) break;
      ++b;
      continue;
    }
    std::size_t n = decode_at(s.substr(0, e), b, cp);
    if (n == 0 || !is_unicode_space(cp)) break;
    b += n;
  }

  while (e > b) {
    const unsigned char c = static_cast<unsigned char>(s[e - 1]);
    if (c < 0x80) {
      if (!is_ascii_space(c)) break;
      --e;
      continue;
    }
    // back up over continuation bytes to the lead byte
    std::size_t j = e - 1;
    while (j > b && e - j < 4 && (static_cast<unsigned char>(s[j]) & 0xC0) == 0x80) --j;
    std::size_t n = decode_at(s.substr(0, e), j, cp);
    if (n != e - j || !is_unicode_space(cp)) break;
    e = j;
  }

  return s.substr(b, e - b);
}

void append_escaped(std::string& out, std::string_view s, std::string_view delim) {
  if (delim.empty()) { out.append(s); return; }
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find(delim, start);
    if (pos == std::string_view::npos) break;
    out.append(s.substr(start, pos - start));
    out.push_back('\\');
    out.append(delim);
    start = pos + delim.size();
  }
  out.append(s.substr(start));
}

}
