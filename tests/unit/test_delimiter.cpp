#include "wrapline/delimiter.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void expect_ok(const std::string& token, const std::string& want) {
  wl::ErrorKind kind = wl::ErrorKind::IOError;
  std::string err;
  auto got = wl::resolve_delimiter(token, &kind, &err);
  if (!got) {
    std::cerr << "[FAIL] resolve(" << token << ") errored: " << err << "\n"; ++failures; return;
  }
  if (*got != want) {
    std::cerr << "[FAIL] resolve(" << token << ") size=" << got->size()
              << " expected size=" << want.size() << "\n"; ++failures; return;
  }
  if (kind != wl::ErrorKind::None) {
    std::cerr << "[FAIL] resolve(" << token << ") left error kind set\n"; ++failures;
  }
}

static void expect_err(const std::string& token, wl::ErrorKind want) {
  wl::ErrorKind kind = wl::ErrorKind::None;
  std::string err;
  auto got = wl::resolve_delimiter(token, &kind, &err);
  if (got) { std::cerr << "[FAIL] resolve(" << token << ") should fail\n"; ++failures; return; }
  if (kind != want) {
    std::cerr << "[FAIL] resolve(" << token << ") kind=" << wl::to_string(kind)
              << " expected " << wl::to_string(want) << "\n"; ++failures; return;
  }
  if (err.find(token) == std::string::npos) {
    std::cerr << "[FAIL] message does not name token: " << err << "\n"; ++failures;
  }
}

int main(){
  // literal tokens pass through
  expect_ok("test", "test");
  expect_ok("'", "'");
  expect_ok("[]", "[]");
  expect_ok("", "");
  expect_ok("0", "0");
  expect_ok("0X22", "0X22");          // prefix is case sensitive
  expect_ok("x22", "x22");
  expect_ok(std::string(4096, '#'), std::string(4096, '#'));

  // hex code points
  expect_ok("0x22", "\"");
  expect_ok("0x27", "'");
  expect_ok("0x7C", "|");
  expect_ok("0x7c", "|");
  expect_ok("0x09", "\t");
  expect_ok("0x0", std::string(1, '\0'));
  expect_ok("0x+41", "A");
  expect_ok("0x-0", std::string(1, '\0'));
  expect_ok("0xE9", "\xC3\xA9");
  expect_ok("0x20AC", "\xE2\x82\xAC");
  expect_ok("0x1F600", "\xF0\x9F\x98\x80");
  expect_ok("0x10FFFF", "\xF4\x8F\xBF\xBF");
  expect_ok("0xD800", "\xEF\xBF\xBD");  // lone surrogate -> U+FFFD

  // malformed hex
  expect_err("0xGG", wl::ErrorKind::InvalidDelimiterSyntax);
  expect_err("0xZZ", wl::ErrorKind::InvalidDelimiterSyntax);
  expect_err("0x", wl::ErrorKind::InvalidDelimiterSyntax);
  expect_err("0x1G", wl::ErrorKind::InvalidDelimiterSyntax);
  expect_err("0x 22", wl::ErrorKind::InvalidDelimiterSyntax);
  expect_err("0x-", wl::ErrorKind::InvalidDelimiterSyntax);

  // out of range
  expect_err("0x110000", wl::ErrorKind::DelimiterOutOfRange);
  expect_err("0xFFFFFFFF", wl::ErrorKind::DelimiterOutOfRange);
  expect_err("0xFFFFFFFFFFFFFFFFFF", wl::ErrorKind::DelimiterOutOfRange);
  expect_err("0x-1", wl::ErrorKind::DelimiterOutOfRange);

  // out-params are optional
  if (wl::resolve_delimiter("0xGG")) { std::cerr << "[FAIL] bare call should fail\n"; ++failures; }

  if (failures) { std::cerr << "[FAIL] " << failures << " delimiter case(s)\n"; return 1; }
  std::cout << "[PASS] delimiter resolution\n";
  return 0;
}
