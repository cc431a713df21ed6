#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace wl {

struct CliOptions {
  std::string delimiter_token = "\"";
  bool strip           = false;
  bool skip_empty      = false;
  bool escape          = false;
  bool null_terminated = false;
  bool show_version    = false;
  bool show_help       = false;
  bool verbose         = false;
  std::string output_path;            // empty -> STDOUT
  std::string stats_path;             // empty -> no stats file
  std::vector<std::string> positional;
};

// Flags end at the first non-flag argument, "-" or "--".
// Returns false on a usage error with the reason in `err_out`.
bool parse_cli(int argc, const char* const* argv, CliOptions* out,
               std::string* err_out = nullptr);

std::string usage_text(std::string_view program);

std::string version_banner(std::string_view name, std::string_view version,
                           std::string_view url);

}
