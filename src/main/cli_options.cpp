#include "wrapline/cli_options.hpp"
#include <sstream>
#include <utility>

namespace wl {

namespace {

enum class FlagKind { Bool, Value, Unknown };

struct FlagSpec {
  const char* short_name;
  const char* long_name;
  FlagKind kind;
};

constexpr FlagSpec kFlags[] = {
  {"v",      "version",    FlagKind::Bool},
  {"h",      "help",       FlagKind::Bool},
  {"d",      "delimiter",  FlagKind::Value},
  {"s",      "strip",      FlagKind::Bool},
  {"e",      "skip-empty", FlagKind::Bool},
  {"escape", "escape",     FlagKind::Bool},
  {"0",      "null",       FlagKind::Bool},
  {"o",      "output",     FlagKind::Value},
  {"stats",  "stats",      FlagKind::Value},
  {"verbose","verbose",    FlagKind::Bool},
};

const FlagSpec* find_flag(std::string_view name) {
  for (const auto& f : kFlags)
    if (name == f.short_name || name == f.long_name) return &f;
  return nullptr;
}

bool parse_bool_value(std::string_view v, bool* out) {
  if (v == "true"  || v == "1") { *out = true;  return true; }
  if (v == "false" || v == "0") { *out = false; return true; }
  return false;
}

bool usage_error(std::string msg, std::string* err_out) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

}

bool parse_cli(int argc, const char* const* argv, CliOptions* out, std::string* err_out) {
  CliOptions c;
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view a(argv[i]);
    if (a == "--") { ++i; break; }
    if (a.size() < 2 || a[0] != '-') break; // "-" and plain words are positional

    std::string_view body = a.substr(a[1] == '-' ? 2 : 1);
    std::string_view name = body, value;
    const std::size_t eq = body.find('=');
    const bool has_value = eq != std::string_view::npos;
    if (has_value) { name = body.substr(0, eq); value = body.substr(eq + 1); }

    const FlagSpec* f = find_flag(name);
    if (!f) return usage_error("flag provided but not defined: " + std::string(a), err_out);

    if (f->kind == FlagKind::Value) {
      std::string v;
      if (has_value)          v = std::string(value);
      else if (i + 1 < argc)  v = argv[++i];
      else return usage_error("flag needs an argument: -" + std::string(name), err_out);

      const std::string_view key = f->long_name;
      if      (key == "delimiter") c.delimiter_token = std::move(v);
      else if (key == "output")    c.output_path = std::move(v);
      else if (key == "stats")     c.stats_path = std::move(v);
      continue;
    }

    bool on = true;
    if (has_value && !parse_bool_value(value, &on))
      return usage_error("invalid boolean value \"" + std::string(value) + "\" for -" + std::string(name), err_out);

    const std::string_view key = f->long_name;
    if      (key == "version")    c.show_version = on;
    else if (key == "help")       c.show_help = on;
    else if (key == "strip")      c.strip = on;
    else if (key == "skip-empty") c.skip_empty = on;
    else if (key == "escape")     c.escape = on;
    else if (key == "null")       c.null_terminated = on;
    else if (key == "verbose")    c.verbose = on;
  }
  for (; i < argc; ++i) c.positional.emplace_back(argv[i]);

  *out = std::move(c);
  return true;
}

std::string usage_text(std::string_view program) {
  std::ostringstream o;
  o << "Usage: " << program << " [-v] [-d DELIM] [-s] [-e] [-escape] [-0] [-o FILE]\n"
       "                [--stats=FILE] [--verbose] [FILE|-]\n"
       "  -d DELIM    delimiter to wrap lines with (or hex value with 0x prefix, default \")\n"
       "  -s          strip whitespace from lines before wrapping\n"
       "  -e          do not emit empty lines\n"
       "  -escape     escape delimiter characters within lines\n"
       "  -0          read null-terminated records instead of newlines\n"
       "  -o FILE     output file (default: STDOUT)\n"
       "  --stats=F   write run statistics as JSON to F\n"
       "  --verbose   log a run summary to stderr\n"
       "  -v          show version and exit\n"
       "Reads FILE, or STDIN when FILE is '-' or input is piped.\n";
  return o.str();
}

std::string version_banner(std::string_view name, std::string_view version,
                           std::string_view url) {
  std::ostringstream o;
  o << name << " v" << version << "\n" << url << "\n";
  return o.str();
}

}
