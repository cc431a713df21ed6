#include "wrapline/cli_options.hpp"
#include "wrapline/delimiter.hpp"
#include "wrapline/run_stats.hpp"
#include "wrapline/sha256_stream.hpp"
#include "wrapline/version.hpp"
#include "wrapline/wrap_processor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

int usage_fail(const std::string& msg) {
  std::cerr << "[wrapline] " << msg << "\n" << wl::usage_text(wl::kProgramName);
  return kExitUsage;
}

// "-" or an explicit path; empty when no input can be chosen.
std::string choose_input(const wl::CliOptions& cli) {
  if (cli.positional.size() == 1) return cli.positional.front();
  if (cli.positional.empty() && !::isatty(STDIN_FILENO)) return "-";
  return {};
}

int run_wrap(const wl::CliOptions& cli, const std::string& delimiter) {
  namespace ch = std::chrono;

  const std::string input_name = choose_input(cli);
  if (input_name.empty())
    return usage_fail("exactly one filename (or '-' for STDIN) required");

  // --- input
  std::ifstream in_file;
  if (input_name != "-") {
    in_file.open(input_name, std::ios::binary);
    if (!in_file) {
      std::cerr << "[wrapline] failed to open file '" << input_name << "': "
                << std::strerror(errno) << "\n";
      return kExitError;
    }
  }
  std::istream& in = (input_name == "-") ? std::cin : in_file;

  // --- output
  std::ofstream out_file;
  if (!cli.output_path.empty()) {
    out_file.open(cli.output_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      std::cerr << "[wrapline] failed to create output file '" << cli.output_path << "': "
                << std::strerror(errno) << "\n";
      return kExitError;
    }
  }
  std::ostream& out = cli.output_path.empty() ? std::cout : out_file;

  // --- process
  wl::WrapConfig cfg;
  cfg.delimiter       = delimiter;
  cfg.strip           = cli.strip;
  cfg.skip_empty      = cli.skip_empty;
  cfg.escape          = cli.escape;
  cfg.null_terminated = cli.null_terminated;

  wl::WrapProcessor proc(cfg);
  std::unique_ptr<wl::Sha256Stream> sha;
  if (!cli.stats_path.empty()) {
    sha = std::make_unique<wl::Sha256Stream>();
    proc.set_chunk_observer([&](std::string_view chunk){ sha->update(chunk); });
  }

  const auto t0 = ch::steady_clock::now();
  const bool ok = proc.run(in, out);
  if (out_file.is_open()) out_file.close();
  const auto t1 = ch::steady_clock::now();

  if (!ok) {
    std::cerr << "[wrapline] " << proc.error() << "\n";
    return kExitError;
  }
  if (!cli.output_path.empty() && out_file.fail()) {
    std::cerr << "[wrapline] failed to write output file '" << cli.output_path << "'\n";
    return kExitError;
  }

  const auto& n = proc.counters();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  if (!cli.stats_path.empty()) {
    wl::RunStats s;
    s.records_read    = n.records_read;
    s.records_emitted = n.records_emitted;
    s.records_dropped = n.records_dropped;
    s.bytes_in        = n.bytes_in;
    s.bytes_out       = n.bytes_out;
    s.wall_time_ms    = wall_ms;
    s.throughput_mb_s = wall_ms > 0.0 ? (n.bytes_in / (1024.0 * 1024.0)) / (wall_ms / 1000.0) : 0.0;
    s.input           = input_name;
    s.output          = cli.output_path.empty() ? "-" : cli.output_path;
    s.delimiter       = delimiter;
    s.null_terminated = cli.null_terminated;
    s.input_sha256    = sha->hex_digest();

    std::string err;
    if (!wl::write_stats_file(cli.stats_path, wl::StatsJsonWriter::to_json(s), &err)) {
      std::cerr << "[wrapline] " << err << "\n";
      return kExitError;
    }
  }

  if (cli.verbose) {
    std::cerr << "[wrapline] ok: " << input_name
              << " records=" << n.records_read
              << " emitted=" << n.records_emitted
              << " dropped=" << n.records_dropped
              << " bytes=" << n.bytes_in
              << " time=" << wall_ms << "ms\n";
  }
  return kExitOk;
}

}

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  wl::CliOptions cli;
  std::string err;
  if (!wl::parse_cli(argc, argv, &cli, &err)) return usage_fail(err);

  if (cli.show_help) {
    std::cout << wl::usage_text(wl::kProgramName);
    return kExitOk;
  }
  if (cli.show_version) {
    std::cout << wl::version_banner(wl::kProgramName, wl::kProgramVersion, wl::kProgramUrl);
    return kExitOk;
  }

  wl::ErrorKind kind = wl::ErrorKind::None;
  auto delimiter = wl::resolve_delimiter(cli.delimiter_token, &kind, &err);
  if (!delimiter) {
    std::cerr << "[wrapline] invalid delimiter (" << wl::to_string(kind) << "): " << err << "\n";
    return kExitError;
  }

  return run_wrap(cli, *delimiter);
}
