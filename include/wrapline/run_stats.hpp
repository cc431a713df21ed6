#pragma once
#include <cstdint>
#include <string>

namespace wl {

struct RunStats {
  std::uint64_t records_read    = 0;
  std::uint64_t records_emitted = 0;
  std::uint64_t records_dropped = 0;
  std::uint64_t bytes_in        = 0;
  std::uint64_t bytes_out       = 0;
  double wall_time_ms    = 0.0;
  double throughput_mb_s = 0.0;

  // Run metadata
  std::string input;        // path or "-"
  std::string output;       // path or "-"
  std::string delimiter;
  bool null_terminated = false;
  std::string input_sha256; // hex, empty when not computed
};

class StatsJsonWriter {
public:
  // Serialize to a compact JSON object.
  static std::string to_json(const RunStats& s);
};

// Write `json` to `path`, creating parent directories. False on error.
bool write_stats_file(const std::string& path, const std::string& json,
                      std::string* err_out = nullptr);

}
