#include "wrapline/run_stats.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace wl {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof u, "\\u%04x", static_cast<unsigned>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string StatsJsonWriter::to_json(const RunStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"records_read\":"    << s.records_read    << ",";
  o << "\"records_emitted\":" << s.records_emitted << ",";
  o << "\"records_dropped\":" << s.records_dropped << ",";
  o << "\"bytes_in\":"        << s.bytes_in        << ",";
  o << "\"bytes_out\":"       << s.bytes_out       << ",";
  o << "\"wall_time_ms\":"    << safe_num(s.wall_time_ms)    << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"input\":";        esc(o, s.input);        o << ",";
  o << "\"output\":";       esc(o, s.output);       o << ",";
  o << "\"delimiter\":";    esc(o, s.delimiter);    o << ",";
  o << "\"null_terminated\":" << (s.null_terminated ? "true" : "false") << ",";
  o << "\"input_sha256\":"; esc(o, s.input_sha256);
  o << "}";
  return o.str();
}

bool write_stats_file(const std::string& path, const std::string& json,
                      std::string* err_out) {
  const std::filesystem::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    if (err_out) *err_out = "failed to create directory for '" + path + "': " + ec.message();
    return false;
  }
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  if (!f) {
    if (err_out) *err_out = "failed to create stats file '" + path + "'";
    return false;
  }
  f.write(json.data(), static_cast<std::streamsize>(json.size()));
  f.put('\n');
  f.close();
  if (!f) {
    if (err_out) *err_out = "failed to write stats file '" + path + "'";
    return false;
  }
  return true;
}

}
