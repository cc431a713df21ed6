#pragma once
#include "wrapline/error.hpp"
#include "wrapline/record_reader.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace wl {

// Settings for one run. `delimiter` is already resolved.
struct WrapConfig {
  std::string delimiter       = "\"";
  bool        strip           = false; // trim whitespace before wrapping
  bool        skip_empty      = false; // drop empty interior records
  bool        escape          = false; // backslash-escape delimiter in content
  bool        null_terminated = false; // split on '\0' instead of '\n'
};

struct WrapCounters {
  std::uint64_t records_read    = 0;
  std::uint64_t records_emitted = 0;
  std::uint64_t records_dropped = 0;
  std::uint64_t bytes_in        = 0;
  std::uint64_t bytes_out       = 0;
};

// Streams records from `in` to `out` as <delim><content><delim>\n.
// Holds one record of lookahead so the final record can be told apart from
// interior ones: an empty final record is always dropped, an empty interior
// record only with skip_empty.
class WrapProcessor {
public:
  explicit WrapProcessor(WrapConfig cfg, std::size_t chunk_bytes = 64 * 1024);

  // False on the first read or write failure; output already written stays.
  bool run(std::istream& in, std::ostream& out);

  void set_chunk_observer(RecordReader::ChunkCallback cb) { chunk_observer_ = std::move(cb); }

  const WrapConfig& config() const noexcept { return cfg_; }
  const WrapCounters& counters() const noexcept { return counters_; }
  ErrorKind error_kind() const noexcept { return kind_; }
  const std::string& error() const noexcept { return err_; }

private:
  bool emit(std::ostream& out, std::string_view record, bool terminal);
  void fail(ErrorKind kind, std::string msg);

  WrapConfig cfg_;
  std::size_t chunk_bytes_;
  RecordReader::ChunkCallback chunk_observer_;
  WrapCounters counters_;
  std::string line_; // reused output buffer
  ErrorKind kind_{ErrorKind::None};
  std::string err_;
};

// One-shot helper around WrapProcessor.
bool run(std::istream& in, std::ostream& out, const WrapConfig& cfg,
         std::string* err_out = nullptr);

}
