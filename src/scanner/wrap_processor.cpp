#include "wrapline/wrap_processor.hpp"
#include "wrapline/text_utils.hpp"
#include <istream>
#include <ostream>

namespace wl {

WrapProcessor::WrapProcessor(WrapConfig cfg, std::size_t chunk_bytes)
  : cfg_(std::move(cfg)), chunk_bytes_(chunk_bytes) {
  line_.reserve(1024);
}

void WrapProcessor::fail(ErrorKind kind, std::string msg) {
  kind_ = kind;
  err_ = std::move(msg);
}

bool WrapProcessor::emit(std::ostream& out, std::string_view record, bool terminal) {
  if (cfg_.strip) record = trim_space(record);

  // An empty final record never produces output.
  if (record.empty() && (terminal || cfg_.skip_empty)) {
    ++counters_.records_dropped;
    return true;
  }

  line_.clear();
  line_.append(cfg_.delimiter);
  if (cfg_.escape) append_escaped(line_, record, cfg_.delimiter);
  else             line_.append(record);
  line_.append(cfg_.delimiter);
  line_.push_back('\n');

  out.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  if (!out) {
    fail(ErrorKind::IOError, "failed to write output");
    return false;
  }
  ++counters_.records_emitted;
  counters_.bytes_out += line_.size();
  return true;
}

bool WrapProcessor::run(std::istream& in, std::ostream& out) {
  counters_ = WrapCounters{};
  kind_ = ErrorKind::None;
  err_.clear();

  RecordReader::Config rcfg;
  rcfg.chunk_bytes = chunk_bytes_;
  rcfg.separator   = cfg_.null_terminated ? '\0' : '\n';
  RecordReader reader(in, rcfg);
  if (chunk_observer_) reader.on_chunk(chunk_observer_);

  // Lookahead: the last terminated record, not yet known to be interior.
  std::string pending;
  bool has_pending = false;

  const bool ok = reader.for_each_record([&](std::string_view record, bool terminated) {
    if (terminated) {
      if (has_pending && !emit(out, pending, /*terminal=*/false)) return false;
      pending.assign(record.data(), record.size());
      has_pending = true;
      return true;
    }

    // End of stream: the pending record, then any unterminated tail, are final.
    if (has_pending) {
      has_pending = false;
      if (!emit(out, pending, /*terminal=*/true)) return false;
    }
    if (!record.empty() && !emit(out, record, /*terminal=*/true)) return false;
    return true;
  });

  counters_.bytes_in = reader.bytes_read();
  counters_.records_read = reader.records();

  if (kind_ != ErrorKind::None) return false;
  if (!ok) {
    fail(ErrorKind::IOError, reader.error());
    return false;
  }

  out.flush();
  if (!out) {
    fail(ErrorKind::IOError, "failed to flush output");
    return false;
  }
  return true;
}

bool run(std::istream& in, std::ostream& out, const WrapConfig& cfg, std::string* err_out) {
  WrapProcessor proc(cfg);
  const bool ok = proc.run(in, out);
  if (!ok && err_out) *err_out = proc.error();
  return ok;
}

}
