#include "wrapline/record_reader.hpp"
#include <istream>
#include <utility>
#include <vector>

namespace wl {

struct RecordReader::Impl {
  std::istream& in;
  Config cfg;
  ChunkCallback on_chunk;
  std::string err;
  std::uint64_t bytes{0};
  std::uint64_t records{0};

  bool for_each_record(const RecordCallback& cb) {
    std::vector<char> buf(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    std::string carry;
    carry.reserve(256);

    while (true) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const std::size_t n = static_cast<std::size_t>(in.gcount());
      if (in.bad()) { err = "failed to read input"; return false; }
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      if (on_chunk) on_chunk(block);

      std::size_t start = 0;
      while (true) {
        std::size_t pos = block.find(cfg.separator, start);
        if (pos == std::string_view::npos) {
          // unfinished record, continues in the next chunk
          carry.append(block.data() + start, n - start);
          break;
        }

        std::string_view slice = block.substr(start, pos - start);
        ++records;
        bool keep_going;
        if (!carry.empty()) {
          carry.append(slice);
          keep_going = cb(carry, true);
          carry.clear();
        } else {
          keep_going = cb(slice, true);
        }
        if (!keep_going) return false;
        start = pos + 1;
      }

      if (in.eof()) break;
    }

    if (!carry.empty()) ++records;
    return cb(carry, false);
  }
};

RecordReader::RecordReader(std::istream& in)
  : RecordReader(in, Config{}) {}

RecordReader::RecordReader(std::istream& in, Config cfg)
  : p_(new Impl{in, cfg, {}, {}, 0, 0}) {}

RecordReader::~RecordReader() { delete p_; }

void RecordReader::on_chunk(ChunkCallback cb) { p_->on_chunk = std::move(cb); }
bool RecordReader::for_each_record(const RecordCallback& cb) { return p_->for_each_record(cb); }
const std::string& RecordReader::error() const noexcept { return p_->err; }
std::uint64_t RecordReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t RecordReader::records() const noexcept { return p_->records; }

}
