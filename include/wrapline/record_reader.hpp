#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace wl {

class RecordReader {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB per read
    char        separator   = '\n';      // '\0' for null-terminated input
  };

  explicit RecordReader(std::istream& in);      // uses default Config{}
  RecordReader(std::istream& in, Config cfg);   // explicit Config
  ~RecordReader();

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  // Called for every separator-terminated record with terminated=true, then
  // exactly once more with terminated=false carrying whatever followed the
  // last separator (possibly nothing). Returning false stops the scan.
  using RecordCallback = std::function<bool(std::string_view record, bool terminated)>;

  // Sees every raw chunk before it is split.
  using ChunkCallback = std::function<void(std::string_view chunk)>;

  void on_chunk(ChunkCallback cb);

  // False on a read error or when the callback stopped the scan.
  bool for_each_record(const RecordCallback& cb);

  const std::string& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t records() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
