#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace st {

// Buffered line reader for sheet dump files.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 256 * 1024;      // 256 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        strip_bom        = true;            // drop a leading UTF-8 BOM
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Return false from the callback to stop early.
  using LineCallback = std::function<bool(std::string_view)>;

  // False on open/read failure or an oversize line; see error().
  // Stopping early from the callback is not a failure.
  bool for_each_line(const LineCallback& cb);

  const std::string& error() const noexcept;
  std::uint64_t line_no() const noexcept;     // last line delivered (1-based)
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
