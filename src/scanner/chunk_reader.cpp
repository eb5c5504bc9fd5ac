#include "sheet_table/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string_view>
#include <vector>

namespace st {

namespace {
struct FileCloser { void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); } };
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;
}

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  std::string err;
  std::uint64_t line_no{0};
  std::uint64_t bytes{0};

  // Emit one complete line; false to stop.
  bool emit(std::string_view out, const LineCallback& cb) {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    if (line_no == 0 && cfg.strip_bom && out.substr(0, 3) == "\xEF\xBB\xBF") out.remove_prefix(3);
    ++line_no;
    return cb(out);
  }

  bool oversize() {
    err = path + ":" + std::to_string(line_no + 1) + ": line exceeds " +
          std::to_string(cfg.max_record_bytes) + " bytes";
    return false;
  }

  bool for_each_line(const LineCallback& cb) {
    err.clear();
    line_no = 0;
    bytes = 0;
    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) { err = path + ": " + std::strerror(errno); return false; }

    std::vector<char> buf(cfg.chunk_bytes);
    std::string carry;
    carry.reserve(256);

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f.get());
      if (n == 0 && std::ferror(f.get())) { err = path + ": read error: " + std::strerror(errno); return false; }
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (start <= block.size()) {
        std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          // unfinished line; keep for the next chunk
          std::string_view tail = block.substr(start);
          if (carry.size() + tail.size() > cfg.max_record_bytes) return oversize();
          carry.append(tail);
          break;
        }
        std::string_view slice = block.substr(start, pos - start);
        start = pos + 1;
        if (!carry.empty()) {
          if (carry.size() + slice.size() > cfg.max_record_bytes) return oversize();
          carry.append(slice);
          bool go = emit(carry, cb);
          carry.clear();
          if (!go) return true;
        } else {
          if (slice.size() > cfg.max_record_bytes) return oversize();
          if (!emit(slice, cb)) return true;
        }
      }
    }

    if (!carry.empty()) (void)emit(carry, cb);  // last line without '\n'
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::line_no() const noexcept { return p_->line_no; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
