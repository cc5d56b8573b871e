#include "jsonl_tally/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace jt {

struct ChunkReader::Impl {
  std::string path;
  ChunkRange range;
  Config cfg;
  int last_errno{0};
  bool stopped{false};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  bool emit(const LineCallback& cb, std::string_view line) {
    ++lines;
    if (!cb(line)) { stopped = true; return false; }
    return true;
  }

  bool for_each_line(const LineCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }

    if (range.start > 0 &&
        ::fseeko(f, static_cast<off_t>(range.start), SEEK_SET) != 0) {
      last_errno = errno; std::fclose(f); return false;
    }

    const bool bounded = (range.end != kToEof);
    std::uint64_t remaining = bounded ? range.size() : kToEof;

    std::vector<char> buf(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1, 0);
    std::string carry;
    carry.reserve(256);

    while (remaining > 0) {
      std::size_t want = buf.size();
      if (remaining < want) want = static_cast<std::size_t>(remaining);
      std::size_t n = std::fread(buf.data(), 1, want, f);
      if (n == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; std::fclose(f); return false; }
      if (n == 0 && std::feof(f)) {
        // The range promised more bytes than the file holds.
        if (bounded) { last_errno = EIO; std::fclose(f); return false; }
        break;
      }
      bytes += n;
      if (bounded) remaining -= n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (true) {
        std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          // unfinished line, keep for the next block
          carry.append(block.substr(start));
          break;
        }

        std::string_view slice = block.substr(start, pos - start);
        bool go;
        if (!carry.empty()) {
          carry.append(slice);
          go = emit(cb, std::string_view(carry.data(), carry.size()));
          carry.clear();
        } else {
          go = emit(cb, slice);
        }
        if (!go) { std::fclose(f); return false; }

        start = pos + 1;
      }
    }

    if (!carry.empty()) {
      bool go = emit(cb, std::string_view(carry.data(), carry.size()));
      carry.clear();
      if (!go) { std::fclose(f); return false; }
    }

    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : ChunkReader(std::move(path), ChunkRange{0, kToEof}, cfg) {}

ChunkReader::ChunkReader(std::string path, ChunkRange range, Config cfg)
  : p_(new Impl{std::move(path), range, cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
bool ChunkReader::stopped() const noexcept { return p_->stopped; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines() const noexcept { return p_->lines; }

}
