#include "jsonl_tally/naive_scanner.hpp"
#include "jsonl_tally/chunk_reader.hpp"
#include "jsonl_tally/line_tallier.hpp"

namespace jt {

bool NaiveScanner::run(const std::string& path, TypeTally& out, ScanError* err) {
  out.clear();
  lines_ = bytes_ = 0;

  LineTallier::Config tcfg;
  tcfg.verbose_errors = cfg_.verbose_errors;
  LineTallier tallier(tcfg);

  ChunkReader::Config rcfg;
  rcfg.chunk_bytes = cfg_.read_bytes;
  ChunkReader reader(path, rcfg);

  const bool ok = reader.for_each_line([&](std::string_view line) {
    return tallier.add_line(line);
  });
  lines_ = tallier.lines();
  bytes_ = reader.bytes_read();

  if (!ok) {
    if (err) {
      *err = reader.stopped() ? tallier.error()
                              : make_io_error("reading " + path, reader.last_error());
    }
    return false;
  }

  out = tallier.take();
  return true;
}

}
