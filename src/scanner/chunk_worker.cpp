#include "jsonl_tally/chunk_worker.hpp"
#include "jsonl_tally/chunk_reader.hpp"
#include "jsonl_tally/line_tallier.hpp"

#include <string>

namespace jt {

ChunkWorker::ChunkWorker(std::string path, Config cfg)
  : path_(std::move(path)), cfg_(cfg) {}

ChunkOutcome ChunkWorker::run(std::size_t index, const ChunkRange& range) const {
  ChunkOutcome out;
  out.index = index;

  LineTallier::Config tcfg;
  tcfg.verbose_errors = cfg_.verbose_errors;
  tcfg.label = "chunk " + std::to_string(index);
  LineTallier tallier(tcfg);

  ChunkReader::Config rcfg;
  rcfg.chunk_bytes = cfg_.read_bytes;
  ChunkReader reader(path_, range, rcfg);

  const bool ok = reader.for_each_line([&](std::string_view line) {
    return tallier.add_line(line);
  });

  out.lines = tallier.lines();
  out.bytes = reader.bytes_read();

  if (!ok) {
    if (reader.stopped()) {
      out.error = tallier.error();
    } else {
      out.error = make_io_error("reading chunk " + std::to_string(index) + " [" +
                                std::to_string(range.start) + ", " +
                                std::to_string(range.end) + ") of " + path_,
                                reader.last_error());
    }
    return out;
  }

  out.ok = true;
  out.tally = tallier.take();
  return out;
}

}
