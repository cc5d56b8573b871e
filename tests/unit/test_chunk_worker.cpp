#include "jsonl_tally/chunk_worker.hpp"
#include "../test_support.hpp"

#include <string>

using namespace jt_test;

static jt::ChunkWorker make_worker(const fs::path& f, std::size_t read_bytes = 4096) {
  jt::ChunkWorker::Config cfg;
  cfg.read_bytes = read_bytes;
  return jt::ChunkWorker(f.string(), cfg);
}

int main(){
  const std::string content = "{\"type\":\"A\"}\nnot-json\n{\"type\":\"B\",\"x\":1}\n";
  const fs::path f = write_temp("chunk_worker.jsonl", content);

  // a whole chunk: one outcome carrying the chunk's tally
  {
    const auto w = make_worker(f, 5);
    jt::ChunkOutcome o = w.run(2, {0, content.size()});
    check(o.ok, "whole-file chunk ok: " + jt::describe(o.error));
    check(o.index == 2, "outcome keeps its chunk index");
    check(o.lines == 3 && o.bytes == content.size(), "line and byte counters");
    check(o.tally.size() == 3 && has(o.tally, "A", 1, 12) && has(o.tally, "ERROR", 1, 8) &&
          has(o.tally, "B", 1, 18), "chunk tally: " + show(o.tally));
  }

  // a sub-range sees only its own lines
  {
    const auto w = make_worker(f);
    jt::ChunkOutcome o = w.run(1, {13, 22});
    check(o.ok && o.tally.size() == 1 && has(o.tally, "ERROR", 1, 8),
          "middle chunk: " + show(o.tally));
  }

  // a range that starts past EOF fails with an I/O error and no tally
  {
    const auto w = make_worker(f);
    jt::ChunkOutcome o = w.run(7, {content.size() + 100, content.size() + 200});
    check(!o.ok, "range past EOF fails");
    check(o.error.kind == jt::ScanError::Kind::Io, "past EOF is an io error: " + jt::describe(o.error));
    check(o.tally.empty(), "no tally from a failed chunk");
    check(o.error.message.find("chunk 7") != std::string::npos, "error names the chunk: " + o.error.message);
  }

  // a range that runs off the end of the file fails the same way
  {
    const auto w = make_worker(f, 3);
    jt::ChunkOutcome o = w.run(0, {0, content.size() + 50});
    check(!o.ok && o.error.kind == jt::ScanError::Kind::Io, "short range is an io error");
    check(o.tally.empty(), "short range keeps no partial tally: " + show(o.tally));
  }

  // missing file
  {
    const auto w = make_worker(fs::temp_directory_path() / "jt_test_chunk_worker_missing.jsonl");
    jt::ChunkOutcome o = w.run(0, {0, 10});
    check(!o.ok && o.error.kind == jt::ScanError::Kind::Io && o.error.sys_errno != 0,
          "missing file is an io error with errno: " + jt::describe(o.error));
  }

  // invalid UTF-8 inside the range is an encoding error, not an ERROR row
  {
    const std::string bad = "{\"type\":\"A\"}\n{\"type\":\"\xc3\x28\"}\n";
    const fs::path g = write_temp("chunk_worker_bad_utf8.jsonl", bad);
    const auto w = make_worker(g);
    jt::ChunkOutcome o = w.run(0, {0, bad.size()});
    check(!o.ok && o.error.kind == jt::ScanError::Kind::Encoding,
          "invalid UTF-8 is an encoding error: " + jt::describe(o.error));
    check(o.tally.empty(), "no tally after an encoding error");
  }

  return finish("chunk_worker");
}
