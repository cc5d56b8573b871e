#include "jsonl_tally/chunk_reader.hpp"
#include "../test_support.hpp"

#include <string>
#include <vector>

using namespace jt_test;

static std::vector<std::string> lines_of(const fs::path& f, jt::ChunkRange range,
                                         std::size_t block, bool* ok = nullptr) {
  jt::ChunkReader::Config cfg;
  cfg.chunk_bytes = block;
  jt::ChunkReader r(f.string(), range, cfg);
  std::vector<std::string> out;
  bool res = r.for_each_line([&](std::string_view s){ out.emplace_back(s); return true; });
  if (ok) *ok = res;
  return out;
}

int main(){
  const std::string content = "{\"type\":\"A\"}\n\nabc\r\nlast-without-newline";
  const fs::path f = write_temp("chunk_reader.jsonl", content);
  const std::vector<std::string> expect = {"{\"type\":\"A\"}", "", "abc\r", "last-without-newline"};

  // every block size, including ones that split lines and terminators
  for (std::size_t block = 1; block <= content.size() + 1; ++block) {
    bool ok = false;
    auto got = lines_of(f, {0, jt::kToEof}, block, &ok);
    check(ok, "whole-file read ok, block=" + std::to_string(block));
    check(got == expect, "lines match, block=" + std::to_string(block));
  }

  {
    jt::ChunkReader r(f.string());
    std::uint64_t n = 0;
    check(r.for_each_line([&](std::string_view){ ++n; return true; }), "default config read");
    check(n == 4 && r.lines() == 4, "line counter");
    check(r.bytes_read() == content.size(), "bytes_read covers the file");
  }

  // a range reads exactly its bytes
  {
    const std::uint64_t second = content.find('\n') + 1;  // start of the empty line
    auto got = lines_of(f, {second, second + 6}, 4);        // "\nabc\r\n"
    check(got == std::vector<std::string>{"", "abc\r"}, "bounded range lines");
  }

  // trailing terminator does not create an extra empty line
  {
    const fs::path g = write_temp("chunk_reader_nl.jsonl", "a\nb\n");
    auto got = lines_of(g, {0, jt::kToEof}, 3);
    check(got == std::vector<std::string>{"a", "b"}, "no phantom line after final newline");
  }

  // callback can stop the scan
  {
    jt::ChunkReader r(f.string());
    int seen = 0;
    bool ok = r.for_each_line([&](std::string_view){ return ++seen < 2; });
    check(!ok && r.stopped() && seen == 2 && r.last_error() == 0, "stop from callback");
  }

  // range past EOF is an I/O failure, not a short tally
  {
    bool ok = true;
    (void)lines_of(f, {0, content.size() + 10}, 8, &ok);
    check(!ok, "range beyond EOF fails");
  }

  {
    jt::ChunkReader r("/nonexistent/jt/missing.jsonl");
    bool ok = r.for_each_line([](std::string_view){ return true; });
    check(!ok && r.last_error() != 0 && !r.stopped(), "missing file sets errno");
  }

  return finish("chunk_reader");
}
