#include "jsonl_tally/scan_stats.hpp"
#include "jsonl_tally/scanner.hpp"
#include "../test_support.hpp"

#include <random>
#include <string>
#include <vector>

using namespace jt_test;

static jt::TypeTally must_scan(const fs::path& f, const jt::ScanStrategy& s, const std::string& tag,
                               jt::ScanStats* stats = nullptr) {
  jt::TypeTally t;
  jt::ScanError err;
  if (!jt::scan(f.string(), s, t, &err, stats))
    check(false, "scan failed" + tag + ": " + jt::describe(err));
  return t;
}

static std::string synth(std::size_t lines, unsigned seed) {
  std::mt19937 rng(seed);
  const char* types[] = {"click", "view", "purchase", "Click", "ünï", ""};
  std::string out;
  for (std::size_t i = 0; i < lines; ++i) {
    switch (rng() % 10) {
      case 0: out += "not json at all"; break;
      case 1: break;  // empty line
      case 2: out += "{\"kind\":\"view\"}"; break;
      case 3: out += "{\"type\":" + std::to_string(rng() % 100) + "}"; break;
      case 4: out += "  {\"type\":\"view\" , \"pad\":\"" + std::string(rng() % 300, 'p') + "\"}\r"; break;
      default: {
        const char* t = types[rng() % 6];
        out += "{\"id\":" + std::to_string(i) + ",\"type\":\"" + t + "\",\"items\":[1,2,{\"type\":\"x\"}]}";
      }
    }
    if (i + 1 < lines || rng() % 2) out += "\n";
  }
  return out;
}

static std::uint64_t count_lines(const std::string& s) {
  std::uint64_t n = 0;
  for (char c : s) if (c == '\n') ++n;
  if (!s.empty() && s.back() != '\n') ++n;
  return n;
}

static void equivalence_sweep(const std::string& name, const std::string& content,
                              const std::vector<std::int64_t>& chunk_sizes) {
  const fs::path f = write_temp(name, content);
  const jt::TypeTally naive = must_scan(f, jt::ScanStrategy::naive(), " naive " + name);

  check(jt::total_count(naive) == count_lines(content), "naive conserves lines: " + name);

  for (auto chunk : chunk_sizes) {
    for (unsigned threads : {1u, 3u, 0u}) {
      jt::ScanStrategy s = jt::ScanStrategy::chunked(chunk);
      s.max_threads = threads;
      s.read_bytes = (chunk % 2) ? 7 : 4096;  // exercise the carry buffer too
      const std::string tag = " " + name + " chunk=" + std::to_string(chunk) +
                              " threads=" + std::to_string(threads);
      jt::ScanStats stats;
      const jt::TypeTally chunked = must_scan(f, s, tag, &stats);
      check(chunked == naive, "chunked == naive" + tag + "\n  naive:   " + show(naive) +
                              "\n  chunked: " + show(chunked));

      const auto summary = stats.snapshot(0.0);
      check(summary.lines == count_lines(content), "chunk line counts add up" + tag);
      if (static_cast<std::uint64_t>(chunk) >= content.size() && !content.empty())
        check(summary.chunks == 1, "chunk >= file size -> one chunk" + tag);
    }
  }
}

int main(){
  // worked example
  {
    const std::string content =
        "{\"type\":\"A\"}\n{\"type\":\"B\",\"x\":1}\nnot-json\n{\"type\":\"B\"}\n";
    const fs::path f = write_temp("example.jsonl", content);
    const jt::TypeTally t = must_scan(f, jt::ScanStrategy::naive(), " example");
    check(t.size() == 3, "example has three rows: " + show(t));
    check(has(t, "A", 1, 12), "A row");
    check(has(t, "B", 2, 18 + 12), "B row");
    check(has(t, "ERROR", 1, 8), "ERROR row");
    check(must_scan(f, jt::ScanStrategy::chunked(5), " example chunked") == t, "example chunked");
    check(must_scan(f, jt::ScanStrategy::chunked(), " example default") == t, "example default chunk");
  }

  {
    const std::string small = "{\"type\":\"A\"}\n\n[1]\n{\"type\":\"A\",\"b\":2}\nx";
    std::vector<std::int64_t> sizes;
    for (std::int64_t c = 1; c <= static_cast<std::int64_t>(small.size()) + 2; ++c) sizes.push_back(c);
    equivalence_sweep("small.jsonl", small, sizes);
  }

  for (unsigned seed : {1u, 2u, 3u}) {
    const std::string big = synth(3000, seed);
    const auto n = static_cast<std::int64_t>(big.size());
    equivalence_sweep("synth" + std::to_string(seed) + ".jsonl", big,
                      {1, 13, 64, 1000, 4096, 65536, n - 1, n, n * 2});
  }

  // integers wider than 64 bits do not turn a typed line into ERROR
  {
    const std::string line = "{\"type\":\"A\",\"id\":123456789012345678901234}";
    const fs::path f = write_temp("wide_int.jsonl", line + "\n");
    for (auto s : {jt::ScanStrategy::naive(), jt::ScanStrategy::chunked(4)}) {
      const jt::TypeTally t = must_scan(f, s, " wide int");
      check(t.size() == 1 && has(t, "A", 1, line.size()),
            std::string("wide int tallied as A (") + jt::mode_name(s.mode) + "): " + show(t));
    }
  }

  // empty file: no rows, no ERROR row
  {
    const fs::path f = write_temp("empty.jsonl", "");
    check(must_scan(f, jt::ScanStrategy::naive(), " empty").empty(), "empty naive");
    jt::ScanStats stats;
    check(must_scan(f, jt::ScanStrategy::chunked(10), " empty chunked", &stats).empty(), "empty chunked");
    check(stats.snapshot(0.0).chunks == 0, "empty file plans zero chunks");
  }

  // all invalid lines -> a single ERROR row
  {
    const std::string content = "nope\n{bad\n\n[]\n{\"type\":1}\n";
    const fs::path f = write_temp("all_invalid.jsonl", content);
    for (auto s : {jt::ScanStrategy::naive(), jt::ScanStrategy::chunked(3)}) {
      const jt::TypeTally t = must_scan(f, s, " all invalid");
      check(t.size() == 1 && has(t, "ERROR", 5, 4 + 4 + 0 + 2 + 10),
            std::string("all invalid -> ERROR only (") + jt::mode_name(s.mode) + "): " + show(t));
    }
  }

  // invalid UTF-8 is fatal for both strategies
  {
    const std::string content = "{\"type\":\"A\"}\n{\"type\":\"\xff\"}\n{\"type\":\"C\"}\n";
    const fs::path f = write_temp("bad_utf8.jsonl", content);
    for (auto s : {jt::ScanStrategy::naive(), jt::ScanStrategy::chunked(4), jt::ScanStrategy::chunked(1000)}) {
      jt::TypeTally t;
      jt::tally_line(t, "stale", 1);
      jt::ScanError err;
      check(!jt::scan(f.string(), s, t, &err), "invalid UTF-8 fails the scan");
      check(err.kind == jt::ScanError::Kind::Encoding, "encoding error kind: " + jt::describe(err));
      check(t.empty(), "no partial tally on encoding error");
    }
  }

  // missing file
  for (auto s : {jt::ScanStrategy::naive(), jt::ScanStrategy::chunked(10)}) {
    jt::TypeTally t;
    jt::ScanError err;
    check(!jt::scan("/nonexistent/jt/missing.jsonl", s, t, &err), "missing file fails");
    check(err.kind == jt::ScanError::Kind::Io && err.sys_errno != 0, "io error with errno");
  }

  // non-positive chunk size is rejected before touching the file
  for (std::int64_t bad : {std::int64_t(0), std::int64_t(-3)}) {
    jt::TypeTally t;
    jt::ScanError err;
    check(!jt::scan("/nonexistent/jt/missing.jsonl", jt::ScanStrategy::chunked(bad), t, &err),
          "bad chunk size fails");
    check(err.kind == jt::ScanError::Kind::Config, "config error before I/O");
  }

  return finish("naive_vs_chunked");
}
