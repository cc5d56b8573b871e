#include "jsonl_tally/path_utils.hpp"
#include "jsonl_tally/scan_stats.hpp"
#include "jsonl_tally/scanner.hpp"
#include "jsonl_tally/tally_json.hpp"
#include "jsonl_tally/tally_printer.hpp"

#include <charconv>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitScan = 2;
constexpr int kExitReport = 3;

struct Cli {
  std::string file_path;
  bool use_chunks = false;
  std::int64_t chunk_size = jt::kDefaultChunkSize;
  unsigned threads = 0;
  bool pretty_print = false;
  bool verbose_errors = false;
  bool json = false;
  std::string out_path;
  bool help = false;
  std::string error;
};

void print_usage(std::ostream& os) {
  os <<
    "Usage: jsonl-tally [-c|--use-chunks] [--chunk-size=N] [--threads=N]\n"
    "                   [-p|--pretty-print] [--format=table|json] [--out=FILE]\n"
    "                   [-v|--verbose-errors] <file>\n"
    "\n"
    "Counts JSON lines by their \"type\" field and sums their byte sizes.\n"
    "Lines that are not a JSON object with a string \"type\" are counted as ERROR.\n"
    "\n"
    "  -c, --use-chunks       read the file in parallel chunks (best for big files)\n"
    "      --chunk-size=N     chunk size in bytes (default 1000000)\n"
    "      --threads=N        max worker threads, 0 = all cores (default 0)\n"
    "  -p, --pretty-print     print a bordered table\n"
    "      --format=F         table (default) or json\n"
    "      --out=FILE         also write the JSON report to FILE\n"
    "  -v, --verbose-errors   log every unparsable line to stderr\n";
}

template <typename T>
bool parse_int(std::string_view s, T* out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto value_of = [&](const char* pfx, std::string_view* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::string_view(a).substr(std::string_view(pfx).size()); return true; }
      return false;
    };
    std::string_view v;
    if (value_of("--chunk-size=", &v)) {
      if (!parse_int(v, &c.chunk_size)) c.error = "invalid --chunk-size: " + std::string(v);
      continue;
    }
    if (value_of("--threads=", &v)) {
      if (!parse_int(v, &c.threads)) c.error = "invalid --threads: " + std::string(v);
      continue;
    }
    if (value_of("--format=", &v)) {
      if (v == "json") c.json = true;
      else if (v == "table") c.json = false;
      else c.error = "unknown --format: " + std::string(v);
      continue;
    }
    if (value_of("--out=", &v)) { c.out_path = std::string(v); continue; }
    if (a == "-c" || a == "--use-chunks")     { c.use_chunks = true; continue; }
    if (a == "-p" || a == "--pretty-print")   { c.pretty_print = true; continue; }
    if (a == "-v" || a == "--verbose-errors") { c.verbose_errors = true; continue; }
    if (a == "-h" || a == "--help")           { c.help = true; continue; }
    if (!a.empty() && a[0] == '-') { c.error = "unknown option: " + a; continue; }
    if (!c.file_path.empty()) { c.error = "more than one input file given"; continue; }
    c.file_path = a;
  }
  if (!c.help && c.error.empty() && c.file_path.empty()) c.error = "missing input file";
  return c;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.help) { print_usage(std::cout); return kExitOk; }
  if (!cli.error.empty()) {
    std::cerr << "[cli] " << cli.error << "\n";
    print_usage(std::cerr);
    return kExitUsage;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  const std::string path = jt::resolve_input(cli.file_path).string();

  jt::ScanStrategy strategy = cli.use_chunks ? jt::ScanStrategy::chunked(cli.chunk_size)
                                             : jt::ScanStrategy::naive();
  strategy.max_threads = cli.threads;
  strategy.verbose_errors = cli.verbose_errors;

  jt::ScanStats stats;
  jt::TypeTally tally;
  jt::ScanError err;
  if (!jt::scan(path, strategy, tally, &err, &stats)) {
    std::cerr << "[scan] failed on " << path << ": " << jt::describe(err) << "\n";
    return kExitScan;
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_us = ch::duration<double, std::micro>(t1 - t0).count();

  jt::TallyReport report;
  report.summary = stats.snapshot(wall_us);
  report.filename = path;
  std::error_code fec;
  report.file_size = std::filesystem::file_size(path, fec);
  report.strategy = jt::mode_name(strategy.mode);
  report.chunk_size = cli.use_chunks ? strategy.chunk_size : 0;
  report.tally = std::move(tally);

  std::string json;
  if (cli.json || !cli.out_path.empty()) json = jt::TallyJsonWriter::to_json(report);

  if (!cli.out_path.empty()) {
    std::string werr;
    if (!jt::write_text_file(cli.out_path, json, &werr)) {
      std::cerr << "[report] " << werr << "\n";
      return kExitReport;
    }
  }

  if (cli.json) {
    std::cout << json << "\n";
    return kExitOk;
  }

  jt::TallyPrinter::Config pcfg;
  pcfg.style = cli.pretty_print ? jt::TallyPrinter::Style::Pretty : jt::TallyPrinter::Style::Lean;
  jt::TallyPrinter printer(pcfg);
  std::string table;
  if (!printer.render(report.tally, table)) {
    std::cerr << "[report] render failed: " << printer.error() << "\n";
    return kExitReport;
  }
  std::cout << table;
  std::cout << "Took " << static_cast<std::uint64_t>(wall_us) << " microseconds\n";
  return kExitOk;
}
