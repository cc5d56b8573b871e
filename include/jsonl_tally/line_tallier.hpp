#pragma once
#include "jsonl_tally/record_classifier.hpp"
#include "jsonl_tally/scan_error.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace jt {

// The per-line rule shared by every scanner: UTF-8 check, classification,
// and accumulation of terminator-excluded byte sizes.
class LineTallier {
public:
  struct Config {
    bool verbose_errors = false;
    std::string label = "file";  // prefix for verbose logs, e.g. "chunk 3"
  };

  LineTallier();
  explicit LineTallier(Config cfg);

  // False on invalid UTF-8; error() then holds an Encoding error and the
  // line is not counted.
  bool add_line(std::string_view line);

  TypeTally take() { return std::move(tally_); }

  std::uint64_t lines() const noexcept { return lines_; }
  const ScanError& error() const noexcept { return err_; }

private:
  Config cfg_;
  RecordClassifier classifier_;
  TypeTally tally_;
  std::uint64_t lines_{0};
  ScanError err_;
};

}
