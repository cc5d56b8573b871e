#include "jsonl_tally/line_tallier.hpp"

#include <simdjson.h>
#include <iostream>
#include <sstream>
#include <string>

namespace jt {

LineTallier::LineTallier() : LineTallier(Config{}) {}

LineTallier::LineTallier(Config cfg) : cfg_(std::move(cfg)) {}

bool LineTallier::add_line(std::string_view line) {
  const std::uint64_t line_no = lines_ + 1;

  if (!simdjson::validate_utf8(line.data(), line.size())) {
    err_ = make_encoding_error("invalid UTF-8 in " + cfg_.label + " line " + std::to_string(line_no));
    return false;
  }

  ++lines_;

  Classification c = classifier_.classify(line);
  if (c.typed) {
    tally_line(tally_, c.type_name, line.size());
    return true;
  }

  tally_line(tally_, kErrorType, line.size());
  if (cfg_.verbose_errors) {
    // one write per message so concurrent workers don't interleave mid-line
    std::ostringstream o;
    o << "[scan] " << cfg_.label << " line " << line_no << ": " << line.size()
      << " bytes, " << kind_name(c.root) << " - " << c.reason << "\n";
    std::cerr << o.str();
  }
  return true;
}

}
