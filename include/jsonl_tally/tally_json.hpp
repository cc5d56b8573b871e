#pragma once
#include "jsonl_tally/scan_stats.hpp"
#include "jsonl_tally/type_tally.hpp"

#include <cstdint>
#include <string>

namespace jt {

struct TallyReport {
  TypeTally tally;
  ScanSummary summary;

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
  std::string strategy;
  std::int64_t chunk_size = 0;
};

class TallyJsonWriter {
public:
  // Serialize the report as one JSON object; type rows sorted by name.
  static std::string to_json(const TallyReport& r);
};

// Writes `contents` to `path`, creating parent directories.
bool write_text_file(const std::string& path, const std::string& contents,
                     std::string* err_out = nullptr);

}
