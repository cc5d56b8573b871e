#include "jsonl_tally/tally_json.hpp"
#include "jsonl_tally/path_utils.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace jt {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string TallyJsonWriter::to_json(const TallyReport& r) {
  std::ostringstream o;
  o << "{";

  o << "\"types\":[";
  bool first = true;
  for (auto& k : sorted_keys(r.tally)) {
    if (!first) o << ",";
    first = false;
    const auto& c = r.tally.at(k);
    o << "{\"type\":"; esc(o, k);
    o << ",\"count\":" << c.count << ",\"bytes\":" << c.bytes << "}";
  }
  o << "],";

  o << "\"total_count\":" << total_count(r.tally) << ",";
  o << "\"total_bytes\":" << total_bytes(r.tally) << ",";

  o << "\"filename\":"; esc(o, r.filename); o << ",";
  o << "\"file_size\":" << r.file_size << ",";
  o << "\"strategy\":"; esc(o, r.strategy); o << ",";
  o << "\"chunk_size\":" << r.chunk_size << ",";
  o << "\"chunks\":" << r.summary.chunks << ",";
  o << "\"threads\":" << r.summary.threads << ",";
  o << "\"lines\":" << r.summary.lines << ",";
  o << "\"wall_time_us\":" << safe_num(r.summary.wall_time_us) << ",";
  o << "\"throughput_mb_s\":" << safe_num(r.summary.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<r.summary.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, r.summary.stages[i].name);
    o << ",\"duration_us\":" << r.summary.stages[i].duration_us << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

bool write_text_file(const std::string& path, const std::string& contents,
                     std::string* err_out) {
  if (!ensure_parent_dirs(std::filesystem::path(path))) {
    if (err_out) *err_out = "cannot create parent directories for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
