#include "jsonl_tally/tally_printer.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <algorithm>
#include <string>
#include <vector>

namespace jt {

namespace {

constexpr const char* kLeanTemplate =
    "{{#rows}}TYPE: {{name}} | TOTAL COUNT: {{count}} | TOTAL BYTES: {{bytes}}\n{{/rows}}";

constexpr const char* kPrettyTemplate =
    "{{sep}}\n"
    "{{#rows}}| {{name}} | {{count}} | {{bytes}} |\n{{sep}}\n{{/rows}}";

struct Row {
  std::string name;
  std::string count;
  std::string bytes;
};

std::vector<Row> rows_of(const TypeTally& tally, bool sorted) {
  std::vector<Row> rows;
  rows.reserve(tally.size());
  if (sorted) {
    for (auto& k : sorted_keys(tally)) {
      const auto& c = tally.at(k);
      rows.push_back(Row{k, std::to_string(c.count), std::to_string(c.bytes)});
    }
  } else {
    for (auto& kv : tally)
      rows.push_back(Row{kv.first, std::to_string(kv.second.count), std::to_string(kv.second.bytes)});
  }
  return rows;
}

// Terminal columns of a UTF-8 string: one per code point.
std::size_t display_width(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80) ++n;
  return n;
}

std::string pad(const std::string& s, std::size_t w) {
  const std::size_t have = display_width(s);
  return have >= w ? s : s + std::string(w - have, ' ');
}

bool render_rows(const char* tpl_src, const std::vector<Row>& rows, const std::string& sep,
                 std::string& out, std::string& err) {
  kainjow::mustache::mustache tpl{std::string(tpl_src)};
  if (!tpl.is_valid()) { err = tpl.error_message(); return false; }
  // type names are printed verbatim
  tpl.set_custom_escape([](const std::string& s) { return s; });

  kainjow::mustache::data list{kainjow::mustache::data::type::list};
  for (auto& r : rows) {
    kainjow::mustache::data item;
    item.set("name", r.name);
    item.set("count", r.count);
    item.set("bytes", r.bytes);
    list.push_back(item);
  }

  kainjow::mustache::data ctx;
  ctx.set("rows", list);
  ctx.set("sep", sep);

  out = tpl.render(ctx);
  if (!tpl.is_valid()) { err = tpl.error_message(); return false; }
  return true;
}

}

TallyPrinter::TallyPrinter() : cfg_{} {}

TallyPrinter::TallyPrinter(Config cfg) : cfg_(cfg) {}

bool TallyPrinter::render(const TypeTally& tally, std::string& out) {
  err_.clear();
  return cfg_.style == Style::Pretty ? render_pretty(tally, out)
                                     : render_lean(tally, out);
}

bool TallyPrinter::render_lean(const TypeTally& tally, std::string& out) {
  return render_rows(kLeanTemplate, rows_of(tally, cfg_.sort_rows), std::string(), out, err_);
}

bool TallyPrinter::render_pretty(const TypeTally& tally, std::string& out) {
  std::vector<Row> rows;
  rows.push_back(Row{"TYPE", "TOTAL COUNT", "TOTAL BYTES"});
  for (auto& r : rows_of(tally, cfg_.sort_rows)) rows.push_back(std::move(r));

  std::size_t w_name = 0, w_count = 0, w_bytes = 0;
  for (auto& r : rows) {
    w_name  = std::max(w_name,  display_width(r.name));
    w_count = std::max(w_count, display_width(r.count));
    w_bytes = std::max(w_bytes, display_width(r.bytes));
  }
  for (auto& r : rows) {
    r.name  = pad(r.name,  w_name);
    r.count = pad(r.count, w_count);
    r.bytes = pad(r.bytes, w_bytes);
  }

  const std::string sep = "+" + std::string(w_name + 2, '-') +
                          "+" + std::string(w_count + 2, '-') +
                          "+" + std::string(w_bytes + 2, '-') + "+";
  return render_rows(kPrettyTemplate, rows, sep, out, err_);
}

}
