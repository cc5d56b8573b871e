#pragma once
#include "jsonl_tally/type_tally.hpp"

#include <string>

namespace jt {

// Renders a tally as text through Mustache templates.
//   Lean:   TYPE: A | TOTAL COUNT: 1 | TOTAL BYTES: 12
//   Pretty: bordered table, one separator line between rows
class TallyPrinter {
public:
  enum class Style { Lean, Pretty };

  struct Config {
    Style style = Style::Lean;
    bool sort_rows = true;
  };

  TallyPrinter();
  explicit TallyPrinter(Config cfg);

  bool render(const TypeTally& tally, std::string& out);

  const std::string& error() const noexcept { return err_; }

private:
  bool render_lean(const TypeTally& tally, std::string& out);
  bool render_pretty(const TypeTally& tally, std::string& out);

  Config cfg_;
  std::string err_;
};

}
