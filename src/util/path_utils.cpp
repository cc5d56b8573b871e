#include "jsonl_tally/path_utils.hpp"
#include <string>
#include <system_error>

namespace jt {

std::filesystem::path resolve_input(std::string_view path) {
  std::filesystem::path p{std::string(path)};
  if (p.is_absolute()) return p;
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) return p;
  return cwd / p;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

}
