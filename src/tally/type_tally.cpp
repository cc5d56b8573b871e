#include "jsonl_tally/type_tally.hpp"
#include <algorithm>
#include <utility>

namespace jt {

void tally_line(TypeTally& t, std::string_view type_name, std::uint64_t bytes) {
  t[std::string(type_name)].add_bytes(bytes);
}

void merge_into(TypeTally& dst, TypeTally&& src) {
  if (dst.empty()) { dst = std::move(src); src.clear(); return; }
  for (auto& kv : src) {
    auto& c = dst[kv.first];
    c.count += kv.second.count;
    c.bytes += kv.second.bytes;
  }
  src.clear();
}

void merge_into(TypeTally& dst, const TypeTally& src) {
  for (auto& kv : src) {
    auto& c = dst[kv.first];
    c.count += kv.second.count;
    c.bytes += kv.second.bytes;
  }
}

std::uint64_t total_count(const TypeTally& t) noexcept {
  std::uint64_t n = 0;
  for (auto& kv : t) n += kv.second.count;
  return n;
}

std::uint64_t total_bytes(const TypeTally& t) noexcept {
  std::uint64_t n = 0;
  for (auto& kv : t) n += kv.second.bytes;
  return n;
}

std::vector<std::string> sorted_keys(const TypeTally& t) {
  std::vector<std::string> keys;
  keys.reserve(t.size());
  for (auto& kv : t) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

}
