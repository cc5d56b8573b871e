#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jt {

// Reserved key for lines that are not a JSON object with a string "type".
inline constexpr std::string_view kErrorType = "ERROR";

struct TypeCounter {
  std::uint64_t count = 0;
  std::uint64_t bytes = 0;

  void add_bytes(std::uint64_t b) noexcept { ++count; bytes += b; }
};

using TypeTally = std::unordered_map<std::string, TypeCounter>;

inline bool operator==(const TypeCounter& a, const TypeCounter& b) noexcept {
  return a.count == b.count && a.bytes == b.bytes;
}
inline bool operator!=(const TypeCounter& a, const TypeCounter& b) noexcept {
  return !(a == b);
}

// Adds one line of `bytes` content bytes under `type_name`.
void tally_line(TypeTally& t, std::string_view type_name, std::uint64_t bytes);

// Sums counts and bytes per key. Commutative and associative.
void merge_into(TypeTally& dst, TypeTally&& src);
void merge_into(TypeTally& dst, const TypeTally& src);

std::uint64_t total_count(const TypeTally& t) noexcept;
std::uint64_t total_bytes(const TypeTally& t) noexcept;

// Keys in ascending byte order; used for stable rendering.
std::vector<std::string> sorted_keys(const TypeTally& t);

}
