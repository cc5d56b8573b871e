#pragma once
#include <filesystem>
#include <string_view>

namespace jt {

// Relative paths resolve against the current working directory.
std::filesystem::path resolve_input(std::string_view path);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

}
