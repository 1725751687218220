#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gro {

// Expand a leading "~" to $HOME and make the result absolute and lexically normal.
auto expand_path(std::string_view raw) -> std::filesystem::path;

// Render p with $HOME abbreviated to "~" when it lives under it
auto abbreviate_home(const std::filesystem::path &p) -> std::string;

auto home_dir() -> std::filesystem::path;

// String helpers
namespace strutil {
  // Trim spaces/tabs/CR/LF on both ends
  auto trim(std::string_view sv) -> std::string;
  auto split(std::string_view sv, char sep) -> std::vector<std::string>;
  auto join(const std::vector<std::string> &parts, char sep) -> std::string;
}

} // namespace gro
