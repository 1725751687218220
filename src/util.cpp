// Path and string helpers shared by config, scanner and CLI
#include "gro/util.hpp"

#include <cstdlib>
#include <stdexcept>

namespace gro {

std::filesystem::path home_dir() {
  if (const char *h = std::getenv("HOME"); h && *h)
    return std::filesystem::path(h);
  throw std::runtime_error("HOME is not set");
}

std::filesystem::path expand_path(std::string_view raw) {
  std::string s = strutil::trim(raw);
  std::filesystem::path p;
  if (s == "~") {
    p = home_dir();
  } else if (s.starts_with("~/")) {
    p = home_dir() / s.substr(2);
  } else {
    p = s;
  }
  if (p.is_relative())
    p = std::filesystem::current_path() / p;
  p = p.lexically_normal();
  // "/a/b/" normalizes to "/a/b/"; drop the empty filename so basename() works
  if (!p.has_filename() && p.has_parent_path() && p != p.root_path())
    p = p.parent_path();
  return p;
}

std::string abbreviate_home(const std::filesystem::path &p) {
  const char *h = std::getenv("HOME");
  if (!h || !*h)
    return p.string();
  const auto rel = p.lexically_relative(std::filesystem::path(h).lexically_normal());
  if (rel.empty() || rel.native().starts_with(".."))
    return p.string();
  if (rel == ".")
    return "~";
  return "~/" + rel.generic_string();
}

namespace strutil {

std::string trim(std::string_view sv) {
  auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split(std::string_view sv, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const auto pos = sv.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(sv.substr(start));
      break;
    }
    out.emplace_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, char sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace strutil

} // namespace gro
