#include "gro/fs.hpp"

#include "gro/consts.hpp"

#include <fstream>
#include <stdexcept>

namespace gro::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

void write_text_atomic(const std::filesystem::path &p, const std::string &text) {
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  write_file_atomic(p, std::span(data, text.size()));
}

bool is_symlink(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(p, ec));
}

bool is_plain_dir(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(std::filesystem::symlink_status(p, ec));
}

bool has_repo_marker(const std::filesystem::path &dir) {
  return gro::fs::exists(dir / consts::kRepoMarker);
}

std::optional<std::filesystem::path> resolve_link(const std::filesystem::path &link) {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(link, ec);
  if (ec)
    return std::nullopt;
  if (target.is_relative())
    target = link.parent_path() / target;
  auto resolved = std::filesystem::weakly_canonical(target, ec);
  if (ec)
    return std::nullopt; // loops, permission errors
  return resolved;
}

std::optional<std::filesystem::path> link_destination(const std::filesystem::path &link) {
  std::error_code ec;
  auto target = std::filesystem::read_symlink(link, ec);
  if (ec)
    return std::nullopt;
  if (target.is_relative())
    target = canonical_dir(link.parent_path()) / target;
  return target.lexically_normal();
}

std::filesystem::path canonical_dir(const std::filesystem::path &p) {
  std::error_code ec;
  auto out = std::filesystem::weakly_canonical(p, ec);
  if (ec)
    return p.lexically_normal();
  return out;
}

void make_relative_symlink(const std::filesystem::path &link, const std::filesystem::path &target) {
  ensure_parent_dir(link);
  // Relative to the canonical parent so ".." steps survive symlinked ancestors
  const auto parent = canonical_dir(link.parent_path());
  const auto dest = canonical_dir(target.parent_path()) / target.filename();
  auto rel = dest.lexically_relative(parent);
  if (rel.empty())
    rel = target;
  std::error_code ec;
  std::filesystem::create_directory_symlink(rel, link, ec);
  if (ec)
    throw std::runtime_error("symlink failed: " + link.string() + ": " + ec.message());
}

} // namespace gro::fs
