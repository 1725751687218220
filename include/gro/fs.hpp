#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gro::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, const std::string& text);

// lstat-style checks (never follow the final symlink)
bool is_symlink(const std::filesystem::path& p);
bool is_plain_dir(const std::filesystem::path& p);

// Does dir hold a version-control marker (".git" directory or file)?
bool has_repo_marker(const std::filesystem::path& dir);

// Absolute, normalized target of a symlink, following any symlinks that exist along
// the way. The target itself need not exist. nullopt if the link cannot be read.
auto resolve_link(const std::filesystem::path& link) -> std::optional<std::filesystem::path>;

// Absolute target as written in the link, anchored at the link's resolved parent
// and lexically normalized. The final path is not followed.
auto link_destination(const std::filesystem::path& link) -> std::optional<std::filesystem::path>;

// Canonical form of a directory that may not exist yet
auto canonical_dir(const std::filesystem::path& p) -> std::filesystem::path;

// Create `link` pointing at `target` via a path relative to link's parent.
// Only target's parent is resolved, so a link into the store stays a link into the
// store even when the store entry is itself a symlink. Parent directories are
// created on demand.
void make_relative_symlink(const std::filesystem::path& link, const std::filesystem::path& target);

} // namespace gro::fs
