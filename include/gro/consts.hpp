#pragma once
#include <string_view>

namespace gro::consts {

// Category sentinel for the workspace root
inline constexpr std::string_view kRootCategory = ".";
inline constexpr char kCategorySep = '/';
inline constexpr char kAliasSep = ':';

// Version-control marker that identifies a repository directory
inline constexpr std::string_view kRepoMarker = ".git";

// Configuration
inline constexpr std::string_view kConfigDir = ".config/gro";
inline constexpr std::string_view kConfigFile = "config.yaml";
inline constexpr std::string_view kDefaultStore = "~/code";
inline constexpr std::string_view kDefaultWorkspace = "~/workspace";

// Reserved top-level config keys (everything else is a workspace)
inline constexpr std::string_view kKeyCode = "code";
inline constexpr std::string_view kKeyVscode = "vscode_workspaces";
inline constexpr std::string_view kKeyLegacyWorkspaces = "workspaces";

} // namespace gro::consts
