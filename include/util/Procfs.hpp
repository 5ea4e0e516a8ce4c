// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace devtel::util {

// Map an absolute /proc path to an alternate root if DEVTEL_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if DEVTEL_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Apply whichever of the two remaps matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only, sorted). On failure returns false and
// stores errno in err_out so callers can tell "absent" from "unreadable".
auto list_dir(const std::string& abs, std::vector<std::string>& out, int& err_out) -> bool;

// Target of a symlink, or std::nullopt if it is not one / cannot be read.
auto read_link(const std::string& abs) -> std::optional<std::string>;

auto is_directory(const std::string& abs) -> bool;
auto is_regular_file(const std::string& abs) -> bool;
auto exists(const std::string& abs) -> bool;

} // namespace devtel::util
