// POSIX-style remote path helpers. Everything here is pure string work so
// navigation can be resolved before any network round-trip.
#pragma once
#include <string>
#include <vector>

namespace sftpdesk {
namespace RemotePath {

// Collapses "//", "." and ".." segments. The result is absolute; ".." at the
// root stays at the root.
std::string normalize(const std::string& path);

// Resolves `path` against `base` (used when `path` is relative).
std::string resolve(const std::string& base, const std::string& path);

std::string parent(const std::string& path);
std::string baseName(const std::string& path);
std::string join(const std::string& dir, const std::string& name);

// Splits "a/b/c" into {"a","b","c"}, dropping empty segments.
std::vector<std::string> segments(const std::string& path);

} // namespace RemotePath
} // namespace sftpdesk
