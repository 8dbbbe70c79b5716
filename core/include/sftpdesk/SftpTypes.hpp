// Basic types shared between the transport core and the service layer.
// Keep them plain and copyable so snapshots can cross threads freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sftpdesk {

// Host key validation policy.
enum class KnownHostsPolicy {
    Strict,     // Requires an existing, matching record.
    AcceptNew,  // TOFU: first-seen keys may be accepted and recorded; changes are rejected.
    Off         // No verification (not recommended).
};

struct FileInfo {
    std::string   name;       // base name
    bool          is_dir = false;
    bool          is_symlink = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// Renders POSIX mode bits the way `ls -l` does ("drwxr-xr-x").
std::string permissionString(std::uint32_t mode, bool isDir, bool isLink = false);

// Host identity as presented by the server during the handshake.
struct HostKeyInfo {
    std::string host;
    std::uint16_t port = 22;
    std::string algorithm;    // "ED25519", "RSA", ...
    std::string fingerprint;  // "SHA256:AB:CD:..."
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // Connect/handshake and per-call response timeout.
    int timeout_seconds = 30;

    // Host key verification. Receives the server identity and returns true
    // to continue; on false the callback fills the reason into `reason`.
    std::function<bool(const HostKeyInfo& key, std::string& reason)> hostkey_verify_cb;
};

} // namespace sftpdesk
